//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/mir/profile/ProfileData.hpp
// Purpose: Execution-count tables read from and written to the line-oriented
//          profile format.
// Key invariants: Probabilities and loop averages are derived from the raw
//                 counts and are never serialized.
// Ownership/Lifetime: Value type; all tables are ordered maps.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//
#pragma once

#include "mir/core/fwd.hpp"
#include "support/diag_expected.hpp"

#include <cstdint>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace mir::profile
{

struct BranchProfile
{
    uint64_t total = 0;
    uint64_t taken = 0;
    double probability = 0.0; ///< taken / total, 0 when total is 0.

    bool operator==(const BranchProfile &) const = default;
};

struct LoopProfile
{
    uint64_t entries = 0;
    uint64_t totalIterations = 0;
    uint64_t maxIterations = 0;
    double averageIterations = 0.0; ///< totalIterations / entries, 0 when never entered.

    bool operator==(const LoopProfile &) const = default;
};

struct ProfileStatistics
{
    size_t functions = 0;
    size_t blocks = 0;
    size_t branches = 0;
    size_t calls = 0;
    size_t loops = 0;
    uint64_t totalExecutions = 0;
    std::optional<std::pair<std::string, uint64_t>> hottestFunction;
};

/// @brief Profile tables keyed by function name, then block id or callee.
struct ProfileData
{
    std::map<std::string, uint64_t> functionCounts;
    std::map<std::string, std::map<core::BlockId, uint64_t>> blockCounts;
    std::map<std::string, std::map<core::BlockId, BranchProfile>> branches;
    std::map<std::string, std::map<std::string, uint64_t>> callCounts;
    std::map<std::string, std::map<core::BlockId, LoopProfile>> loops;

    /// @brief Read every record of @p in. Malformed lines and unknown record
    ///        kinds are skipped.
    static ProfileData parse(std::istream &in);

    static ProfileData parseString(const std::string &text);

    /// @brief Parse the file at @p path.
    /// @return An error when the file cannot be opened.
    static support::Expected<ProfileData> loadFile(const std::string &path);

    /// @brief Add one record line to the tables.
    /// @return False when the line was skipped.
    bool parseLine(const std::string &line);

    /// @brief Write FUNC, BLOCK, BRANCH, CALL and LOOP records, each sorted by key.
    void serialize(std::ostream &out) const;

    [[nodiscard]] support::Expected<void> saveFile(const std::string &path) const;

    /// @brief Execution count of @p function, 0 when absent.
    [[nodiscard]] uint64_t functionCount(const std::string &function) const;

    [[nodiscard]] ProfileStatistics statistics() const;

    [[nodiscard]] bool empty() const;

    bool operator==(const ProfileData &) const = default;
};

} // namespace mir::profile
