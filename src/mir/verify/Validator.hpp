//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the MIR validator, which checks the structural
// invariants every pass must preserve:
//
// - every local named by a statement or terminator is declared
// - every block named by a terminator exists, and the entry block exists
// - every block reachable from the entry carries a real terminator
// - block ids are unique
// - direct calls name a function, an external declaration or a constant
//
// Findings are collected, never repaired. Unreachable blocks and locals
// assigned more than once are reported as informational findings: the IR is
// not SSA, so multiple assignment is legal, and unreachable blocks are
// harmless until dead-code elimination removes them.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "mir/core/Program.hpp"
#include "support/diag_expected.hpp"

#include <string>
#include <vector>

namespace mir::verify
{

/// @brief One validator finding.
struct ValidationError
{
    enum class Kind
    {
        UndefinedLocal,
        MissingTerminator,
        InvalidEdge,
        UnreachableCode,
        DuplicateBlock,
        MultipleAssignment,
        UnknownCallee,
    };

    Kind kind;
    std::string function;
    core::LocalId local = 0;
    core::BlockId block = 0;          ///< Block of the finding; edge source for InvalidEdge.
    core::BlockId target = 0;         ///< Edge target for InvalidEdge.
    size_t statementIndex = 0;        ///< Statement index; statements.size() means the terminator.
    unsigned count = 0;               ///< Assignment count for MultipleAssignment.
    std::string callee;               ///< Unresolved name for UnknownCallee.

    /// @brief True for findings that make a function ill-formed.
    [[nodiscard]] bool isHardError() const;

    /// @brief Human-readable description, e.g. "f: bb2: undefined local _7".
    [[nodiscard]] std::string toString() const;
};

/// @brief Checks MIR structural invariants.
class Validator
{
  public:
    /// @brief Validate @p fn and return every finding.
    static std::vector<ValidationError> validate(const core::Function &fn);

    /// @brief Validate every function of @p program plus cross-function
    ///        call resolution.
    static std::vector<ValidationError> validateProgram(const core::Program &program);

    /// @brief True when @p errors holds no hard error.
    static bool isWellFormed(const std::vector<ValidationError> &errors);

    /// @brief Validate @p program and fold the first hard error into a
    ///        diagnostic.
    [[nodiscard]] static support::Expected<void> verify(const core::Program &program);
};

} // namespace mir::verify
