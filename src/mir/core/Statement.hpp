//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares MIR statements: the non-control-flow operations that
// make up the body of a basic block.
//
// A Statement is one of:
// - Assign: evaluate an rvalue and store it into a place
// - StorageLive / StorageDead: open and close the lifetime region of a local
// - Nop: placeholder left behind by passes that blank a statement in place
//
// Key Invariants:
// - Locals named by a statement are declared in the owning function
// - Assignments may redefine a local more than once (not SSA)
//
//===----------------------------------------------------------------------===//

#pragma once

#include "mir/core/Rvalue.hpp"
#include "support/source_location.hpp"

#include <variant>

namespace mir::core
{

/// @brief Source position and lexical scope of a statement.
struct SourceInfo
{
    support::SourceLoc span;
    uint32_t scope = 0;

    bool operator==(const SourceInfo &) const = default;
};

namespace stmt
{
struct Assign
{
    Place place;
    Rvalue rvalue;
    SourceInfo sourceInfo;

    bool operator==(const Assign &) const = default;
};

struct StorageLive
{
    LocalId local = 0;
    bool operator==(const StorageLive &) const = default;
};

struct StorageDead
{
    LocalId local = 0;
    bool operator==(const StorageDead &) const = default;
};

struct Nop
{
    bool operator==(const Nop &) const = default;
};
} // namespace stmt

/// @brief One MIR statement.
struct Statement
{
    using Kind = std::variant<stmt::Assign, stmt::StorageLive, stmt::StorageDead, stmt::Nop>;

    Kind kind;

    static Statement assign(Place place, Rvalue rvalue, SourceInfo info = {})
    {
        return Statement{stmt::Assign{std::move(place), std::move(rvalue), info}};
    }

    static Statement storageLive(LocalId local)
    {
        return Statement{stmt::StorageLive{local}};
    }

    static Statement storageDead(LocalId local)
    {
        return Statement{stmt::StorageDead{local}};
    }

    static Statement nop()
    {
        return Statement{stmt::Nop{}};
    }

    /// @brief Assignment payload or nullptr.
    [[nodiscard]] stmt::Assign *asAssign()
    {
        return std::get_if<stmt::Assign>(&kind);
    }

    [[nodiscard]] const stmt::Assign *asAssign() const
    {
        return std::get_if<stmt::Assign>(&kind);
    }

    [[nodiscard]] bool isNop() const
    {
        return std::holds_alternative<stmt::Nop>(kind);
    }

    bool operator==(const Statement &) const = default;
};

} // namespace mir::core
