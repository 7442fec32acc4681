//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the BasicBlock struct: a straight-line sequence of MIR
// statements closed by exactly one terminator.
//
// Key Invariants:
// - Ids are unique within the parent function
// - A block under construction may carry an Unreachable placeholder; every
//   block reachable from the entry of a finished function has a real
//   terminator
//
// Ownership Model:
// - Function owns BasicBlocks by value in a std::vector (layout order)
// - BasicBlock owns its statements and terminator by value
//
//===----------------------------------------------------------------------===//

#pragma once

#include "mir/core/Statement.hpp"
#include "mir/core/Terminator.hpp"

#include <vector>

namespace mir::core
{

/// @brief Statements followed by a control transfer.
struct BasicBlock
{
    /// Identity of the block within its function.
    BlockId id = 0;

    /// Ordered statements executed on entry.
    std::vector<Statement> statements;

    /// Control transfer executed after the last statement.
    Terminator terminator;
};

} // namespace mir::core
