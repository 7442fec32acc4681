//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the dominator analysis for MIR functions. Block A
// dominates block B if every path from the entry to B passes through A.
//
// The analysis computes full dominator sets with the classic iterative
// algorithm: the entry starts at {entry}, every other reachable block at the
// set of all reachable blocks, and each block is refined to itself plus the
// intersection of its reachable predecessors' sets until nothing changes.
// Immediate dominators, the dominator tree and dominance frontiers are then
// derived from the sets.
//
// Key Queries:
// - dominates(A, B): A dominates B (reflexive)
// - immediateDominator(B): nearest strict dominator, none for the entry
// - frontier(B): blocks where B's dominance ends
//
// Unreachable blocks carry no dominator information.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "mir/analysis/CFG.hpp"

#include <map>
#include <optional>
#include <set>
#include <vector>

namespace mir::analysis
{

/// @brief Dominance information for a function.
struct DomTree
{
    core::BlockId root = 0;

    /// Full dominator set of each reachable block, including the block.
    std::map<core::BlockId, std::set<core::BlockId>> sets;

    /// Immediate dominator of each reachable non-entry block.
    std::map<core::BlockId, core::BlockId> idom;

    /// Blocks immediately dominated by each block, in layout order.
    std::map<core::BlockId, std::vector<core::BlockId>> children;

    /// Dominance frontier of each reachable block.
    std::map<core::BlockId, std::set<core::BlockId>> frontiers;

    /// @brief Return true if block @p a dominates block @p b.
    [[nodiscard]] bool dominates(core::BlockId a, core::BlockId b) const;

    [[nodiscard]] std::optional<core::BlockId> immediateDominator(core::BlockId b) const;

    [[nodiscard]] const std::set<core::BlockId> &frontier(core::BlockId b) const;

    [[nodiscard]] bool isReachable(core::BlockId b) const
    {
        return sets.count(b) != 0;
    }
};

/// @brief Compute dominance for @p fn.
DomTree computeDominatorTree(const core::Function &fn);

/// @brief Compute dominance from a prebuilt CFG.
DomTree computeDominatorTree(const CFGInfo &cfg);

} // namespace mir::analysis
