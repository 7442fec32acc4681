// File: src/mir/analysis/CFG.hpp
// Purpose: Control-flow graph queries for MIR functions.
// Key invariants: Edges are derived purely from terminators; edges naming
//                 blocks that do not exist are ignored by CFGInfo.
// Ownership/Lifetime: CFGInfo holds ids only and stays valid until the
//                     function's blocks or terminators change.
// Links: DESIGN.md
#pragma once

#include "mir/core/Function.hpp"

#include <map>
#include <set>
#include <vector>

namespace mir::analysis
{

/// @brief Successors of @p bb in terminator order, duplicates removed.
std::vector<core::BlockId> successors(const core::BasicBlock &bb);

/// @brief Blocks of @p fn, in layout order, that branch to @p id.
std::vector<core::BlockId> predecessors(const core::Function &fn, core::BlockId id);

/// @brief DFS post-order of the blocks reachable from the entry.
/// @return Blocks in post-order; the entry block is last.
std::vector<core::BlockId> postOrder(const core::Function &fn);

/// @brief Reverse post-order; the entry block is first.
std::vector<core::BlockId> reversePostOrder(const core::Function &fn);

/// @brief Blocks reachable from the entry through terminator edges.
std::set<core::BlockId> reachableBlocks(const core::Function &fn);

/// @brief Cached successor/predecessor maps for one function.
class CFGInfo
{
  public:
    explicit CFGInfo(const core::Function &fn);

    [[nodiscard]] const std::vector<core::BlockId> &successors(core::BlockId id) const;

    [[nodiscard]] const std::vector<core::BlockId> &predecessors(core::BlockId id) const;

    /// @brief Reachable blocks in reverse post-order.
    [[nodiscard]] const std::vector<core::BlockId> &reversePostOrder() const
    {
        return rpo_;
    }

    [[nodiscard]] bool isReachable(core::BlockId id) const
    {
        return reachable_.count(id) != 0;
    }

    [[nodiscard]] const std::set<core::BlockId> &reachable() const
    {
        return reachable_;
    }

    /// @brief Every block of the function in layout order.
    [[nodiscard]] const std::vector<core::BlockId> &blocks() const
    {
        return blocks_;
    }

    [[nodiscard]] core::BlockId entry() const
    {
        return entry_;
    }

  private:
    core::BlockId entry_ = 0;
    std::vector<core::BlockId> blocks_;
    std::map<core::BlockId, std::vector<core::BlockId>> succs_;
    std::map<core::BlockId, std::vector<core::BlockId>> preds_;
    std::vector<core::BlockId> rpo_;
    std::set<core::BlockId> reachable_;
};

} // namespace mir::analysis
