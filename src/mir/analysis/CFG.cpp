//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/mir/analysis/CFG.cpp
// Purpose: Implements successor/predecessor queries and block orderings.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "mir/analysis/CFG.hpp"

#include <algorithm>
#include <utility>

namespace mir::analysis
{

using namespace core;

std::vector<BlockId> successors(const BasicBlock &bb)
{
    return bb.terminator.successors();
}

std::vector<BlockId> predecessors(const Function &fn, BlockId id)
{
    std::vector<BlockId> out;
    for (const auto &bb : fn.blocks)
    {
        auto succs = bb.terminator.successors();
        if (std::find(succs.begin(), succs.end(), id) != succs.end())
            out.push_back(bb.id);
    }
    return out;
}

std::vector<BlockId> postOrder(const Function &fn)
{
    std::vector<BlockId> order;
    if (!fn.findBlock(fn.entry))
        return order;

    std::set<BlockId> visited;
    // Explicit stack of (block, next successor index) keeps deep CFGs off the
    // call stack.
    std::vector<std::pair<BlockId, size_t>> stack;
    std::map<BlockId, std::vector<BlockId>> succCache;
    auto succsOf = [&](BlockId id) -> const std::vector<BlockId> &
    {
        auto it = succCache.find(id);
        if (it != succCache.end())
            return it->second;
        std::vector<BlockId> succs;
        for (BlockId s : fn.findBlock(id)->terminator.successors())
            if (fn.findBlock(s))
                succs.push_back(s);
        return succCache.emplace(id, std::move(succs)).first->second;
    };

    visited.insert(fn.entry);
    stack.emplace_back(fn.entry, 0);
    while (!stack.empty())
    {
        auto &[id, next] = stack.back();
        const auto &succs = succsOf(id);
        if (next < succs.size())
        {
            BlockId s = succs[next++];
            if (visited.insert(s).second)
                stack.emplace_back(s, 0);
            continue;
        }
        order.push_back(id);
        stack.pop_back();
    }
    return order;
}

std::vector<BlockId> reversePostOrder(const Function &fn)
{
    auto order = postOrder(fn);
    std::reverse(order.begin(), order.end());
    return order;
}

std::set<BlockId> reachableBlocks(const Function &fn)
{
    auto order = postOrder(fn);
    return std::set<BlockId>(order.begin(), order.end());
}

CFGInfo::CFGInfo(const Function &fn) : entry_(fn.entry)
{
    for (const auto &bb : fn.blocks)
    {
        blocks_.push_back(bb.id);
        succs_[bb.id];
        preds_[bb.id];
    }
    for (const auto &bb : fn.blocks)
    {
        for (BlockId s : bb.terminator.successors())
        {
            if (!fn.findBlock(s))
                continue;
            succs_[bb.id].push_back(s);
            preds_[s].push_back(bb.id);
        }
    }
    rpo_ = analysis::reversePostOrder(fn);
    reachable_.insert(rpo_.begin(), rpo_.end());
}

const std::vector<BlockId> &CFGInfo::successors(BlockId id) const
{
    static const std::vector<BlockId> kEmpty;
    auto it = succs_.find(id);
    return it == succs_.end() ? kEmpty : it->second;
}

const std::vector<BlockId> &CFGInfo::predecessors(BlockId id) const
{
    static const std::vector<BlockId> kEmpty;
    auto it = preds_.find(id);
    return it == preds_.end() ? kEmpty : it->second;
}

} // namespace mir::analysis
