//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/mir/analysis/Dominators.cpp
// Purpose: Iterative dominator sets, immediate dominators, dominator tree and
//          dominance frontiers for MIR CFGs.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "mir/analysis/Dominators.hpp"

#include <algorithm>
#include <iterator>

namespace mir::analysis
{

using namespace core;

bool DomTree::dominates(BlockId a, BlockId b) const
{
    auto it = sets.find(b);
    if (it == sets.end())
        return false;
    return it->second.count(a) != 0;
}

std::optional<BlockId> DomTree::immediateDominator(BlockId b) const
{
    auto it = idom.find(b);
    if (it == idom.end())
        return std::nullopt;
    return it->second;
}

const std::set<BlockId> &DomTree::frontier(BlockId b) const
{
    static const std::set<BlockId> kEmpty;
    auto it = frontiers.find(b);
    return it == frontiers.end() ? kEmpty : it->second;
}

DomTree computeDominatorTree(const Function &fn)
{
    return computeDominatorTree(CFGInfo(fn));
}

DomTree computeDominatorTree(const CFGInfo &cfg)
{
    DomTree tree;
    tree.root = cfg.entry();
    const auto &rpo = cfg.reversePostOrder();
    if (rpo.empty())
        return tree;

    const std::set<BlockId> all(rpo.begin(), rpo.end());
    for (BlockId b : rpo)
        tree.sets[b] = b == tree.root ? std::set<BlockId>{b} : all;

    bool changed = true;
    while (changed)
    {
        changed = false;
        for (BlockId b : rpo)
        {
            if (b == tree.root)
                continue;
            std::set<BlockId> next;
            bool first = true;
            for (BlockId p : cfg.predecessors(b))
            {
                if (!cfg.isReachable(p))
                    continue;
                const auto &ps = tree.sets[p];
                if (first)
                {
                    next = ps;
                    first = false;
                    continue;
                }
                std::set<BlockId> meet;
                std::set_intersection(next.begin(),
                                      next.end(),
                                      ps.begin(),
                                      ps.end(),
                                      std::inserter(meet, meet.end()));
                next = std::move(meet);
            }
            next.insert(b);
            if (next != tree.sets[b])
            {
                tree.sets[b] = std::move(next);
                changed = true;
            }
        }
    }

    // The immediate dominator is the strict dominator whose own set is one
    // smaller than the block's: every other strict dominator dominates it.
    for (BlockId b : rpo)
    {
        if (b == tree.root)
            continue;
        const auto &doms = tree.sets[b];
        for (BlockId d : doms)
        {
            if (d != b && tree.sets[d].size() + 1 == doms.size())
            {
                tree.idom[b] = d;
                break;
            }
        }
    }

    for (BlockId b : cfg.blocks())
    {
        auto it = tree.idom.find(b);
        if (it != tree.idom.end())
            tree.children[it->second].push_back(b);
    }

    for (BlockId b : rpo)
    {
        tree.frontiers[b];
        std::vector<BlockId> preds;
        for (BlockId p : cfg.predecessors(b))
            if (cfg.isReachable(p))
                preds.push_back(p);
        // The entry has an implicit edge from outside the function.
        if (preds.size() < 2 && !(b == tree.root && !preds.empty()))
            continue;
        auto stop = tree.immediateDominator(b);
        for (BlockId p : preds)
        {
            std::optional<BlockId> runner = p;
            while (runner && runner != stop)
            {
                tree.frontiers[*runner].insert(b);
                runner = tree.immediateDominator(*runner);
            }
        }
    }
    return tree;
}

} // namespace mir::analysis
