//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/mir/analysis/LoopInfo.cpp
// Purpose: Implement natural loop discovery using CFG traversal and dominance.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Identifies back edges (edges whose head dominates their tail),
/// grows each natural loop by walking predecessors from the tail without
/// crossing the header, merges loops sharing a header and assembles the
/// nesting forest by strict containment. Counted-loop bounds come from the
/// induction-variable analysis.

#include "mir/analysis/LoopInfo.hpp"

#include "mir/analysis/InductionVars.hpp"

#include <algorithm>
#include <limits>
#include <map>

namespace mir::analysis
{

using namespace core;

bool Loop::isLatch(BlockId b) const
{
    return std::find(latches.begin(), latches.end(), b) != latches.end();
}

namespace
{

void growNaturalLoop(const CFGInfo &cfg, Loop &loop, BlockId tail)
{
    std::vector<BlockId> worklist{tail};
    while (!worklist.empty())
    {
        BlockId current = worklist.back();
        worklist.pop_back();
        if (!loop.blocks.insert(current).second)
            continue;
        for (BlockId pred : cfg.predecessors(current))
            if (cfg.isReachable(pred) && !loop.contains(pred))
                worklist.push_back(pred);
    }
}

bool isStrictSubset(const Loop &inner, const Loop &outer)
{
    if (inner.blocks.size() >= outer.blocks.size())
        return false;
    return std::includes(
        outer.blocks.begin(), outer.blocks.end(), inner.blocks.begin(), inner.blocks.end());
}

} // namespace

LoopForest LoopForest::compute(const Function &fn)
{
    CFGInfo cfg(fn);
    DomTree dom = computeDominatorTree(cfg);
    return compute(fn, cfg, dom);
}

LoopForest LoopForest::compute(const Function &fn, const CFGInfo &cfg, const DomTree &dom)
{
    LoopForest forest;
    std::map<BlockId, size_t> byHeader;

    for (BlockId tail : cfg.blocks())
    {
        if (!cfg.isReachable(tail))
            continue;
        for (BlockId head : cfg.successors(tail))
        {
            if (!dom.dominates(head, tail))
                continue;
            auto [it, inserted] = byHeader.emplace(head, forest.loops_.size());
            if (inserted)
            {
                Loop loop;
                loop.header = head;
                loop.blocks.insert(head);
                forest.loops_.push_back(std::move(loop));
            }
            Loop &loop = forest.loops_[it->second];
            if (!loop.isLatch(tail))
                loop.latches.push_back(tail);
            growNaturalLoop(cfg, loop, tail);
        }
    }

    for (Loop &loop : forest.loops_)
    {
        for (BlockId b : loop.blocks)
        {
            for (BlockId succ : cfg.successors(b))
            {
                if (loop.contains(succ))
                    continue;
                loop.exits.insert(b);
                loop.exitTargets.insert(succ);
            }
        }

        std::vector<BlockId> outside;
        for (BlockId pred : cfg.predecessors(loop.header))
            if (!loop.contains(pred))
                outside.push_back(pred);
        if (outside.size() == 1)
            loop.preheader = outside.front();
    }

    for (size_t i = 0; i < forest.loops_.size(); ++i)
    {
        std::optional<size_t> parent;
        size_t parentSize = std::numeric_limits<size_t>::max();
        for (size_t j = 0; j < forest.loops_.size(); ++j)
        {
            if (i == j || !isStrictSubset(forest.loops_[i], forest.loops_[j]))
                continue;
            if (forest.loops_[j].blocks.size() < parentSize)
            {
                parent = j;
                parentSize = forest.loops_[j].blocks.size();
            }
        }
        forest.loops_[i].parent = parent;
        if (parent)
            forest.loops_[*parent].children.push_back(i);
        else
            forest.roots_.push_back(i);
    }

    // Depth follows parent links; parents may have larger indices.
    for (Loop &loop : forest.loops_)
    {
        unsigned depth = 1;
        for (auto p = loop.parent; p; p = forest.loops_[*p].parent)
            ++depth;
        loop.depth = depth;
    }

    for (Loop &loop : forest.loops_)
    {
        loop.bounds = computeLoopBounds(fn, cfg, dom, forest, loop);
        if (loop.bounds)
        {
            uint64_t count = loop.bounds->continuingTests + (loop.isLatch(loop.bounds->exitingBlock) ? 1 : 0);
            if (count <= kMaxKnownTripCount)
                loop.iterationCount = count;
        }
    }
    return forest;
}

const Loop *LoopForest::loopFor(BlockId block) const noexcept
{
    const Loop *best = nullptr;
    for (const Loop &loop : loops_)
        if (loop.contains(block) && (!best || loop.depth > best->depth))
            best = &loop;
    return best;
}

std::vector<size_t> LoopForest::innermostFirst() const
{
    std::vector<size_t> order;
    std::vector<std::pair<size_t, bool>> stack;
    for (auto it = roots_.rbegin(); it != roots_.rend(); ++it)
        stack.emplace_back(*it, false);
    while (!stack.empty())
    {
        auto [idx, expanded] = stack.back();
        stack.pop_back();
        if (expanded)
        {
            order.push_back(idx);
            continue;
        }
        stack.emplace_back(idx, true);
        const auto &kids = loops_[idx].children;
        for (auto it = kids.rbegin(); it != kids.rend(); ++it)
            stack.emplace_back(*it, false);
    }
    return order;
}

} // namespace mir::analysis
