//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the generic fixed-point dataflow engine over MIR
// control-flow graphs.
//
// An analysis supplies a direction, an initial fact, a join and transfer
// functions for statements and terminators. The engine runs a worklist of
// block ids:
//
// - Forward: seeded from the entry block. A block's input is the join of
//   its processed predecessors' exit facts (the entry block uses the initial
//   fact). Statements run in order, then the terminator.
// - Backward: seeded from every Return block and every block without
//   successors. A block's output is the join of its processed successors'
//   entry facts; such exit blocks start from the initial fact. The
//   terminator runs first, then statements in reverse order.
//
// A location's stored fact is overwritten only when the new fact differs,
// and neighbours are re-enqueued only when the block's boundary fact
// changed. Joins must be monotone and idempotent for termination.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "mir/analysis/CFG.hpp"
#include "mir/core/Function.hpp"

#include <compare>
#include <cstddef>
#include <deque>
#include <map>
#include <set>
#include <vector>

namespace mir::dataflow
{

/// @brief Statement position; statementIndex == statements.size() denotes the
///        terminator.
struct Location
{
    core::BlockId block = 0;
    size_t statementIndex = 0;

    auto operator<=>(const Location &) const = default;
};

enum class Direction
{
    Forward,
    Backward,
};

/// @brief Dataflow problem over facts of type @p Fact.
/// @tparam Fact Copyable type with operator==.
template <class Fact> class Analysis
{
  public:
    virtual ~Analysis() = default;

    virtual Direction direction() const = 0;

    /// @brief Fact at the entry (forward) or at function exits (backward).
    virtual Fact initialFact(const core::Function &fn) const = 0;

    /// @brief Identity of join, used before any neighbour was processed.
    virtual Fact bottom() const = 0;

    /// @brief Combine @p facts; must be monotone and idempotent.
    virtual Fact join(const std::vector<const Fact *> &facts) const = 0;

    virtual void transferStatement(Fact &fact,
                                   const core::Statement &stmt,
                                   const Location &loc) const = 0;

    virtual void transferTerminator(Fact &fact,
                                    const core::Terminator &term,
                                    const Location &loc) const = 0;
};

/// @brief Solution of a dataflow problem.
template <class Fact> struct DataflowResults
{
    Direction direction = Direction::Forward;

    /// Fact after each location (forward) or before it (backward).
    std::map<Location, Fact> facts;

    /// Fact at the start of each processed block.
    std::map<core::BlockId, Fact> blockEntry;

    /// Fact at the end of each processed block.
    std::map<core::BlockId, Fact> blockExit;

    /// @brief Stored fact for @p loc or nullptr when never computed.
    const Fact *at(const Location &loc) const
    {
        auto it = facts.find(loc);
        return it == facts.end() ? nullptr : &it->second;
    }
};

namespace detail
{

/// @brief Store @p fact at @p key when it differs from the stored value.
/// @return True when the map changed.
template <class Map, class Key, class Fact> bool update(Map &map, const Key &key, const Fact &fact)
{
    auto it = map.find(key);
    if (it == map.end())
    {
        map.emplace(key, fact);
        return true;
    }
    if (it->second == fact)
        return false;
    it->second = fact;
    return true;
}

class Worklist
{
  public:
    void push(core::BlockId id)
    {
        if (queued_.insert(id).second)
            queue_.push_back(id);
    }

    bool empty() const
    {
        return queue_.empty();
    }

    core::BlockId pop()
    {
        core::BlockId id = queue_.front();
        queue_.pop_front();
        queued_.erase(id);
        return id;
    }

  private:
    std::deque<core::BlockId> queue_;
    std::set<core::BlockId> queued_;
};

template <class Fact>
void solveForward(const core::Function &fn,
                  const analysis::CFGInfo &cfg,
                  const Analysis<Fact> &problem,
                  DataflowResults<Fact> &results)
{
    const core::BasicBlock *entry = fn.findBlock(fn.entry);
    if (!entry)
        return;

    Worklist work;
    work.push(fn.entry);
    while (!work.empty())
    {
        core::BlockId id = work.pop();
        const core::BasicBlock *bb = fn.findBlock(id);

        Fact fact = problem.bottom();
        if (id == fn.entry)
        {
            fact = problem.initialFact(fn);
        }
        else
        {
            std::vector<const Fact *> inputs;
            for (core::BlockId pred : cfg.predecessors(id))
                if (auto it = results.blockExit.find(pred); it != results.blockExit.end())
                    inputs.push_back(&it->second);
            if (!inputs.empty())
                fact = problem.join(inputs);
        }
        detail::update(results.blockEntry, id, fact);

        for (size_t i = 0; i < bb->statements.size(); ++i)
        {
            Location loc{id, i};
            problem.transferStatement(fact, bb->statements[i], loc);
            detail::update(results.facts, loc, fact);
        }
        Location termLoc{id, bb->statements.size()};
        problem.transferTerminator(fact, bb->terminator, termLoc);
        detail::update(results.facts, termLoc, fact);

        if (detail::update(results.blockExit, id, fact))
            for (core::BlockId succ : cfg.successors(id))
                work.push(succ);
    }
}

template <class Fact>
void solveBackward(const core::Function &fn,
                   const analysis::CFGInfo &cfg,
                   const Analysis<Fact> &problem,
                   DataflowResults<Fact> &results)
{
    Worklist work;
    for (const auto &bb : fn.blocks)
        if (bb.terminator.isReturn() || cfg.successors(bb.id).empty())
            work.push(bb.id);

    auto drain = [&]()
    {
        while (!work.empty())
        {
            core::BlockId id = work.pop();
            const core::BasicBlock *bb = fn.findBlock(id);

            Fact fact = problem.bottom();
            const auto &succs = cfg.successors(id);
            if (succs.empty())
            {
                fact = problem.initialFact(fn);
            }
            else
            {
                std::vector<const Fact *> inputs;
                for (core::BlockId succ : succs)
                    if (auto it = results.blockEntry.find(succ); it != results.blockEntry.end())
                        inputs.push_back(&it->second);
                if (!inputs.empty())
                    fact = problem.join(inputs);
            }
            detail::update(results.blockExit, id, fact);

            Location termLoc{id, bb->statements.size()};
            problem.transferTerminator(fact, bb->terminator, termLoc);
            detail::update(results.facts, termLoc, fact);
            for (size_t i = bb->statements.size(); i-- > 0;)
            {
                Location loc{id, i};
                problem.transferStatement(fact, bb->statements[i], loc);
                detail::update(results.facts, loc, fact);
            }

            if (detail::update(results.blockEntry, id, fact))
                for (core::BlockId pred : cfg.predecessors(id))
                    work.push(pred);
        }
    };

    drain();
    // Blocks that cannot reach an exit (infinite loops) start from bottom.
    for (const auto &bb : fn.blocks)
    {
        if (results.blockEntry.count(bb.id))
            continue;
        work.push(bb.id);
        drain();
    }
}

} // namespace detail

/// @brief Solve @p problem over @p fn to a fixed point.
template <class Fact>
DataflowResults<Fact> solve(const core::Function &fn, const Analysis<Fact> &problem)
{
    DataflowResults<Fact> results;
    results.direction = problem.direction();
    analysis::CFGInfo cfg(fn);
    if (problem.direction() == Direction::Forward)
        detail::solveForward(fn, cfg, problem, results);
    else
        detail::solveBackward(fn, cfg, problem, results);
    return results;
}

} // namespace mir::dataflow
