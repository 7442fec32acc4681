// File: src/mir/dataflow/Liveness.cpp
// Purpose: Transfer functions for backward liveness.
// Key invariants: A fully overwritten local is killed before the reads of the
//                 same statement are added.
// Ownership/Lifetime: Borrows the analysed function for the solve only.
// Links: DESIGN.md

#include "mir/dataflow/Liveness.hpp"

#include "mir/utils/Uses.hpp"

namespace mir::dataflow
{

using namespace core;

LiveSet LivenessAnalysis::join(const std::vector<const LiveSet *> &facts) const
{
    LiveSet out;
    for (const LiveSet *f : facts)
        out.insert(f->begin(), f->end());
    return out;
}

void LivenessAnalysis::transferStatement(LiveSet &fact,
                                         const Statement &stmt,
                                         const Location &) const
{
    if (const auto *dead = std::get_if<stmt::StorageDead>(&stmt.kind))
    {
        fact.erase(dead->local);
        return;
    }
    if (auto def = util::definedLocal(stmt))
        fact.erase(*def);
    for (LocalId id : util::statementReads(stmt))
        fact.insert(id);
}

void LivenessAnalysis::transferTerminator(LiveSet &fact,
                                          const Terminator &term,
                                          const Location &) const
{
    if (const auto *call = std::get_if<term::Call>(&term.kind))
        if (call->destination && call->destination->isLocal())
            fact.erase(call->destination->local);
    for (LocalId id : util::terminatorReads(term))
        fact.insert(id);
    if (term.isReturn() && fn_.returnLocal)
        fact.insert(*fn_.returnLocal);
}

LivenessResult::LivenessResult(const Function &fn) : results_(solve(fn, LivenessAnalysis(fn))) {}

LiveSet LivenessResult::liveIn(BlockId block) const
{
    auto it = results_.blockEntry.find(block);
    return it == results_.blockEntry.end() ? LiveSet{} : it->second;
}

LiveSet LivenessResult::liveOut(BlockId block) const
{
    auto it = results_.blockExit.find(block);
    return it == results_.blockExit.end() ? LiveSet{} : it->second;
}

LiveSet LivenessResult::liveBefore(const Location &loc) const
{
    const LiveSet *fact = results_.at(loc);
    return fact ? *fact : LiveSet{};
}

} // namespace mir::dataflow
