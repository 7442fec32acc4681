// File: src/mir/dataflow/ReachingDefs.cpp
// Purpose: Transfer functions for reaching definitions.
// Key invariants: Call terminators define their destination.
// Ownership/Lifetime: Stateless analysis object.
// Links: DESIGN.md

#include "mir/dataflow/ReachingDefs.hpp"

#include "mir/utils/Uses.hpp"

namespace mir::dataflow
{

using namespace core;

namespace
{
void define(DefinitionSet &fact, const Place &place, const Location &loc)
{
    if (place.isLocal())
    {
        for (auto it = fact.begin(); it != fact.end();)
        {
            if (it->local == place.local)
                it = fact.erase(it);
            else
                ++it;
        }
    }
    fact.insert(Definition{place.local, loc});
}
} // namespace

DefinitionSet ReachingDefsAnalysis::join(const std::vector<const DefinitionSet *> &facts) const
{
    DefinitionSet out;
    for (const DefinitionSet *f : facts)
        out.insert(f->begin(), f->end());
    return out;
}

void ReachingDefsAnalysis::transferStatement(DefinitionSet &fact,
                                             const Statement &stmt,
                                             const Location &loc) const
{
    if (const auto *assign = stmt.asAssign())
        define(fact, assign->place, loc);
}

void ReachingDefsAnalysis::transferTerminator(DefinitionSet &fact,
                                              const Terminator &term,
                                              const Location &loc) const
{
    if (const auto *call = std::get_if<term::Call>(&term.kind))
        if (call->destination)
            define(fact, *call->destination, loc);
}

DataflowResults<DefinitionSet> computeReachingDefs(const Function &fn)
{
    return solve(fn, ReachingDefsAnalysis{});
}

std::vector<Definition> reachingDefsOf(const DataflowResults<DefinitionSet> &results,
                                       const Location &loc,
                                       LocalId local)
{
    const DefinitionSet *fact = nullptr;
    if (loc.statementIndex == 0)
    {
        auto it = results.blockEntry.find(loc.block);
        if (it != results.blockEntry.end())
            fact = &it->second;
    }
    else
    {
        fact = results.at(Location{loc.block, loc.statementIndex - 1});
    }

    std::vector<Definition> out;
    if (!fact)
        return out;
    for (const auto &def : *fact)
        if (def.local == local)
            out.push_back(def);
    return out;
}

} // namespace mir::dataflow
