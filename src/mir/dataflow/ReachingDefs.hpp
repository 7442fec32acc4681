// File: src/mir/dataflow/ReachingDefs.hpp
// Purpose: Forward reaching-definitions analysis over MIR locals.
// Key invariants: A full assignment kills every earlier definition of its
//                 local; a projected store adds a definition without killing.
// Ownership/Lifetime: Results are value snapshots of one function.
// Links: DESIGN.md
#pragma once

#include "mir/dataflow/Dataflow.hpp"

#include <set>

namespace mir::dataflow
{

/// @brief Assignment of @p local at @p location.
struct Definition
{
    core::LocalId local = 0;
    Location location;

    auto operator<=>(const Definition &) const = default;
};

using DefinitionSet = std::set<Definition>;

class ReachingDefsAnalysis final : public Analysis<DefinitionSet>
{
  public:
    Direction direction() const override
    {
        return Direction::Forward;
    }

    DefinitionSet initialFact(const core::Function &) const override
    {
        return {};
    }

    DefinitionSet bottom() const override
    {
        return {};
    }

    DefinitionSet join(const std::vector<const DefinitionSet *> &facts) const override;

    void transferStatement(DefinitionSet &fact,
                           const core::Statement &stmt,
                           const Location &loc) const override;

    void transferTerminator(DefinitionSet &fact,
                            const core::Terminator &term,
                            const Location &loc) const override;
};

/// @brief Solve reaching definitions for @p fn.
DataflowResults<DefinitionSet> computeReachingDefs(const core::Function &fn);

/// @brief Definitions of @p local that reach the point just before @p loc.
std::vector<Definition> reachingDefsOf(const DataflowResults<DefinitionSet> &results,
                                       const Location &loc,
                                       core::LocalId local);

} // namespace mir::dataflow
