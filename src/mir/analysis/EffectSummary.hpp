// File: src/mir/analysis/EffectSummary.hpp
// Purpose: Per-function side-effect and escape summaries over the call graph.
// Key invariants: A caller's summary includes the union of its callees'
//                 effects; members of one call-graph cycle are iterated to a
//                 fixed point.
// Ownership/Lifetime: Summaries are value types keyed by function name.
// Links: DESIGN.md
#pragma once

#include "mir/analysis/CallGraph.hpp"

#include <map>
#include <set>
#include <string>

namespace mir::analysis
{

struct SideEffects
{
    bool readsMemory = false;
    bool writesMemory = false;
    bool performsIo = false;
    bool mayThrow = false;
    bool callsFunctions = false;

    void merge(const SideEffects &other);

    bool operator==(const SideEffects &) const = default;
};

struct FunctionSummary
{
    std::string name;
    SideEffects effects;
    std::set<std::string> readsGlobals;    ///< Program constants referenced, callees' included.
    std::set<std::string> calls;           ///< Direct callees, external ones included.
    std::set<size_t> escapingParameters;   ///< Indices into Function::params.
    bool mayNotTerminate = false;
    bool isRecursive = false;

    /// @brief No memory access, no I/O, cannot throw, always terminates and
    ///        is not recursive.
    [[nodiscard]] bool isPure() const;

    bool operator==(const FunctionSummary &) const = default;
};

using SummaryMap = std::map<std::string, FunctionSummary>;

/// @brief Compute summaries for every function of @p program.
SummaryMap computeSummaries(const core::Program &program, const CallGraph &cg);

} // namespace mir::analysis
