// File: src/mir/analysis/Dependence.hpp
// Purpose: Data dependences between MIR statements within blocks and across
//          loop iterations.
// Key invariants: Two places overlap iff they share a base local; sources
//                 precede sinks in block order.
// Ownership/Lifetime: Results are value types.
// Links: DESIGN.md
#pragma once

#include "mir/analysis/LoopInfo.hpp"
#include "mir/dataflow/Dataflow.hpp"

#include <optional>
#include <set>
#include <vector>

namespace mir::analysis
{

enum class DependenceKind
{
    Flow,   ///< Read after write.
    Anti,   ///< Write after read.
    Output, ///< Write after write.
};

enum class DependenceDirection
{
    Less,
    Equal,
    Greater,
    Any,
};

struct Dependence
{
    dataflow::Location source;
    dataflow::Location sink;
    DependenceKind kind = DependenceKind::Flow;
    DependenceDirection direction = DependenceDirection::Equal;
    std::optional<int64_t> distance; ///< Iteration distance when known.
    core::LocalId local = 0;         ///< Base local carrying the dependence.
};

/// @brief Dependences of one loop.
struct LoopDependences
{
    std::vector<Dependence> intraBlock;
    std::vector<Dependence> loopCarried;

    /// Some statement in the loop stores through a pointer or calls a function.
    bool memoryHazard = false;

    /// @brief True when a carried dependence involves a local outside @p ignore.
    [[nodiscard]] bool hasCarriedOutside(const std::set<core::LocalId> &ignore) const;
};

/// @brief Pairwise dependences among the statements of @p bb.
std::vector<Dependence> blockDependences(const core::BasicBlock &bb);

/// @brief Intra-block and loop-carried dependences of @p loop.
LoopDependences analyzeLoopDependences(const core::Function &fn,
                                       const CFGInfo &cfg,
                                       const Loop &loop);

} // namespace mir::analysis
