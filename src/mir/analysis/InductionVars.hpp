// File: src/mir/analysis/InductionVars.hpp
// Purpose: Basic and derived induction variables and counted-loop bounds.
// Key invariants: A basic induction variable is assigned exactly once inside
//                 its loop, as `x = x + c` or `x = x - c`, and its address is
//                 never taken.
// Ownership/Lifetime: Results are value types keyed by local ids.
// Links: DESIGN.md
#pragma once

#include "mir/analysis/LoopInfo.hpp"

#include <optional>
#include <vector>

namespace mir::analysis
{

/// @brief `local = local + step` executed once per iteration.
struct BasicInductionVar
{
    core::LocalId local = 0;
    std::optional<core::Int128> initial; ///< Constant value on loop entry, when known.
    core::Int128 step = 0;
    core::BlockId block = 0;             ///< Block holding the increment.
    size_t statement = 0;                ///< Index of the increment.
};

/// @brief `local = base * multiplier + offset` with @c base a basic IV.
struct DerivedInductionVar
{
    core::LocalId local = 0;
    core::LocalId base = 0;
    core::Int128 multiplier = 1;
    core::Int128 offset = 0;
    core::BlockId block = 0;
    size_t statement = 0;
};

struct InductionInfo
{
    std::vector<BasicInductionVar> basic;
    std::vector<DerivedInductionVar> derived;

    [[nodiscard]] const BasicInductionVar *findBasic(core::LocalId local) const;
};

/// @brief Find the induction variables of @p loop.
InductionInfo findInductionVariables(const core::Function &fn,
                                     const CFGInfo &cfg,
                                     const Loop &loop);

/// @brief Constant value of @p local when control reaches the end of @p from,
///        found by walking back through unique predecessors.
std::optional<core::Int128> constantValueAtEnd(const core::Function &fn,
                                               const CFGInfo &cfg,
                                               core::BlockId from,
                                               core::LocalId local);

/// @brief Recognise the counted-loop shape of @p loop.
/// @details Requires a single exiting block whose branch tests a comparison
///          of a basic induction variable (with a constant start) against a
///          constant. Returns nullopt for any other shape and for loops
///          whose exit is never reached.
std::optional<LoopBounds> computeLoopBounds(const core::Function &fn,
                                            const CFGInfo &cfg,
                                            const DomTree &dom,
                                            const LoopForest &forest,
                                            const Loop &loop);

/// @brief Locals whose address is taken by a Ref anywhere in @p fn.
std::set<core::LocalId> addressTakenLocals(const core::Function &fn);

} // namespace mir::analysis
