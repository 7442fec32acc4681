// File: src/mir/transform/LoopOpt.hpp
// Purpose: Loop-invariant hoisting, full unrolling of short counted loops and
//          strength reduction of derived induction variables.
// Key invariants: Loops are visited innermost first; analyses are recomputed
//                 after every loop that changed.
// Ownership/Lifetime: Mutates caller-owned functions in place.
// Links: DESIGN.md

#pragma once

#include "mir/analysis/LoopInfo.hpp"
#include "mir/transform/PassRegistry.hpp"

#include <cstdint>

namespace mir::transform
{

/// @brief Thresholds of the loop transforms.
struct LoopOptConfig
{
    /// Largest known iteration count that is fully unrolled.
    uint64_t unrollTripLimit = 16;

    /// Largest loop, in blocks, that is fully unrolled.
    size_t unrollBlockLimit = 5;

    /// Minimum hoisting profit.
    uint64_t hoistThreshold = 10;

    /// Trip count assumed for loops whose count is unknown.
    uint64_t defaultTrip = 10;

    /// Upper bound on the estimated profit of hoisting.
    uint64_t profitCap = 1000;
};

/// @brief Move invariant assignments of @p loop to the end of its preheader.
/// @return Number of statements hoisted.
unsigned hoistInvariants(core::Function &fn,
                         const analysis::CFGInfo &cfg,
                         const analysis::Loop &loop,
                         const LoopOptConfig &config);

/// @brief Replace `j = i * c` with a running sum updated after i's increment.
/// @return Number of derived induction variables rewritten.
unsigned strengthReduce(core::Function &fn,
                        const analysis::CFGInfo &cfg,
                        const analysis::Loop &loop);

/// @brief Replace @p loop by straight-line copies of its body.
/// @details Requires a preheader, known bounds, at most
///          LoopOptConfig::unrollBlockLimit blocks and an iteration count of
///          at most LoopOptConfig::unrollTripLimit.
bool unrollLoop(core::Function &fn, const analysis::Loop &loop, const LoopOptConfig &config);

/// @brief Run all loop transforms over @p fn.
bool optimizeLoops(core::Function &fn, const LoopOptConfig &config = {});

void registerLoopOptPass(PassRegistry &registry, const LoopOptConfig *config);

} // namespace mir::transform
