//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/options.hpp
// Purpose: Declares the settings that drive an optimizer run.
// Key invariants: maxIterations >= 1 for a pipeline to make progress.
// Ownership/Lifetime: Caller owns option values.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>

namespace mir::support
{

/// @brief Global settings that influence a pipeline run.
/// @invariant Flags are independent booleans.
struct Options
{
    /// @brief Enable per-pass trace lines on the instrumentation stream.
    bool trace = false;

    /// @brief Run the MIR validator after every pass.
    bool verify = true;

    /// @brief Dump the IR before each pass.
    bool printBefore = false;

    /// @brief Dump the IR after each pass.
    bool printAfter = false;

    /// @brief Upper bound on fixed-point rounds over the pipeline.
    unsigned maxIterations = 10;

    /// @brief Profile file consumed by the profile-guided pipeline.
    std::string profilePath;
};

} // namespace mir::support
