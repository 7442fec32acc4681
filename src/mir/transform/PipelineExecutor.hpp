//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the PipelineExecutor, which performs one walk over a
// MIR pass pipeline. The executor resolves pass identifiers through the
// PassRegistry, instantiates program and function passes, runs them with a
// shared AnalysisManager and invalidates cached analyses according to what
// each pass reports as preserved.
//
// Function passes visit the program's functions in name order. Sequencing
// and the instrumentation hooks (print before/after, verify, result) are
// delegated to aether::pass::PassDriver.
//
// The executor only borrows the registries; the PassManager owns them and
// drives repeated walks until the pipeline reaches a fixed point.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "aether/pass/PassDriver.hpp"
#include "mir/core/fwd.hpp"
#include "mir/transform/AnalysisManager.hpp"
#include "mir/transform/PassRegistry.hpp"

#include <string>
#include <vector>

namespace mir::transform
{

class PipelineExecutor
{
  public:
    /// @brief Hooks forwarded to the pass driver.
    struct Instrumentation
    {
        aether::pass::PassDriver::PrintHook printBefore;
        aether::pass::PassDriver::PrintHook printAfter;
        aether::pass::PassDriver::VerifyHook verifyEach;
        aether::pass::PassDriver::ResultHook onResult;
    };

    PipelineExecutor(const PassRegistry &registry,
                     const AnalysisRegistry &analysisRegistry,
                     Instrumentation instrumentation);

    /// @brief Run every pass of @p pipeline once over @p program.
    /// @param diags Receives the notes and warnings passes emit.
    /// @param profile Profile data handed to passes, may be null.
    aether::pass::PipelineOutcome run(core::Program &program,
                                      const std::vector<std::string> &pipeline,
                                      support::DiagnosticEngine &diags,
                                      const profile::ProfileData *profile = nullptr) const;

  private:
    const PassRegistry &registry_;
    const AnalysisRegistry &analysisRegistry_;
    Instrumentation instrumentation_;
};

} // namespace mir::transform
