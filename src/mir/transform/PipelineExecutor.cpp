//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/mir/transform/PipelineExecutor.cpp
// Purpose: Bridge registered MIR passes onto the pass driver for one walk
//          over a pipeline.
// Key invariants: Analyses a pass did not preserve are evicted before the
//                 next pass runs.
// Ownership/Lifetime: Pass objects live for a single invocation.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "mir/transform/PipelineExecutor.hpp"

#include "mir/core/Program.hpp"

#include <utility>

using aether::pass::PassStatus;

namespace mir::transform
{

PipelineExecutor::PipelineExecutor(const PassRegistry &registry,
                                   const AnalysisRegistry &analysisRegistry,
                                   Instrumentation instrumentation)
    : registry_(registry), analysisRegistry_(analysisRegistry),
      instrumentation_(std::move(instrumentation))
{
}

/// @brief Execute the supplied pipeline against the program.
/// @details Creates an AnalysisManager for the walk, materialises each pass
///          through the registry and runs it on the program or on every
///          function. A pass whose factory yields nothing reports Failed.
aether::pass::PipelineOutcome PipelineExecutor::run(core::Program &program,
                                                    const std::vector<std::string> &pipeline,
                                                    support::DiagnosticEngine &diags,
                                                    const profile::ProfileData *profile) const
{
    AnalysisManager analysis(program, analysisRegistry_);
    PassContext ctx{analysis, diags, profile};

    aether::pass::PassDriver driver;
    if (instrumentation_.printBefore)
        driver.setPrintBeforeHook(instrumentation_.printBefore);
    if (instrumentation_.printAfter)
        driver.setPrintAfterHook(instrumentation_.printAfter);
    if (instrumentation_.verifyEach)
        driver.setVerifyEachHook(instrumentation_.verifyEach);
    if (instrumentation_.onResult)
        driver.setResultHook(instrumentation_.onResult);

    for (const auto &passId : pipeline)
    {
        driver.registerPass(passId,
                            [this, &program, &analysis, &ctx, passId]() -> PassStatus
                            {
                                const detail::PassFactory *factory = registry_.lookup(passId);
                                if (!factory)
                                    return PassStatus::Failed;

                                switch (factory->kind)
                                {
                                    case detail::PassKind::Program:
                                    {
                                        auto pass = factory->makeProgram ? factory->makeProgram()
                                                                         : nullptr;
                                        if (!pass)
                                            return PassStatus::Failed;
                                        PassResult result = pass->run(program, ctx);
                                        analysis.invalidateAfterProgramPass(result.preserved);
                                        return result.changed ? PassStatus::Changed
                                                              : PassStatus::Unchanged;
                                    }
                                    case detail::PassKind::Function:
                                    {
                                        if (!factory->makeFunction)
                                            return PassStatus::Failed;
                                        bool changed = false;
                                        for (auto &[name, fn] : program.functions)
                                        {
                                            auto pass = factory->makeFunction();
                                            if (!pass)
                                                return PassStatus::Failed;
                                            PassResult result = pass->run(fn, ctx);
                                            analysis.invalidateAfterFunctionPass(result.preserved, fn);
                                            changed |= result.changed;
                                        }
                                        return changed ? PassStatus::Changed : PassStatus::Unchanged;
                                    }
                                }
                                return PassStatus::Failed;
                            });
    }

    return driver.runPipeline(pipeline);
}

} // namespace mir::transform
