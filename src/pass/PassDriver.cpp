//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/pass/PassDriver.cpp
// Purpose: Define the pass sequencing facade used by the MIR pipeline.
// Key invariants: Pipelines execute in the order provided by the caller and stop
//                 at the first missing pass, failing pass or failed verification.
// Ownership/Lifetime: Owns pass callbacks and instrumentation hooks by value;
//                     callers retain ownership of any captured state.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements the instrumentation-friendly pass driver.

#include "aether/pass/PassDriver.hpp"

#include <utility>

namespace aether::pass
{

/// @brief Register a pass implementation under a unique identifier.
/// @details Re-registering an identifier replaces the existing callback, which
///          lets tests override a single pass in isolation.
void PassDriver::registerPass(std::string id, PassCallback callback)
{
    passes_[std::move(id)] = std::move(callback);
}

void PassDriver::setPrintBeforeHook(PrintHook hook)
{
    printBefore_ = std::move(hook);
}

/// @brief Install instrumentation invoked after each pass successfully runs.
/// @details The hook does not fire for a pass that failed.
void PassDriver::setPrintAfterHook(PrintHook hook)
{
    printAfter_ = std::move(hook);
}

/// @brief Install a verifier hook that runs after each pass completes.
/// @details Returning @c false from the hook terminates the pipeline.
void PassDriver::setVerifyEachHook(VerifyHook hook)
{
    verifyEach_ = std::move(hook);
}

void PassDriver::setResultHook(ResultHook hook)
{
    onResult_ = std::move(hook);
}

/// @brief Execute the passes referenced by @p pipeline in order.
/// @details For each identifier the driver invokes the print-before hook, the
///          registered pass, the result hook, the optional verifier and finally
///          the print-after hook.
PipelineOutcome PassDriver::runPipeline(const Pipeline &pipeline) const
{
    PipelineOutcome outcome;
    for (const auto &passId : pipeline)
    {
        auto it = passes_.find(passId);
        if (it == passes_.end())
        {
            outcome.failure = PipelineOutcome::Failure::UnknownPass;
            outcome.failedPass = passId;
            return outcome;
        }

        if (printBefore_)
            printBefore_(passId);

        PassStatus status = it->second();
        if (onResult_)
            onResult_(passId, status);
        if (status == PassStatus::Failed)
        {
            outcome.failure = PipelineOutcome::Failure::PassFailed;
            outcome.failedPass = passId;
            return outcome;
        }
        if (status == PassStatus::Changed)
            ++outcome.changedPasses;

        if (verifyEach_ && !verifyEach_(passId))
        {
            outcome.failure = PipelineOutcome::Failure::VerifyFailed;
            outcome.failedPass = passId;
            return outcome;
        }

        if (printAfter_)
            printAfter_(passId);
    }
    return outcome;
}

} // namespace aether::pass
