//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/aether/pass/PassDriver.hpp
// Purpose: Declare the instrumentation-friendly pass sequencing facade.
// Key invariants: Pass callbacks are invoked in pipeline order; instrumentation
// hooks run around each pass invocation when provided.
// Ownership/Lifetime: The driver stores pass callbacks by value and does not own
// the IR they capture. Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace aether::pass
{

/// @brief What a pass callback reports back to the driver.
enum class PassStatus
{
    Unchanged,
    Changed,
    Failed,
};

/// @brief Summary of one walk over a pipeline.
struct PipelineOutcome
{
    enum class Failure
    {
        None,
        UnknownPass,
        PassFailed,
        VerifyFailed,
    };

    Failure failure = Failure::None;

    /// @brief Identifier of the pass that stopped the pipeline.
    std::string failedPass;

    /// @brief Number of passes that reported PassStatus::Changed.
    unsigned changedPasses = 0;

    [[nodiscard]] bool ok() const
    {
        return failure == Failure::None;
    }
};

/// @brief Maps pass identifiers to callbacks and sequences them.
/// @details The MIR pipeline executor registers one callback per pipeline
///          entry that captures the program and the analysis cache, then
///          lets the driver handle ordering and instrumentation.
class PassDriver
{
  public:
    /// @brief Ordered list of pass identifiers forming a pipeline.
    using Pipeline = std::vector<std::string>;

    /// @brief Callback type invoked to run an individual pass.
    using PassCallback = std::function<PassStatus()>;

    /// @brief Instrumentation hook executed before or after a pass.
    using PrintHook = std::function<void(std::string_view id)>;

    /// @brief Hook used to verify state after each pass.
    /// @return @c true when verification succeeds.
    using VerifyHook = std::function<bool(std::string_view id)>;

    /// @brief Hook notified with the status of every pass that ran.
    using ResultHook = std::function<void(std::string_view id, PassStatus status)>;

    /// @brief Register or replace the callback associated with @p id.
    void registerPass(std::string id, PassCallback callback);

    void setPrintBeforeHook(PrintHook hook);

    void setPrintAfterHook(PrintHook hook);

    void setVerifyEachHook(VerifyHook hook);

    void setResultHook(ResultHook hook);

    /// @brief Execute @p pipeline, invoking instrumentation hooks when present.
    /// @return Outcome naming the failing pass when the pipeline stopped early.
    PipelineOutcome runPipeline(const Pipeline &pipeline) const;

  private:
    std::unordered_map<std::string, PassCallback> passes_;
    PrintHook printBefore_{};
    PrintHook printAfter_{};
    VerifyHook verifyEach_{};
    ResultHook onResult_{};
};

} // namespace aether::pass
