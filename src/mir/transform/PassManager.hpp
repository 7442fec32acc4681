//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the PassManager, the entry point of the MIR optimizer.
// It owns the pass and analysis registries, the tuning knobs of the
// individual passes and the named pipeline presets. Running a pipeline walks
// it repeatedly until no pass reports a change or the configured iteration
// bound is reached.
//
// Presets:
//   default         constant folding, dead code elimination, CSE
//   advanced        default plus inlining, interprocedural optimization,
//                   loop optimization and vectorization
//   whole-program   whole-program optimization followed by advanced
//   profile-guided  profile application followed by advanced (alias: pgo)
//
// The pass registrations capture pointers to the configuration members, so a
// PassManager is neither copyable nor movable.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "mir/core/fwd.hpp"
#include "mir/transform/AnalysisManager.hpp"
#include "mir/transform/Inline.hpp"
#include "mir/transform/LoopOpt.hpp"
#include "mir/transform/PassRegistry.hpp"
#include "mir/transform/ProfileGuided.hpp"
#include "mir/transform/Vectorize.hpp"
#include "support/diag_expected.hpp"
#include "support/options.hpp"

#include <iosfwd>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace mir::transform
{

using OptimizerOptions = support::Options;

/// @brief What a pipeline run did to the program.
struct PipelineReport
{
    enum class Status
    {
        Success,
        PartialSuccess,
    };

    /// @brief Rounds over the pipeline that were executed.
    unsigned iterations = 0;

    /// @brief True when any pass changed the program.
    bool changed = false;

    /// @brief True when the last round made no change.
    bool converged = false;

    /// @brief Number of rounds in which each pass reported a change.
    std::map<std::string, unsigned> passChanges;

    /// @brief Distinct warnings reported by passes, in first-seen order.
    std::vector<std::string> warnings;

    std::vector<std::string> notes;

    /// @brief PartialSuccess when some pass reported a warning.
    [[nodiscard]] Status status() const
    {
        return warnings.empty() ? Status::Success : Status::PartialSuccess;
    }
};

const char *toString(PipelineReport::Status status);

class PassManager
{
  public:
    using Pipeline = std::vector<std::string>;

    /// @brief Register the built-in analyses, passes and pipeline presets.
    PassManager();

    PassManager(const PassManager &) = delete;
    PassManager &operator=(const PassManager &) = delete;

    PassRegistry &passes()
    {
        return passRegistry_;
    }

    AnalysisRegistry &analyses()
    {
        return analysisRegistry_;
    }

    InlineConfig &inlineConfig()
    {
        return inlineConfig_;
    }

    LoopOptConfig &loopConfig()
    {
        return loopConfig_;
    }

    VectorizeConfig &vectorizeConfig()
    {
        return vectorizeConfig_;
    }

    ProfileConfig &profileConfig()
    {
        return profileConfig_;
    }

    void registerPipeline(const std::string &id, Pipeline pipeline);

    /// @return Pipeline registered under @p id or nullptr.
    const Pipeline *getPipeline(const std::string &id) const;

    /// @brief Stream receiving IR dumps, verification failures and trace lines.
    void setInstrumentationStream(std::ostream &os)
    {
        instrumentationStream_ = &os;
    }

    /// @brief Run @p pipeline over @p program until it reaches a fixed point.
    /// @details When the pipeline contains the profile-guided pass the profile
    ///          named by options.profilePath is loaded first; a missing path
    ///          or an unreadable file is an error. Unknown pass identifiers,
    ///          failing passes and failed verification are errors as well.
    support::Expected<PipelineReport> run(core::Program &program,
                                          const Pipeline &pipeline,
                                          const OptimizerOptions &options = {}) const;

    /// @brief Run @p pipeline with an already loaded profile.
    /// @param profile Profile handed to the passes; options.profilePath is
    ///        ignored when non-null.
    support::Expected<PipelineReport> run(core::Program &program,
                                          const Pipeline &pipeline,
                                          const OptimizerOptions &options,
                                          const profile::ProfileData *profile) const;

    /// @brief Run the preset registered under @p pipelineId.
    support::Expected<PipelineReport> runPipeline(core::Program &program,
                                                  const std::string &pipelineId,
                                                  const OptimizerOptions &options = {}) const;

  private:
    PassRegistry passRegistry_;
    AnalysisRegistry analysisRegistry_;
    std::unordered_map<std::string, Pipeline> pipelines_;
    InlineConfig inlineConfig_{};
    LoopOptConfig loopConfig_{};
    VectorizeConfig vectorizeConfig_{};
    ProfileConfig profileConfig_{};
    std::ostream *instrumentationStream_ = nullptr;
};

} // namespace mir::transform
