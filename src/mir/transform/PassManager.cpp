//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the PassManager: analysis and pass registration, pipeline
// presets, profile loading and the fixed-point loop over a pipeline. One
// round is delegated to PipelineExecutor; this file wires the IR dumps,
// verification and trace output into its instrumentation hooks.
//
//===----------------------------------------------------------------------===//

#include "mir/transform/PassManager.hpp"

#include "mir/analysis/CFG.hpp"
#include "mir/analysis/CallGraph.hpp"
#include "mir/analysis/Dominators.hpp"
#include "mir/analysis/EffectSummary.hpp"
#include "mir/analysis/LoopInfo.hpp"
#include "mir/core/Program.hpp"
#include "mir/dataflow/Liveness.hpp"
#include "mir/io/Printer.hpp"
#include "mir/profile/ProfileData.hpp"
#include "mir/transform/AnalysisIDs.hpp"
#include "mir/transform/CSE.hpp"
#include "mir/transform/ConstFold.hpp"
#include "mir/transform/DCE.hpp"
#include "mir/transform/Interprocedural.hpp"
#include "mir/transform/PipelineExecutor.hpp"
#include "mir/transform/WholeProgram.hpp"
#include "mir/verify/Validator.hpp"
#include "support/trace.hpp"

#include <algorithm>
#include <iostream>
#include <optional>
#include <set>
#include <utility>

using aether::pass::PassStatus;
using aether::pass::PipelineOutcome;

namespace mir::transform
{

namespace
{

constexpr const char *kProfileGuidedPass = "profile-guided";

/// @brief Turns tracing on for the lifetime of a run and restores it after.
class TraceScope
{
  public:
    explicit TraceScope(bool enable) : previous_(support::traceEnabled())
    {
        if (enable)
            support::setTraceEnabled(true);
    }

    ~TraceScope()
    {
        support::setTraceEnabled(previous_);
    }

    TraceScope(const TraceScope &) = delete;
    TraceScope &operator=(const TraceScope &) = delete;

  private:
    bool previous_;
};

void appendUnique(std::vector<std::string> &list, std::set<std::string> &seen, const std::string &s)
{
    if (seen.insert(s).second)
        list.push_back(s);
}

} // namespace

const char *toString(PipelineReport::Status status)
{
    switch (status)
    {
        case PipelineReport::Status::Success:
            return "success";
        case PipelineReport::Status::PartialSuccess:
            return "partial-success";
    }
    return "success";
}

/// @brief Construct a pass manager with the built-in analyses and passes.
/// @details Function analyses cover the CFG, dominators, natural loops and
///          liveness; program analyses cover the call graph and the effect
///          summaries. Every optimization pass is registered against the
///          configuration members so that tuning applies to later runs.
PassManager::PassManager()
{
    analysisRegistry_.registerFunctionAnalysis<analysis::CFGInfo>(
        kAnalysisCFG, [](core::Program &, core::Function &fn) { return analysis::CFGInfo(fn); });
    analysisRegistry_.registerFunctionAnalysis<analysis::DomTree>(
        kAnalysisDominators,
        [](core::Program &, core::Function &fn) { return analysis::computeDominatorTree(fn); });
    analysisRegistry_.registerFunctionAnalysis<analysis::LoopForest>(
        kAnalysisLoops,
        [](core::Program &, core::Function &fn) { return analysis::LoopForest::compute(fn); });
    analysisRegistry_.registerFunctionAnalysis<dataflow::LivenessResult>(
        kAnalysisLiveness,
        [](core::Program &, core::Function &fn) { return dataflow::LivenessResult(fn); });
    analysisRegistry_.registerProgramAnalysis<analysis::CallGraph>(
        kAnalysisCallGraph,
        [](core::Program &program) { return analysis::CallGraph::build(program); });
    analysisRegistry_.registerProgramAnalysis<analysis::SummaryMap>(
        kAnalysisEffects,
        [](core::Program &program)
        { return analysis::computeSummaries(program, analysis::CallGraph::build(program)); });

    registerConstFoldPass(passRegistry_);
    registerDCEPass(passRegistry_);
    registerCSEPass(passRegistry_);
    registerInlinePass(passRegistry_, &inlineConfig_);
    registerInterproceduralPass(passRegistry_);
    registerLoopOptPass(passRegistry_, &loopConfig_);
    registerVectorizePass(passRegistry_, &vectorizeConfig_);
    registerWholeProgramPass(passRegistry_);
    registerProfileGuidedPass(passRegistry_, &profileConfig_);

    Pipeline basic = {"constant-folding", "dead-code-elimination", "common-subexpression-elimination"};
    Pipeline advanced = {"inlining",
                         "interprocedural",
                         "constant-folding",
                         "common-subexpression-elimination",
                         "loop-optimization",
                         "vectorization",
                         "dead-code-elimination"};
    Pipeline wholeProgram = advanced;
    wholeProgram.insert(wholeProgram.begin(), "whole-program");
    Pipeline profileGuided = advanced;
    profileGuided.insert(profileGuided.begin(), kProfileGuidedPass);

    registerPipeline("default", std::move(basic));
    registerPipeline("advanced", std::move(advanced));
    registerPipeline("whole-program", std::move(wholeProgram));
    registerPipeline("pgo", profileGuided);
    registerPipeline("profile-guided", std::move(profileGuided));

    instrumentationStream_ = &std::cerr;
}

void PassManager::registerPipeline(const std::string &id, Pipeline pipeline)
{
    pipelines_[id] = std::move(pipeline);
}

const PassManager::Pipeline *PassManager::getPipeline(const std::string &id) const
{
    auto it = pipelines_.find(id);
    if (it == pipelines_.end())
        return nullptr;
    return &it->second;
}

support::Expected<PipelineReport> PassManager::run(core::Program &program,
                                                   const Pipeline &pipeline,
                                                   const OptimizerOptions &options) const
{
    const bool needsProfile =
        std::find(pipeline.begin(), pipeline.end(), kProfileGuidedPass) != pipeline.end();
    if (!needsProfile)
        return run(program, pipeline, options, nullptr);

    if (options.profilePath.empty())
        return support::makeError("profile-guided optimization requires a profile data file");
    auto loaded = profile::ProfileData::loadFile(options.profilePath);
    if (!loaded)
        return loaded.error();
    return run(program, pipeline, options, &loaded.value());
}

/// @brief Iterate @p pipeline over @p program until it stops changing.
/// @details Each round runs every pass once. Verification failures are
///          reported on the instrumentation stream and abort the run with
///          the validator's message. Warnings and notes collected from all
///          rounds are deduplicated into the report.
support::Expected<PipelineReport> PassManager::run(core::Program &program,
                                                   const Pipeline &pipeline,
                                                   const OptimizerOptions &options,
                                                   const profile::ProfileData *profile) const
{
    for (const auto &id : pipeline)
        if (!passRegistry_.lookup(id))
            return support::makeError("unknown pass '" + id + "'");
    if (options.maxIterations == 0)
        return support::makeError("maxIterations must be at least 1");

    TraceScope trace(options.trace);
    std::ostream &out = instrumentationStream_ ? *instrumentationStream_ : std::cerr;

    PipelineReport report;
    std::optional<std::string> verifyMessage;

    PipelineExecutor::Instrumentation instrumentation;
    if (options.printBefore)
    {
        instrumentation.printBefore = [&](std::string_view id)
        {
            out << "*** MIR before pass '" << id << "' ***\n";
            io::Printer::write(program, out);
        };
    }
    if (options.printAfter)
    {
        instrumentation.printAfter = [&](std::string_view id)
        {
            out << "*** MIR after pass '" << id << "' ***\n";
            io::Printer::write(program, out);
        };
    }
    if (options.verify)
    {
        instrumentation.verifyEach = [&](std::string_view id)
        {
            auto result = verify::Validator::verify(program);
            if (result)
                return true;
            out << "verification failed after pass '" << id << "'\n";
            support::printDiag(result.error(), out);
            verifyMessage = result.error().message;
            return false;
        };
    }
    instrumentation.onResult = [&](std::string_view id, PassStatus status)
    {
        const bool changed = status == PassStatus::Changed;
        if (changed)
            ++report.passChanges[std::string(id)];
        if (options.trace)
            out << "[mir-opt] pass '" << id << "' changed=" << (changed ? 1 : 0) << '\n';
    };

    PipelineExecutor executor(passRegistry_, analysisRegistry_, std::move(instrumentation));
    support::DiagnosticEngine diags;

    for (unsigned round = 1; round <= options.maxIterations; ++round)
    {
        PipelineOutcome outcome = executor.run(program, pipeline, diags, profile);
        report.iterations = round;
        switch (outcome.failure)
        {
            case PipelineOutcome::Failure::None:
                break;
            case PipelineOutcome::Failure::UnknownPass:
                return support::makeError("unknown pass '" + outcome.failedPass + "'");
            case PipelineOutcome::Failure::PassFailed:
                return support::makeError("pass '" + outcome.failedPass + "' failed");
            case PipelineOutcome::Failure::VerifyFailed:
                return support::makeError("validation failed after pass '" + outcome.failedPass +
                                          "': " + verifyMessage.value_or("malformed MIR"));
        }
        if (outcome.changedPasses == 0)
        {
            report.converged = true;
            break;
        }
        report.changed = true;
    }

    std::set<std::string> seenWarnings;
    std::set<std::string> seenNotes;
    for (const auto &d : diags.diagnostics())
    {
        if (d.severity == support::Severity::Warning)
            appendUnique(report.warnings, seenWarnings, d.message);
        else if (d.severity == support::Severity::Note)
            appendUnique(report.notes, seenNotes, d.message);
    }
    return report;
}

support::Expected<PipelineReport> PassManager::runPipeline(core::Program &program,
                                                           const std::string &pipelineId,
                                                           const OptimizerOptions &options) const
{
    const Pipeline *pipeline = getPipeline(pipelineId);
    if (!pipeline)
        return support::makeError("unknown pipeline '" + pipelineId + "'");
    return run(program, *pipeline, options);
}

} // namespace mir::transform
