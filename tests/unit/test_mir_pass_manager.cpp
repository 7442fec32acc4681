// File: tests/unit/test_mir_pass_manager.cpp
// Purpose: Exercise the pass driver, the analysis cache and the PassManager
//          presets, fixed-point iteration, profile handling and
//          instrumentation.
// Key invariants: Pipelines stop at the first unknown pass, failing pass or
//                 failed verification; warnings are reported once per run.
// Ownership/Lifetime: Standalone unit test executable; writes profile files
//                     under the GoogleTest temporary directory.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "MirTestPrograms.hpp"
#include "aether/pass/PassDriver.hpp"
#include "mir/analysis/CFG.hpp"
#include "mir/analysis/CallGraph.hpp"
#include "mir/profile/ProfileData.hpp"
#include "mir/transform/AnalysisIDs.hpp"
#include "mir/transform/AnalysisManager.hpp"
#include "mir/transform/PassManager.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

using namespace mir;
using namespace mir::core;
using namespace mir::transform;
using aether::pass::PassDriver;
using aether::pass::PassStatus;
using aether::pass::PipelineOutcome;

namespace
{

/// fn main() -> int { x = Add(2, 3); y = Mul(x, 4); _0 = Add(x, 1); return }
Program makeFoldable()
{
    build::Builder b;
    b.startFunction("main", {}, test::intType());
    LocalId x = b.newLocal(test::intType(), false, "x");
    LocalId y = b.newLocal(test::intType(), false, "y");
    b.assign(Place::of(x), test::binary(BinOp::Add, build::intConst(2), build::intConst(3)));
    b.assign(Place::of(y), test::binary(BinOp::Mul, Operand::copy(x), build::intConst(4)));
    b.assign(Place::of(*b.returnLocal()),
             test::binary(BinOp::Add, Operand::copy(x), build::intConst(1)));
    b.terminate(Terminator::ret());
    return test::single(b.finish());
}

Program makeHotCall()
{
    Program program;
    program.addFunction(test::makeCaller("main", "square", 9));
    program.addFunction(test::makeSquare());
    return program;
}

std::string writeProfile(const std::string &name, const std::string &text)
{
    const std::string path = ::testing::TempDir() + name;
    std::ofstream out(path);
    out << text;
    return path;
}

bool contains(const std::string &haystack, const std::string &needle)
{
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST(PassDriver, RunsHooksAroundEachPass)
{
    std::vector<std::string> events;
    PassDriver driver;
    driver.registerPass("a", [&] { events.push_back("run a"); return PassStatus::Changed; });
    driver.registerPass("b", [&] { events.push_back("run b"); return PassStatus::Unchanged; });
    driver.setPrintBeforeHook([&](std::string_view id) { events.push_back("before " + std::string(id)); });
    driver.setPrintAfterHook([&](std::string_view id) { events.push_back("after " + std::string(id)); });
    driver.setVerifyEachHook([&](std::string_view id)
                             {
                                 events.push_back("verify " + std::string(id));
                                 return true;
                             });

    PipelineOutcome outcome = driver.runPipeline({"a", "b"});
    EXPECT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.changedPasses, 1u);
    EXPECT_EQ(events,
              (std::vector<std::string>{"before a", "run a", "verify a", "after a",
                                        "before b", "run b", "verify b", "after b"}));
}

TEST(PassDriver, StopsAtUnknownFailedOrUnverifiedPass)
{
    PassDriver driver;
    int runs = 0;
    driver.registerPass("ok", [&] { ++runs; return PassStatus::Unchanged; });
    driver.registerPass("bad", [] { return PassStatus::Failed; });

    PipelineOutcome missing = driver.runPipeline({"ok", "missing", "ok"});
    EXPECT_EQ(missing.failure, PipelineOutcome::Failure::UnknownPass);
    EXPECT_EQ(missing.failedPass, "missing");
    EXPECT_EQ(runs, 1);

    std::vector<std::string> results;
    driver.setResultHook([&](std::string_view id, PassStatus) { results.emplace_back(id); });
    PipelineOutcome failed = driver.runPipeline({"bad", "ok"});
    EXPECT_EQ(failed.failure, PipelineOutcome::Failure::PassFailed);
    EXPECT_EQ(results, (std::vector<std::string>{"bad"}));

    driver.setVerifyEachHook([](std::string_view id) { return id != "ok"; });
    PipelineOutcome unverified = driver.runPipeline({"ok"});
    EXPECT_EQ(unverified.failure, PipelineOutcome::Failure::VerifyFailed);
    EXPECT_EQ(unverified.failedPass, "ok");
}

TEST(MirAnalysisManager, CachesUntilInvalidated)
{
    PassManager pm;
    Program program = test::single(test::makeSumLoop("sum", 4));
    Function &fn = *program.findFunction("sum");
    AnalysisManager am(program, pm.analyses());

    auto &cfg = am.getFunctionResult<analysis::CFGInfo>(kAnalysisCFG, fn);
    EXPECT_EQ(cfg.reversePostOrder().front(), fn.entry);
    am.getFunctionResult<analysis::CFGInfo>(kAnalysisCFG, fn);
    am.getProgramResult<analysis::CallGraph>(kAnalysisCallGraph);
    am.getProgramResult<analysis::CallGraph>(kAnalysisCallGraph);
    EXPECT_EQ(am.counts().functionComputations, 1u);
    EXPECT_EQ(am.counts().programComputations, 1u);

    am.invalidateAfterFunctionPass(PreservedAnalyses::all(), fn);
    am.getFunctionResult<analysis::CFGInfo>(kAnalysisCFG, fn);
    EXPECT_EQ(am.counts().functionComputations, 1u);

    am.invalidateAfterFunctionPass(PreservedAnalyses::none().preserveFunction(kAnalysisCFG), fn);
    am.getFunctionResult<analysis::CFGInfo>(kAnalysisCFG, fn);
    am.getProgramResult<analysis::CallGraph>(kAnalysisCallGraph);
    EXPECT_EQ(am.counts().functionComputations, 1u);
    EXPECT_EQ(am.counts().programComputations, 2u);

    am.invalidateAfterProgramPass(PreservedAnalyses::none().preserveProgram(kAnalysisCallGraph));
    am.getFunctionResult<analysis::CFGInfo>(kAnalysisCFG, fn);
    am.getProgramResult<analysis::CallGraph>(kAnalysisCallGraph);
    EXPECT_EQ(am.counts().functionComputations, 2u);
    EXPECT_EQ(am.counts().programComputations, 2u);
}

TEST(MirPassManager, DefaultPipelineReachesFixedPoint)
{
    PassManager pm;
    Program program = makeFoldable();

    auto report = pm.runPipeline(program, "default");
    ASSERT_TRUE(report);
    EXPECT_TRUE(report.value().changed);
    EXPECT_TRUE(report.value().converged);
    EXPECT_GE(report.value().iterations, 2u);
    EXPECT_GE(report.value().passChanges.at("constant-folding"), 1u);
    EXPECT_EQ(report.value().status(), PipelineReport::Status::Success);
    EXPECT_EQ(test::evaluateInt(program, "main"), Int128(6));

    auto again = pm.runPipeline(program, "default");
    ASSERT_TRUE(again);
    EXPECT_FALSE(again.value().changed);
    EXPECT_TRUE(again.value().converged);
    EXPECT_EQ(again.value().iterations, 1u);
}

TEST(MirPassManager, IterationBound)
{
    PassManager pm;
    OptimizerOptions options;
    options.maxIterations = 1;
    Program program = makeFoldable();
    auto report = pm.runPipeline(program, "default", options);
    ASSERT_TRUE(report);
    EXPECT_EQ(report.value().iterations, 1u);
    EXPECT_TRUE(report.value().changed);
    EXPECT_FALSE(report.value().converged);

    options.maxIterations = 0;
    auto rejected = pm.runPipeline(program, "default", options);
    ASSERT_FALSE(rejected);
    EXPECT_EQ(rejected.error().message, "maxIterations must be at least 1");
}

TEST(MirPassManager, UnknownPipelineAndPass)
{
    PassManager pm;
    Program program = makeFoldable();

    auto pipeline = pm.runPipeline(program, "turbo");
    ASSERT_FALSE(pipeline);
    EXPECT_EQ(pipeline.error().message, "unknown pipeline 'turbo'");

    auto pass = pm.run(program, {"constant-folding", "bogus"});
    ASSERT_FALSE(pass);
    EXPECT_EQ(pass.error().message, "unknown pass 'bogus'");
    EXPECT_EQ(test::evaluateInt(program, "main"), Int128(6));
}

TEST(MirPassManager, ProfileGuidedPipelineNeedsProfile)
{
    PassManager pm;
    Program program = makeHotCall();

    auto noPath = pm.runPipeline(program, "pgo");
    ASSERT_FALSE(noPath);
    EXPECT_EQ(noPath.error().message, "profile-guided optimization requires a profile data file");

    OptimizerOptions options;
    options.profilePath = ::testing::TempDir() + "missing/aether.prof";
    auto unreadable = pm.runPipeline(program, "profile-guided", options);
    ASSERT_FALSE(unreadable);
    EXPECT_TRUE(contains(unreadable.error().message, "cannot open profile data file"));
}

TEST(MirPassManager, ProfileGuidedPipelineReportsWarningsOnce)
{
    PassManager pm;
    Program program = makeHotCall();
    OptimizerOptions options;
    options.profilePath = writeProfile("aether_pgo_pipeline.prof",
                                       "FUNC:main:100\n"
                                       "FUNC:square:5000\n"
                                       "FUNC:ghost:1\n"
                                       "CALL:main:square:95\n");

    auto report = pm.runPipeline(program, "pgo", options);
    ASSERT_TRUE(report);
    // Later rounds also warn about 'square' once it has been inlined and removed.
    const auto &warnings = report.value().warnings;
    ASSERT_FALSE(warnings.empty());
    EXPECT_EQ(warnings.front(), "profile-guided: unknown function 'ghost'");
    EXPECT_EQ(std::count(warnings.begin(), warnings.end(), warnings.front()), 1);
    EXPECT_EQ(report.value().status(), PipelineReport::Status::PartialSuccess);
    EXPECT_STREQ(toString(report.value().status()), "partial-success");
    EXPECT_EQ(test::evaluateInt(program, "main"), Int128(81));
}

TEST(MirPassManager, ProfileGuidedPassWithoutDataIsSkipped)
{
    PassManager pm;
    Program program = makeHotCall();
    auto report = pm.run(program, {"profile-guided"}, OptimizerOptions{}, nullptr);
    ASSERT_TRUE(report);
    EXPECT_FALSE(report.value().changed);
    EXPECT_EQ(report.value().warnings,
              (std::vector<std::string>{"profile-guided: no profile data loaded; pass skipped"}));
}

TEST(MirPassManager, VerificationFailureNamesThePass)
{
    PassManager pm;
    pm.passes().registerFunctionPass("break-ir",
                                     std::function<bool(Function &)>(
                                         [](Function &fn)
                                         {
                                             fn.blocks.front().terminator = Terminator::gotoBlock(77);
                                             return true;
                                         }));
    std::ostringstream log;
    pm.setInstrumentationStream(log);

    Program program = makeFoldable();
    auto report = pm.run(program, {"constant-folding", "break-ir"});
    ASSERT_FALSE(report);
    EXPECT_EQ(report.error().message.rfind("validation failed after pass 'break-ir': ", 0), 0u);
    EXPECT_TRUE(contains(log.str(), "verification failed after pass 'break-ir'"));

    OptimizerOptions lenient;
    lenient.verify = false;
    lenient.maxIterations = 1;
    Program unchecked = makeFoldable();
    EXPECT_TRUE(pm.run(unchecked, {"break-ir"}, lenient));
}

TEST(MirPassManager, TraceAndDumpsGoToInstrumentationStream)
{
    PassManager pm;
    std::ostringstream log;
    pm.setInstrumentationStream(log);
    OptimizerOptions options;
    options.trace = true;
    options.printBefore = true;
    options.printAfter = true;

    Program program = makeFoldable();
    ASSERT_TRUE(pm.runPipeline(program, "default", options));
    const std::string text = log.str();
    EXPECT_TRUE(contains(text, "[mir-opt] pass 'constant-folding' changed=1"));
    EXPECT_TRUE(contains(text, "[mir-opt] pass 'common-subexpression-elimination' changed="));
    EXPECT_TRUE(contains(text, "*** MIR before pass 'constant-folding' ***"));
    EXPECT_TRUE(contains(text, "*** MIR after pass 'dead-code-elimination' ***"));
    EXPECT_TRUE(contains(text, "fn main"));
}

TEST(MirPassManager, AdvancedPipelinePreservesResultsAndDropsDeadCode)
{
    PassManager pm;
    Program program;
    program.addFunction(test::makeCaller("main", "square", 7));
    program.addFunction(test::makeSquare());
    program.addFunction(test::makeConstant("dead", 1));

    auto report = pm.runPipeline(program, "advanced");
    ASSERT_TRUE(report);
    EXPECT_TRUE(report.value().changed);
    EXPECT_EQ(program.findFunction("dead"), nullptr);
    EXPECT_EQ(test::evaluateInt(program, "main"), Int128(49));
}

TEST(MirPassManager, WholeProgramPipelinePreservesLoopResult)
{
    PassManager pm;
    Program program = test::single(test::makeSumLoop("main", 10));
    auto report = pm.runPipeline(program, "whole-program");
    ASSERT_TRUE(report);
    EXPECT_EQ(test::evaluateInt(program, "main"), Int128(45));
}
