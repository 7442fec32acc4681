// File: tests/unit/test_mir_callgraph.cpp
// Purpose: Exercise call-graph construction, SCC ordering and the
//          per-function effect summaries built on top of it.
// Key invariants: Callee components precede callers; effects of callees flow
//                 into their callers.
// Ownership/Lifetime: Standalone unit test executable.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "MirTestPrograms.hpp"
#include "mir/analysis/CallGraph.hpp"
#include "mir/analysis/EffectSummary.hpp"

#include <algorithm>

using namespace mir;
using namespace mir::core;
using analysis::CallGraph;

namespace
{

/// fn logger() { call puts(1) -> bb1; bb1: return }
Function makeLogger(const std::string &name)
{
    build::Builder b;
    b.startFunction(name, {}, Type(Type::Kind::Void));
    BlockId done = b.newBlock();
    b.terminate(test::callTerm("puts", {build::intConst(1)}, std::nullopt, done));
    b.switchTo(done);
    b.terminate(Terminator::ret());
    return b.finish();
}

void addPuts(Program &program)
{
    ExternalFunction puts;
    puts.name = "puts";
    puts.params = {test::intType()};
    puts.returnType = Type(Type::Kind::Void);
    program.externalFunctions.emplace(puts.name, puts);
}

size_t position(const std::vector<std::string> &order, const std::string &name)
{
    return static_cast<size_t>(std::find(order.begin(), order.end(), name) - order.begin());
}

} // namespace

TEST(MirCallGraph, EdgesAndSites)
{
    Program program;
    program.addFunction(test::makeCaller("main", "square", 3));
    program.addFunction(test::makeCaller("other", "square", 4));
    program.addFunction(test::makeSquare());
    CallGraph cg = CallGraph::build(program);

    EXPECT_EQ(cg.callees("main"), (std::set<std::string>{"square"}));
    EXPECT_EQ(cg.callers("square"), (std::set<std::string>{"main", "other"}));
    EXPECT_TRUE(cg.callers("main").empty());
    EXPECT_TRUE(cg.callees("nobody").empty());
    EXPECT_EQ(cg.callSiteCount("square"), 2u);
    EXPECT_EQ(cg.callSiteCount("main"), 0u);
    EXPECT_EQ(cg.indirectCallCount(), 0u);

    auto sites = cg.callSitesOf("square");
    ASSERT_EQ(sites.size(), 2u);
    EXPECT_EQ(sites[0].caller, "main");
    EXPECT_EQ(sites[0].block, 0u);
    EXPECT_FALSE(sites[0].statement.has_value());
}

TEST(MirCallGraph, CalleesComeFirstInTopologicalOrder)
{
    Program program;
    program.addFunction(test::makeCaller("main", "square", 3));
    program.addFunction(test::makeSquare());
    CallGraph cg = CallGraph::build(program);

    const auto &topo = cg.topoOrder();
    ASSERT_EQ(topo.size(), 2u);
    EXPECT_LT(position(topo, "square"), position(topo, "main"));
    EXPECT_LT(*cg.sccIndex("square"), *cg.sccIndex("main"));
    EXPECT_FALSE(cg.isRecursive("main"));
}

TEST(MirCallGraph, MutualRecursionSharesAComponent)
{
    Program program;
    program.addFunction(test::makeCaller("ping", "pong", 1));
    program.addFunction(test::makeCaller("pong", "ping", 1));
    program.addFunction(test::makeCaller("self", "self", 1));
    program.addFunction(test::makeCaller("main", "ping", 0));
    CallGraph cg = CallGraph::build(program);

    EXPECT_TRUE(cg.isRecursive("ping"));
    EXPECT_TRUE(cg.isRecursive("pong"));
    EXPECT_TRUE(cg.isRecursive("self"));
    EXPECT_FALSE(cg.isRecursive("main"));
    EXPECT_EQ(cg.sccIndex("ping"), cg.sccIndex("pong"));
    EXPECT_EQ(cg.sccs()[*cg.sccIndex("ping")], (std::vector<std::string>{"ping", "pong"}));

    const auto &topo = cg.topoOrder();
    EXPECT_LT(position(topo, "pong"), position(topo, "main"));
    EXPECT_EQ(cg.reachableFrom({"main"}), (std::set<std::string>{"main", "ping", "pong"}));
}

TEST(MirCallGraph, IndirectCallsAreCounted)
{
    Function fn = test::makeCaller("main", "square", 1);
    std::get<term::Call>(fn.blocks[0].terminator.kind).func = Operand::copy(1);
    Program program = test::single(std::move(fn));
    CallGraph cg = CallGraph::build(program);
    EXPECT_EQ(cg.indirectCallCount(), 1u);
    EXPECT_TRUE(cg.callSites().empty());
}

TEST(MirEffects, StraightLineArithmeticIsPure)
{
    Program program;
    program.addFunction(test::makeCaller("main", "square", 3));
    program.addFunction(test::makeSquare());
    auto summaries = analysis::computeSummaries(program, CallGraph::build(program));

    EXPECT_TRUE(summaries.at("square").isPure());
    EXPECT_TRUE(summaries.at("main").isPure());
    EXPECT_TRUE(summaries.at("main").effects.callsFunctions);
    EXPECT_EQ(summaries.at("main").calls, (std::set<std::string>{"square"}));
}

TEST(MirEffects, ExternalCallsPropagateToCallers)
{
    Program program;
    addPuts(program);
    program.addFunction(makeLogger("log"));
    program.addFunction(test::makeCaller("main", "log", 0));
    auto summaries = analysis::computeSummaries(program, CallGraph::build(program));

    EXPECT_TRUE(summaries.at("log").effects.performsIo);
    EXPECT_FALSE(summaries.at("log").isPure());
    EXPECT_TRUE(summaries.at("main").effects.performsIo);
    EXPECT_FALSE(summaries.at("main").isPure());
}

TEST(MirEffects, LoopsAndRecursionMayNotTerminate)
{
    Program program;
    program.addFunction(test::makeSumLoop("loop", 4));
    program.addFunction(test::makeCaller("self", "self", 1));
    program.addFunction(test::makeCaller("main", "loop", 0));
    auto summaries = analysis::computeSummaries(program, CallGraph::build(program));

    EXPECT_TRUE(summaries.at("loop").mayNotTerminate);
    EXPECT_TRUE(summaries.at("self").isRecursive);
    EXPECT_TRUE(summaries.at("self").mayNotTerminate);
    EXPECT_TRUE(summaries.at("main").mayNotTerminate);
    EXPECT_FALSE(summaries.at("main").isPure());
}

TEST(MirEffects, GlobalReadsAndEscapingParameters)
{
    Program program;
    program.constants.emplace("LIMIT", Constant::integer(10));

    build::Builder b;
    b.startFunction("leak", {{"p", test::intType()}}, test::intType());
    LocalId limit = b.newLocal(test::intType());
    BlockId done = b.newBlock();
    b.assign(Place::of(limit), test::callRvalue("LIMIT", {}));
    b.terminate(test::callTerm("square", {Operand::copy(b.param(0))}, Place::of(*b.returnLocal()), done));
    b.switchTo(done);
    b.terminate(Terminator::ret());
    program.addFunction(b.finish());
    program.addFunction(test::makeSquare());

    auto summaries = analysis::computeSummaries(program, CallGraph::build(program));
    const auto &leak = summaries.at("leak");
    EXPECT_EQ(leak.readsGlobals, (std::set<std::string>{"LIMIT"}));
    EXPECT_EQ(leak.escapingParameters, (std::set<size_t>{0}));
    EXPECT_EQ(leak.calls, (std::set<std::string>{"square"}));
}

TEST(MirEffects, GlobalReadsPropagateToCallers)
{
    Program program;
    program.constants.emplace("LIMIT", Constant::integer(10));

    build::Builder b;
    b.startFunction("limit", {{"x", test::intType()}}, test::intType());
    b.assign(Place::of(*b.returnLocal()), test::callRvalue("LIMIT", {}));
    b.terminate(Terminator::ret());
    program.addFunction(b.finish());
    program.addFunction(test::makeCaller("main", "limit", 0));

    auto summaries = analysis::computeSummaries(program, CallGraph::build(program));
    EXPECT_EQ(summaries.at("limit").readsGlobals, (std::set<std::string>{"LIMIT"}));
    EXPECT_EQ(summaries.at("main").readsGlobals, (std::set<std::string>{"LIMIT"}));
    EXPECT_TRUE(summaries.at("limit").isPure());
    EXPECT_TRUE(summaries.at("main").isPure());
}
