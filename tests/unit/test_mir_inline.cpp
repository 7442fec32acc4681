// File: tests/unit/test_mir_inline.cpp
// Purpose: Check the inline cost model and call-site splicing for both call
//          forms.
// Key invariants: Inlining preserves the value computed by the caller;
//                 recursive and oversized callees are left alone.
// Ownership/Lifetime: Standalone unit test executable.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "MirTestPrograms.hpp"
#include "mir/analysis/CallGraph.hpp"
#include "mir/transform/Inline.hpp"
#include "mir/verify/Validator.hpp"
#include "support/diagnostics.hpp"

using namespace mir;
using namespace mir::core;
using namespace mir::transform;

namespace
{

bool hasCalls(const Function &fn)
{
    for (const auto &bb : fn.blocks)
    {
        if (std::holds_alternative<term::Call>(bb.terminator.kind))
            return true;
        for (const auto &s : bb.statements)
            if (const auto *a = s.asAssign())
                if (std::holds_alternative<rv::Call>(a->rvalue))
                    return true;
    }
    return false;
}

/// fn main() -> int { r = square(3); _0 = Add(r, 1); return }
Function makeStatementCaller()
{
    build::Builder b;
    b.startFunction("main", {}, test::intType());
    LocalId r = b.newLocal(test::intType(), true, "r");
    b.assign(Place::of(r), test::callRvalue("square", {build::intConst(3)}));
    b.assign(Place::of(*b.returnLocal()),
             test::binary(BinOp::Add, Operand::copy(r), build::intConst(1)));
    b.terminate(Terminator::ret());
    return b.finish();
}

std::vector<std::string> notes(const support::DiagnosticEngine &diags)
{
    std::vector<std::string> out;
    for (const auto &d : diags.diagnostics())
        out.push_back(d.message);
    return out;
}

} // namespace

TEST(MirInline, CostCountsStatementsAndTerminators)
{
    InlineConfig config;
    EXPECT_EQ(inlineCost(test::makeSquare(), config), 2u);
    EXPECT_EQ(inlineCost(test::makeCaller("main", "square", 1), config), 7u);
    // Six statements, one switch and three other terminators.
    EXPECT_EQ(inlineCost(test::makeSumLoop("sum", 4), config), 11u);
}

TEST(MirInline, CandidatesRespectRecursionSitesAndThreshold)
{
    Program program;
    program.addFunction(test::makeCaller("main", "square", 1));
    program.addFunction(test::makeSquare());
    program.addFunction(test::makeCaller("self", "self", 1));
    analysis::CallGraph cg = analysis::CallGraph::build(program);

    InlineConfig config;
    EXPECT_TRUE(isInlineCandidate(*program.findFunction("square"), cg, config));
    EXPECT_FALSE(isInlineCandidate(*program.findFunction("self"), cg, config));

    config.threshold = 1;
    EXPECT_FALSE(isInlineCandidate(*program.findFunction("square"), cg, config));

    config = InlineConfig{};
    config.maxCallSites = 0;
    EXPECT_FALSE(isInlineCandidate(*program.findFunction("square"), cg, config));
}

TEST(MirInline, SplicesCallTerminator)
{
    Program program;
    program.addFunction(test::makeCaller("main", "square", 7));
    program.addFunction(test::makeSquare());

    Inliner inliner;
    EXPECT_TRUE(inliner.inlineProgram(program));

    const Function &main = *program.findFunction("main");
    EXPECT_FALSE(hasCalls(main));
    EXPECT_TRUE(verify::Validator::verify(program));
    EXPECT_EQ(test::evaluateInt(program, "main"), Int128(49));
    EXPECT_EQ(analysis::CallGraph::build(program).callSiteCount("square"), 0u);
}

TEST(MirInline, SplitsBlockAroundCallStatement)
{
    Program program;
    program.addFunction(makeStatementCaller());
    program.addFunction(test::makeSquare());

    Function &main = *program.findFunction("main");
    const Function &square = *program.findFunction("square");
    ASSERT_TRUE(inlineCallSite(main, 0, size_t{0}, square));

    EXPECT_FALSE(hasCalls(main));
    EXPECT_TRUE(verify::Validator::isWellFormed(verify::Validator::validate(main)));
    EXPECT_EQ(main.blocks.size(), 3u);
    EXPECT_EQ(test::evaluateInt(program, "main"), Int128(10));
}

TEST(MirInline, InlineCallsHonoursPredicate)
{
    Program program;
    program.addFunction(makeStatementCaller());
    program.addFunction(test::makeSquare());
    Function &main = *program.findFunction("main");

    EXPECT_EQ(inlineCalls(main, program, [](const std::string &) { return false; }), 0u);
    EXPECT_TRUE(hasCalls(main));
    EXPECT_EQ(inlineCalls(main, program, [](const std::string &n) { return n == "square"; }), 1u);
    EXPECT_FALSE(hasCalls(main));
}

TEST(MirInline, UnsupportedSitesLeaveNotes)
{
    Program program;
    program.addFunction(test::makeSquare());

    Function noReturn = test::makeCaller("main", "square", 2);
    std::get<term::Call>(noReturn.blocks[0].terminator.kind).target.reset();
    support::DiagnosticEngine diags;
    EXPECT_FALSE(inlineCallSite(noReturn, 0, std::nullopt, *program.findFunction("square"), &diags));

    Function wrongArity = test::makeCaller("other", "square", 2);
    std::get<term::Call>(wrongArity.blocks[0].terminator.kind).args.push_back(build::intConst(3));
    EXPECT_FALSE(inlineCallSite(wrongArity, 0, std::nullopt, *program.findFunction("square"), &diags));

    auto messages = notes(diags);
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0], "inline: call to 'square' in 'main' has no return edge; skipped");
    EXPECT_EQ(messages[1], "inline: argument count mismatch calling 'square' from 'other'; skipped");
}

TEST(MirInline, RecursiveCalleeIsKept)
{
    Program program;
    program.addFunction(test::makeCaller("main", "self", 1));
    program.addFunction(test::makeCaller("self", "self", 1));
    Inliner inliner;
    EXPECT_FALSE(inliner.inlineProgram(program));
    EXPECT_TRUE(hasCalls(*program.findFunction("main")));
}
