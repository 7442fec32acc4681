// File: tests/unit/test_mir_loops.cpp
// Purpose: Cover natural-loop discovery, loop bounds, induction variables and
//          loop dependences.
// Key invariants: Iteration counts equal the number of body executions for
//                 both top-tested and bottom-tested loops.
// Ownership/Lifetime: Standalone unit test executable.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "MirTestPrograms.hpp"
#include "mir/analysis/CFG.hpp"
#include "mir/analysis/Dependence.hpp"
#include "mir/analysis/Dominators.hpp"
#include "mir/analysis/InductionVars.hpp"
#include "mir/analysis/LoopInfo.hpp"

#include <algorithm>

using namespace mir;
using namespace mir::core;
using analysis::LoopForest;

namespace
{

/// Outer loop over i in [0, 3) containing an inner loop over j in [0, 2).
///   bb1 outer header, bb2 inner preheader, bb3 inner header, bb4 inner latch,
///   bb5 exit, bb6 outer latch.
Function makeNest()
{
    build::Builder b;
    b.startFunction("nest", {}, test::intType());
    LocalId i = b.newLocal(test::intType(), true, "i");
    LocalId j = b.newLocal(test::intType(), true, "j");
    LocalId c = b.newLocal(test::boolType(), true, "c");
    LocalId d = b.newLocal(test::boolType(), true, "d");
    BlockId outer = b.newBlock();
    BlockId pre = b.newBlock();
    BlockId inner = b.newBlock();
    BlockId innerLatch = b.newBlock();
    BlockId exit = b.newBlock();
    BlockId outerLatch = b.newBlock();

    b.assign(Place::of(i), test::use(build::intConst(0)));
    b.terminate(Terminator::gotoBlock(outer));
    b.switchTo(outer);
    b.assign(Place::of(c), test::binary(BinOp::Lt, Operand::copy(i), build::intConst(3)));
    b.terminate(Terminator::branch(Operand::copy(c), pre, exit));
    b.switchTo(pre);
    b.assign(Place::of(j), test::use(build::intConst(0)));
    b.terminate(Terminator::gotoBlock(inner));
    b.switchTo(inner);
    b.assign(Place::of(d), test::binary(BinOp::Lt, Operand::copy(j), build::intConst(2)));
    b.terminate(Terminator::branch(Operand::copy(d), innerLatch, outerLatch));
    b.switchTo(innerLatch);
    b.assign(Place::of(j), test::binary(BinOp::Add, Operand::copy(j), build::intConst(1)));
    b.terminate(Terminator::gotoBlock(inner));
    b.switchTo(outerLatch);
    b.assign(Place::of(i), test::binary(BinOp::Add, Operand::copy(i), build::intConst(1)));
    b.terminate(Terminator::gotoBlock(outer));
    b.switchTo(exit);
    b.assign(Place::of(*b.returnLocal()), test::use(Operand::copy(i)));
    b.terminate(Terminator::ret());
    return b.finish();
}

} // namespace

TEST(MirLoops, TopTestedLoopShape)
{
    Function fn = test::makeSumLoop("sum", 4);
    LoopForest forest = LoopForest::compute(fn);
    ASSERT_EQ(forest.loops().size(), 1u);
    const auto &loop = forest.loops()[0];

    EXPECT_EQ(loop.header, 1u);
    EXPECT_EQ(loop.blocks, (std::set<BlockId>{1, 2}));
    EXPECT_EQ(loop.preheader, std::optional<BlockId>(0));
    EXPECT_EQ(loop.latches, (std::vector<BlockId>{2}));
    EXPECT_EQ(loop.exits, (std::set<BlockId>{1}));
    EXPECT_EQ(loop.exitTargets, (std::set<BlockId>{3}));
    EXPECT_EQ(loop.depth, 1u);
    EXPECT_FALSE(loop.parent.has_value());
}

TEST(MirLoops, TopTestedIterationCount)
{
    LoopForest forest = LoopForest::compute(test::makeSumLoop("sum", 10));
    const auto &loop = forest.loops()[0];
    ASSERT_TRUE(loop.bounds.has_value());
    EXPECT_EQ(loop.bounds->inductionVar, 1u);
    EXPECT_EQ(loop.bounds->initial, Int128(0));
    EXPECT_EQ(loop.bounds->finalValue, Int128(10));
    EXPECT_EQ(loop.bounds->step, Int128(1));
    EXPECT_EQ(loop.bounds->comparison, BinOp::Lt);
    EXPECT_EQ(loop.bounds->exitingBlock, 1u);
    EXPECT_EQ(loop.bounds->continueTarget, 2u);
    EXPECT_EQ(loop.bounds->exitTarget, 3u);
    EXPECT_EQ(loop.iterationCount, std::optional<uint64_t>(10));
}

TEST(MirLoops, BottomTestedIterationCount)
{
    LoopForest forest = LoopForest::compute(test::makeSelfLoop("self", 18));
    ASSERT_EQ(forest.loops().size(), 1u);
    const auto &loop = forest.loops()[0];
    EXPECT_EQ(loop.blocks, (std::set<BlockId>{1}));
    EXPECT_TRUE(loop.isLatch(1));
    EXPECT_EQ(loop.iterationCount, std::optional<uint64_t>(18));
}

TEST(MirLoops, LoopThatNeverEntersHasZeroIterations)
{
    LoopForest forest = LoopForest::compute(test::makeSumLoop("sum", 0));
    EXPECT_EQ(forest.loops()[0].iterationCount, std::optional<uint64_t>(0));
}

TEST(MirLoops, NonConstantLimitHasNoBounds)
{
    Function fn = test::makeSumLoop("sum", 4);
    // Compare against a local instead of a constant.
    auto &cmp = std::get<rv::BinaryOp>(fn.blocks[1].statements[0].asAssign()->rvalue);
    cmp.right = Operand::copy(2);
    LoopForest forest = LoopForest::compute(fn);
    EXPECT_FALSE(forest.loops()[0].bounds.has_value());
    EXPECT_FALSE(forest.loops()[0].iterationCount.has_value());
}

TEST(MirLoops, NestedLoopsFormAForest)
{
    Function fn = makeNest();
    LoopForest forest = LoopForest::compute(fn);
    ASSERT_EQ(forest.loops().size(), 2u);
    ASSERT_EQ(forest.roots().size(), 1u);

    const auto &outer = forest.loops()[forest.roots()[0]];
    EXPECT_EQ(outer.header, 1u);
    EXPECT_EQ(outer.blocks, (std::set<BlockId>{1, 2, 3, 4, 6}));
    ASSERT_EQ(outer.children.size(), 1u);

    const auto &inner = forest.loops()[outer.children[0]];
    EXPECT_EQ(inner.header, 3u);
    EXPECT_EQ(inner.depth, 2u);
    EXPECT_EQ(inner.preheader, std::optional<BlockId>(2));
    EXPECT_EQ(inner.iterationCount, std::optional<uint64_t>(2));
    EXPECT_EQ(outer.iterationCount, std::optional<uint64_t>(3));

    EXPECT_EQ(forest.loopFor(4)->header, 3u);
    EXPECT_EQ(forest.loopFor(6)->header, 1u);
    EXPECT_EQ(forest.loopFor(5), nullptr);

    auto order = forest.innermostFirst();
    ASSERT_EQ(order.size(), 2u);
    EXPECT_EQ(forest.loops()[order[0]].header, 3u);
    EXPECT_EQ(forest.loops()[order[1]].header, 1u);
}

TEST(MirLoops, StraightLineCodeHasNoLoops)
{
    EXPECT_TRUE(LoopForest::compute(test::makeSquare()).empty());
}

TEST(MirInductionVars, BasicAndDerived)
{
    Function fn = test::makeScaledLoop("scaled", 8);
    analysis::CFGInfo cfg(fn);
    LoopForest forest = LoopForest::compute(fn);
    auto info = analysis::findInductionVariables(fn, cfg, forest.loops()[0]);

    ASSERT_EQ(info.basic.size(), 1u);
    EXPECT_EQ(info.basic[0].local, 1u);
    EXPECT_EQ(info.basic[0].step, Int128(1));
    EXPECT_EQ(info.basic[0].initial, std::optional<Int128>(0));
    EXPECT_EQ(info.findBasic(2), nullptr);

    ASSERT_EQ(info.derived.size(), 1u);
    EXPECT_EQ(info.derived[0].local, 3u);
    EXPECT_EQ(info.derived[0].base, 1u);
    EXPECT_EQ(info.derived[0].multiplier, Int128(4));
    EXPECT_EQ(info.derived[0].offset, Int128(0));
}

TEST(MirInductionVars, ConstantValueAtEndWalksUniquePredecessors)
{
    Function fn = makeNest();
    analysis::CFGInfo cfg(fn);
    EXPECT_EQ(analysis::constantValueAtEnd(fn, cfg, 2, 2), std::optional<Int128>(0));
    // bb1 has two predecessors, so i is unknown there.
    EXPECT_FALSE(analysis::constantValueAtEnd(fn, cfg, 1, 1).has_value());
}

TEST(MirDependence, OnlyInductionVariableIsCarried)
{
    Function fn = test::makeSelfLoop("self", 16);
    analysis::CFGInfo cfg(fn);
    LoopForest forest = LoopForest::compute(fn);
    auto deps = analysis::analyzeLoopDependences(fn, cfg, forest.loops()[0]);

    ASSERT_EQ(deps.loopCarried.size(), 1u);
    EXPECT_EQ(deps.loopCarried[0].local, 1u);
    EXPECT_EQ(deps.loopCarried[0].distance, std::optional<int64_t>(1));
    EXPECT_FALSE(deps.hasCarriedOutside({1}));
    EXPECT_FALSE(deps.memoryHazard);

    auto flowOnT = std::find_if(deps.intraBlock.begin(),
                                deps.intraBlock.end(),
                                [](const analysis::Dependence &d)
                                { return d.kind == analysis::DependenceKind::Flow && d.local == 2; });
    ASSERT_NE(flowOnT, deps.intraBlock.end());
    EXPECT_EQ(flowOnT->source, (dataflow::Location{1, 0}));
    EXPECT_EQ(flowOnT->sink, (dataflow::Location{1, 1}));
}

TEST(MirDependence, ReductionIsCarried)
{
    Function fn = test::makeSelfReduction("red", 16);
    analysis::CFGInfo cfg(fn);
    LoopForest forest = LoopForest::compute(fn);
    auto deps = analysis::analyzeLoopDependences(fn, cfg, forest.loops()[0]);
    EXPECT_TRUE(deps.hasCarriedOutside({1}));
}

TEST(MirDependence, CallInLoopIsAMemoryHazard)
{
    Function fn = test::makeSumLoop("sum", 4);
    fn.blocks[2].statements[0] =
        Statement::assign(Place::of(2), test::callRvalue("square", {Operand::copy(1)}));
    analysis::CFGInfo cfg(fn);
    LoopForest forest = LoopForest::compute(fn);
    EXPECT_TRUE(analysis::analyzeLoopDependences(fn, cfg, forest.loops()[0]).memoryHazard);
}
