// File: tests/unit/test_mir_dataflow.cpp
// Purpose: Check the liveness and reaching-definition solvers on loops and
//          straight-line code.
// Key invariants: Loop-carried locals are live around the back edge; both
//                 definitions of an induction variable reach the header.
// Ownership/Lifetime: Standalone unit test executable.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "MirTestPrograms.hpp"
#include "mir/dataflow/Liveness.hpp"
#include "mir/dataflow/ReachingDefs.hpp"

using namespace mir;
using namespace mir::core;
using dataflow::Definition;
using dataflow::LiveSet;
using dataflow::Location;

TEST(MirLiveness, LoopCarriedLocalsAreLiveAroundTheBackEdge)
{
    Function fn = test::makeSumLoop("sum", 4);
    dataflow::LivenessResult live(fn);

    EXPECT_TRUE(live.liveIn(0).empty());
    EXPECT_EQ(live.liveOut(0), (LiveSet{1, 2}));
    EXPECT_EQ(live.liveIn(1), (LiveSet{1, 2}));
    EXPECT_EQ(live.liveOut(2), (LiveSet{1, 2}));
    EXPECT_EQ(live.liveIn(3), (LiveSet{2}));
    EXPECT_TRUE(live.liveOut(3).empty());
}

TEST(MirLiveness, ReturnLocalIsLiveAtReturn)
{
    Function fn = test::makeSumLoop("sum", 4);
    dataflow::LivenessResult live(fn);
    // Before the terminator of bb3 only the return value remains.
    EXPECT_EQ(live.liveBefore(Location{3, 1}), (LiveSet{0}));
    EXPECT_EQ(live.liveBefore(Location{3, 0}), (LiveSet{2}));
}

TEST(MirLiveness, DeadStoreIsNotLive)
{
    build::Builder b;
    b.startFunction("f", {{"a", test::intType()}}, test::intType());
    LocalId tmp = b.newLocal(test::intType());
    b.assign(Place::of(tmp), test::binary(BinOp::Add, Operand::copy(b.param(0)), build::intConst(1)));
    b.assign(Place::of(*b.returnLocal()), test::use(Operand::copy(b.param(0))));
    b.terminate(Terminator::ret());
    Function fn = b.finish();

    dataflow::LivenessResult live(fn);
    EXPECT_EQ(live.liveIn(0), (LiveSet{0}));
    EXPECT_EQ(live.liveBefore(Location{0, 1}).count(tmp), 0u);
}

TEST(MirReachingDefs, BothInductionDefinitionsReachTheHeader)
{
    Function fn = test::makeSumLoop("sum", 4);
    auto results = dataflow::computeReachingDefs(fn);

    auto defs = dataflow::reachingDefsOf(results, Location{1, 0}, 1);
    ASSERT_EQ(defs.size(), 2u);
    EXPECT_EQ(defs[0], (Definition{1, Location{0, 0}}));
    EXPECT_EQ(defs[1], (Definition{1, Location{2, 1}}));
}

TEST(MirReachingDefs, RedefinitionKillsEarlierDefinition)
{
    Function fn = test::makeSumLoop("sum", 4);
    auto results = dataflow::computeReachingDefs(fn);

    // Inside the body the update of s at bb2[0] replaces both incoming defs.
    auto defs = dataflow::reachingDefsOf(results, Location{2, 1}, 2);
    ASSERT_EQ(defs.size(), 1u);
    EXPECT_EQ(defs[0].location, (Location{2, 0}));
}

TEST(MirReachingDefs, CallDestinationIsADefinition)
{
    Function fn = test::makeCaller("main", "square", 3);
    auto results = dataflow::computeReachingDefs(fn);
    auto defs = dataflow::reachingDefsOf(results, Location{1, 0}, 1);
    ASSERT_EQ(defs.size(), 1u);
    EXPECT_EQ(defs[0].location, (Location{0, 0}));
}
