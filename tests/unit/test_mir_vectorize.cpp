// File: tests/unit/test_mir_vectorize.cpp
// Purpose: Cover vectorization planning (candidates, legality, width, score)
//          and the body replication with scalar peeling.
// Key invariants: A vectorized loop computes the same result as the scalar
//                 loop; reductions and calls block vectorization.
// Ownership/Lifetime: Standalone unit test executable.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "MirTestPrograms.hpp"
#include "mir/analysis/LoopInfo.hpp"
#include "mir/transform/Vectorize.hpp"
#include "mir/verify/Validator.hpp"

using namespace mir;
using namespace mir::core;
using namespace mir::transform;

TEST(MirVectorize, PlansSelfLoop)
{
    Function fn = test::makeSelfLoop("v", 18);
    auto plans = analyzeVectorization(fn, VectorizeConfig{});
    ASSERT_EQ(plans.size(), 1u);
    const auto &plan = plans[0];

    EXPECT_EQ(plan.header, 1u);
    EXPECT_EQ(plan.inductionVar, std::optional<LocalId>(1));
    EXPECT_EQ(plan.tripCount, std::optional<uint64_t>(18));
    ASSERT_EQ(plan.candidates.size(), 4u);
    EXPECT_EQ(plan.candidates[0].op, VectorOp::Arithmetic);
    EXPECT_EQ(plan.candidates[0].pattern, AccessPattern::Broadcast);
    EXPECT_EQ(plan.candidates[3].type.kind, Type::Kind::Boolean);
    EXPECT_TRUE(plan.legal);
    EXPECT_EQ(plan.width, 4u);
    EXPECT_TRUE(plan.profitable());
}

TEST(MirVectorize, OnlySelfLoopingBlocksAreConsidered)
{
    EXPECT_TRUE(analyzeVectorization(test::makeSumLoop("sum", 100), VectorizeConfig{}).empty());
}

TEST(MirVectorize, ReductionIsIllegal)
{
    auto plans = analyzeVectorization(test::makeSelfReduction("red", 64), VectorizeConfig{});
    ASSERT_EQ(plans.size(), 1u);
    EXPECT_FALSE(plans[0].legal);
    EXPECT_FALSE(plans[0].profitable());

    Function fn = test::makeSelfReduction("red", 64);
    EXPECT_FALSE(vectorize(fn));
    EXPECT_TRUE(fn.vectorHints.empty());
}

TEST(MirVectorize, ReplicatesBodyAndPeelsRemainder)
{
    Function fn = test::makeSelfLoop("v", 18);
    ASSERT_TRUE(vectorize(fn));

    ASSERT_EQ(fn.blocks.size(), 4u);
    EXPECT_EQ(fn.vectorHints.at(1), 4u);
    const BasicBlock *body = fn.findBlock(1);
    ASSERT_NE(body, nullptr);
    EXPECT_EQ(body->statements.size(), 16u);

    // The prologue holds two scalar iterations and falls into the loop.
    const BasicBlock &prologue = fn.blocks[1];
    EXPECT_EQ(prologue.statements.size(), 8u);
    EXPECT_EQ(prologue.terminator.successors(), (std::vector<BlockId>{1}));
    EXPECT_EQ(fn.blocks[0].terminator.successors(), (std::vector<BlockId>{prologue.id}));

    EXPECT_TRUE(verify::Validator::isWellFormed(verify::Validator::validate(fn)));
    EXPECT_EQ(test::evaluateInt(test::single(fn), "v"), Int128(35));
    EXPECT_FALSE(vectorize(fn));
}

TEST(MirVectorize, ExactMultipleNeedsNoPrologue)
{
    Function fn = test::makeSelfLoop("v", 16);
    ASSERT_TRUE(vectorize(fn));
    EXPECT_EQ(fn.blocks.size(), 3u);
    EXPECT_EQ(test::evaluateInt(test::single(fn), "v"), Int128(31));
}

TEST(MirVectorize, WidthAboveTripCountIsRejected)
{
    Function fn = test::makeSelfLoop("v", 3);
    EXPECT_FALSE(vectorize(fn));
    EXPECT_TRUE(fn.vectorHints.empty());
}

TEST(MirVectorize, WidthFollowsNarrowestType)
{
    VectorCandidate wide;
    wide.type = Type(Type::Kind::Integer64);
    VectorCandidate narrow;
    narrow.type = Type(Type::Kind::Boolean);
    VectorizeConfig config;
    EXPECT_EQ(vectorWidth({narrow}, config), 16u);
    EXPECT_EQ(vectorWidth({narrow, wide}, config), 2u);
    config.maxWidth = 8;
    EXPECT_EQ(vectorWidth({narrow}, config), 8u);
    EXPECT_EQ(vectorWidth({}, config), 8u);
}

TEST(MirVectorize, ScoreRewardsKnownTripsAndPenalisesIrregularAccess)
{
    VectorCandidate seq;
    seq.pattern = AccessPattern::Sequential;
    VectorCandidate irregular;
    irregular.pattern = AccessPattern::Irregular;

    EXPECT_DOUBLE_EQ(benefitScore({seq}, std::nullopt), 3.0);
    EXPECT_DOUBLE_EQ(benefitScore({seq}, 100), 4.0);
    EXPECT_DOUBLE_EQ(benefitScore({seq}, 4), 2.0);
    EXPECT_DOUBLE_EQ(benefitScore({irregular}, std::nullopt), 1.0);
    EXPECT_STREQ(toString(AccessPattern::Strided), "strided");
}
