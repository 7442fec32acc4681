// File: tests/unit/test_mir_profile.cpp
// Purpose: Cover the profile data format and the profile-guided inline and
//          layout decisions.
// Key invariants: Malformed records are skipped; the entry block stays
//                 first; records naming missing functions become warnings.
// Ownership/Lifetime: Standalone unit test executable; writes one file under
//                     the GoogleTest temporary directory.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "MirTestPrograms.hpp"
#include "mir/profile/ProfileData.hpp"
#include "mir/transform/ProfileGuided.hpp"
#include "support/diagnostics.hpp"

#include <sstream>

using namespace mir;
using namespace mir::core;
using namespace mir::transform;
using profile::ProfileData;

namespace
{

/// bb0: switchInt(c) -> bb1 (true) / bb2 (false); bb1, bb2 -> bb3: return
Function makeDiamond(const std::string &name)
{
    build::Builder b;
    b.startFunction(name, {{"c", test::boolType()}}, test::intType());
    BlockId left = b.newBlock();
    BlockId right = b.newBlock();
    BlockId join = b.newBlock();
    LocalId ret = *b.returnLocal();
    b.terminate(Terminator::branch(Operand::copy(b.param(0)), left, right));
    b.switchTo(left);
    b.assign(Place::of(ret), test::use(build::intConst(1)));
    b.terminate(Terminator::gotoBlock(join));
    b.switchTo(right);
    b.assign(Place::of(ret), test::use(build::intConst(2)));
    b.terminate(Terminator::gotoBlock(join));
    b.switchTo(join);
    b.terminate(Terminator::ret());
    return b.finish();
}

const char *kDiamondProfile = "# counts for pick\n"
                              "FUNC:pick:100\n"
                              "BLOCK:pick:0:100\n"
                              "BLOCK:pick:1:5\n"
                              "BLOCK:pick:2:95\n"
                              "BLOCK:pick:3:100\n"
                              "BRANCH:pick:0:100:95\n";

std::vector<BlockId> blockOrder(const Function &fn)
{
    std::vector<BlockId> out;
    for (const auto &bb : fn.blocks)
        out.push_back(bb.id);
    return out;
}

} // namespace

TEST(MirProfileData, ParsesEveryRecordKind)
{
    ProfileData data = ProfileData::parseString("FUNC:main:10\n"
                                                "BLOCK:main:2:7\n"
                                                "BRANCH:main:2:8:6\n"
                                                "CALL:main:helper:4\n"
                                                "LOOP:main:1:2:10:6\n");
    EXPECT_EQ(data.functionCount("main"), 10u);
    EXPECT_EQ(data.functionCount("other"), 0u);
    EXPECT_EQ(data.blockCounts.at("main").at(2), 7u);
    const auto &branch = data.branches.at("main").at(2);
    EXPECT_EQ(branch.total, 8u);
    EXPECT_EQ(branch.taken, 6u);
    EXPECT_DOUBLE_EQ(branch.probability, 0.75);
    EXPECT_EQ(data.callCounts.at("main").at("helper"), 4u);
    const auto &loop = data.loops.at("main").at(1);
    EXPECT_EQ(loop.entries, 2u);
    EXPECT_EQ(loop.maxIterations, 6u);
    EXPECT_DOUBLE_EQ(loop.averageIterations, 5.0);
}

TEST(MirProfileData, SkipsCommentsAndMalformedLines)
{
    ProfileData data;
    EXPECT_FALSE(data.parseLine("# comment"));
    EXPECT_FALSE(data.parseLine("   "));
    EXPECT_FALSE(data.parseLine("FUNC:main:lots"));
    EXPECT_FALSE(data.parseLine("BLOCK:main:1"));
    EXPECT_FALSE(data.parseLine("EDGE:main:1:2"));
    EXPECT_FALSE(data.parseLine("BRANCH:main:0:-1:0"));
    EXPECT_TRUE(data.parseLine("  FUNC : main : 3  "));
    EXPECT_EQ(data.functionCount("main"), 3u);
    EXPECT_EQ(data.statistics().functions, 1u);
}

TEST(MirProfileData, ZeroTotalsGiveZeroRatios)
{
    ProfileData data = ProfileData::parseString("BRANCH:f:0:0:0\nLOOP:f:1:0:0:0\n");
    EXPECT_DOUBLE_EQ(data.branches.at("f").at(0).probability, 0.0);
    EXPECT_DOUBLE_EQ(data.loops.at("f").at(1).averageIterations, 0.0);
}

TEST(MirProfileData, SerializesSortedRecords)
{
    ProfileData data = ProfileData::parseString("CALL:main:b:1\n"
                                                "FUNC:zeta:2\n"
                                                "FUNC:alpha:1\n"
                                                "BLOCK:alpha:3:9\n");
    std::ostringstream out;
    data.serialize(out);
    EXPECT_EQ(out.str(),
              "FUNC:alpha:1\n"
              "FUNC:zeta:2\n"
              "BLOCK:alpha:3:9\n"
              "CALL:main:b:1\n");
    EXPECT_EQ(ProfileData::parseString(out.str()), data);
}

TEST(MirProfileData, SaveAndLoadFile)
{
    ProfileData data = ProfileData::parseString(kDiamondProfile);
    const std::string path = ::testing::TempDir() + "aether_profile_roundtrip.prof";
    ASSERT_TRUE(data.saveFile(path));
    auto loaded = ProfileData::loadFile(path);
    ASSERT_TRUE(loaded);
    EXPECT_EQ(loaded.value(), data);

    auto missing = ProfileData::loadFile(::testing::TempDir() + "no/such/file.prof");
    ASSERT_FALSE(missing);
    EXPECT_NE(missing.error().message.find("cannot open profile data file"), std::string::npos);
}

TEST(MirProfileData, Statistics)
{
    ProfileData data = ProfileData::parseString("FUNC:a:10\nFUNC:b:30\nFUNC:c:5\n"
                                                "BLOCK:a:0:10\nBLOCK:a:1:3\n"
                                                "CALL:a:b:30\n");
    auto stats = data.statistics();
    EXPECT_EQ(stats.functions, 3u);
    EXPECT_EQ(stats.blocks, 2u);
    EXPECT_EQ(stats.calls, 1u);
    EXPECT_EQ(stats.branches, 0u);
    EXPECT_EQ(stats.totalExecutions, 45u);
    ASSERT_TRUE(stats.hottestFunction.has_value());
    EXPECT_EQ(stats.hottestFunction->first, "b");
    EXPECT_FALSE(data.empty());
    EXPECT_TRUE(ProfileData{}.empty());
}

TEST(MirProfileGuided, InlineDecisions)
{
    ProfileData data = ProfileData::parseString("FUNC:main:100\n"
                                                "FUNC:hot:5000\n"
                                                "FUNC:warm:600\n"
                                                "FUNC:cold:5\n"
                                                "FUNC:mid:300\n"
                                                "CALL:main:hot:95\n"
                                                "CALL:main:warm:60\n"
                                                "CALL:main:cold:50\n"
                                                "CALL:main:mid:30\n");
    EXPECT_EQ(decideInlining(data, "main", "hot"), InlineDecision::AlwaysInline);
    EXPECT_EQ(decideInlining(data, "main", "warm"), InlineDecision::InlineHot);
    EXPECT_EQ(decideInlining(data, "main", "cold"), InlineDecision::NeverInline);
    EXPECT_EQ(decideInlining(data, "main", "mid"), InlineDecision::Default);
    EXPECT_EQ(decideInlining(data, "nobody", "hot"), InlineDecision::NeverInline);
    EXPECT_STREQ(toString(InlineDecision::InlineHot), "inline-hot");
}

TEST(MirProfileGuided, LayoutPutsLikelyPathFirstAndColdLast)
{
    Function fn = makeDiamond("pick");
    ProfileData data = ProfileData::parseString(kDiamondProfile);
    ProfileConfig config;
    config.hotBlock = 50;

    BlockLayout layout = decideLayout(data, fn, config);
    EXPECT_EQ(layout.order, (std::vector<BlockId>{0, 2, 3, 1}));
    EXPECT_EQ(layout.hot, (std::vector<BlockId>{0, 2, 3}));
    EXPECT_EQ(layout.cold, (std::vector<BlockId>{1}));

    EXPECT_TRUE(applyLayout(fn, layout.order));
    EXPECT_EQ(blockOrder(fn), (std::vector<BlockId>{0, 2, 3, 1}));
    EXPECT_FALSE(applyLayout(fn, layout.order));
    EXPECT_EQ(test::evaluateInt(test::single(fn), "pick", {Constant::boolean(false)}), Int128(2));
}

TEST(MirProfileGuided, ApplyLayoutKeepsEntryFirstAndAppendsMissing)
{
    Function fn = makeDiamond("pick");
    EXPECT_TRUE(applyLayout(fn, {3, 99}));
    EXPECT_EQ(blockOrder(fn), (std::vector<BlockId>{0, 3, 1, 2}));
}

TEST(MirProfileGuided, ApplyProfileInlinesHotEdgesAndWarns)
{
    Program program;
    program.addFunction(test::makeCaller("main", "square", 9));
    program.addFunction(test::makeSquare());
    ProfileData data = ProfileData::parseString("FUNC:main:100\n"
                                                "FUNC:square:5000\n"
                                                "FUNC:ghost:5\n"
                                                "CALL:main:square:95\n"
                                                "BLOCK:main:42:7\n");

    support::DiagnosticEngine diags;
    ProfileApplication result = applyProfile(program, data, ProfileConfig{}, &diags);
    EXPECT_TRUE(result.changed);
    EXPECT_EQ(result.inlinedSites, 1u);
    EXPECT_EQ(result.reorderedFunctions, 0u);
    EXPECT_EQ(result.warnings,
              (std::vector<std::string>{"profile-guided: unknown function 'ghost'",
                                        "profile-guided: unknown block bb42 in 'main'"}));
    EXPECT_EQ(diags.warningCount(), 2u);
    EXPECT_EQ(test::evaluateInt(program, "main"), Int128(81));
}
