// File: tests/unit/test_mir_cfg.cpp
// Purpose: Verify MIR control-flow queries, dominator trees and the
//          structural validator.
// Key invariants: Reverse post-order starts at the entry; only reachable
//                 blocks appear in dominator sets.
// Ownership/Lifetime: Standalone unit test executable.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "MirTestPrograms.hpp"
#include "mir/analysis/CFG.hpp"
#include "mir/analysis/Dominators.hpp"
#include "mir/verify/Validator.hpp"

#include <algorithm>

using namespace mir;
using namespace mir::core;
using verify::ValidationError;
using verify::Validator;

namespace
{

/// bb0 -> bb1 | bb2 -> bb3, plus an unreachable bb4.
Function makeDiamond()
{
    build::Builder b;
    b.startFunction("diamond", {{"c", test::boolType()}}, test::intType());
    BlockId left = b.newBlock();
    BlockId right = b.newBlock();
    BlockId join = b.newBlock();
    BlockId dead = b.newBlock();
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
    b.switchTo(dead);
    b.assign(Place::of(ret), test::use(build::intConst(3)));
    b.terminate(Terminator::ret());
    return b.finish();
}

bool hasKind(const std::vector<ValidationError> &errors, ValidationError::Kind kind)
{
    return std::any_of(
        errors.begin(), errors.end(), [&](const ValidationError &e) { return e.kind == kind; });
}

} // namespace

TEST(MirCFG, SuccessorsAndPredecessors)
{
    Function fn = makeDiamond();
    analysis::CFGInfo cfg(fn);
    EXPECT_EQ(cfg.successors(0), (std::vector<BlockId>{2, 1}));
    EXPECT_EQ(cfg.predecessors(3), (std::vector<BlockId>{1, 2}));
    EXPECT_TRUE(cfg.predecessors(0).empty());
    EXPECT_FALSE(cfg.isReachable(4));
    EXPECT_EQ(cfg.reachable(), (std::set<BlockId>{0, 1, 2, 3}));
}

TEST(MirCFG, ReversePostOrderStartsAtEntry)
{
    Function fn = test::makeSumLoop("sum", 4);
    std::vector<BlockId> rpo = analysis::reversePostOrder(fn);
    ASSERT_EQ(rpo.size(), 4u);
    EXPECT_EQ(rpo.front(), 0u);
    auto pos = [&](BlockId b) { return std::find(rpo.begin(), rpo.end(), b) - rpo.begin(); };
    EXPECT_LT(pos(1), pos(2));
    EXPECT_LT(pos(1), pos(3));
    EXPECT_EQ(analysis::postOrder(fn).back(), 0u);
}

TEST(MirDominators, DiamondJoinIsDominatedByEntryOnly)
{
    Function fn = makeDiamond();
    analysis::DomTree dom = analysis::computeDominatorTree(fn);
    EXPECT_TRUE(dom.dominates(0, 3));
    EXPECT_FALSE(dom.dominates(1, 3));
    EXPECT_FALSE(dom.dominates(2, 3));
    EXPECT_TRUE(dom.dominates(3, 3));
    EXPECT_EQ(dom.immediateDominator(3), std::optional<BlockId>(0));
    EXPECT_FALSE(dom.immediateDominator(0).has_value());
    EXPECT_EQ(dom.frontier(1), (std::set<BlockId>{3}));
    EXPECT_EQ(dom.frontier(2), (std::set<BlockId>{3}));
    EXPECT_TRUE(dom.frontier(0).empty());
    EXPECT_FALSE(dom.isReachable(4));
}

TEST(MirDominators, LoopHeaderDominatesBody)
{
    Function fn = test::makeSumLoop("sum", 4);
    analysis::DomTree dom = analysis::computeDominatorTree(fn);
    EXPECT_TRUE(dom.dominates(1, 2));
    EXPECT_TRUE(dom.dominates(1, 3));
    EXPECT_FALSE(dom.dominates(2, 1));
    EXPECT_EQ(dom.frontier(2), (std::set<BlockId>{1}));
    ASSERT_TRUE(dom.children.count(1));
    EXPECT_EQ(dom.children.at(1), (std::vector<BlockId>{2, 3}));
}

TEST(MirValidator, WellFormedLoopOnlyReportsSoftFindings)
{
    Function fn = test::makeSumLoop("sum", 4);
    auto errors = Validator::validate(fn);
    EXPECT_TRUE(Validator::isWellFormed(errors));
    EXPECT_TRUE(hasKind(errors, ValidationError::Kind::MultipleAssignment));
    for (const auto &e : errors)
        EXPECT_FALSE(e.isHardError()) << e.toString();
}

TEST(MirValidator, UnreachableBlockIsSoft)
{
    auto errors = Validator::validate(makeDiamond());
    ASSERT_TRUE(hasKind(errors, ValidationError::Kind::UnreachableCode));
    EXPECT_TRUE(Validator::isWellFormed(errors));
}

TEST(MirValidator, UndefinedLocal)
{
    Function fn = test::makeConstant("f", 1);
    fn.blocks[0].statements[0] = Statement::assign(Place::of(0), test::use(Operand::copy(9)));
    auto errors = Validator::validate(fn);
    ASSERT_FALSE(Validator::isWellFormed(errors));
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].kind, ValidationError::Kind::UndefinedLocal);
    EXPECT_EQ(errors[0].toString(), "f: bb0[0]: undefined local _9");
}

TEST(MirValidator, EdgeToMissingBlock)
{
    Function fn = test::makeConstant("f", 1);
    fn.blocks[0].terminator = Terminator::gotoBlock(7);
    auto errors = Validator::validate(fn);
    ASSERT_TRUE(hasKind(errors, ValidationError::Kind::InvalidEdge));
    EXPECT_EQ(errors[0].toString(), "f: invalid edge bb0 -> bb7");
}

TEST(MirValidator, ReachableEmptyBlockNeedsTerminator)
{
    Function fn = test::makeConstant("f", 1);
    BlockId hole = fn.addBlock();
    fn.blocks[0].terminator = Terminator::gotoBlock(hole);
    auto errors = Validator::validate(fn);
    EXPECT_TRUE(hasKind(errors, ValidationError::Kind::MissingTerminator));
    EXPECT_FALSE(Validator::isWellFormed(errors));
}

TEST(MirValidator, ReachableBlockWithStatementsNeedsTerminator)
{
    Function fn = test::makeConstant("f", 1);
    fn.blocks[0].terminator = Terminator::unreachable();
    ASSERT_FALSE(fn.blocks[0].statements.empty());
    auto errors = Validator::validate(fn);
    EXPECT_TRUE(hasKind(errors, ValidationError::Kind::MissingTerminator));
    EXPECT_FALSE(Validator::isWellFormed(errors));
}

TEST(MirValidator, DuplicateBlockIds)
{
    Function fn = test::makeConstant("f", 1);
    fn.blocks.push_back(fn.blocks[0]);
    EXPECT_TRUE(hasKind(Validator::validate(fn), ValidationError::Kind::DuplicateBlock));
}

TEST(MirValidator, ProgramReportsUnknownCallee)
{
    Program program;
    program.addFunction(test::makeCaller("main", "missing", 1));
    auto errors = Validator::validateProgram(program);
    ASSERT_TRUE(hasKind(errors, ValidationError::Kind::UnknownCallee));

    auto verdict = Validator::verify(program);
    ASSERT_FALSE(verdict);
    EXPECT_EQ(verdict.error().message, "main: bb0: call to unknown function 'missing'");

    program.addFunction(test::makeSquare("missing"));
    EXPECT_TRUE(Validator::verify(program));
}
