// File: tests/unit/test_mir_scalar_opts.cpp
// Purpose: Cover constant evaluation, constant folding, dead code elimination
//          and block-local CSE.
// Key invariants: Folding never introduces a trap; DCE keeps calls and the
//                 return value; CSE reuses the first computation in a block.
// Ownership/Lifetime: Standalone unit test executable.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "MirTestPrograms.hpp"
#include "mir/transform/CSE.hpp"
#include "mir/transform/ConstEval.hpp"
#include "mir/transform/ConstFold.hpp"
#include "mir/transform/DCE.hpp"

using namespace mir;
using namespace mir::core;
using namespace mir::transform;

namespace
{

const Operand *usedOperand(const Statement &stmt)
{
    const auto *assign = stmt.asAssign();
    if (!assign)
        return nullptr;
    const auto *use = std::get_if<rv::Use>(&assign->rvalue);
    return use ? &use->operand : nullptr;
}

Int128 usedInt(const Statement &stmt)
{
    const Operand *op = usedOperand(stmt);
    if (!op || !op->isConstant() || !op->getConstant().isInt())
        return Int128(-1);
    return op->getConstant().asInt();
}

} // namespace

TEST(MirConstEval, IntegerArithmetic)
{
    auto c = [](Int128 v) { return Constant::integer(v); };
    EXPECT_EQ(foldBinary(BinOp::Add, c(2), c(3)), c(5));
    EXPECT_EQ(foldBinary(BinOp::Mul, c(-4), c(6)), c(-24));
    EXPECT_EQ(foldBinary(BinOp::Rem, c(-7), c(3)), c(-1));
    EXPECT_EQ(foldBinary(BinOp::Mod, c(-7), c(3)), c(2));
    EXPECT_EQ(foldBinary(BinOp::Shl, c(1), c(4)), c(16));
    EXPECT_EQ(foldBinary(BinOp::Lt, c(1), c(2)), Constant::boolean(true));
    EXPECT_FALSE(foldBinary(BinOp::Div, c(1), c(0)).has_value());
    EXPECT_FALSE(foldBinary(BinOp::Rem, c(1), c(0)).has_value());
}

TEST(MirConstEval, MixedKinds)
{
    auto sum = foldBinary(BinOp::Add, Constant::floating(1.5), Constant::floating(2.0));
    ASSERT_TRUE(sum && sum->isFloat());
    EXPECT_DOUBLE_EQ(sum->asFloat(), 3.5);
    EXPECT_EQ(foldBinary(BinOp::Add, Constant::string("ab"), Constant::string("cd")),
              Constant::string("abcd"));
    EXPECT_EQ(foldBinary(BinOp::And, Constant::boolean(true), Constant::boolean(false)),
              Constant::boolean(false));
    EXPECT_FALSE(foldBinary(BinOp::Add, Constant::boolean(true), Constant::string("x")).has_value());
}

TEST(MirConstEval, IntegerOverflowWrapsAndShiftAmountIsMasked)
{
    const Int128 max = static_cast<Int128>((UInt128(1) << 127) - 1);
    const Int128 min = static_cast<Int128>(UInt128(1) << 127);
    EXPECT_EQ(foldBinary(BinOp::Add, Constant::integer(max), Constant::integer(1)),
              Constant::integer(min));
    EXPECT_EQ(foldBinary(BinOp::Shl, Constant::integer(1), Constant::integer(64)),
              Constant::integer(1));
    EXPECT_EQ(foldBinary(BinOp::Shl, Constant::integer(1), Constant::integer(65)),
              Constant::integer(2));
}

TEST(MirConstEval, FloatEqualityUsesEpsilon)
{
    auto sum = foldBinary(BinOp::Add, Constant::floating(0.1), Constant::floating(0.2));
    ASSERT_TRUE(sum && sum->isFloat());
    EXPECT_EQ(foldBinary(BinOp::Eq, *sum, Constant::floating(0.3)), Constant::boolean(true));
    EXPECT_EQ(foldBinary(BinOp::Ne, *sum, Constant::floating(0.3)), Constant::boolean(false));
}

TEST(MirConstEval, IntegerMeetingFloatPromotes)
{
    auto left = foldBinary(BinOp::Add, Constant::integer(2), Constant::floating(0.5));
    ASSERT_TRUE(left && left->isFloat());
    EXPECT_DOUBLE_EQ(left->asFloat(), 2.5);
    auto right = foldBinary(BinOp::Mul, Constant::floating(1.5), Constant::integer(4));
    ASSERT_TRUE(right && right->isFloat());
    EXPECT_DOUBLE_EQ(right->asFloat(), 6.0);
    EXPECT_FALSE(foldBinary(BinOp::Div, Constant::floating(1.0), Constant::integer(0)).has_value());
}

TEST(MirConstEval, UnaryAndCast)
{
    EXPECT_EQ(foldUnary(UnOp::Neg, Constant::integer(5)), Constant::integer(-5));
    EXPECT_EQ(foldUnary(UnOp::Not, Constant::boolean(true)), Constant::boolean(false));
    auto asFloat = foldCast(CastKind::Numeric, Constant::integer(3), Type(Type::Kind::Float));
    ASSERT_TRUE(asFloat && asFloat->isFloat());
    EXPECT_DOUBLE_EQ(asFloat->asFloat(), 3.0);
    auto truncated = foldCast(CastKind::Numeric, Constant::floating(2.9), test::intType());
    EXPECT_EQ(truncated, Constant::integer(2));
    EXPECT_EQ(switchValue(Constant::boolean(true)), std::optional<UInt128>(1));
}

TEST(MirConstFold, FoldsLiteralArithmeticAndSwitches)
{
    build::Builder b;
    b.startFunction("f", {}, test::intType());
    LocalId x = b.newLocal(test::intType());
    BlockId yes = b.newBlock();
    BlockId no = b.newBlock();
    b.assign(Place::of(x), test::binary(BinOp::Mul, build::intConst(6), build::intConst(7)));
    b.terminate(Terminator::branch(build::boolConst(false), yes, no));
    b.switchTo(yes);
    b.assign(Place::of(*b.returnLocal()), test::use(Operand::copy(x)));
    b.terminate(Terminator::ret());
    b.switchTo(no);
    b.assign(Place::of(*b.returnLocal()), test::use(build::intConst(0)));
    b.terminate(Terminator::ret());
    Function fn = b.finish();

    EXPECT_TRUE(constFold(fn));
    EXPECT_EQ(usedInt(fn.blocks[0].statements[0]), Int128(42));
    EXPECT_EQ(fn.blocks[0].terminator.successors(), (std::vector<BlockId>{no}));
    EXPECT_FALSE(constFold(fn));
}

TEST(MirConstFold, LeavesTrappingDivisionAlone)
{
    Function fn = test::makeConstant("f", 1);
    fn.blocks[0].statements[0] = Statement::assign(
        Place::of(0), test::binary(BinOp::Div, build::intConst(1), build::intConst(0)));
    EXPECT_FALSE(constFold(fn));

    fn.blocks[0].statements[0] = Statement::assign(
        Place::of(0), test::binary(BinOp::Rem, build::intConst(7), build::intConst(0)));
    EXPECT_FALSE(constFold(fn));
    EXPECT_EQ(usedOperand(fn.blocks[0].statements[0]), nullptr);
}

TEST(MirDCE, RemovesDeadStoresAndUnusedLocals)
{
    build::Builder b;
    b.startFunction("f", {{"a", test::intType()}}, test::intType());
    LocalId t = b.newLocal(test::intType());
    LocalId u = b.newLocal(test::intType());
    b.assign(Place::of(t), test::binary(BinOp::Add, Operand::copy(b.param(0)), build::intConst(1)));
    b.assign(Place::of(u), test::binary(BinOp::Mul, Operand::copy(t), build::intConst(2)));
    b.assign(Place::of(*b.returnLocal()), test::use(Operand::copy(b.param(0))));
    b.terminate(Terminator::ret());
    Function fn = b.finish();

    EXPECT_TRUE(dce(fn));
    ASSERT_EQ(fn.blocks[0].statements.size(), 1u);
    EXPECT_EQ(fn.locals.count(t), 0u);
    EXPECT_EQ(fn.locals.count(u), 0u);
    EXPECT_EQ(fn.locals.count(0), 1u);
    EXPECT_FALSE(dce(fn));
}

TEST(MirDCE, KeepsLocalMentionedOnlyByStorageMarkers)
{
    build::Builder b;
    b.startFunction("f", {}, test::intType());
    b.pushScope();
    LocalId x = b.newLocal(test::intType());
    b.push(Statement::storageLive(x));
    b.popScope();
    b.assign(Place::of(*b.returnLocal()), test::use(build::intConst(1)));
    b.terminate(Terminator::ret());
    Function fn = b.finish();

    dce(fn);
    EXPECT_EQ(fn.locals.count(x), 1u);
    const auto &stmts = fn.blocks[0].statements;
    ASSERT_EQ(stmts.size(), 3u);
    EXPECT_EQ(stmts[0], Statement::storageLive(x));
    EXPECT_EQ(stmts[1], Statement::storageDead(x));
    EXPECT_FALSE(removeUnusedLocals(fn));
}

TEST(MirDCE, KeepsCallsAndLoopState)
{
    Function fn = test::makeSumLoop("sum", 4);
    fn.blocks[0].statements.push_back(
        Statement::assign(Place::of(3), test::callRvalue("square", {build::intConst(2)})));
    EXPECT_FALSE(removeDeadAssignments(fn));
    EXPECT_EQ(fn.blocks[0].statements.size(), 3u);
    EXPECT_EQ(fn.blocks[2].statements.size(), 2u);
}

TEST(MirDCE, DropsUnreachableBlocksAndTheirHints)
{
    Function fn = test::makeConstant("f", 1);
    BlockId orphan = fn.addBlock();
    fn.blocks.back().terminator = Terminator::ret();
    fn.vectorHints[orphan] = 4;
    EXPECT_TRUE(removeUnreachableBlocks(fn));
    EXPECT_EQ(fn.blocks.size(), 1u);
    EXPECT_TRUE(fn.vectorHints.empty());
}

TEST(MirCSE, ReusesFirstComputationIncludingCommutedOperands)
{
    build::Builder b;
    b.startFunction("f", {{"a", test::intType()}, {"b", test::intType()}}, test::intType());
    LocalId x = b.newLocal(test::intType());
    LocalId y = b.newLocal(test::intType());
    LocalId z = b.newLocal(test::intType());
    Operand a = Operand::copy(b.param(0));
    Operand bb = Operand::copy(b.param(1));
    b.assign(Place::of(x), test::binary(BinOp::Add, a, bb));
    b.assign(Place::of(y), test::binary(BinOp::Add, bb, a));
    b.assign(Place::of(z), test::binary(BinOp::Sub, bb, a));
    b.assign(Place::of(*b.returnLocal()),
             test::binary(BinOp::Add, Operand::copy(y), Operand::copy(z)));
    b.terminate(Terminator::ret());
    Function fn = b.finish();

    EXPECT_TRUE(cse(fn));
    const Operand *reused = usedOperand(fn.blocks[0].statements[1]);
    ASSERT_NE(reused, nullptr);
    EXPECT_EQ(*reused, Operand::copy(x));
    EXPECT_EQ(usedOperand(fn.blocks[0].statements[2]), nullptr);
    EXPECT_FALSE(cse(fn));
}

TEST(MirCSE, ReassignmentInvalidatesExpression)
{
    build::Builder b;
    b.startFunction("f", {{"a", test::intType()}}, test::intType());
    LocalId v = b.newLocal(test::intType());
    LocalId x = b.newLocal(test::intType());
    LocalId y = b.newLocal(test::intType());
    b.assign(Place::of(v), test::use(Operand::copy(b.param(0))));
    b.assign(Place::of(x), test::binary(BinOp::Mul, Operand::copy(v), build::intConst(3)));
    b.assign(Place::of(v), test::binary(BinOp::Add, Operand::copy(v), build::intConst(1)));
    b.assign(Place::of(y), test::binary(BinOp::Mul, Operand::copy(v), build::intConst(3)));
    b.assign(Place::of(*b.returnLocal()),
             test::binary(BinOp::Add, Operand::copy(x), Operand::copy(y)));
    b.terminate(Terminator::ret());
    Function fn = b.finish();

    EXPECT_FALSE(cse(fn));
}

TEST(MirCSE, StorageDeadOfDefiningLocalClearsTable)
{
    build::Builder b;
    b.startFunction("f", {{"a", test::intType()}, {"b", test::intType()}}, test::intType());
    LocalId t1 = b.newLocal(test::intType());
    LocalId t2 = b.newLocal(test::intType());
    Operand a = Operand::copy(b.param(0));
    Operand bb = Operand::copy(b.param(1));
    b.assign(Place::of(t1), test::binary(BinOp::Add, a, bb));
    b.push(Statement::storageDead(t1));
    b.assign(Place::of(t2), test::binary(BinOp::Add, a, bb));
    b.assign(Place::of(*b.returnLocal()), test::use(Operand::copy(t2)));
    b.terminate(Terminator::ret());
    Function fn = b.finish();

    EXPECT_FALSE(cse(fn));
    EXPECT_EQ(usedOperand(fn.blocks[0].statements[2]), nullptr);
}
