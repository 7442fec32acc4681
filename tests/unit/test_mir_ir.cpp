// File: tests/unit/test_mir_ir.cpp
// Purpose: Cover MIR construction through the Builder and the textual printer.
// Key invariants: Parameters occupy the first local ids; printing is
//                 deterministic.
// Ownership/Lifetime: Standalone unit test executable.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "MirTestPrograms.hpp"
#include "mir/io/Printer.hpp"

using namespace mir;
using namespace mir::core;

TEST(MirBuilder, ParamsComeFirstThenReturnLocal)
{
    build::Builder b;
    BlockId entry = b.startFunction("f", {{"a", test::intType()}, {"b", test::boolType()}}, test::intType());
    LocalId extra = b.newLocal(test::intType());
    b.assign(Place::of(*b.returnLocal()), test::use(Operand::copy(b.param(0))));
    b.terminate(Terminator::ret());
    Function fn = b.finish();

    EXPECT_EQ(entry, 0u);
    EXPECT_EQ(fn.entry, 0u);
    ASSERT_EQ(fn.params.size(), 2u);
    EXPECT_EQ(fn.params[0].local, 0u);
    EXPECT_EQ(fn.params[1].local, 1u);
    EXPECT_TRUE(fn.isParam(1));
    ASSERT_TRUE(fn.returnLocal.has_value());
    EXPECT_EQ(*fn.returnLocal, 2u);
    EXPECT_EQ(extra, 3u);
    EXPECT_EQ(fn.nextLocalId(), 4u);
    EXPECT_EQ(fn.nextBlockId(), 1u);
    EXPECT_FALSE(fn.locals.at(0).isMutable);
}

TEST(MirBuilder, VoidFunctionHasNoReturnLocal)
{
    build::Builder b;
    b.startFunction("v", {}, Type(Type::Kind::Void));
    b.terminate(Terminator::ret());
    Function fn = b.finish();
    EXPECT_FALSE(fn.returnLocal.has_value());
    EXPECT_TRUE(fn.locals.empty());
}

TEST(MirBuilder, PopScopeEmitsStorageDeadInReverseOrder)
{
    build::Builder b;
    b.startFunction("scoped", {}, Type(Type::Kind::Void));
    b.pushScope();
    LocalId x = b.newLocal(test::intType());
    LocalId y = b.newLocal(test::intType());
    b.assign(Place::of(x), test::use(build::intConst(1)));
    b.assign(Place::of(y), test::use(build::intConst(2)));
    b.popScope();
    b.terminate(Terminator::ret());
    Function fn = b.finish();

    const auto &stmts = fn.blocks[0].statements;
    ASSERT_EQ(stmts.size(), 4u);
    EXPECT_EQ(stmts[2], Statement::storageDead(y));
    EXPECT_EQ(stmts[3], Statement::storageDead(x));
}

TEST(MirIR, BranchEncodesFalseTargetAsZero)
{
    Terminator t = Terminator::branch(build::boolConst(true), 5, 7);
    const auto *sw = std::get_if<term::SwitchInt>(&t.kind);
    ASSERT_NE(sw, nullptr);
    ASSERT_EQ(sw->values.size(), 1u);
    EXPECT_EQ(sw->values[0], UInt128(0));
    EXPECT_EQ(sw->targets[0], 7u);
    EXPECT_EQ(sw->otherwise, 5u);
    EXPECT_EQ(t.successors(), (std::vector<BlockId>{7, 5}));
}

TEST(MirIR, ReplaceSuccessorRewritesEveryEdge)
{
    Terminator t = Terminator::branch(build::boolConst(true), 3, 3);
    t.replaceSuccessor(3, 9);
    for (BlockId s : t.successors())
        EXPECT_EQ(s, 9u);
}

TEST(MirIR, ConstantsCompareByTypeAndValue)
{
    EXPECT_EQ(Constant::integer(3), Constant::integer(3));
    EXPECT_FALSE(Constant::integer(3) == Constant::integer(3, Type(Type::Kind::Integer64)));
    EXPECT_FALSE(Constant::integer(1) == Constant::boolean(true));
    EXPECT_EQ(Constant::integer(-42).toString(), "const -42_int");
    EXPECT_EQ(Constant::boolean(false).toString(), "const false");
    EXPECT_EQ(int128ToString(wrappingMul(Int128(1) << 100, Int128(1) << 100)), "0");
}

TEST(MirIR, TypeNames)
{
    EXPECT_EQ(Type(Type::Kind::Integer32).toString(), "i32");
    EXPECT_EQ(Type::pointer(test::intType(), true).toString(), "*mut int");
    EXPECT_EQ(Type::array(test::boolType(), 4).toString(), "[bool; 4]");
    EXPECT_TRUE(Type(Type::Kind::Float64).isNumeric());
    EXPECT_FALSE(test::boolType().isNumeric());
}

TEST(MirPrinter, PrintsLocalsBlocksAndTerminators)
{
    Function fn = test::makeSumLoop("sum", 4);
    std::string text = io::Printer::toString(fn);

    EXPECT_NE(text.find("fn sum() -> int {\n"), std::string::npos) << text;
    EXPECT_NE(text.find("    let mut _0: int; // return\n"), std::string::npos) << text;
    EXPECT_NE(text.find("    let mut _1: int; // i\n"), std::string::npos) << text;
    EXPECT_NE(text.find("  bb1:\n"), std::string::npos) << text;
    EXPECT_NE(text.find("    _3 = Lt(copy _1, const 4_int);\n"), std::string::npos) << text;
    EXPECT_NE(text.find("    switchInt(copy _3) -> [0: bb3, otherwise: bb2];\n"), std::string::npos)
        << text;
    EXPECT_NE(text.find("    goto -> bb1;\n"), std::string::npos) << text;
    EXPECT_NE(text.find("    return;\n"), std::string::npos) << text;
    EXPECT_EQ(text.back(), '\n');
}

TEST(MirPrinter, PrintsCallsAndExterns)
{
    Program program;
    ExternalFunction ext;
    ext.name = "puts";
    ext.params = {Type(Type::Kind::String)};
    ext.returnType = Type(Type::Kind::Void);
    program.externalFunctions.emplace(ext.name, ext);
    program.constants.emplace("LIMIT", Constant::integer(10));
    program.addFunction(test::makeCaller("main", "square", 7));
    program.addFunction(test::makeSquare());

    std::string text = io::Printer::toString(program);
    EXPECT_NE(text.find("extern fn puts(string) -> void;\n"), std::string::npos) << text;
    EXPECT_NE(text.find("const LIMIT: int = const 10_int;\n"), std::string::npos) << text;
    EXPECT_NE(text.find("_1 = call square(const 7_int) -> [return: bb1];"), std::string::npos)
        << text;
    EXPECT_LT(text.find("fn main()"), text.find("fn square("));
}

TEST(MirPrinter, EqualFunctionsPrintIdentically)
{
    EXPECT_EQ(io::Printer::toString(test::makeScaledLoop("f", 8)),
              io::Printer::toString(test::makeScaledLoop("f", 8)));
}

TEST(MirPrinter, VectorHintIsAnnotated)
{
    Function fn = test::makeSelfLoop("v", 8);
    fn.vectorHints[1] = 4;
    EXPECT_NE(io::Printer::toString(fn).find("  bb1: // vector width 4\n"), std::string::npos);
}
