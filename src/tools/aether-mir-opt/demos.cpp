//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Builds the demo programs shipped with aether-mir-opt. Each one targets a
// group of passes:
//
//   loop-sum        counted loop with an invariant product and a scaled
//                   induction variable (loop optimization, folding)
//   calls           helper chain, a named constant and an external call
//                   (inlining, interprocedural, pure-call folding)
//   dead-functions  unreachable helpers next to an exported function
//                   (dead-function elimination)
//
//===----------------------------------------------------------------------===//

#include "tools/aether-mir-opt/demos.hpp"

#include "mir/build/Builder.hpp"

using namespace mir;
using namespace mir::core;

namespace aether::tools::mir_opt
{

namespace
{

Type intType()
{
    return Type(Type::Kind::Integer);
}

Rvalue binary(BinOp op, Operand lhs, Operand rhs)
{
    return rv::BinaryOp{op, std::move(lhs), std::move(rhs)};
}

Rvalue use(Operand op)
{
    return rv::Use{std::move(op)};
}

Terminator call(const std::string &callee,
                std::vector<Operand> args,
                std::optional<Place> dest,
                BlockId target)
{
    term::Call c;
    c.func = build::funcRef(callee);
    c.args = std::move(args);
    c.destination = std::move(dest);
    c.target = target;
    return Terminator{std::move(c)};
}

/// fn main() -> int
///   i = 0; s = 0
///   loop while i < 12: t = Mul(k, 3); j = Mul(i, 4); s = s + t + j; i += 1
///   return s
Program makeLoopSum()
{
    build::Builder b;
    b.startFunction("main", {}, intType());
    LocalId k = b.newLocal(intType(), false, "k");
    LocalId i = b.newLocal(intType(), true, "i");
    LocalId s = b.newLocal(intType(), true, "s");
    LocalId t = b.newLocal(intType(), true, "t");
    LocalId j = b.newLocal(intType(), true, "j");
    LocalId cond = b.newLocal(Type(Type::Kind::Boolean), true, "cond");
    BlockId header = b.newBlock();
    BlockId body = b.newBlock();
    BlockId exit = b.newBlock();

    b.assign(Place::of(k), use(build::intConst(7)));
    b.assign(Place::of(i), use(build::intConst(0)));
    b.assign(Place::of(s), use(build::intConst(0)));
    b.terminate(Terminator::gotoBlock(header));

    b.switchTo(header);
    b.assign(Place::of(cond), binary(BinOp::Lt, Operand::copy(i), build::intConst(12)));
    b.terminate(Terminator::branch(Operand::copy(cond), body, exit));

    b.switchTo(body);
    b.assign(Place::of(t), binary(BinOp::Mul, Operand::copy(k), build::intConst(3)));
    b.assign(Place::of(j), binary(BinOp::Mul, Operand::copy(i), build::intConst(4)));
    b.assign(Place::of(s), binary(BinOp::Add, Operand::copy(s), Operand::copy(t)));
    b.assign(Place::of(s), binary(BinOp::Add, Operand::copy(s), Operand::copy(j)));
    b.assign(Place::of(i), binary(BinOp::Add, Operand::copy(i), build::intConst(1)));
    b.terminate(Terminator::gotoBlock(header));

    b.switchTo(exit);
    b.assign(Place::of(*b.returnLocal()), use(Operand::copy(s)));
    b.terminate(Terminator::ret());

    Program program;
    program.addFunction(b.finish());
    return program;
}

/// fn square(x) -> int { return x * x }
Function makeSquare()
{
    build::Builder b;
    b.startFunction("square", {{"x", intType()}}, intType());
    b.assign(Place::of(*b.returnLocal()),
             binary(BinOp::Mul, Operand::copy(b.param(0)), Operand::copy(b.param(0))));
    b.terminate(Terminator::ret());
    return b.finish();
}

/// fn main() -> int
///   r = helper(LIMIT()); puts("done"); return r
/// fn helper(x) -> int { q = square(x); return q + 1 }
Program makeCalls()
{
    Program program;
    program.constants.emplace("LIMIT", Constant::integer(6));

    ExternalFunction putsDecl;
    putsDecl.name = "puts";
    putsDecl.params = {Type(Type::Kind::String)};
    putsDecl.returnType = intType();
    program.externalFunctions.emplace(putsDecl.name, putsDecl);

    {
        build::Builder b;
        b.startFunction("main", {}, intType());
        LocalId limit = b.newLocal(intType(), false, "limit");
        LocalId r = b.newLocal(intType(), false, "r");
        LocalId status = b.newLocal(intType(), false, "status");
        BlockId afterHelper = b.newBlock();
        BlockId afterPuts = b.newBlock();
        b.assign(Place::of(limit), rv::Call{build::funcRef("LIMIT"), {}});
        b.terminate(call("helper", {Operand::copy(limit)}, Place::of(r), afterHelper));
        b.switchTo(afterHelper);
        b.terminate(call("puts",
                         {Operand::constOf(Constant::string("done"))},
                         Place::of(status),
                         afterPuts));
        b.switchTo(afterPuts);
        b.assign(Place::of(*b.returnLocal()), use(Operand::copy(r)));
        b.terminate(Terminator::ret());
        program.addFunction(b.finish());
    }
    {
        build::Builder b;
        b.startFunction("helper", {{"x", intType()}}, intType());
        LocalId q = b.newLocal(intType(), false, "q");
        BlockId done = b.newBlock();
        b.terminate(call("square", {Operand::copy(b.param(0))}, Place::of(q), done));
        b.switchTo(done);
        b.assign(Place::of(*b.returnLocal()),
                 binary(BinOp::Add, Operand::copy(q), build::intConst(1)));
        b.terminate(Terminator::ret());
        program.addFunction(b.finish());
    }
    program.addFunction(makeSquare());
    return program;
}

/// main calls square; orphan and its callee unused are unreachable; exported
/// is declared external and therefore kept.
Program makeDeadFunctions()
{
    Program program;
    {
        build::Builder b;
        b.startFunction("main", {}, intType());
        LocalId r = b.newLocal(intType(), false, "r");
        BlockId done = b.newBlock();
        b.terminate(call("square", {build::intConst(3)}, Place::of(r), done));
        b.switchTo(done);
        b.assign(Place::of(*b.returnLocal()), use(Operand::copy(r)));
        b.terminate(Terminator::ret());
        program.addFunction(b.finish());
    }
    {
        build::Builder b;
        b.startFunction("orphan", {}, intType());
        LocalId r = b.newLocal(intType(), false, "r");
        BlockId done = b.newBlock();
        b.terminate(call("unused", {}, Place::of(r), done));
        b.switchTo(done);
        b.assign(Place::of(*b.returnLocal()), use(Operand::copy(r)));
        b.terminate(Terminator::ret());
        program.addFunction(b.finish());
    }
    for (const char *name : {"unused", "exported"})
    {
        build::Builder b;
        b.startFunction(name, {}, intType());
        b.assign(Place::of(*b.returnLocal()), use(build::intConst(1)));
        b.terminate(Terminator::ret());
        program.addFunction(b.finish());
    }
    program.addFunction(makeSquare());

    ExternalFunction exported;
    exported.name = "exported";
    exported.returnType = intType();
    program.externalFunctions.emplace(exported.name, exported);
    return program;
}

} // namespace

const std::vector<std::string> &demoNames()
{
    static const std::vector<std::string> names = {"loop-sum", "calls", "dead-functions"};
    return names;
}

std::optional<Program> makeDemo(std::string_view name)
{
    if (name == "loop-sum")
        return makeLoopSum();
    if (name == "calls")
        return makeCalls();
    if (name == "dead-functions")
        return makeDeadFunctions();
    return std::nullopt;
}

} // namespace aether::tools::mir_opt
