//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/mir/build/Builder.cpp
// Purpose: Implements the MIR function builder.
// Key invariants: Id counters are private to each builder and reset by
//                 startFunction.
// Ownership/Lifetime: The builder owns the function until finish().
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "mir/build/Builder.hpp"

#include <cassert>

namespace mir::build
{

using namespace core;

BlockId Builder::startFunction(std::string name,
                               const std::vector<ParamSpec> &params,
                               Type returnType)
{
    assert(!name.empty() && "function name cannot be empty");

    fn_ = Function{};
    fn_.name = std::move(name);
    fn_.returnType = returnType;
    nextLocal_ = 0;
    nextBlock_ = 0;
    scopes_.clear();
    scopes_.emplace_back();
    started_ = true;

    for (const auto &[pname, ptype] : params)
    {
        LocalId id = nextLocal_++;
        Local local;
        local.type = ptype;
        local.isMutable = false;
        local.debugName = pname;
        fn_.locals.emplace(id, std::move(local));
        fn_.params.push_back(Parameter{pname, ptype, id});
    }

    if (returnType.kind != Type::Kind::Void)
    {
        LocalId ret = nextLocal_++;
        Local local;
        local.type = std::move(returnType);
        fn_.locals.emplace(ret, std::move(local));
        fn_.returnLocal = ret;
    }

    BlockId entry = newBlock();
    fn_.entry = entry;
    current_ = entry;
    return entry;
}

LocalId Builder::newLocal(Type type, bool isMutable, std::string debugName)
{
    assert(started_ && "no active function");
    LocalId id = nextLocal_++;
    Local local;
    local.type = std::move(type);
    local.isMutable = isMutable;
    local.debugName = std::move(debugName);
    fn_.locals.emplace(id, std::move(local));
    scopes_.back().push_back(id);
    return id;
}

BlockId Builder::newBlock()
{
    assert(started_ && "no active function");
    BasicBlock bb;
    bb.id = nextBlock_++;
    fn_.blocks.push_back(std::move(bb));
    return fn_.blocks.back().id;
}

void Builder::switchTo(BlockId block)
{
    assert(fn_.findBlock(block) && "unknown block");
    current_ = block;
}

BasicBlock &Builder::active()
{
    BasicBlock *bb = fn_.findBlock(current_);
    assert(bb && "insert point not set");
    return *bb;
}

void Builder::push(Statement stmt)
{
    active().statements.push_back(std::move(stmt));
}

void Builder::assign(Place place, Rvalue rvalue, SourceInfo info)
{
    push(Statement::assign(std::move(place), std::move(rvalue), info));
}

void Builder::terminate(Terminator term)
{
    active().terminator = std::move(term);
}

void Builder::pushScope()
{
    scopes_.emplace_back();
}

void Builder::popScope()
{
    assert(scopes_.size() > 1 && "cannot pop the function scope");
    std::vector<LocalId> declared = std::move(scopes_.back());
    scopes_.pop_back();
    for (auto it = declared.rbegin(); it != declared.rend(); ++it)
        push(Statement::storageDead(*it));
}

LocalId Builder::param(size_t index) const
{
    assert(index < fn_.params.size() && "parameter index out of range");
    return fn_.params[index].local;
}

Function Builder::finish()
{
    scopes_.clear();
    started_ = false;
    return std::move(fn_);
}

Operand intConst(Int128 value)
{
    return Operand::constOf(Constant::integer(value));
}

Operand boolConst(bool value)
{
    return Operand::constOf(Constant::boolean(value));
}

Operand floatConst(double value)
{
    return Operand::constOf(Constant::floating(value));
}

Operand funcRef(const std::string &name)
{
    return Operand::constOf(Constant::string(name));
}

} // namespace mir::build
