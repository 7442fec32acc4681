//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/mir/core/Terminator.cpp
// Purpose: Successor enumeration and edge rewriting for terminators.
// Key invariants: Successor order is the explicit targets first, then the
//                 fallback or unwind edge.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "mir/core/Terminator.hpp"
#include "support/overload.hpp"

#include <algorithm>
#include <type_traits>

namespace mir::core
{

namespace
{
using support::Overload;

void pushUnique(std::vector<BlockId> &out, BlockId id)
{
    if (std::find(out.begin(), out.end(), id) == out.end())
        out.push_back(id);
}
} // namespace

Terminator Terminator::branch(Operand cond, BlockId ifTrue, BlockId ifFalse)
{
    term::SwitchInt sw;
    sw.discriminant = std::move(cond);
    sw.switchType = Type(Type::Kind::Boolean);
    sw.values = {0};
    sw.targets = {ifFalse};
    sw.otherwise = ifTrue;
    return Terminator{std::move(sw)};
}

std::vector<BlockId> Terminator::successors() const
{
    std::vector<BlockId> out;
    std::visit(Overload{[&](const term::Goto &t) { pushUnique(out, t.target); },
                        [&](const term::SwitchInt &t)
                        {
                            for (BlockId b : t.targets)
                                pushUnique(out, b);
                            pushUnique(out, t.otherwise);
                        },
                        [&](const term::Call &t)
                        {
                            if (t.target)
                                pushUnique(out, *t.target);
                            if (t.cleanup)
                                pushUnique(out, *t.cleanup);
                        },
                        [&](const term::Drop &t)
                        {
                            pushUnique(out, t.target);
                            if (t.unwind)
                                pushUnique(out, *t.unwind);
                        },
                        [&](const term::Assert &t)
                        {
                            pushUnique(out, t.target);
                            if (t.cleanup)
                                pushUnique(out, *t.cleanup);
                        },
                        [](const auto &) {}},
               kind);
    return out;
}

void Terminator::replaceSuccessor(BlockId from, BlockId to)
{
    auto fix = [&](BlockId &b)
    {
        if (b == from)
            b = to;
    };
    auto fixOpt = [&](std::optional<BlockId> &b)
    {
        if (b && *b == from)
            b = to;
    };
    std::visit(Overload{[&](term::Goto &t) { fix(t.target); },
                        [&](term::SwitchInt &t)
                        {
                            for (BlockId &b : t.targets)
                                fix(b);
                            fix(t.otherwise);
                        },
                        [&](term::Call &t)
                        {
                            fixOpt(t.target);
                            fixOpt(t.cleanup);
                        },
                        [&](term::Drop &t)
                        {
                            fix(t.target);
                            fixOpt(t.unwind);
                        },
                        [&](term::Assert &t)
                        {
                            fix(t.target);
                            fixOpt(t.cleanup);
                        },
                        [](auto &) {}},
               kind);
}

std::string toString(const AssertMessage &msg)
{
    return std::visit(
        Overload{[](const assert_msg::BoundsCheck &m)
                 {
                     return "index out of bounds: len " + m.len.toString() + ", index " +
                            m.index.toString();
                 },
                 [](const assert_msg::Overflow &m)
                 {
                     return std::string("overflow in ") + toString(m.op) + "(" + m.a.toString() +
                            ", " + m.b.toString() + ")";
                 },
                 [](const assert_msg::DivisionByZero &) { return std::string("division by zero"); },
                 [](const assert_msg::RemainderByZero &)
                 { return std::string("remainder by zero"); },
                 [](const assert_msg::Custom &m) { return m.text; }},
        msg);
}

} // namespace mir::core
