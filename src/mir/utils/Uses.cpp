// File: src/mir/utils/Uses.cpp
// Purpose: Implements read/write queries and id remapping for MIR.
// Key invariants: Call terminators write their destination; everything else
//                 in a terminator is a read.
// Ownership/Lifetime: Operates on caller-owned IR.
// Links: DESIGN.md

#include "mir/utils/Uses.hpp"

#include "support/overload.hpp"

namespace mir::util
{

using namespace core;
using support::Overload;

std::optional<std::string> directCallee(const Operand &func)
{
    if (!func.isConstant() || !func.getConstant().isString())
        return std::nullopt;
    return func.getConstant().asString();
}

namespace
{
void addProjectionReads(const Place &place, LocalSet &out)
{
    for (const auto &elem : place.projection)
        if (const auto *idx = std::get_if<proj::Index>(&elem))
            out.insert(idx->local);
}
} // namespace

void addPlaceReads(const Place &place, LocalSet &out)
{
    out.insert(place.local);
    addProjectionReads(place, out);
}

void addDestinationReads(const Place &place, LocalSet &out)
{
    if (!place.isLocal())
        out.insert(place.local);
    addProjectionReads(place, out);
}

void addOperandReads(const Operand &op, LocalSet &out)
{
    if (op.isPlace())
        addPlaceReads(op.place, out);
}

void addRvalueReads(const Rvalue &rvalue, LocalSet &out)
{
    std::visit(Overload{[&](const rv::Use &r) { addOperandReads(r.operand, out); },
                        [&](const rv::BinaryOp &r)
                        {
                            addOperandReads(r.left, out);
                            addOperandReads(r.right, out);
                        },
                        [&](const rv::UnaryOp &r) { addOperandReads(r.operand, out); },
                        [&](const rv::Call &r)
                        {
                            addOperandReads(r.func, out);
                            for (const auto &a : r.args)
                                addOperandReads(a, out);
                        },
                        [&](const rv::Aggregate &r)
                        {
                            for (const auto &a : r.operands)
                                addOperandReads(a, out);
                        },
                        [&](const rv::Cast &r) { addOperandReads(r.operand, out); },
                        [&](const rv::Ref &r) { addPlaceReads(r.place, out); },
                        [&](const rv::Len &r) { addPlaceReads(r.place, out); },
                        [&](const rv::Discriminant &r) { addPlaceReads(r.place, out); }},
               rvalue);
}

LocalSet statementReads(const Statement &stmt)
{
    LocalSet out;
    if (const auto *a = stmt.asAssign())
    {
        addRvalueReads(a->rvalue, out);
        addDestinationReads(a->place, out);
    }
    return out;
}

LocalSet terminatorReads(const Terminator &term)
{
    LocalSet out;
    std::visit(Overload{[&](const term::SwitchInt &t) { addOperandReads(t.discriminant, out); },
                        [&](const term::Call &t)
                        {
                            addOperandReads(t.func, out);
                            for (const auto &a : t.args)
                                addOperandReads(a, out);
                            if (t.destination)
                                addDestinationReads(*t.destination, out);
                        },
                        [&](const term::Drop &t) { addPlaceReads(t.place, out); },
                        [&](const term::Assert &t)
                        {
                            addOperandReads(t.condition, out);
                            if (const auto *bc = std::get_if<assert_msg::BoundsCheck>(&t.message))
                            {
                                addOperandReads(bc->len, out);
                                addOperandReads(bc->index, out);
                            }
                            else if (const auto *ov = std::get_if<assert_msg::Overflow>(&t.message))
                            {
                                addOperandReads(ov->a, out);
                                addOperandReads(ov->b, out);
                            }
                        },
                        [](const auto &) {}},
               term.kind);
    return out;
}

LocalSet statementMentions(const Statement &stmt)
{
    LocalSet out = statementReads(stmt);
    std::visit(Overload{[&](const stmt::Assign &s) { out.insert(s.place.local); },
                        [&](const stmt::StorageLive &s) { out.insert(s.local); },
                        [&](const stmt::StorageDead &s) { out.insert(s.local); },
                        [](const stmt::Nop &) {}},
               stmt.kind);
    return out;
}

LocalSet terminatorMentions(const Terminator &term)
{
    LocalSet out = terminatorReads(term);
    if (const auto *call = std::get_if<term::Call>(&term.kind))
        if (call->destination)
            out.insert(call->destination->local);
    return out;
}

std::optional<LocalId> definedLocal(const Statement &stmt)
{
    const auto *a = stmt.asAssign();
    if (!a || !a->place.isLocal())
        return std::nullopt;
    return a->place.local;
}

std::optional<LocalId> writtenLocal(const Statement &stmt)
{
    const auto *a = stmt.asAssign();
    if (!a)
        return std::nullopt;
    return a->place.local;
}

bool isCall(const Rvalue &rvalue)
{
    return std::holds_alternative<rv::Call>(rvalue);
}

void remapLocals(Place &place, const LocalMapFn &map)
{
    place.local = map(place.local);
    for (auto &elem : place.projection)
        if (auto *idx = std::get_if<proj::Index>(&elem))
            idx->local = map(idx->local);
}

void remapLocals(Operand &op, const LocalMapFn &map)
{
    if (op.isPlace())
        remapLocals(op.place, map);
}

void remapLocals(Rvalue &rvalue, const LocalMapFn &map)
{
    std::visit(Overload{[&](rv::Use &r) { remapLocals(r.operand, map); },
                        [&](rv::BinaryOp &r)
                        {
                            remapLocals(r.left, map);
                            remapLocals(r.right, map);
                        },
                        [&](rv::UnaryOp &r) { remapLocals(r.operand, map); },
                        [&](rv::Call &r)
                        {
                            remapLocals(r.func, map);
                            for (auto &a : r.args)
                                remapLocals(a, map);
                        },
                        [&](rv::Aggregate &r)
                        {
                            for (auto &a : r.operands)
                                remapLocals(a, map);
                        },
                        [&](rv::Cast &r) { remapLocals(r.operand, map); },
                        [&](rv::Ref &r) { remapLocals(r.place, map); },
                        [&](rv::Len &r) { remapLocals(r.place, map); },
                        [&](rv::Discriminant &r) { remapLocals(r.place, map); }},
               rvalue);
}

void remapLocals(Statement &stmt, const LocalMapFn &map)
{
    std::visit(Overload{[&](stmt::Assign &s)
                        {
                            remapLocals(s.place, map);
                            remapLocals(s.rvalue, map);
                        },
                        [&](stmt::StorageLive &s) { s.local = map(s.local); },
                        [&](stmt::StorageDead &s) { s.local = map(s.local); },
                        [](stmt::Nop &) {}},
               stmt.kind);
}

void remapLocals(Terminator &term, const LocalMapFn &map)
{
    std::visit(Overload{[&](term::SwitchInt &t) { remapLocals(t.discriminant, map); },
                        [&](term::Call &t)
                        {
                            remapLocals(t.func, map);
                            for (auto &a : t.args)
                                remapLocals(a, map);
                            if (t.destination)
                                remapLocals(*t.destination, map);
                        },
                        [&](term::Drop &t) { remapLocals(t.place, map); },
                        [&](term::Assert &t)
                        {
                            remapLocals(t.condition, map);
                            if (auto *bc = std::get_if<assert_msg::BoundsCheck>(&t.message))
                            {
                                remapLocals(bc->len, map);
                                remapLocals(bc->index, map);
                            }
                            else if (auto *ov = std::get_if<assert_msg::Overflow>(&t.message))
                            {
                                remapLocals(ov->a, map);
                                remapLocals(ov->b, map);
                            }
                        },
                        [](auto &) {}},
               term.kind);
}

void remapBlocks(Terminator &term, const BlockMapFn &map)
{
    auto fixOpt = [&](std::optional<BlockId> &b)
    {
        if (b)
            b = map(*b);
    };
    std::visit(Overload{[&](term::Goto &t) { t.target = map(t.target); },
                        [&](term::SwitchInt &t)
                        {
                            for (auto &b : t.targets)
                                b = map(b);
                            t.otherwise = map(t.otherwise);
                        },
                        [&](term::Call &t)
                        {
                            fixOpt(t.target);
                            fixOpt(t.cleanup);
                        },
                        [&](term::Drop &t)
                        {
                            t.target = map(t.target);
                            fixOpt(t.unwind);
                        },
                        [&](term::Assert &t)
                        {
                            t.target = map(t.target);
                            fixOpt(t.cleanup);
                        },
                        [](auto &) {}},
               term.kind);
}

unsigned countAssignments(const Function &fn, LocalId local)
{
    unsigned count = 0;
    for (const auto &bb : fn.blocks)
    {
        for (const auto &s : bb.statements)
            if (auto w = writtenLocal(s); w && *w == local)
                ++count;
        if (const auto *call = std::get_if<term::Call>(&bb.terminator.kind))
            if (call->destination && call->destination->local == local)
                ++count;
    }
    return count;
}

} // namespace mir::util
