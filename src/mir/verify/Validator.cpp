//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/mir/verify/Validator.cpp
// Purpose: Implements the MIR structural checks.
// Key invariants: Findings are produced in a deterministic order: duplicate
//                 blocks, entry, per block in layout order, then multiple
//                 assignments by local id.
// Ownership/Lifetime: Reads caller-owned IR only.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "mir/verify/Validator.hpp"

#include "mir/analysis/CFG.hpp"
#include "mir/utils/Uses.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <sstream>

namespace mir::verify
{

using namespace core;
using Kind = ValidationError::Kind;

bool ValidationError::isHardError() const
{
    switch (kind)
    {
        case Kind::UndefinedLocal:
        case Kind::MissingTerminator:
        case Kind::InvalidEdge:
        case Kind::DuplicateBlock:
        case Kind::UnknownCallee:
            return true;
        case Kind::UnreachableCode:
        case Kind::MultipleAssignment:
            return false;
    }
    return true;
}

std::string ValidationError::toString() const
{
    std::ostringstream os;
    os << function << ": ";
    switch (kind)
    {
        case Kind::UndefinedLocal:
            os << "bb" << block << "[" << statementIndex << "]: undefined local _" << local;
            break;
        case Kind::MissingTerminator:
            os << "bb" << block << ": missing terminator";
            break;
        case Kind::InvalidEdge:
            os << "invalid edge bb" << block << " -> bb" << target;
            break;
        case Kind::UnreachableCode:
            os << "bb" << block << ": unreachable block";
            break;
        case Kind::DuplicateBlock:
            os << "duplicate block bb" << block;
            break;
        case Kind::MultipleAssignment:
            os << "local _" << local << " assigned " << count << " times";
            break;
        case Kind::UnknownCallee:
            os << "bb" << block << ": call to unknown function '" << callee << "'";
            break;
    }
    return os.str();
}

namespace
{

ValidationError finding(Kind kind, const Function &fn)
{
    ValidationError e{kind, fn.name};
    return e;
}

bool isDeclared(const Function &fn, LocalId id)
{
    return fn.locals.count(id) != 0 || fn.isParam(id);
}

void checkLocals(const Function &fn,
                 const BasicBlock &bb,
                 const util::LocalSet &mentioned,
                 size_t index,
                 std::vector<ValidationError> &out)
{
    for (LocalId id : mentioned)
    {
        if (isDeclared(fn, id))
            continue;
        auto e = finding(Kind::UndefinedLocal, fn);
        e.local = id;
        e.block = bb.id;
        e.statementIndex = index;
        out.push_back(std::move(e));
    }
}

} // namespace

std::vector<ValidationError> Validator::validate(const Function &fn)
{
    std::vector<ValidationError> out;

    std::set<BlockId> seen;
    for (const auto &bb : fn.blocks)
    {
        if (seen.insert(bb.id).second)
            continue;
        auto e = finding(Kind::DuplicateBlock, fn);
        e.block = bb.id;
        out.push_back(std::move(e));
    }

    const bool hasEntry = fn.findBlock(fn.entry) != nullptr;
    if (!hasEntry)
    {
        auto e = finding(Kind::InvalidEdge, fn);
        e.block = fn.entry;
        e.target = fn.entry;
        out.push_back(std::move(e));
    }

    const std::set<BlockId> reachable = analysis::reachableBlocks(fn);

    for (const auto &bb : fn.blocks)
    {
        for (size_t i = 0; i < bb.statements.size(); ++i)
            checkLocals(fn, bb, util::statementMentions(bb.statements[i]), i, out);

        util::LocalSet termLocals = util::terminatorMentions(bb.terminator);
        if (bb.terminator.isReturn() && fn.returnLocal)
            termLocals.insert(*fn.returnLocal);
        checkLocals(fn, bb, termLocals, bb.statements.size(), out);

        for (BlockId succ : bb.terminator.successors())
        {
            if (seen.count(succ))
                continue;
            auto e = finding(Kind::InvalidEdge, fn);
            e.block = bb.id;
            e.target = succ;
            out.push_back(std::move(e));
        }

        const bool isReachable = reachable.count(bb.id) != 0;
        if (isReachable && bb.terminator.isUnreachable())
        {
            auto e = finding(Kind::MissingTerminator, fn);
            e.block = bb.id;
            out.push_back(std::move(e));
        }
        if (hasEntry && !isReachable)
        {
            auto e = finding(Kind::UnreachableCode, fn);
            e.block = bb.id;
            out.push_back(std::move(e));
        }
    }

    std::map<LocalId, unsigned> assignments;
    for (const auto &bb : fn.blocks)
    {
        for (const auto &s : bb.statements)
            if (auto w = util::writtenLocal(s))
                ++assignments[*w];
        if (const auto *call = std::get_if<term::Call>(&bb.terminator.kind))
            if (call->destination)
                ++assignments[call->destination->local];
    }
    for (const auto &[local, count] : assignments)
    {
        if (count < 2)
            continue;
        auto e = finding(Kind::MultipleAssignment, fn);
        e.local = local;
        e.count = count;
        out.push_back(std::move(e));
    }
    return out;
}

std::vector<ValidationError> Validator::validateProgram(const Program &program)
{
    std::vector<ValidationError> out;
    auto known = [&](const std::string &name)
    {
        return program.functions.count(name) != 0 || program.externalFunctions.count(name) != 0 ||
               program.constants.count(name) != 0;
    };

    for (const auto &[name, fn] : program.functions)
    {
        auto errs = validate(fn);
        out.insert(out.end(), errs.begin(), errs.end());

        auto report = [&](BlockId block, const Operand &func)
        {
            auto callee = util::directCallee(func);
            if (!callee || known(*callee))
                return;
            auto e = finding(Kind::UnknownCallee, fn);
            e.block = block;
            e.callee = *callee;
            out.push_back(std::move(e));
        };
        for (const auto &bb : fn.blocks)
        {
            for (const auto &s : bb.statements)
                if (const auto *a = s.asAssign())
                    if (const auto *call = std::get_if<rv::Call>(&a->rvalue))
                        report(bb.id, call->func);
            if (const auto *call = std::get_if<term::Call>(&bb.terminator.kind))
                report(bb.id, call->func);
        }
    }
    return out;
}

bool Validator::isWellFormed(const std::vector<ValidationError> &errors)
{
    return std::none_of(
        errors.begin(), errors.end(), [](const ValidationError &e) { return e.isHardError(); });
}

support::Expected<void> Validator::verify(const Program &program)
{
    for (const auto &e : validateProgram(program))
        if (e.isHardError())
            return support::makeError(e.toString());
    return {};
}

} // namespace mir::verify
