// File: src/mir/transform/DCE.cpp
// Purpose: Unreachable-block, dead-store and unused-local elimination.
// Key invariants: Block layout order of surviving blocks is unchanged; the
//                 return local is never removed.
// Ownership/Lifetime: Mutates caller-owned functions in place.
// Links: DESIGN.md

#include "mir/transform/DCE.hpp"

#include "mir/analysis/CFG.hpp"
#include "mir/analysis/InductionVars.hpp"
#include "mir/dataflow/Liveness.hpp"
#include "mir/transform/PassRegistry.hpp"
#include "mir/utils/Uses.hpp"

#include <algorithm>

using namespace mir::core;

namespace mir::transform
{

bool removeUnreachableBlocks(Function &fn)
{
    std::set<BlockId> reachable = analysis::reachableBlocks(fn);
    size_t before = fn.blocks.size();
    fn.blocks.erase(std::remove_if(fn.blocks.begin(),
                                   fn.blocks.end(),
                                   [&](const BasicBlock &bb) { return !reachable.count(bb.id); }),
                    fn.blocks.end());
    for (auto it = fn.vectorHints.begin(); it != fn.vectorHints.end();)
    {
        if (reachable.count(it->first))
            ++it;
        else
            it = fn.vectorHints.erase(it);
    }
    return fn.blocks.size() != before;
}

namespace
{

/// One sweep of dead-store removal against a fresh liveness solution.
bool sweepDeadAssignments(Function &fn)
{
    dataflow::LivenessResult live(fn);
    std::set<LocalId> addressTaken = analysis::addressTakenLocals(fn);
    bool changed = false;

    for (auto &bb : fn.blocks)
    {
        std::vector<Statement> kept;
        kept.reserve(bb.statements.size());
        for (size_t i = 0; i < bb.statements.size(); ++i)
        {
            Statement &stmt = bb.statements[i];
            if (stmt.isNop())
            {
                changed = true;
                continue;
            }
            const auto *assign = stmt.asAssign();
            if (!assign || !assign->place.isLocal() || util::isCall(assign->rvalue))
            {
                kept.push_back(std::move(stmt));
                continue;
            }
            LocalId dest = assign->place.local;
            bool observable = fn.isParam(dest) || fn.returnLocal == dest ||
                              addressTaken.count(dest) ||
                              live.liveBefore(dataflow::Location{bb.id, i + 1}).count(dest);
            if (observable)
            {
                kept.push_back(std::move(stmt));
                continue;
            }
            changed = true;
        }
        bb.statements = std::move(kept);
    }
    return changed;
}

} // namespace

bool removeDeadAssignments(Function &fn)
{
    bool changed = false;
    while (sweepDeadAssignments(fn))
        changed = true;
    return changed;
}

bool removeUnusedLocals(Function &fn)
{
    util::LocalSet used;
    for (const auto &p : fn.params)
        used.insert(p.local);
    if (fn.returnLocal)
        used.insert(*fn.returnLocal);
    for (const auto &bb : fn.blocks)
    {
        for (const auto &stmt : bb.statements)
        {
            util::LocalSet m = util::statementMentions(stmt);
            used.insert(m.begin(), m.end());
        }
        util::LocalSet m = util::terminatorMentions(bb.terminator);
        used.insert(m.begin(), m.end());
    }

    bool changed = false;
    for (auto it = fn.locals.begin(); it != fn.locals.end();)
    {
        if (used.count(it->first))
        {
            ++it;
            continue;
        }
        it = fn.locals.erase(it);
        changed = true;
    }
    return changed;
}

bool dce(Function &fn)
{
    bool changed = removeUnreachableBlocks(fn);
    changed |= removeDeadAssignments(fn);
    changed |= removeUnusedLocals(fn);
    return changed;
}

void registerDCEPass(PassRegistry &registry)
{
    registry.registerFunctionPass("dead-code-elimination",
                                  std::function<bool(Function &)>(
                                      [](Function &fn) { return dce(fn); }));
}

} // namespace mir::transform
