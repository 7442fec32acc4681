//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/mir/transform/CSE.cpp
// Purpose: Block-local common-subexpression elimination.
// Key invariants:
//   - An entry is dropped when its defining local is reassigned or when any
//     local its expression reads is written.
//   - StorageLive/StorageDead of a local that an entry reads or defines
//     clears the whole table.
//   - Each rewritten rvalue becomes `Use(copy t)` where t first computed it.
// Ownership/Lifetime: Mutates caller-owned functions in place.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "mir/transform/CSE.hpp"

#include "mir/analysis/InductionVars.hpp"
#include "mir/transform/AnalysisIDs.hpp"
#include "mir/transform/ExprKey.hpp"
#include "mir/transform/PassRegistry.hpp"

#include <unordered_map>

using namespace mir::core;

namespace mir::transform
{

namespace
{

using ExprTable = std::unordered_map<ExprKey, LocalId, ExprKeyHash>;

bool tableMentions(const ExprTable &table, LocalId local)
{
    for (const auto &[key, def] : table)
        if (def == local || key.reads(local))
            return true;
    return false;
}

void forgetWritesTo(ExprTable &table, LocalId local)
{
    for (auto it = table.begin(); it != table.end();)
    {
        if (it->second == local || it->first.reads(local))
            it = table.erase(it);
        else
            ++it;
    }
}

bool cseBlock(BasicBlock &bb, const std::set<LocalId> &addressTaken)
{
    ExprTable table;
    bool changed = false;

    for (auto &stmt : bb.statements)
    {
        if (const auto *dead = std::get_if<stmt::StorageDead>(&stmt.kind))
        {
            if (tableMentions(table, dead->local))
                table.clear();
            continue;
        }
        if (const auto *live = std::get_if<stmt::StorageLive>(&stmt.kind))
        {
            if (tableMentions(table, live->local))
                table.clear();
            continue;
        }
        auto *assign = stmt.asAssign();
        if (!assign)
            continue;

        LocalId dest = assign->place.local;
        if (auto key = makeExprKey(assign->rvalue, addressTaken))
        {
            auto it = table.find(*key);
            if (it != table.end() && it->second != dest)
            {
                assign->rvalue = rv::Use{Operand::copy(it->second)};
                changed = true;
            }
        }

        forgetWritesTo(table, dest);

        if (!assign->place.isLocal() || addressTaken.count(dest))
            continue;
        auto key = makeExprKey(assign->rvalue, addressTaken);
        if (key && !key->reads(dest))
            table.emplace(std::move(*key), dest);
    }
    return changed;
}

} // namespace

bool cse(Function &fn)
{
    std::set<LocalId> addressTaken = analysis::addressTakenLocals(fn);
    bool changed = false;
    for (auto &bb : fn.blocks)
        changed |= cseBlock(bb, addressTaken);
    return changed;
}

void registerCSEPass(PassRegistry &registry)
{
    registry.registerFunctionPass(
        "common-subexpression-elimination",
        PassRegistry::FunctionPassCallback(
            [](Function &fn, PassContext &)
            {
                if (!cse(fn))
                    return PassResult::unchanged();
                PreservedAnalyses preserved;
                preserved.preserveFunction(kAnalysisCFG).preserveFunction(kAnalysisDominators);
                return PassResult::modified(preserved);
            }));
}

} // namespace mir::transform
