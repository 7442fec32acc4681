//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/mir/analysis/Dependence.cpp
// Purpose: Implements dependence detection on base-local overlap.
// Key invariants: A carried dependence exists when a local is read in the
//                 loop before its first definition in loop order, so the read
//                 observes the previous iteration's value.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "mir/analysis/Dependence.hpp"

#include "mir/utils/Uses.hpp"

#include <map>

namespace mir::analysis
{

using namespace core;
using dataflow::Location;

namespace
{

struct Access
{
    util::LocalSet reads;
    util::LocalSet writes;
};

Access statementAccess(const Statement &s)
{
    Access a;
    a.reads = util::statementReads(s);
    if (auto w = util::writtenLocal(s))
        a.writes.insert(*w);
    return a;
}

Access terminatorAccess(const Terminator &t)
{
    Access a;
    a.reads = util::terminatorReads(t);
    if (const auto *call = std::get_if<term::Call>(&t.kind))
        if (call->destination)
            a.writes.insert(call->destination->local);
    return a;
}

void pairDependences(const Access &first,
                     const Location &firstLoc,
                     const Access &second,
                     const Location &secondLoc,
                     std::vector<Dependence> &out)
{
    auto add = [&](DependenceKind kind, LocalId local)
    {
        Dependence d;
        d.source = firstLoc;
        d.sink = secondLoc;
        d.kind = kind;
        d.direction = DependenceDirection::Equal;
        d.distance = 0;
        d.local = local;
        out.push_back(d);
    };
    for (LocalId w : first.writes)
    {
        if (second.reads.count(w))
            add(DependenceKind::Flow, w);
        if (second.writes.count(w))
            add(DependenceKind::Output, w);
    }
    for (LocalId r : first.reads)
        if (second.writes.count(r))
            add(DependenceKind::Anti, r);
}

bool storesThroughPointer(const Statement &s)
{
    const auto *a = s.asAssign();
    return a && (a->place.hasDeref() || util::isCall(a->rvalue));
}

} // namespace

bool LoopDependences::hasCarriedOutside(const std::set<LocalId> &ignore) const
{
    for (const auto &d : loopCarried)
        if (!ignore.count(d.local))
            return true;
    return false;
}

std::vector<Dependence> blockDependences(const BasicBlock &bb)
{
    std::vector<Dependence> out;
    std::vector<Access> accesses;
    for (const auto &s : bb.statements)
        accesses.push_back(statementAccess(s));
    for (size_t i = 0; i < accesses.size(); ++i)
        for (size_t j = i + 1; j < accesses.size(); ++j)
            pairDependences(accesses[i], Location{bb.id, i}, accesses[j], Location{bb.id, j}, out);
    return out;
}

LoopDependences analyzeLoopDependences(const Function &fn, const CFGInfo &cfg, const Loop &loop)
{
    LoopDependences deps;

    // Loop order: reverse post-order restricted to the loop, header first.
    std::vector<std::pair<Location, Access>> ordered;
    for (BlockId b : cfg.reversePostOrder())
    {
        if (!loop.contains(b))
            continue;
        const BasicBlock *bb = fn.findBlock(b);
        if (!bb)
            continue;
        auto intra = blockDependences(*bb);
        deps.intraBlock.insert(deps.intraBlock.end(), intra.begin(), intra.end());
        for (size_t i = 0; i < bb->statements.size(); ++i)
        {
            ordered.emplace_back(Location{b, i}, statementAccess(bb->statements[i]));
            if (storesThroughPointer(bb->statements[i]))
                deps.memoryHazard = true;
        }
        ordered.emplace_back(Location{b, bb->statements.size()}, terminatorAccess(bb->terminator));
        if (std::holds_alternative<term::Call>(bb->terminator.kind))
            deps.memoryHazard = true;
    }

    std::map<LocalId, size_t> firstWrite;
    for (size_t pos = 0; pos < ordered.size(); ++pos)
        for (LocalId w : ordered[pos].second.writes)
            firstWrite.emplace(w, pos);

    std::set<LocalId> written;
    for (size_t pos = 0; pos < ordered.size(); ++pos)
    {
        const auto &[loc, access] = ordered[pos];
        for (LocalId r : access.reads)
        {
            auto it = firstWrite.find(r);
            if (it == firstWrite.end() || written.count(r))
                continue;
            Dependence d;
            d.source = ordered[it->second].first;
            d.sink = loc;
            d.kind = DependenceKind::Flow;
            d.direction = DependenceDirection::Less;
            d.distance = 1;
            d.local = r;
            deps.loopCarried.push_back(d);
        }
        written.insert(access.writes.begin(), access.writes.end());
    }
    return deps;
}

} // namespace mir::analysis
