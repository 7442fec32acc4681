//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the MIR inliner: cost model, candidate selection and the splice
// of a callee body into a call site. Calls through a non-constant operand,
// calls whose argument count does not match, calls that need a value from a
// callee without return local and terminator calls without a return edge are
// skipped with a note.
//
//===----------------------------------------------------------------------===//

#include "mir/transform/Inline.hpp"

#include "mir/analysis/CallGraph.hpp"
#include "mir/core/Program.hpp"
#include "mir/utils/Uses.hpp"
#include "support/trace.hpp"

#include <algorithm>
#include <iostream>
#include <map>
#include <set>

using namespace mir::core;

namespace mir::transform
{

namespace
{

void note(support::DiagnosticEngine *diags, const std::string &message)
{
    if (diags)
        diags->note(message);
}

/// Call rvalue of statement @p index in @p bb, when there is one.
const rv::Call *callAt(const BasicBlock &bb, size_t index)
{
    if (index >= bb.statements.size())
        return nullptr;
    const auto *assign = bb.statements[index].asAssign();
    if (!assign)
        return nullptr;
    return std::get_if<rv::Call>(&assign->rvalue);
}

/// Fresh caller ids for every local and block of the callee.
struct CloneMaps
{
    std::map<LocalId, LocalId> locals;
    std::map<BlockId, BlockId> blocks;
    BlockId nextFree = 0; ///< First block id not used by the clone.
};

CloneMaps allocateIds(Function &caller, const Function &callee)
{
    CloneMaps maps;
    std::set<LocalId> ids;
    for (const auto &[id, local] : callee.locals)
        ids.insert(id);
    for (const auto &p : callee.params)
        ids.insert(p.local);
    if (callee.returnLocal)
        ids.insert(*callee.returnLocal);

    for (LocalId id : ids)
    {
        auto it = callee.locals.find(id);
        Type type = it != callee.locals.end() ? it->second.type : callee.localType(id);
        LocalId fresh = caller.addLocal(type, true);
        if (it != callee.locals.end())
        {
            caller.locals[fresh].sourceInfo = it->second.sourceInfo;
            caller.locals[fresh].debugName = it->second.debugName;
        }
        maps.locals.emplace(id, fresh);
    }

    BlockId next = caller.nextBlockId();
    for (const auto &bb : callee.blocks)
        maps.blocks.emplace(bb.id, next++);
    maps.nextFree = next;
    return maps;
}

} // namespace

unsigned inlineCost(const Function &fn, const InlineConfig &config)
{
    unsigned cost = 0;
    for (const auto &bb : fn.blocks)
    {
        cost += static_cast<unsigned>(bb.statements.size());
        if (std::holds_alternative<term::Call>(bb.terminator.kind))
            cost += config.callWeight;
        else if (std::holds_alternative<term::SwitchInt>(bb.terminator.kind))
            cost += config.switchWeight;
        else
            cost += config.otherWeight;
    }
    return cost;
}

bool isInlineCandidate(const Function &callee,
                       const analysis::CallGraph &cg,
                       const InlineConfig &config)
{
    if (callee.blocks.empty() || cg.isRecursive(callee.name))
        return false;
    if (cg.callSiteCount(callee.name) > config.maxCallSites)
        return false;
    return inlineCost(callee, config) <= config.threshold;
}

bool inlineCallSite(Function &caller,
                    BlockId block,
                    std::optional<size_t> statement,
                    const Function &callee,
                    support::DiagnosticEngine *diags)
{
    auto blockPos = caller.blockIndex(block);
    if (!blockPos || callee.blocks.empty() || !callee.findBlock(callee.entry))
        return false;
    BasicBlock &site = caller.blocks[*blockPos];

    std::vector<Operand> args;
    std::optional<Place> destination;
    std::optional<BlockId> continuation;
    if (statement)
    {
        const rv::Call *call = callAt(site, *statement);
        if (!call)
            return false;
        args = call->args;
        destination = site.statements[*statement].asAssign()->place;
    }
    else
    {
        const auto *call = std::get_if<term::Call>(&site.terminator.kind);
        if (!call)
            return false;
        if (!call->target)
        {
            note(diags, "inline: call to '" + callee.name + "' in '" + caller.name +
                            "' has no return edge; skipped");
            return false;
        }
        args = call->args;
        destination = call->destination;
        continuation = call->target;
    }

    if (args.size() != callee.params.size())
    {
        note(diags, "inline: argument count mismatch calling '" + callee.name + "' from '" +
                        caller.name + "'; skipped");
        return false;
    }
    if (destination && !callee.returnLocal && callee.returnType.kind == Type::Kind::Void)
        destination.reset();
    if (destination && !callee.returnLocal)
    {
        note(diags, "inline: '" + callee.name + "' has no return local; call in '" +
                        caller.name + "' skipped");
        return false;
    }

    CloneMaps maps = allocateIds(caller, callee);

    // Statement form: split the block after the call.
    std::optional<BasicBlock> tail;
    if (statement)
    {
        BasicBlock rest;
        rest.id = maps.nextFree;
        rest.statements.assign(site.statements.begin() + static_cast<long>(*statement + 1),
                               site.statements.end());
        rest.terminator = site.terminator;
        site.statements.resize(*statement);
        continuation = rest.id;
        tail = std::move(rest);
    }

    for (size_t i = 0; i < args.size(); ++i)
    {
        LocalId param = maps.locals.at(callee.params[i].local);
        site.statements.push_back(Statement::assign(Place::of(param), rv::Use{args[i]}));
    }
    site.terminator = Terminator::gotoBlock(maps.blocks.at(callee.entry));

    auto mapLocal = [&](LocalId id)
    {
        auto it = maps.locals.find(id);
        return it == maps.locals.end() ? id : it->second;
    };
    auto mapBlock = [&](BlockId id)
    {
        auto it = maps.blocks.find(id);
        return it == maps.blocks.end() ? id : it->second;
    };

    std::vector<BasicBlock> cloned;
    cloned.reserve(callee.blocks.size() + 1);
    for (const auto &src : callee.blocks)
    {
        BasicBlock bb;
        bb.id = maps.blocks.at(src.id);
        bb.statements = src.statements;
        for (auto &s : bb.statements)
            util::remapLocals(s, mapLocal);
        if (src.terminator.isReturn())
        {
            if (destination)
                bb.statements.push_back(Statement::assign(
                    *destination, rv::Use{Operand::copy(maps.locals.at(*callee.returnLocal))}));
            bb.terminator = Terminator::gotoBlock(*continuation);
        }
        else
        {
            bb.terminator = src.terminator;
            util::remapLocals(bb.terminator, mapLocal);
            util::remapBlocks(bb.terminator, mapBlock);
        }
        cloned.push_back(std::move(bb));
    }
    if (tail)
        cloned.push_back(std::move(*tail));

    for (const auto &[hintBlock, width] : callee.vectorHints)
        caller.vectorHints[mapBlock(hintBlock)] = width;

    caller.blocks.insert(caller.blocks.begin() + static_cast<long>(*blockPos + 1),
                         std::make_move_iterator(cloned.begin()),
                         std::make_move_iterator(cloned.end()));
    return true;
}

unsigned inlineCalls(Function &caller,
                     const Program &program,
                     const std::function<bool(const std::string &)> &shouldInline,
                     support::DiagnosticEngine *diags)
{
    std::set<BlockId> pending;
    for (const auto &bb : caller.blocks)
        pending.insert(bb.id);

    bool reportedIndirect = false;
    unsigned spliced = 0;
    while (!pending.empty())
    {
        BlockId id = *pending.begin();
        pending.erase(pending.begin());
        const BasicBlock *bb = caller.findBlock(id);
        if (!bb)
            continue;

        auto wanted = [&](const Operand &func) -> const Function *
        {
            auto name = util::directCallee(func);
            if (!name)
            {
                if (!reportedIndirect)
                    note(diags, "inline: indirect call in '" + caller.name + "' skipped");
                reportedIndirect = true;
                return nullptr;
            }
            if (*name == caller.name || !shouldInline(*name))
                return nullptr;
            return program.findFunction(*name);
        };

        for (size_t i = 0; i < bb->statements.size(); ++i)
        {
            const rv::Call *call = callAt(*bb, i);
            if (!call)
                continue;
            const Function *callee = wanted(call->func);
            if (!callee)
                continue;
            size_t before = caller.blocks.size();
            if (!inlineCallSite(caller, id, i, *callee, diags))
                continue;
            ++spliced;
            // The continuation is the last block inserted after the split one.
            size_t added = caller.blocks.size() - before;
            pending.insert(caller.blocks[*caller.blockIndex(id) + added].id);
            bb = nullptr;
            break;
        }
        if (!bb)
            continue;

        if (const auto *call = std::get_if<term::Call>(&bb->terminator.kind))
        {
            if (const Function *callee = wanted(call->func))
                if (inlineCallSite(caller, id, std::nullopt, *callee, diags))
                    ++spliced;
        }
    }
    return spliced;
}

std::string_view Inliner::id() const
{
    return "inlining";
}

bool Inliner::inlineProgram(Program &program, support::DiagnosticEngine *diags)
{
    analysis::CallGraph cg = analysis::CallGraph::build(program);

    std::set<std::string> candidates;
    for (const auto &[name, fn] : program.functions)
        if (cg.callSiteCount(name) > 0 && isInlineCandidate(fn, cg, config_))
            candidates.insert(name);

    bool changed = false;
    for (auto &[name, caller] : program.functions)
    {
        if (candidates.count(name))
            continue;
        unsigned n = inlineCalls(caller,
                                 program,
                                 [&](const std::string &callee) { return candidates.count(callee) > 0; },
                                 diags);
        if (n > 0 && support::traceEnabled())
            std::cerr << "[inline] " << name << ": " << n << " call site(s) inlined\n";
        changed |= n > 0;
    }
    return changed;
}

PassResult Inliner::run(Program &program, PassContext &ctx)
{
    return PassResult::from(inlineProgram(program, &ctx.diags));
}

void registerInlinePass(PassRegistry &registry, const InlineConfig *config)
{
    registry.registerProgramPass("inlining",
                                 PassRegistry::ProgramPassFactory(
                                     [config]() -> std::unique_ptr<ProgramPass>
                                     {
                                         return std::make_unique<Inliner>(config ? *config
                                                                                 : InlineConfig{});
                                     }));
}

} // namespace mir::transform
