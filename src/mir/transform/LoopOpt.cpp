//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Loop transforms over natural loops discovered by LoopForest.
//
// Hoisting moves an assignment to the end of the preheader when its operands
// are constants or locals the loop never writes (or that were hoisted just
// before it), the rvalue cannot trap or call, and the destination is a plain
// local written once in the loop and not live on entry to the header. The
// estimated profit is the trip count, or a default, capped; loops below the
// threshold are left alone.
//
// Full unrolling clones the body once per exit test the loop performs and
// resolves the test of the exiting block statically in every copy. Back
// edges of copy k lead to the header of copy k + 1; the last copy leaves
// through the exit target. Copies that became unreachable are dropped.
//
// Strength reduction rewrites `j = i * c`, with i a basic induction variable
// of step s, into a copy of a running product r that starts as `i * c` in
// the preheader and is bumped by `c * s` right after i's increment.
//
//===----------------------------------------------------------------------===//

#include "mir/transform/LoopOpt.hpp"

#include "mir/analysis/InductionVars.hpp"
#include "mir/dataflow/Liveness.hpp"
#include "mir/transform/AnalysisIDs.hpp"
#include "mir/transform/AnalysisManager.hpp"
#include "mir/utils/Uses.hpp"
#include "support/trace.hpp"

#include <algorithm>
#include <iostream>
#include <map>
#include <set>

using namespace mir::core;
using mir::analysis::CFGInfo;
using mir::analysis::Loop;

namespace mir::transform
{

namespace
{

struct LoopWrites
{
    std::map<LocalId, unsigned> assignments;
    std::set<LocalId> storageMarked;
};

LoopWrites scanLoopWrites(const Function &fn, const Loop &loop)
{
    LoopWrites out;
    for (BlockId id : loop.blocks)
    {
        const BasicBlock *bb = fn.findBlock(id);
        if (!bb)
            continue;
        for (const auto &s : bb->statements)
        {
            if (auto w = util::writtenLocal(s))
                ++out.assignments[*w];
            else if (const auto *live = std::get_if<stmt::StorageLive>(&s.kind))
                out.storageMarked.insert(live->local);
            else if (const auto *dead = std::get_if<stmt::StorageDead>(&s.kind))
                out.storageMarked.insert(dead->local);
        }
        if (const auto *call = std::get_if<term::Call>(&bb->terminator.kind))
            if (call->destination)
                ++out.assignments[call->destination->local];
    }
    return out;
}

/// Operands of an rvalue that may be evaluated early, or nullopt when the
/// rvalue may trap, call or read through memory.
std::optional<std::vector<const Operand *>> speculatableOperands(const Rvalue &rvalue)
{
    if (const auto *use = std::get_if<rv::Use>(&rvalue))
        return std::vector<const Operand *>{&use->operand};
    if (const auto *bin = std::get_if<rv::BinaryOp>(&rvalue))
    {
        if (bin->op == BinOp::Div || bin->op == BinOp::Rem || bin->op == BinOp::Mod)
            return std::nullopt;
        return std::vector<const Operand *>{&bin->left, &bin->right};
    }
    if (const auto *un = std::get_if<rv::UnaryOp>(&rvalue))
        return std::vector<const Operand *>{&un->operand};
    if (const auto *cast = std::get_if<rv::Cast>(&rvalue))
        return std::vector<const Operand *>{&cast->operand};
    return std::nullopt;
}

bool preheaderAcceptsStatements(const Function &fn, const Loop &loop)
{
    if (!loop.preheader)
        return false;
    const BasicBlock *pre = fn.findBlock(*loop.preheader);
    if (!pre)
        return false;
    const auto *jump = std::get_if<term::Goto>(&pre->terminator.kind);
    return jump && jump->target == loop.header;
}

const Loop *findLoop(const analysis::LoopForest &forest, BlockId header)
{
    for (const auto &loop : forest.loops())
        if (loop.header == header)
            return &loop;
    return nullptr;
}

} // namespace

unsigned hoistInvariants(Function &fn,
                         const CFGInfo &cfg,
                         const Loop &loop,
                         const LoopOptConfig &config)
{
    if (!preheaderAcceptsStatements(fn, loop))
        return 0;
    const uint64_t trip = loop.iterationCount.value_or(config.defaultTrip);
    if (std::min(trip, config.profitCap) < config.hoistThreshold)
        return 0;

    const LoopWrites writes = scanLoopWrites(fn, loop);
    const std::set<LocalId> addressTaken = analysis::addressTakenLocals(fn);
    const dataflow::LiveSet liveAtHeader = dataflow::LivenessResult(fn).liveIn(loop.header);

    std::set<LocalId> hoistedLocals;
    auto invariant = [&](const Operand &op)
    {
        if (op.isConstant())
            return true;
        if (!op.place.isLocal())
            return false;
        const LocalId l = op.place.local;
        if (addressTaken.count(l) || writes.storageMarked.count(l))
            return false;
        return hoistedLocals.count(l) != 0 || writes.assignments.count(l) == 0;
    };
    auto hoistable = [&](const Statement &s)
    {
        const auto *assign = s.asAssign();
        if (!assign || !assign->place.isLocal())
            return false;
        const LocalId dest = assign->place.local;
        auto count = writes.assignments.find(dest);
        if (count == writes.assignments.end() || count->second != 1)
            return false;
        if (liveAtHeader.count(dest) || addressTaken.count(dest) ||
            writes.storageMarked.count(dest) || fn.isParam(dest))
            return false;
        auto operands = speculatableOperands(assign->rvalue);
        if (!operands)
            return false;
        return std::all_of(operands->begin(),
                           operands->end(),
                           [&](const Operand *op) { return invariant(*op); });
    };

    std::vector<Statement> hoisted;
    for (BlockId id : cfg.reversePostOrder())
    {
        if (!loop.contains(id))
            continue;
        BasicBlock *bb = fn.findBlock(id);
        for (size_t i = 0; i < bb->statements.size();)
        {
            if (!hoistable(bb->statements[i]))
            {
                ++i;
                continue;
            }
            hoistedLocals.insert(bb->statements[i].asAssign()->place.local);
            hoisted.push_back(std::move(bb->statements[i]));
            bb->statements.erase(bb->statements.begin() + static_cast<long>(i));
        }
    }

    BasicBlock *pre = fn.findBlock(*loop.preheader);
    for (auto &s : hoisted)
        pre->statements.push_back(std::move(s));
    return static_cast<unsigned>(hoisted.size());
}

unsigned strengthReduce(Function &fn, const CFGInfo &cfg, const Loop &loop)
{
    if (!preheaderAcceptsStatements(fn, loop))
        return 0;

    unsigned rewritten = 0;
    for (;;)
    {
        analysis::InductionInfo info = analysis::findInductionVariables(fn, cfg, loop);
        const analysis::DerivedInductionVar *target = nullptr;
        std::optional<rv::BinaryOp> mul;
        for (const auto &dv : info.derived)
        {
            if (dv.offset != 0 || dv.multiplier == 0 || dv.multiplier == 1)
                continue;
            const auto *assign = fn.findBlock(dv.block)->statements[dv.statement].asAssign();
            const auto *bin = std::get_if<rv::BinaryOp>(&assign->rvalue);
            if (!bin || bin->op != BinOp::Mul)
                continue;
            target = &dv;
            mul = *bin;
            break;
        }
        if (!target)
            return rewritten;

        const analysis::BasicInductionVar *base = info.findBasic(target->base);
        const Constant factor =
            mul->left.isConstant() ? mul->left.getConstant() : mul->right.getConstant();
        const Constant bump =
            Constant::integer(wrappingMul(factor.asInt(), base->step), factor.type);

        const LocalId product = fn.addLocal(fn.localType(target->local));
        fn.findBlock(*loop.preheader)
            ->statements.push_back(Statement::assign(Place::of(product), Rvalue(*mul)));

        Statement &def = fn.findBlock(target->block)->statements[target->statement];
        def.asAssign()->rvalue = rv::Use{Operand::copy(product)};

        auto &incBlock = fn.findBlock(base->block)->statements;
        incBlock.insert(incBlock.begin() + static_cast<long>(base->statement + 1),
                        Statement::assign(Place::of(product),
                                          rv::BinaryOp{BinOp::Add,
                                                       Operand::copy(product),
                                                       Operand::constOf(bump)}));
        ++rewritten;
    }
}

bool unrollLoop(Function &fn, const Loop &loop, const LoopOptConfig &config)
{
    if (!loop.preheader || !loop.bounds || !loop.iterationCount)
        return false;
    // A vectorized body is already replicated.
    if (fn.vectorHints.count(loop.header))
        return false;
    if (loop.blocks.size() > config.unrollBlockLimit ||
        *loop.iterationCount > config.unrollTripLimit)
        return false;

    const analysis::LoopBounds &bounds = *loop.bounds;
    const uint64_t copies = bounds.continuingTests + 1;

    std::vector<BlockId> body;
    std::optional<size_t> firstPos;
    for (size_t i = 0; i < fn.blocks.size(); ++i)
    {
        if (!loop.contains(fn.blocks[i].id))
            continue;
        if (!firstPos)
            firstPos = i;
        body.push_back(fn.blocks[i].id);
    }
    if (!firstPos)
        return false;

    BlockId next = fn.nextBlockId();
    std::vector<std::map<BlockId, BlockId>> ids(copies);
    std::set<BlockId> cloneIds;
    for (auto &copy : ids)
        for (BlockId b : body)
        {
            cloneIds.insert(next);
            copy.emplace(b, next++);
        }

    std::vector<BasicBlock> clones;
    clones.reserve(copies * body.size());
    for (uint64_t c = 0; c < copies; ++c)
    {
        const bool last = c + 1 == copies;
        auto mapTarget = [&](BlockId t)
        {
            if (t == loop.header)
                return last ? bounds.exitTarget : ids[c + 1].at(t);
            auto it = ids[c].find(t);
            return it == ids[c].end() ? t : it->second;
        };
        for (BlockId b : body)
        {
            const BasicBlock *src = fn.findBlock(b);
            BasicBlock bb;
            bb.id = ids[c].at(b);
            bb.statements = src->statements;
            if (b == bounds.exitingBlock)
            {
                bb.terminator = Terminator::gotoBlock(last ? bounds.exitTarget
                                                           : mapTarget(bounds.continueTarget));
            }
            else
            {
                bb.terminator = src->terminator;
                util::remapBlocks(bb.terminator, mapTarget);
            }
            clones.push_back(std::move(bb));
        }
    }

    const BlockId newHeader = ids.front().at(loop.header);
    for (auto &bb : fn.blocks)
        if (!loop.contains(bb.id))
            bb.terminator.replaceSuccessor(loop.header, newHeader);

    fn.blocks.insert(fn.blocks.begin() + static_cast<long>(*firstPos),
                     std::make_move_iterator(clones.begin()),
                     std::make_move_iterator(clones.end()));
    fn.blocks.erase(std::remove_if(fn.blocks.begin(),
                                   fn.blocks.end(),
                                   [&](const BasicBlock &bb) { return loop.contains(bb.id); }),
                    fn.blocks.end());
    for (BlockId b : body)
        fn.vectorHints.erase(b);

    const std::set<BlockId> reachable = analysis::reachableBlocks(fn);
    fn.blocks.erase(std::remove_if(fn.blocks.begin(),
                                   fn.blocks.end(),
                                   [&](const BasicBlock &bb)
                                   { return cloneIds.count(bb.id) && !reachable.count(bb.id); }),
                    fn.blocks.end());
    return true;
}

bool optimizeLoops(Function &fn, const LoopOptConfig &config)
{
    bool changed = false;
    std::set<BlockId> visited;
    for (;;)
    {
        CFGInfo cfg(fn);
        analysis::DomTree dom = analysis::computeDominatorTree(cfg);
        analysis::LoopForest forest = analysis::LoopForest::compute(fn, cfg, dom);

        std::optional<Loop> loop;
        for (size_t idx : forest.innermostFirst())
            if (!visited.count(forest.loops()[idx].header))
            {
                loop = forest.loops()[idx];
                break;
            }
        if (!loop)
            return changed;
        visited.insert(loop->header);

        unsigned hoisted = hoistInvariants(fn, cfg, *loop, config);
        unsigned reduced = strengthReduce(fn, cfg, *loop);
        if (support::traceEnabled() && (hoisted || reduced))
            std::cerr << "[licm] " << fn.name << ": loop bb" << loop->header << ": hoisted "
                      << hoisted << ", strength-reduced " << reduced << "\n";

        if (hoisted || reduced)
        {
            changed = true;
            CFGInfo fresh(fn);
            forest = analysis::LoopForest::compute(fn, fresh, analysis::computeDominatorTree(fresh));
            const Loop *same = findLoop(forest, loop->header);
            if (!same)
                continue;
            loop = *same;
        }

        if (unrollLoop(fn, *loop, config))
        {
            changed = true;
            if (support::traceEnabled())
                std::cerr << "[licm] " << fn.name << ": unrolled loop bb" << loop->header << " ("
                          << *loop->iterationCount << " iterations)\n";
        }
    }
}

void registerLoopOptPass(PassRegistry &registry, const LoopOptConfig *config)
{
    registry.registerFunctionPass("loop-optimization",
                                  PassRegistry::FunctionPassCallback(
                                      [config](Function &fn, PassContext &ctx)
                                      {
                                          if (ctx.analysis
                                                  .getFunctionResult<analysis::LoopForest>(
                                                      kAnalysisLoops, fn)
                                                  .empty())
                                              return PassResult::unchanged();
                                          return PassResult::from(
                                              optimizeLoops(fn, config ? *config : LoopOptConfig{}));
                                      }));
}

} // namespace mir::transform
