// File: src/mir/analysis/InductionVars.cpp
// Purpose: Induction-variable recognition and closed-form trip counts.
// Key invariants: The IV value seen by the n-th exit test is
//                 init + (n + k) * step, where k is 1 when the increment runs
//                 before the test within an iteration.
// Ownership/Lifetime: Stateless helpers over caller-owned IR.
// Links: DESIGN.md

#include "mir/analysis/InductionVars.hpp"

#include "mir/utils/Uses.hpp"

#include <map>

namespace mir::analysis
{

using namespace core;

namespace
{

constexpr Int128 kMagnitudeLimit = Int128{1} << 62;

std::optional<Int128> intConstant(const Operand &op)
{
    if (!op.isConstant() || !op.getConstant().isInt())
        return std::nullopt;
    return op.getConstant().asInt();
}

std::optional<LocalId> plainLocal(const Operand &op)
{
    if (!op.isPlace() || !op.place.isLocal())
        return std::nullopt;
    return op.place.local;
}

Int128 magnitude(Int128 v)
{
    return v < 0 ? -v : v;
}

std::map<LocalId, unsigned> assignmentsInLoop(const Function &fn, const Loop &loop)
{
    std::map<LocalId, unsigned> counts;
    for (BlockId b : loop.blocks)
    {
        const BasicBlock *bb = fn.findBlock(b);
        if (!bb)
            continue;
        for (const auto &s : bb->statements)
            if (auto w = util::writtenLocal(s))
                ++counts[*w];
        if (const auto *call = std::get_if<term::Call>(&bb->terminator.kind))
            if (call->destination)
                ++counts[call->destination->local];
    }
    return counts;
}

BinOp swapSides(BinOp op)
{
    switch (op)
    {
        case BinOp::Lt:
            return BinOp::Gt;
        case BinOp::Le:
            return BinOp::Ge;
        case BinOp::Gt:
            return BinOp::Lt;
        case BinOp::Ge:
            return BinOp::Le;
        default:
            return op;
    }
}

BinOp negate(BinOp op)
{
    switch (op)
    {
        case BinOp::Lt:
            return BinOp::Ge;
        case BinOp::Le:
            return BinOp::Gt;
        case BinOp::Gt:
            return BinOp::Le;
        case BinOp::Ge:
            return BinOp::Lt;
        case BinOp::Eq:
            return BinOp::Ne;
        default:
            return BinOp::Eq;
    }
}

/// Number of leading values a, a+step, ... satisfying `v pred c`.
std::optional<Int128> countWhile(BinOp pred, Int128 a, Int128 step, Int128 c)
{
    switch (pred)
    {
        case BinOp::Lt:
            if (!(a < c))
                return 0;
            if (step <= 0)
                return std::nullopt;
            return (c - a + step - 1) / step;
        case BinOp::Le:
            if (a > c)
                return 0;
            if (step <= 0)
                return std::nullopt;
            return (c - a) / step + 1;
        case BinOp::Gt:
            if (!(a > c))
                return 0;
            if (step >= 0)
                return std::nullopt;
            return (a - c + (-step) - 1) / (-step);
        case BinOp::Ge:
            if (a < c)
                return 0;
            if (step >= 0)
                return std::nullopt;
            return (a - c) / (-step) + 1;
        case BinOp::Eq:
            if (a != c)
                return 0;
            if (step == 0)
                return std::nullopt;
            return 1;
        case BinOp::Ne:
        {
            if (a == c)
                return 0;
            if (step == 0)
                return std::nullopt;
            Int128 diff = c - a;
            if (diff % step != 0 || diff / step <= 0)
                return std::nullopt;
            return diff / step;
        }
        default:
            return std::nullopt;
    }
}

} // namespace

const BasicInductionVar *InductionInfo::findBasic(LocalId local) const
{
    for (const auto &iv : basic)
        if (iv.local == local)
            return &iv;
    return nullptr;
}

std::set<LocalId> addressTakenLocals(const Function &fn)
{
    std::set<LocalId> out;
    for (const auto &bb : fn.blocks)
        for (const auto &s : bb.statements)
            if (const auto *a = s.asAssign())
                if (const auto *ref = std::get_if<rv::Ref>(&a->rvalue))
                    out.insert(ref->place.local);
    return out;
}

std::optional<Int128> constantValueAtEnd(const Function &fn,
                                         const CFGInfo &cfg,
                                         BlockId from,
                                         LocalId local)
{
    std::set<BlockId> visited;
    BlockId b = from;
    while (visited.insert(b).second)
    {
        const BasicBlock *bb = fn.findBlock(b);
        if (!bb)
            return std::nullopt;
        if (const auto *call = std::get_if<term::Call>(&bb->terminator.kind))
            if (call->destination && call->destination->local == local)
                return std::nullopt;
        for (auto it = bb->statements.rbegin(); it != bb->statements.rend(); ++it)
        {
            auto written = util::writtenLocal(*it);
            if (!written || *written != local)
                continue;
            const auto *assign = it->asAssign();
            if (!assign->place.isLocal())
                return std::nullopt;
            if (const auto *use = std::get_if<rv::Use>(&assign->rvalue))
                return intConstant(use->operand);
            return std::nullopt;
        }
        const auto &preds = cfg.predecessors(b);
        if (preds.size() != 1)
            return std::nullopt;
        b = preds.front();
    }
    return std::nullopt;
}

InductionInfo findInductionVariables(const Function &fn, const CFGInfo &cfg, const Loop &loop)
{
    InductionInfo info;
    const auto counts = assignmentsInLoop(fn, loop);
    const auto addressTaken = addressTakenLocals(fn);
    auto singleDef = [&](LocalId id)
    {
        auto it = counts.find(id);
        return it != counts.end() && it->second == 1 && addressTaken.count(id) == 0;
    };

    for (BlockId b : loop.blocks)
    {
        const BasicBlock *bb = fn.findBlock(b);
        if (!bb)
            continue;
        for (size_t i = 0; i < bb->statements.size(); ++i)
        {
            const auto *assign = bb->statements[i].asAssign();
            if (!assign || !assign->place.isLocal())
                continue;
            const auto *bin = std::get_if<rv::BinaryOp>(&assign->rvalue);
            if (!bin)
                continue;
            LocalId x = assign->place.local;
            if (!singleDef(x))
                continue;

            std::optional<Int128> step;
            auto l = plainLocal(bin->left);
            auto r = plainLocal(bin->right);
            if (bin->op == BinOp::Add && l == x)
                step = intConstant(bin->right);
            else if (bin->op == BinOp::Add && r == x)
                step = intConstant(bin->left);
            else if (bin->op == BinOp::Sub && l == x)
                if (auto c = intConstant(bin->right))
                    step = -*c;
            if (!step)
                continue;

            BasicInductionVar iv;
            iv.local = x;
            iv.step = *step;
            iv.block = b;
            iv.statement = i;
            if (loop.preheader)
                iv.initial = constantValueAtEnd(fn, cfg, *loop.preheader, x);
            info.basic.push_back(iv);
        }
    }

    for (BlockId b : loop.blocks)
    {
        const BasicBlock *bb = fn.findBlock(b);
        if (!bb)
            continue;
        for (size_t i = 0; i < bb->statements.size(); ++i)
        {
            const auto *assign = bb->statements[i].asAssign();
            if (!assign || !assign->place.isLocal())
                continue;
            const auto *bin = std::get_if<rv::BinaryOp>(&assign->rvalue);
            LocalId j = assign->place.local;
            if (!bin || info.findBasic(j) || !singleDef(j))
                continue;

            auto l = plainLocal(bin->left);
            auto r = plainLocal(bin->right);
            std::optional<LocalId> base;
            std::optional<Int128> c;
            if (l && info.findBasic(*l))
            {
                base = l;
                c = intConstant(bin->right);
            }
            else if (r && info.findBasic(*r) && bin->op != BinOp::Sub)
            {
                base = r;
                c = intConstant(bin->left);
            }
            if (!base || !c)
                continue;

            DerivedInductionVar dv;
            dv.local = j;
            dv.base = *base;
            dv.block = b;
            dv.statement = i;
            if (bin->op == BinOp::Mul)
                dv.multiplier = *c;
            else if (bin->op == BinOp::Add)
                dv.offset = *c;
            else if (bin->op == BinOp::Sub)
                dv.offset = -*c;
            else
                continue;
            info.derived.push_back(dv);
        }
    }
    return info;
}

std::optional<LoopBounds> computeLoopBounds(const Function &fn,
                                            const CFGInfo &cfg,
                                            const DomTree &dom,
                                            const LoopForest &forest,
                                            const Loop &loop)
{
    if (loop.exits.size() != 1)
        return std::nullopt;
    const BlockId exiting = *loop.exits.begin();
    auto directlyIn = [&](BlockId b)
    {
        const Loop *inner = forest.loopFor(b);
        return inner && inner->header == loop.header;
    };
    if (!directlyIn(exiting))
        return std::nullopt;
    for (BlockId latch : loop.latches)
        if (!dom.dominates(exiting, latch))
            return std::nullopt;

    const BasicBlock *bb = fn.findBlock(exiting);
    const auto *sw = bb ? std::get_if<term::SwitchInt>(&bb->terminator.kind) : nullptr;
    if (!sw || sw->targets.size() != 1 || sw->values.size() != 1 || sw->values[0] > 1)
        return std::nullopt;
    auto cond = plainLocal(sw->discriminant);
    if (!cond)
        return std::nullopt;

    const BlockId trueTarget = sw->values[0] == 0 ? sw->otherwise : sw->targets[0];
    const BlockId falseTarget = sw->values[0] == 0 ? sw->targets[0] : sw->otherwise;
    if (loop.contains(trueTarget) == loop.contains(falseTarget))
        return std::nullopt;
    const bool continueOnTrue = loop.contains(trueTarget);

    std::optional<size_t> cmpIndex;
    for (size_t i = bb->statements.size(); i-- > 0;)
    {
        auto written = util::writtenLocal(bb->statements[i]);
        if (written && *written == *cond)
        {
            cmpIndex = i;
            break;
        }
    }
    if (!cmpIndex)
        return std::nullopt;
    const auto *cmpAssign = bb->statements[*cmpIndex].asAssign();
    const auto *cmp = cmpAssign->place.isLocal() ? std::get_if<rv::BinaryOp>(&cmpAssign->rvalue)
                                                 : nullptr;
    if (!cmp || !isComparison(cmp->op))
        return std::nullopt;

    std::optional<LocalId> iv = plainLocal(cmp->left);
    std::optional<Int128> limit = intConstant(cmp->right);
    BinOp op = cmp->op;
    if (!iv || !limit)
    {
        iv = plainLocal(cmp->right);
        limit = intConstant(cmp->left);
        op = swapSides(cmp->op);
    }
    if (!iv || !limit)
        return std::nullopt;

    InductionInfo info = findInductionVariables(fn, cfg, loop);
    const BasicInductionVar *biv = info.findBasic(*iv);
    if (!biv || !biv->initial || !directlyIn(biv->block))
        return std::nullopt;

    Int128 k = 0;
    if (biv->block == exiting)
    {
        k = biv->statement < *cmpIndex ? 1 : 0;
    }
    else if (dom.dominates(biv->block, exiting))
    {
        k = 1;
    }
    else if (dom.dominates(exiting, biv->block))
    {
        for (BlockId latch : loop.latches)
            if (!dom.dominates(biv->block, latch))
                return std::nullopt;
        k = 0;
    }
    else
    {
        return std::nullopt;
    }

    const Int128 init = *biv->initial;
    if (magnitude(init) > kMagnitudeLimit || magnitude(*limit) > kMagnitudeLimit ||
        magnitude(biv->step) > kMagnitudeLimit)
        return std::nullopt;

    const BinOp keepGoing = continueOnTrue ? op : negate(op);
    auto tests = countWhile(keepGoing, init + k * biv->step, biv->step, *limit);
    if (!tests || *tests > static_cast<Int128>(kMaxKnownTripCount))
        return std::nullopt;

    LoopBounds bounds;
    bounds.inductionVar = *iv;
    bounds.initial = init;
    bounds.finalValue = *limit;
    bounds.step = biv->step;
    bounds.comparison = keepGoing;
    bounds.exitingBlock = exiting;
    bounds.continueTarget = continueOnTrue ? trueTarget : falseTarget;
    bounds.exitTarget = continueOnTrue ? falseTarget : trueTarget;
    bounds.continuingTests = static_cast<uint64_t>(*tests);
    return bounds;
}

} // namespace mir::analysis
