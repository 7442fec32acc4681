// File: src/mir/transform/Vectorize.cpp
// Purpose: Candidate classification, legality, scoring and the rewrite of
//          vectorizable single-block loops.
// Key invariants: A loop is rewritten at most once; its header then carries a
//                 vector hint.
// Ownership/Lifetime: Mutates caller-owned functions in place.
// Links: DESIGN.md

#include "mir/transform/Vectorize.hpp"

#include "mir/analysis/Dependence.hpp"
#include "mir/analysis/InductionVars.hpp"
#include "mir/transform/AnalysisIDs.hpp"
#include "mir/transform/AnalysisManager.hpp"
#include "support/trace.hpp"

#include <algorithm>
#include <iostream>

using namespace mir::core;

namespace mir::transform
{

namespace
{

bool vectorizableType(const Type &type)
{
    return type.isNumeric() || type.isBoolean();
}

AccessPattern operandPattern(const Operand &op)
{
    if (op.isConstant())
        return AccessPattern::Broadcast;
    if (op.place.isLocal())
        return AccessPattern::Sequential;
    if (op.place.hasDeref())
        return AccessPattern::Irregular;
    for (const auto &elem : op.place.projection)
        if (std::holds_alternative<proj::Index>(elem))
            return AccessPattern::Strided;
    return AccessPattern::Irregular;
}

AccessPattern combine(AccessPattern a, AccessPattern b)
{
    if (a == AccessPattern::Irregular || b == AccessPattern::Irregular)
        return AccessPattern::Irregular;
    if (a == AccessPattern::Strided || b == AccessPattern::Strided)
        return AccessPattern::Strided;
    if (a == AccessPattern::Broadcast || b == AccessPattern::Broadcast)
        return AccessPattern::Broadcast;
    return AccessPattern::Sequential;
}

std::optional<VectorCandidate> classify(const Function &fn, const Statement &s, size_t index)
{
    const auto *assign = s.asAssign();
    if (!assign || !assign->place.isLocal())
        return std::nullopt;
    Type type = fn.localType(assign->place.local);
    if (!vectorizableType(type))
        return std::nullopt;

    VectorCandidate c;
    c.statement = index;
    c.output = assign->place.local;
    c.type = type;
    if (const auto *bin = std::get_if<rv::BinaryOp>(&assign->rvalue))
    {
        c.op = VectorOp::Arithmetic;
        c.pattern = combine(operandPattern(bin->left), operandPattern(bin->right));
    }
    else if (const auto *un = std::get_if<rv::UnaryOp>(&assign->rvalue))
    {
        c.op = VectorOp::Unary;
        c.pattern = operandPattern(un->operand);
    }
    else if (const auto *use = std::get_if<rv::Use>(&assign->rvalue))
    {
        c.op = VectorOp::Load;
        c.pattern = operandPattern(use->operand);
    }
    else
    {
        return std::nullopt;
    }
    return c;
}

bool branchesToItself(const BasicBlock &bb)
{
    const auto *sw = std::get_if<term::SwitchInt>(&bb.terminator.kind);
    if (!sw)
        return false;
    return sw->otherwise == bb.id ||
           std::find(sw->targets.begin(), sw->targets.end(), bb.id) != sw->targets.end();
}

} // namespace

const char *toString(AccessPattern pattern)
{
    switch (pattern)
    {
        case AccessPattern::Sequential:
            return "sequential";
        case AccessPattern::Strided:
            return "strided";
        case AccessPattern::Broadcast:
            return "broadcast";
        case AccessPattern::Irregular:
            return "irregular";
    }
    return "irregular";
}

double benefitScore(const std::vector<VectorCandidate> &candidates,
                    std::optional<uint64_t> tripCount)
{
    double score = 2.0 * static_cast<double>(candidates.size());
    if (tripCount)
        score *= 1.5;
    for (const auto &c : candidates)
    {
        switch (c.pattern)
        {
            case AccessPattern::Sequential:
                score += 1.0;
                break;
            case AccessPattern::Strided:
                score += 0.5;
                break;
            case AccessPattern::Broadcast:
                score += 0.3;
                break;
            case AccessPattern::Irregular:
                score -= 1.0;
                break;
        }
    }
    if (tripCount && *tripCount < 8)
        score *= 0.5;
    return score;
}

uint32_t vectorWidth(const std::vector<VectorCandidate> &candidates, const VectorizeConfig &config)
{
    uint32_t width = config.maxWidth;
    for (const auto &c : candidates)
    {
        auto it = config.lanes.find(c.type.kind);
        if (it != config.lanes.end())
            width = std::min(width, it->second);
    }
    return width;
}

std::vector<LoopVectorization> analyzeVectorization(const Function &fn, const VectorizeConfig &config)
{
    std::vector<LoopVectorization> out;
    analysis::CFGInfo cfg(fn);
    analysis::DomTree dom = analysis::computeDominatorTree(cfg);
    analysis::LoopForest forest = analysis::LoopForest::compute(fn, cfg, dom);

    for (const auto &bb : fn.blocks)
    {
        if (!cfg.isReachable(bb.id) || !branchesToItself(bb))
            continue;
        LoopVectorization plan;
        plan.header = bb.id;

        const analysis::Loop *loop = nullptr;
        for (const auto &l : forest.loops())
            if (l.header == bb.id)
                loop = &l;
        if (!loop)
            continue;

        analysis::InductionInfo ivs = analysis::findInductionVariables(fn, cfg, *loop);
        std::set<LocalId> ivLocals;
        for (const auto &iv : ivs.basic)
            ivLocals.insert(iv.local);
        if (loop->bounds)
            plan.inductionVar = loop->bounds->inductionVar;
        else if (!ivs.basic.empty())
            plan.inductionVar = ivs.basic.front().local;
        plan.tripCount = loop->iterationCount;

        for (size_t i = 0; i < bb.statements.size(); ++i)
            if (auto c = classify(fn, bb.statements[i], i))
                plan.candidates.push_back(*c);

        analysis::LoopDependences deps = analysis::analyzeLoopDependences(fn, cfg, *loop);
        plan.legal = plan.inductionVar && !deps.memoryHazard && !deps.hasCarriedOutside(ivLocals);
        plan.score = benefitScore(plan.candidates, plan.tripCount);
        plan.width = vectorWidth(plan.candidates, config);

        if (support::traceEnabled())
            std::cerr << "[vectorize] " << fn.name << ": bb" << bb.id << " candidates="
                      << plan.candidates.size() << " legal=" << plan.legal
                      << " score=" << plan.score << " width=" << plan.width << "\n";
        out.push_back(std::move(plan));
    }
    return out;
}

bool vectorizeLoop(Function &fn, const LoopVectorization &plan)
{
    if (!plan.profitable() || !plan.tripCount || fn.vectorHints.count(plan.header))
        return false;
    const uint64_t trip = *plan.tripCount;
    const uint32_t width = plan.width;
    if (width < 2 || width > trip)
        return false;

    analysis::CFGInfo cfg(fn);
    analysis::LoopForest forest = analysis::LoopForest::compute(fn, cfg, analysis::computeDominatorTree(cfg));
    const analysis::Loop *loop = forest.loopFor(plan.header);
    if (!loop || loop->header != plan.header || loop->blocks.size() != 1 || !loop->preheader ||
        !loop->bounds || loop->bounds->exitingBlock != plan.header)
        return false;
    const BlockId preheader = *loop->preheader;

    BasicBlock *body = fn.findBlock(plan.header);
    const std::vector<Statement> scalar = body->statements;

    const uint64_t peeled = trip % width;
    if (peeled > 0)
    {
        BasicBlock prologue;
        prologue.id = fn.nextBlockId();
        for (uint64_t k = 0; k < peeled; ++k)
            prologue.statements.insert(prologue.statements.end(), scalar.begin(), scalar.end());
        prologue.terminator = Terminator::gotoBlock(plan.header);
        fn.findBlock(preheader)->terminator.replaceSuccessor(plan.header, prologue.id);
        fn.blocks.insert(fn.blocks.begin() + static_cast<long>(*fn.blockIndex(plan.header)),
                         std::move(prologue));
        body = fn.findBlock(plan.header);
    }

    body->statements.clear();
    for (uint32_t k = 0; k < width; ++k)
        body->statements.insert(body->statements.end(), scalar.begin(), scalar.end());
    fn.vectorHints[plan.header] = width;

    if (support::traceEnabled())
        std::cerr << "[vectorize] " << fn.name << ": bb" << plan.header << " vectorized with width "
                  << width << ", " << peeled << " iteration(s) peeled\n";
    return true;
}

bool vectorize(Function &fn, const VectorizeConfig &config)
{
    bool changed = false;
    for (const auto &plan : analyzeVectorization(fn, config))
        changed |= vectorizeLoop(fn, plan);
    return changed;
}

void registerVectorizePass(PassRegistry &registry, const VectorizeConfig *config)
{
    registry.registerFunctionPass("vectorization",
                                  PassRegistry::FunctionPassCallback(
                                      [config](Function &fn, PassContext &ctx)
                                      {
                                          if (ctx.analysis
                                                  .getFunctionResult<analysis::LoopForest>(
                                                      kAnalysisLoops, fn)
                                                  .empty())
                                              return PassResult::unchanged();
                                          return PassResult::from(
                                              vectorize(fn, config ? *config : VectorizeConfig{}));
                                      }));
}

} // namespace mir::transform
