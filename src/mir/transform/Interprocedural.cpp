//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the interprocedural pass. Lowering reads a named program
// constant through a zero-argument call to the constant's name; those calls
// become the constant itself. Calls to pure functions with constant
// arguments are evaluated by a small interpreter that understands scalar
// assignments, branches, returns and nested pure calls. Functions that no
// entry point reaches are erased last.
//
//===----------------------------------------------------------------------===//

#include "mir/transform/Interprocedural.hpp"

#include "mir/analysis/CallGraph.hpp"
#include "mir/core/Program.hpp"
#include "mir/transform/AnalysisIDs.hpp"
#include "mir/transform/AnalysisManager.hpp"
#include "mir/transform/ConstEval.hpp"
#include "mir/utils/Uses.hpp"
#include "support/trace.hpp"

#include <iostream>
#include <map>
#include <type_traits>

using namespace mir::core;

namespace mir::transform
{

namespace
{

/// Replace a Call terminator by an optional assignment plus a Goto.
void resolveCallTerminator(BasicBlock &bb, const term::Call &call, const Constant &value)
{
    BlockId target = *call.target;
    if (call.destination)
        bb.statements.push_back(Statement::assign(*call.destination, rv::Use{Operand::constOf(value)}));
    bb.terminator = Terminator::gotoBlock(target);
}

void addNamedOperand(const Operand &op, const Program &program, std::set<std::string> &out)
{
    if (op.isConstant() && op.getConstant().isString() &&
        program.findFunction(op.getConstant().asString()))
        out.insert(op.getConstant().asString());
}

/// Functions whose name appears as a value rather than as a callee.
std::set<std::string> functionsUsedAsValues(const Program &program)
{
    std::set<std::string> out;
    auto visitRvalue = [&](const Rvalue &rvalue)
    {
        std::visit(
            [&](const auto &r)
            {
                using R = std::decay_t<decltype(r)>;
                if constexpr (std::is_same_v<R, rv::Use> || std::is_same_v<R, rv::UnaryOp> ||
                              std::is_same_v<R, rv::Cast>)
                {
                    addNamedOperand(r.operand, program, out);
                }
                else if constexpr (std::is_same_v<R, rv::BinaryOp>)
                {
                    addNamedOperand(r.left, program, out);
                    addNamedOperand(r.right, program, out);
                }
                else if constexpr (std::is_same_v<R, rv::Call>)
                {
                    for (const auto &a : r.args)
                        addNamedOperand(a, program, out);
                }
                else if constexpr (std::is_same_v<R, rv::Aggregate>)
                {
                    for (const auto &a : r.operands)
                        addNamedOperand(a, program, out);
                }
            },
            rvalue);
    };

    for (const auto &[name, fn] : program.functions)
        for (const auto &bb : fn.blocks)
        {
            for (const auto &s : bb.statements)
                if (const auto *a = s.asAssign())
                    visitRvalue(a->rvalue);
            if (const auto *call = std::get_if<term::Call>(&bb.terminator.kind))
                for (const auto &a : call->args)
                    addNamedOperand(a, program, out);
        }
    return out;
}

/// Constant values of all @p args, or nullopt when one is not a constant.
std::optional<std::vector<Constant>> constantArgs(const std::vector<Operand> &args)
{
    std::vector<Constant> out;
    out.reserve(args.size());
    for (const auto &a : args)
    {
        if (!a.isConstant())
            return std::nullopt;
        out.push_back(a.getConstant());
    }
    return out;
}

} // namespace

bool propagateGlobalConstants(Program &program)
{
    auto globalFor = [&](const Operand &func, const std::vector<Operand> &args) -> const Constant *
    {
        if (!args.empty())
            return nullptr;
        auto name = util::directCallee(func);
        if (!name || program.findFunction(*name))
            return nullptr;
        auto it = program.constants.find(*name);
        return it == program.constants.end() ? nullptr : &it->second;
    };

    bool changed = false;
    for (auto &[name, fn] : program.functions)
        for (auto &bb : fn.blocks)
        {
            for (auto &s : bb.statements)
            {
                auto *assign = s.asAssign();
                const auto *call = assign ? std::get_if<rv::Call>(&assign->rvalue) : nullptr;
                if (!call)
                    continue;
                if (const Constant *value = globalFor(call->func, call->args))
                {
                    assign->rvalue = rv::Use{Operand::constOf(*value)};
                    changed = true;
                }
            }
            const auto *call = std::get_if<term::Call>(&bb.terminator.kind);
            if (!call || !call->target)
                continue;
            if (const Constant *value = globalFor(call->func, call->args))
            {
                term::Call copy = *call;
                resolveCallTerminator(bb, copy, *value);
                changed = true;
            }
        }
    return changed;
}

std::set<std::string> entryPoints(const Program &program)
{
    std::set<std::string> roots = functionsUsedAsValues(program);
    if (program.findFunction("main"))
        roots.insert("main");
    for (const auto &[name, ext] : program.externalFunctions)
        if (program.findFunction(name))
            roots.insert(name);
    return roots;
}

bool eliminateDeadFunctions(Program &program, const analysis::CallGraph &cg)
{
    std::set<std::string> roots = entryPoints(program);
    if (roots.empty())
        return false;
    std::set<std::string> live = cg.reachableFrom(std::vector<std::string>(roots.begin(), roots.end()));

    bool changed = false;
    for (auto it = program.functions.begin(); it != program.functions.end();)
    {
        if (live.count(it->first))
        {
            ++it;
            continue;
        }
        if (support::traceEnabled())
            std::cerr << "[ipo] removing dead function '" << it->first << "'\n";
        it = program.functions.erase(it);
        changed = true;
    }
    return changed;
}

std::optional<Constant> PureEvaluator::call(const std::string &callee,
                                            const std::vector<Constant> &args)
{
    steps_ = 0;
    return invoke(callee, args, 0);
}

std::optional<Constant> PureEvaluator::invoke(const std::string &callee,
                                              const std::vector<Constant> &args,
                                              unsigned depth)
{
    if (depth >= kMaxDepth)
        return std::nullopt;
    auto summary = summaries_.find(callee);
    const Function *fn = program_.findFunction(callee);
    if (!fn || summary == summaries_.end() || !summary->second.isPure())
        return std::nullopt;
    if (!fn->returnLocal || args.size() != fn->params.size())
        return std::nullopt;

    std::map<LocalId, Constant> frame;
    for (size_t i = 0; i < args.size(); ++i)
        frame.insert_or_assign(fn->params[i].local, args[i]);

    auto value = [&](const Operand &op) -> std::optional<Constant>
    {
        if (op.isConstant())
            return op.getConstant();
        if (!op.place.isLocal())
            return std::nullopt;
        auto it = frame.find(op.place.local);
        if (it == frame.end())
            return std::nullopt;
        return it->second;
    };
    auto nestedCall = [&](const Operand &func,
                          const std::vector<Operand> &operands) -> std::optional<Constant>
    {
        auto name = util::directCallee(func);
        if (!name)
            return std::nullopt;
        std::vector<Constant> nestedArgs;
        for (const auto &a : operands)
        {
            auto v = value(a);
            if (!v)
                return std::nullopt;
            nestedArgs.push_back(*v);
        }
        return invoke(*name, nestedArgs, depth + 1);
    };
    auto evaluate = [&](const Rvalue &rvalue) -> std::optional<Constant>
    {
        if (const auto *use = std::get_if<rv::Use>(&rvalue))
            return value(use->operand);
        if (const auto *bin = std::get_if<rv::BinaryOp>(&rvalue))
        {
            auto l = value(bin->left);
            auto r = value(bin->right);
            if (!l || !r)
                return std::nullopt;
            return foldBinary(bin->op, *l, *r);
        }
        if (const auto *un = std::get_if<rv::UnaryOp>(&rvalue))
        {
            auto v = value(un->operand);
            return v ? foldUnary(un->op, *v) : std::nullopt;
        }
        if (const auto *cast = std::get_if<rv::Cast>(&rvalue))
        {
            auto v = value(cast->operand);
            return v ? foldCast(cast->kind, *v, cast->type) : std::nullopt;
        }
        if (const auto *c = std::get_if<rv::Call>(&rvalue))
            return nestedCall(c->func, c->args);
        return std::nullopt;
    };

    const BasicBlock *bb = fn->findBlock(fn->entry);
    while (bb)
    {
        for (const auto &s : bb->statements)
        {
            if (++steps_ > kStepBudget)
                return std::nullopt;
            if (const auto *dead = std::get_if<stmt::StorageDead>(&s.kind))
            {
                frame.erase(dead->local);
                continue;
            }
            const auto *assign = s.asAssign();
            if (!assign)
                continue;
            if (!assign->place.isLocal())
                return std::nullopt;
            auto v = evaluate(assign->rvalue);
            if (!v)
                return std::nullopt;
            frame.insert_or_assign(assign->place.local, *v);
        }
        if (++steps_ > kStepBudget)
            return std::nullopt;

        std::optional<BlockId> next;
        const Terminator &t = bb->terminator;
        if (const auto *g = std::get_if<term::Goto>(&t.kind))
        {
            next = g->target;
        }
        else if (const auto *sw = std::get_if<term::SwitchInt>(&t.kind))
        {
            auto d = value(sw->discriminant);
            auto key = d ? switchValue(*d) : std::nullopt;
            if (!key)
                return std::nullopt;
            next = sw->otherwise;
            for (size_t i = 0; i < sw->values.size(); ++i)
                if (sw->values[i] == *key)
                {
                    next = sw->targets[i];
                    break;
                }
        }
        else if (const auto *as = std::get_if<term::Assert>(&t.kind))
        {
            auto c = value(as->condition);
            if (!c || !c->isBool() || c->asBool() != as->expected)
                return std::nullopt;
            next = as->target;
        }
        else if (const auto *c = std::get_if<term::Call>(&t.kind))
        {
            if (!c->target || (c->destination && !c->destination->isLocal()))
                return std::nullopt;
            auto v = nestedCall(c->func, c->args);
            if (!v)
                return std::nullopt;
            if (c->destination)
                frame.insert_or_assign(c->destination->local, *v);
            next = c->target;
        }
        else if (t.isReturn())
        {
            auto it = frame.find(*fn->returnLocal);
            if (it == frame.end())
                return std::nullopt;
            return it->second;
        }
        else
        {
            return std::nullopt;
        }
        bb = fn->findBlock(*next);
    }
    return std::nullopt;
}

bool foldPureCalls(Program &program, const analysis::SummaryMap &summaries)
{
    PureEvaluator evaluator(program, summaries);
    // Every value is computed before the first site is rewritten.
    struct Fold
    {
        std::string function;
        BlockId block;
        std::optional<size_t> statement;
        Constant value;
    };
    std::vector<Fold> folds;

    for (const auto &[name, fn] : program.functions)
        for (const auto &bb : fn.blocks)
        {
            for (size_t i = 0; i < bb.statements.size(); ++i)
            {
                const auto *assign = bb.statements[i].asAssign();
                const auto *call = assign ? std::get_if<rv::Call>(&assign->rvalue) : nullptr;
                if (!call)
                    continue;
                auto callee = util::directCallee(call->func);
                auto args = constantArgs(call->args);
                if (!callee || !args || *callee == name)
                    continue;
                if (auto v = evaluator.call(*callee, *args))
                    folds.push_back(Fold{name, bb.id, i, *v});
            }
            const auto *call = std::get_if<term::Call>(&bb.terminator.kind);
            if (!call || !call->target)
                continue;
            auto callee = util::directCallee(call->func);
            auto args = constantArgs(call->args);
            if (!callee || !args || *callee == name)
                continue;
            if (auto v = evaluator.call(*callee, *args))
                folds.push_back(Fold{name, bb.id, std::nullopt, *v});
        }

    for (const auto &f : folds)
    {
        BasicBlock *bb = program.findFunction(f.function)->findBlock(f.block);
        if (f.statement)
        {
            bb->statements[*f.statement].asAssign()->rvalue = rv::Use{Operand::constOf(f.value)};
        }
        else
        {
            term::Call call = std::get<term::Call>(bb->terminator.kind);
            resolveCallTerminator(*bb, call, f.value);
        }
        if (support::traceEnabled())
            std::cerr << "[ipo] folded pure call in '" << f.function << "' bb" << f.block
                      << " to " << f.value.toString() << "\n";
    }
    return !folds.empty();
}

bool optimizeInterprocedural(Program &program)
{
    bool changed = propagateGlobalConstants(program);
    {
        analysis::CallGraph cg = analysis::CallGraph::build(program);
        changed |= foldPureCalls(program, analysis::computeSummaries(program, cg));
    }
    changed |= eliminateDeadFunctions(program, analysis::CallGraph::build(program));
    return changed;
}

std::string_view InterproceduralPass::id() const
{
    return "interprocedural";
}

PassResult InterproceduralPass::run(Program &program, PassContext &ctx)
{
    auto &summaries = ctx.analysis.getProgramResult<analysis::SummaryMap>(kAnalysisEffects);
    bool folded = foldPureCalls(program, summaries);
    bool propagated = propagateGlobalConstants(program);

    bool removed = false;
    if (folded || propagated)
        removed = eliminateDeadFunctions(program, analysis::CallGraph::build(program));
    else
        removed = eliminateDeadFunctions(
            program, ctx.analysis.getProgramResult<analysis::CallGraph>(kAnalysisCallGraph));
    return PassResult::from(folded || propagated || removed);
}

void registerInterproceduralPass(PassRegistry &registry)
{
    registry.registerProgramPass("interprocedural",
                                 PassRegistry::ProgramPassFactory(
                                     []() -> std::unique_ptr<ProgramPass>
                                     { return std::make_unique<InterproceduralPass>(); }));
}

} // namespace mir::transform
