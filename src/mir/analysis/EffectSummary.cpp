// File: src/mir/analysis/EffectSummary.cpp
// Purpose: Local effect observation and bottom-up summary propagation.
// Key invariants: Components are processed in CallGraph::sccs() order, so
//                 every callee outside the current component is final.
// Ownership/Lifetime: Reads caller-owned IR only.
// Links: DESIGN.md

#include "mir/analysis/EffectSummary.hpp"

#include "mir/analysis/Dominators.hpp"
#include "mir/utils/Uses.hpp"

#include <optional>
#include <type_traits>

namespace mir::analysis
{

using namespace core;

void SideEffects::merge(const SideEffects &other)
{
    readsMemory |= other.readsMemory;
    writesMemory |= other.writesMemory;
    performsIo |= other.performsIo;
    mayThrow |= other.mayThrow;
    callsFunctions |= other.callsFunctions;
}

bool FunctionSummary::isPure() const
{
    return !effects.readsMemory && !effects.writesMemory && !effects.performsIo &&
           !effects.mayThrow && !mayNotTerminate && !isRecursive;
}

namespace
{

std::optional<size_t> paramIndex(const Function &fn, LocalId local)
{
    for (size_t i = 0; i < fn.params.size(); ++i)
        if (fn.params[i].local == local)
            return i;
    return std::nullopt;
}

bool hasBackEdge(const Function &fn)
{
    CFGInfo cfg(fn);
    DomTree dom = computeDominatorTree(cfg);
    for (BlockId b : cfg.reversePostOrder())
        for (BlockId s : cfg.successors(b))
            if (dom.dominates(s, b))
                return true;
    return false;
}

class LocalObserver
{
  public:
    LocalObserver(const Program &program, const Function &fn, FunctionSummary &summary)
        : program_(program), fn_(fn), summary_(summary)
    {
    }

    void observe()
    {
        for (const auto &bb : fn_.blocks)
        {
            for (const auto &s : bb.statements)
                if (const auto *assign = s.asAssign())
                    observeAssign(*assign);
            observeTerminator(bb.terminator);
        }
    }

  private:
    void readPlace(const Place &place)
    {
        if (place.hasDeref())
            summary_.effects.readsMemory = true;
    }

    void readOperand(const Operand &op)
    {
        if (op.isPlace())
            readPlace(op.place);
    }

    void writePlace(const Place &place)
    {
        if (place.isLocal())
            return;
        if (place.hasDeref())
        {
            summary_.effects.writesMemory = true;
            return;
        }
        if (paramIndex(fn_, place.local) && fn_.localType(place.local).kind == Type::Kind::Pointer)
            summary_.effects.writesMemory = true;
    }

    void call(const Operand &func, const std::vector<Operand> &args)
    {
        for (const auto &a : args)
        {
            readOperand(a);
            if (a.isPlace())
                if (auto idx = paramIndex(fn_, a.place.local))
                    summary_.escapingParameters.insert(*idx);
        }

        auto callee = util::directCallee(func);
        if (callee && args.empty() && program_.constants.count(*callee) &&
            !program_.functions.count(*callee))
        {
            summary_.readsGlobals.insert(*callee);
            return;
        }

        summary_.effects.callsFunctions = true;
        if (callee)
            summary_.calls.insert(*callee);
        if (callee && program_.functions.count(*callee))
            return;
        if (callee && program_.externalFunctions.count(*callee))
        {
            summary_.effects.performsIo = true;
            summary_.effects.writesMemory = true;
            return;
        }
        // Indirect or unresolved callee: assume the worst.
        readOperand(func);
        summary_.effects.readsMemory = true;
        summary_.effects.writesMemory = true;
        summary_.effects.performsIo = true;
        summary_.effects.mayThrow = true;
    }

    void observeAssign(const stmt::Assign &assign)
    {
        writePlace(assign.place);
        std::visit(
            [&](const auto &r)
            {
                using T = std::decay_t<decltype(r)>;
                if constexpr (std::is_same_v<T, rv::Use> || std::is_same_v<T, rv::UnaryOp> ||
                              std::is_same_v<T, rv::Cast>)
                    readOperand(r.operand);
                else if constexpr (std::is_same_v<T, rv::BinaryOp>)
                {
                    readOperand(r.left);
                    readOperand(r.right);
                }
                else if constexpr (std::is_same_v<T, rv::Call>)
                    call(r.func, r.args);
                else if constexpr (std::is_same_v<T, rv::Aggregate>)
                {
                    for (const auto &op : r.operands)
                        readOperand(op);
                }
                else if constexpr (std::is_same_v<T, rv::Ref>)
                {
                    if (auto idx = paramIndex(fn_, r.place.local))
                        summary_.escapingParameters.insert(*idx);
                }
                else
                    readPlace(r.place);
            },
            assign.rvalue);
    }

    void observeTerminator(const Terminator &term)
    {
        if (const auto *c = std::get_if<term::Call>(&term.kind))
        {
            call(c->func, c->args);
            if (c->destination)
                writePlace(*c->destination);
        }
        else if (std::holds_alternative<term::Assert>(term.kind))
        {
            summary_.effects.mayThrow = true;
        }
        else if (const auto *d = std::get_if<term::Drop>(&term.kind))
        {
            readPlace(d->place);
        }
    }

    const Program &program_;
    const Function &fn_;
    FunctionSummary &summary_;
};

FunctionSummary summarize(const Function &fn,
                          const CallGraph &cg,
                          const FunctionSummary &local,
                          const SummaryMap &known)
{
    FunctionSummary summary = local;
    for (const auto &callee : local.calls)
    {
        auto it = known.find(callee);
        if (it == known.end())
            continue;
        const FunctionSummary &other = it->second;
        summary.effects.merge(other.effects);
        summary.readsGlobals.insert(other.readsGlobals.begin(), other.readsGlobals.end());
        summary.mayNotTerminate |= other.mayNotTerminate;
    }
    summary.isRecursive = cg.isRecursive(fn.name);
    summary.mayNotTerminate |= summary.isRecursive;
    return summary;
}

} // namespace

SummaryMap computeSummaries(const Program &program, const CallGraph &cg)
{
    SummaryMap locals;
    for (const auto &[name, fn] : program.functions)
    {
        FunctionSummary s;
        s.name = name;
        LocalObserver(program, fn, s).observe();
        s.mayNotTerminate = hasBackEdge(fn);
        locals.emplace(name, std::move(s));
    }

    SummaryMap result;
    for (const auto &component : cg.sccs())
    {
        for (const auto &name : component)
            result[name] = locals[name];
        bool changed = true;
        while (changed)
        {
            changed = false;
            for (const auto &name : component)
            {
                const Function *fn = program.findFunction(name);
                if (!fn)
                    continue;
                FunctionSummary next = summarize(*fn, cg, locals[name], result);
                if (!(next == result[name]))
                {
                    result[name] = std::move(next);
                    changed = true;
                }
            }
        }
    }
    return result;
}

} // namespace mir::analysis
