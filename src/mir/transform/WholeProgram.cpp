// File: src/mir/transform/WholeProgram.cpp
// Purpose: Implements the whole-program pass.
// Key invariants: A function with one call site is spliced into its caller
//                 and then becomes dead unless it is an entry point.
// Ownership/Lifetime: Mutates the caller-owned program in place.
// Links: DESIGN.md

#include "mir/transform/WholeProgram.hpp"

#include "mir/analysis/CallGraph.hpp"
#include "mir/core/Program.hpp"
#include "mir/transform/Inline.hpp"
#include "mir/transform/Interprocedural.hpp"
#include "support/trace.hpp"

#include <iostream>

using namespace mir::core;

namespace mir::transform
{

std::set<std::string> singleCallSiteFunctions(const Program &program)
{
    analysis::CallGraph cg = analysis::CallGraph::build(program);
    std::set<std::string> roots = entryPoints(program);
    std::set<std::string> out;
    for (const auto &[name, fn] : program.functions)
    {
        if (roots.count(name) || fn.blocks.empty() || cg.isRecursive(name))
            continue;
        if (cg.callSiteCount(name) == 1)
            out.insert(name);
    }
    return out;
}

bool optimizeWholeProgram(Program &program, support::DiagnosticEngine *diags)
{
    bool changed = eliminateDeadFunctions(program, analysis::CallGraph::build(program));

    const std::set<std::string> single = singleCallSiteFunctions(program);
    for (auto &[name, caller] : program.functions)
    {
        if (single.count(name))
            continue;
        unsigned n = inlineCalls(caller,
                                 program,
                                 [&](const std::string &callee) { return single.count(callee) > 0; },
                                 diags);
        if (n > 0 && support::traceEnabled())
            std::cerr << "[wpo] " << name << ": " << n << " single-site call(s) inlined\n";
        changed |= n > 0;
    }

    changed |= eliminateDeadFunctions(program, analysis::CallGraph::build(program));
    return changed;
}

void registerWholeProgramPass(PassRegistry &registry)
{
    registry.registerProgramPass("whole-program",
                                 PassRegistry::ProgramPassCallback(
                                     [](Program &program, PassContext &ctx)
                                     { return PassResult::from(optimizeWholeProgram(program, &ctx.diags)); }));
}

} // namespace mir::transform
