// File: src/mir/transform/WholeProgram.hpp
// Purpose: Whole-program optimization: dead-function elimination around
//          inlining of functions with a single call site.
// Key invariants: Recursive functions are never inlined; entry points are
//                 never removed.
// Ownership/Lifetime: Mutates the caller-owned program in place.
// Links: DESIGN.md

#pragma once

#include "mir/transform/PassRegistry.hpp"

#include <set>
#include <string>

namespace mir::transform
{

/// @brief Non-recursive functions with exactly one direct call site that are
///        not entry points.
std::set<std::string> singleCallSiteFunctions(const core::Program &program);

/// @brief Eliminate dead functions, inline single-call-site functions, then
///        eliminate again.
bool optimizeWholeProgram(core::Program &program, support::DiagnosticEngine *diags = nullptr);

void registerWholeProgramPass(PassRegistry &registry);

} // namespace mir::transform
