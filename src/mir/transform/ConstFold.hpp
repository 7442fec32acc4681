// File: src/mir/transform/ConstFold.hpp
// Purpose: Declares the MIR constant folding pass.
// Key invariants: Only folds operators whose operands are all constants.
// Ownership/Lifetime: Mutates the function in place.
// Links: DESIGN.md
#pragma once

#include "mir/core/fwd.hpp"

namespace mir::transform
{

class PassRegistry;

/// \brief Fold constant unary, binary and numeric-cast rvalues in @p fn and
///        turn switches on constant discriminants into gotos.
/// \return True when anything was rewritten.
bool constFold(core::Function &fn);

/// \brief Register "constant-folding".
void registerConstFoldPass(PassRegistry &registry);

} // namespace mir::transform
