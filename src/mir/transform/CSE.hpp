// File: src/mir/transform/CSE.hpp
// Purpose: Block-local common-subexpression elimination for MIR.
// Key invariants: Only pure Use/BinaryOp/UnaryOp rvalues are reused; nothing
//                 is propagated across block boundaries.
// Ownership/Lifetime: Mutates the function in place.
// Links: DESIGN.md
#pragma once

#include "mir/core/fwd.hpp"

namespace mir::transform
{

class PassRegistry;

/// \brief Replace recomputed expressions with a copy of the local that
///        first computed them within the same block.
bool cse(core::Function &fn);

/// \brief Register "common-subexpression-elimination".
void registerCSEPass(PassRegistry &registry);

} // namespace mir::transform
