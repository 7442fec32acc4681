// File: src/mir/transform/DCE.hpp
// Purpose: Dead-code elimination for MIR functions.
// Key invariants: Calls, projected stores and stores to address-taken locals
//                 are never removed; parameters are always considered used.
// Ownership/Lifetime: Mutates the function in place.
// Links: DESIGN.md
#pragma once

#include "mir/core/fwd.hpp"

namespace mir::transform
{

class PassRegistry;

/// \brief Drop blocks unreachable from the entry.
bool removeUnreachableBlocks(core::Function &fn);

/// \brief Drop assignments whose destination is not live afterwards, plus Nops.
/// \details Iterates to a fixed point since removing one store can make the
///          operands of an earlier one dead.
bool removeDeadAssignments(core::Function &fn);

/// \brief Drop declarations of locals that no statement or terminator
///        mentions; StorageLive/StorageDead count as mentions.
bool removeUnusedLocals(core::Function &fn);

/// \brief Run all three cleanups in order.
bool dce(core::Function &fn);

/// \brief Register "dead-code-elimination".
void registerDCEPass(PassRegistry &registry);

} // namespace mir::transform
