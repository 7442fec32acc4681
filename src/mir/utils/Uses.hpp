// File: src/mir/utils/Uses.hpp
// Purpose: Read/write queries and id remapping over MIR statements and
//          terminators.
// Key invariants: A projected destination reads its base local; Index
//                 projections always read their index local.
// Ownership/Lifetime: Does not take ownership of inputs.
// Links: DESIGN.md
#pragma once

#include "mir/core/Function.hpp"

#include <functional>
#include <optional>
#include <set>
#include <string>

namespace mir::util
{

using LocalSet = std::set<core::LocalId>;
using LocalMapFn = std::function<core::LocalId(core::LocalId)>;
using BlockMapFn = std::function<core::BlockId(core::BlockId)>;

/// @brief Name of the callee when @p func is a string constant.
/// @return nullopt for indirect calls.
std::optional<std::string> directCallee(const core::Operand &func);

/// @brief Add the locals read when evaluating @p place as a value.
void addPlaceReads(const core::Place &place, LocalSet &out);

/// @brief Add the locals read by writing to @p place (base when projected,
///        plus index locals).
void addDestinationReads(const core::Place &place, LocalSet &out);

void addOperandReads(const core::Operand &op, LocalSet &out);

void addRvalueReads(const core::Rvalue &rvalue, LocalSet &out);

/// @brief Locals read by @p stmt. StorageLive/Dead read nothing.
LocalSet statementReads(const core::Statement &stmt);

/// @brief Locals read by @p term, excluding the implicit return local.
LocalSet terminatorReads(const core::Terminator &term);

/// @brief Every local mentioned by @p stmt, including storage markers.
LocalSet statementMentions(const core::Statement &stmt);

/// @brief Every local mentioned by @p term.
LocalSet terminatorMentions(const core::Terminator &term);

/// @brief Local fully overwritten by @p stmt (Assign to an unprojected place).
std::optional<core::LocalId> definedLocal(const core::Statement &stmt);

/// @brief Base local of the place written by @p stmt, projected or not.
std::optional<core::LocalId> writtenLocal(const core::Statement &stmt);

/// @brief True when @p rvalue is a Call.
bool isCall(const core::Rvalue &rvalue);

/// @brief Apply @p map to every local id inside @p place.
void remapLocals(core::Place &place, const LocalMapFn &map);
void remapLocals(core::Operand &op, const LocalMapFn &map);
void remapLocals(core::Rvalue &rvalue, const LocalMapFn &map);
void remapLocals(core::Statement &stmt, const LocalMapFn &map);
void remapLocals(core::Terminator &term, const LocalMapFn &map);

/// @brief Apply @p map to every successor of @p term.
void remapBlocks(core::Terminator &term, const BlockMapFn &map);

/// @brief Count assignments whose base local is @p local across @p fn.
unsigned countAssignments(const core::Function &fn, core::LocalId local);

} // namespace mir::util
