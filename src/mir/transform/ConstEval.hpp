// File: src/mir/transform/ConstEval.hpp
// Purpose: Compile-time evaluation of MIR operators over constants.
// Key invariants: Integer arithmetic wraps at 128 bits; operations that would
//                 trap (division or remainder by zero) are never evaluated.
// Ownership/Lifetime: Stateless helpers returning fresh constants.
// Links: DESIGN.md
#pragma once

#include "mir/core/Rvalue.hpp"

#include <optional>

namespace mir::transform
{

/// @brief Evaluate @p op over two constants.
/// @return Folded constant, or nullopt when the operand kinds do not fold or
///         the operation would trap.
std::optional<core::Constant> foldBinary(core::BinOp op,
                                         const core::Constant &lhs,
                                         const core::Constant &rhs);

/// @brief Evaluate @p op over one constant.
std::optional<core::Constant> foldUnary(core::UnOp op, const core::Constant &operand);

/// @brief Evaluate a cast of @p operand to @p to.
/// @details Only numeric casts fold: int to float, float to int (truncating,
///          when finite and in range) and int to int.
std::optional<core::Constant> foldCast(core::CastKind kind,
                                       const core::Constant &operand,
                                       const core::Type &to);

/// @brief Integer value of a switch discriminant (booleans map to 0/1).
std::optional<core::UInt128> switchValue(const core::Constant &c);

} // namespace mir::transform
