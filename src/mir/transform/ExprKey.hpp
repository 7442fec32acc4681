//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: mir/transform/ExprKey.hpp
// Purpose: Expression identity keys used by common-subexpression elimination.
//          Normalises commutative operands, hashes operands stably and gates
//          which rvalues are candidates (pure Use/BinaryOp/UnaryOp).
// Key invariants:
//   - Commutative operands are sorted to produce canonical keys.
//   - Copy and Move reads of the same place produce the same key.
//   - Constants compare bitwise so equality stays transitive.
// Ownership/Lifetime: ExprKey is a value type owning its operands.
// Links: mir/core/Rvalue.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "mir/core/Rvalue.hpp"

#include <optional>
#include <set>
#include <vector>

namespace mir::transform
{

/// @brief Hash an operand by place or constant payload.
struct OperandHash
{
    size_t operator()(const core::Operand &op) const noexcept;
};

/// @brief Operand equality ignoring Copy/Move and comparing constants bitwise.
struct OperandEq
{
    bool operator()(const core::Operand &a, const core::Operand &b) const noexcept;
};

/// @brief Normalised key describing a pure rvalue.
struct ExprKey
{
    enum class Shape
    {
        Use,
        Binary,
        Unary,
    };

    Shape shape = Shape::Use;
    int op = 0; ///< BinOp or UnOp value; 0 for Use.
    std::vector<core::Operand> operands;

    bool operator==(const ExprKey &o) const noexcept;

    /// @brief True when any operand reads @p local.
    [[nodiscard]] bool reads(core::LocalId local) const;
};

struct ExprKeyHash
{
    size_t operator()(const ExprKey &k) const noexcept;
};

/// @brief Build the key of @p rvalue when it is a CSE candidate.
/// @details Uses of constants, reads through Deref and reads of locals in
///          @p addressTaken are rejected since their value may change
///          without an assignment to a local.
std::optional<ExprKey> makeExprKey(const core::Rvalue &rvalue,
                                   const std::set<core::LocalId> &addressTaken);

} // namespace mir::transform
