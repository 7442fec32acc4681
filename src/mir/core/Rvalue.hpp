//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/mir/core/Rvalue.hpp
// Purpose: Declares the right-hand sides of assignments and the operator
//          enumerations they use.
// Key invariants: Call rvalues name their callee through an operand; a direct
//                 call is a string constant naming the function.
// Ownership/Lifetime: Value types.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "mir/core/Place.hpp"

#include <string>
#include <variant>
#include <vector>

namespace mir::core
{

/// @brief Binary operators.
enum class BinOp
{
    Add,
    Sub,
    Mul,
    Div,
    Rem,
    Mod,
    BitXor,
    BitAnd,
    BitOr,
    Shl,
    Shr,
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge,
    And,
    Or,
    Offset,
};

/// @brief Unary operators.
enum class UnOp
{
    Not,
    Neg,
};

enum class CastKind
{
    Numeric,
    Pointer,
    Unsize,
};

enum class Mutability
{
    Not,
    Mut,
};

/// @brief What an Aggregate rvalue constructs.
struct AggregateKind
{
    enum class Kind
    {
        Array,
        Tuple,
        Struct,
        Enum,
    };

    Kind kind = Kind::Tuple;
    Type elementType;                ///< Array element type.
    std::string name;                ///< Struct or enum name.
    std::vector<std::string> fields; ///< Struct field names.
    uint32_t variant = 0;            ///< Enum variant index.

    bool operator==(const AggregateKind &) const = default;
};

namespace rv
{
struct Use
{
    Operand operand;
    bool operator==(const Use &) const = default;
};

struct BinaryOp
{
    BinOp op;
    Operand left;
    Operand right;
    bool operator==(const BinaryOp &) const = default;
};

struct UnaryOp
{
    UnOp op;
    Operand operand;
    bool operator==(const UnaryOp &) const = default;
};

struct Call
{
    Operand func;
    std::vector<Operand> args;
    bool operator==(const Call &) const = default;
};

struct Aggregate
{
    AggregateKind kind;
    std::vector<Operand> operands;
    bool operator==(const Aggregate &) const = default;
};

struct Cast
{
    CastKind kind;
    Operand operand;
    Type type;
    bool operator==(const Cast &) const = default;
};

struct Ref
{
    Place place;
    Mutability mutability = Mutability::Not;
    bool operator==(const Ref &) const = default;
};

struct Len
{
    Place place;
    bool operator==(const Len &) const = default;
};

struct Discriminant
{
    Place place;
    bool operator==(const Discriminant &) const = default;
};
} // namespace rv

using Rvalue = std::variant<rv::Use,
                            rv::BinaryOp,
                            rv::UnaryOp,
                            rv::Call,
                            rv::Aggregate,
                            rv::Cast,
                            rv::Ref,
                            rv::Len,
                            rv::Discriminant>;

/// @brief Mnemonic of a binary operator, e.g. "Add".
const char *toString(BinOp op);

/// @brief Mnemonic of a unary operator, e.g. "Neg".
const char *toString(UnOp op);

/// @brief True for comparison operators (result type is boolean).
bool isComparison(BinOp op);

/// @brief True for operators whose operands may be swapped.
bool isCommutative(BinOp op);

/// @brief Textual spelling of an rvalue, e.g. "Add(copy _1, const 2_int)".
std::string toString(const Rvalue &rvalue);

/// @brief Callee spelling: the bare name for direct calls, the operand otherwise.
std::string calleeText(const Operand &func);

} // namespace mir::core
