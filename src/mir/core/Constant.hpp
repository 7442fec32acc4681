//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/mir/core/Constant.hpp
// Purpose: Declares typed literal values used by operands, program-level
//          constants and the folding evaluator.
// Key invariants: Integers are 128-bit signed; the stored Type describes the
//                 source-level type of the literal.
// Ownership/Lifetime: Value type.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "mir/core/Type.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

namespace mir::core
{

__extension__ typedef __int128 Int128;
__extension__ typedef unsigned __int128 UInt128;

/// @brief Payload of the null literal.
struct NullValue
{
    bool operator==(const NullValue &) const = default;
};

/// @brief Unicode scalar value of a char literal.
struct CharValue
{
    uint32_t codePoint = 0;
    bool operator==(const CharValue &) const = default;
};

/// @brief Literal payload.
using ConstantValue = std::variant<bool, Int128, double, std::string, CharValue, NullValue>;

/// @brief Typed literal.
struct Constant
{
    Type type;
    ConstantValue value;

    static Constant boolean(bool v);
    static Constant integer(Int128 v, Type type = Type(Type::Kind::Integer));
    static Constant floating(double v, Type type = Type(Type::Kind::Float));
    static Constant string(std::string v);
    static Constant character(uint32_t codePoint);
    static Constant null(Type type = Type(Type::Kind::Void));

    [[nodiscard]] bool isBool() const
    {
        return std::holds_alternative<bool>(value);
    }

    [[nodiscard]] bool isInt() const
    {
        return std::holds_alternative<Int128>(value);
    }

    [[nodiscard]] bool isFloat() const
    {
        return std::holds_alternative<double>(value);
    }

    [[nodiscard]] bool isString() const
    {
        return std::holds_alternative<std::string>(value);
    }

    [[nodiscard]] bool asBool() const
    {
        return std::get<bool>(value);
    }

    [[nodiscard]] Int128 asInt() const
    {
        return std::get<Int128>(value);
    }

    [[nodiscard]] double asFloat() const
    {
        return std::get<double>(value);
    }

    [[nodiscard]] const std::string &asString() const
    {
        return std::get<std::string>(value);
    }

    /// @brief Equality with an epsilon tolerance on floats.
    bool operator==(const Constant &other) const;

    /// @brief Bitwise identity, used where equality must be transitive
    ///        (hash keys).
    [[nodiscard]] bool identical(const Constant &other) const;

    /// @brief Hash consistent with identical().
    [[nodiscard]] size_t hash() const;

    /// @brief Literal spelling, e.g. `const 42_int`, `const true`.
    std::string toString() const;
};

/// @brief Decimal spelling of a 128-bit integer.
std::string int128ToString(Int128 v);

/// @brief Decimal spelling of an unsigned 128-bit integer.
std::string uint128ToString(UInt128 v);

/// @brief Wrapping arithmetic on 128-bit two's complement integers.
Int128 wrappingAdd(Int128 a, Int128 b);
Int128 wrappingSub(Int128 a, Int128 b);
Int128 wrappingMul(Int128 a, Int128 b);
Int128 wrappingNeg(Int128 a);

} // namespace mir::core
