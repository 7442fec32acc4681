//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/mir/transform/ConstEval.cpp
// Purpose: Operator semantics shared by constant folding and the bounded
//          evaluator used for pure-call folding.
// Key invariants: Comparison results are Boolean-typed. Arithmetic over two
//                 integers keeps the left operand's type; when either side is
//                 a float the other is promoted and the result is float.
//                 Shift amounts are masked to 6 bits.
// Ownership/Lifetime: Stateless.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "mir/transform/ConstEval.hpp"

#include <cmath>
#include <cstdint>
#include <limits>

using namespace mir::core;

namespace mir::transform
{

namespace
{

constexpr double kFloatEpsilon = std::numeric_limits<double>::epsilon();

const Int128 kInt128Min = static_cast<Int128>(UInt128(1) << 127);

Constant boolean(bool v)
{
    return Constant::boolean(v);
}

std::optional<Constant> foldIntegers(BinOp op, Int128 l, Int128 r, const Type &type)
{
    auto integer = [&](Int128 v) { return Constant::integer(v, type); };
    switch (op)
    {
        case BinOp::Add:
            return integer(wrappingAdd(l, r));
        case BinOp::Sub:
            return integer(wrappingSub(l, r));
        case BinOp::Mul:
            return integer(wrappingMul(l, r));
        case BinOp::Div:
            if (r == 0)
                return std::nullopt;
            if (l == kInt128Min && r == -1)
                return integer(l);
            return integer(l / r);
        case BinOp::Rem:
            if (r == 0)
                return std::nullopt;
            if (r == -1)
                return integer(0);
            return integer(l % r);
        case BinOp::Mod:
        {
            if (r == 0)
                return std::nullopt;
            if (r == -1)
                return integer(0);
            Int128 m = l % r;
            if (m != 0 && ((m < 0) != (r < 0)))
                m += r;
            return integer(m);
        }
        case BinOp::BitAnd:
            return integer(l & r);
        case BinOp::BitOr:
            return integer(l | r);
        case BinOp::BitXor:
            return integer(l ^ r);
        case BinOp::Shl:
            return integer(static_cast<Int128>(static_cast<UInt128>(l) << (r & 63)));
        case BinOp::Shr:
            return integer(l >> (r & 63));
        case BinOp::Eq:
            return boolean(l == r);
        case BinOp::Ne:
            return boolean(l != r);
        case BinOp::Lt:
            return boolean(l < r);
        case BinOp::Le:
            return boolean(l <= r);
        case BinOp::Gt:
            return boolean(l > r);
        case BinOp::Ge:
            return boolean(l >= r);
        default:
            return std::nullopt;
    }
}

std::optional<Constant> foldFloats(BinOp op, double l, double r, const Type &type)
{
    auto floating = [&](double v) { return Constant::floating(v, type); };
    switch (op)
    {
        case BinOp::Add:
            return floating(l + r);
        case BinOp::Sub:
            return floating(l - r);
        case BinOp::Mul:
            return floating(l * r);
        case BinOp::Div:
            if (r == 0.0)
                return std::nullopt;
            return floating(l / r);
        case BinOp::Eq:
            return boolean(std::fabs(l - r) < kFloatEpsilon);
        case BinOp::Ne:
            return boolean(std::fabs(l - r) >= kFloatEpsilon);
        case BinOp::Lt:
            return boolean(l < r);
        case BinOp::Le:
            return boolean(l <= r);
        case BinOp::Gt:
            return boolean(l > r);
        case BinOp::Ge:
            return boolean(l >= r);
        default:
            return std::nullopt;
    }
}

std::optional<Constant> foldBooleans(BinOp op, bool l, bool r)
{
    switch (op)
    {
        case BinOp::Eq:
            return boolean(l == r);
        case BinOp::Ne:
            return boolean(l != r);
        case BinOp::And:
        case BinOp::BitAnd:
            return boolean(l && r);
        case BinOp::Or:
        case BinOp::BitOr:
            return boolean(l || r);
        case BinOp::BitXor:
            return boolean(l != r);
        default:
            return std::nullopt;
    }
}

std::optional<Constant> foldStrings(BinOp op, const std::string &l, const std::string &r)
{
    switch (op)
    {
        case BinOp::Eq:
            return boolean(l == r);
        case BinOp::Ne:
            return boolean(l != r);
        case BinOp::Add:
            return Constant::string(l + r);
        default:
            return std::nullopt;
    }
}

/// Float type of the result when a float meets an integer.
Type floatResultType(const Constant &lhs, const Constant &rhs)
{
    if (lhs.isFloat())
        return lhs.type;
    return rhs.type;
}

bool fitsInteger(double v, const Type &to)
{
    if (!std::isfinite(v))
        return false;
    double t = std::trunc(v);
    if (to.kind == Type::Kind::Integer32)
        return t >= static_cast<double>(std::numeric_limits<int32_t>::min()) &&
               t <= static_cast<double>(std::numeric_limits<int32_t>::max());
    // 2^63 is exactly representable; the open upper bound keeps the cast defined.
    return t >= -9223372036854775808.0 && t < 9223372036854775808.0;
}

} // namespace

std::optional<Constant> foldBinary(BinOp op, const Constant &lhs, const Constant &rhs)
{
    if (lhs.isInt() && rhs.isInt())
        return foldIntegers(op, lhs.asInt(), rhs.asInt(), lhs.type);
    if (lhs.isFloat() && rhs.isFloat())
        return foldFloats(op, lhs.asFloat(), rhs.asFloat(), lhs.type);
    if (lhs.isFloat() && rhs.isInt())
        return foldFloats(op, lhs.asFloat(), static_cast<double>(rhs.asInt()), lhs.type);
    if (lhs.isInt() && rhs.isFloat())
        return foldFloats(
            op, static_cast<double>(lhs.asInt()), rhs.asFloat(), floatResultType(lhs, rhs));
    if (lhs.isBool() && rhs.isBool())
        return foldBooleans(op, lhs.asBool(), rhs.asBool());
    if (lhs.isString() && rhs.isString())
        return foldStrings(op, lhs.asString(), rhs.asString());
    if (std::holds_alternative<CharValue>(lhs.value) &&
        std::holds_alternative<CharValue>(rhs.value))
    {
        uint32_t l = std::get<CharValue>(lhs.value).codePoint;
        uint32_t r = std::get<CharValue>(rhs.value).codePoint;
        if (op == BinOp::Eq)
            return boolean(l == r);
        if (op == BinOp::Ne)
            return boolean(l != r);
    }
    return std::nullopt;
}

std::optional<Constant> foldUnary(UnOp op, const Constant &operand)
{
    switch (op)
    {
        case UnOp::Not:
            if (operand.isBool())
                return boolean(!operand.asBool());
            if (operand.isInt())
                return Constant::integer(~operand.asInt(), operand.type);
            return std::nullopt;
        case UnOp::Neg:
            if (operand.isInt())
                return Constant::integer(wrappingNeg(operand.asInt()), operand.type);
            if (operand.isFloat())
                return Constant::floating(-operand.asFloat(), operand.type);
            return std::nullopt;
    }
    return std::nullopt;
}

std::optional<Constant> foldCast(CastKind kind, const Constant &operand, const Type &to)
{
    if (kind != CastKind::Numeric)
        return std::nullopt;
    if (operand.isInt() && to.isFloat())
        return Constant::floating(static_cast<double>(operand.asInt()), to);
    if (operand.isInt() && to.isInteger())
        return Constant::integer(operand.asInt(), to);
    if (operand.isFloat() && to.isInteger())
    {
        if (!fitsInteger(operand.asFloat(), to))
            return std::nullopt;
        return Constant::integer(static_cast<Int128>(static_cast<int64_t>(operand.asFloat())),
                                 to);
    }
    if (operand.isFloat() && to.isFloat())
        return Constant::floating(operand.asFloat(), to);
    return std::nullopt;
}

std::optional<UInt128> switchValue(const Constant &c)
{
    if (c.isBool())
        return c.asBool() ? 1 : 0;
    if (c.isInt())
        return static_cast<UInt128>(c.asInt());
    if (std::holds_alternative<CharValue>(c.value))
        return std::get<CharValue>(c.value).codePoint;
    return std::nullopt;
}

} // namespace mir::transform
