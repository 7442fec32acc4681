//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/mir/core/Rvalue.cpp
// Purpose: Operator classification and rvalue rendering.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "mir/core/Rvalue.hpp"

#include <type_traits>

namespace mir::core
{

const char *toString(BinOp op)
{
    switch (op)
    {
        case BinOp::Add:
            return "Add";
        case BinOp::Sub:
            return "Sub";
        case BinOp::Mul:
            return "Mul";
        case BinOp::Div:
            return "Div";
        case BinOp::Rem:
            return "Rem";
        case BinOp::Mod:
            return "Mod";
        case BinOp::BitXor:
            return "BitXor";
        case BinOp::BitAnd:
            return "BitAnd";
        case BinOp::BitOr:
            return "BitOr";
        case BinOp::Shl:
            return "Shl";
        case BinOp::Shr:
            return "Shr";
        case BinOp::Eq:
            return "Eq";
        case BinOp::Ne:
            return "Ne";
        case BinOp::Lt:
            return "Lt";
        case BinOp::Le:
            return "Le";
        case BinOp::Gt:
            return "Gt";
        case BinOp::Ge:
            return "Ge";
        case BinOp::And:
            return "And";
        case BinOp::Or:
            return "Or";
        case BinOp::Offset:
            return "Offset";
    }
    return "";
}

const char *toString(UnOp op)
{
    return op == UnOp::Not ? "Not" : "Neg";
}

bool isComparison(BinOp op)
{
    switch (op)
    {
        case BinOp::Eq:
        case BinOp::Ne:
        case BinOp::Lt:
        case BinOp::Le:
        case BinOp::Gt:
        case BinOp::Ge:
            return true;
        default:
            return false;
    }
}

bool isCommutative(BinOp op)
{
    switch (op)
    {
        case BinOp::Add:
        case BinOp::Mul:
        case BinOp::BitAnd:
        case BinOp::BitOr:
        case BinOp::BitXor:
        case BinOp::Eq:
        case BinOp::Ne:
        case BinOp::And:
        case BinOp::Or:
            return true;
        default:
            return false;
    }
}

namespace
{
std::string joinOperands(const std::vector<Operand> &ops)
{
    std::string out;
    for (size_t i = 0; i < ops.size(); ++i)
    {
        if (i)
            out += ", ";
        out += ops[i].toString();
    }
    return out;
}

const char *aggregateName(AggregateKind::Kind kind)
{
    switch (kind)
    {
        case AggregateKind::Kind::Array:
            return "array";
        case AggregateKind::Kind::Tuple:
            return "tuple";
        case AggregateKind::Kind::Struct:
            return "struct";
        case AggregateKind::Kind::Enum:
            return "enum";
    }
    return "";
}
} // namespace

std::string calleeText(const Operand &func)
{
    if (func.isConstant() && func.getConstant().isString())
        return func.getConstant().asString();
    return func.toString();
}

std::string toString(const Rvalue &rvalue)
{
    return std::visit(
        [](const auto &r) -> std::string
        {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, rv::Use>)
                return r.operand.toString();
            else if constexpr (std::is_same_v<T, rv::BinaryOp>)
                return std::string(toString(r.op)) + "(" + r.left.toString() + ", " +
                       r.right.toString() + ")";
            else if constexpr (std::is_same_v<T, rv::UnaryOp>)
                return std::string(toString(r.op)) + "(" + r.operand.toString() + ")";
            else if constexpr (std::is_same_v<T, rv::Call>)
                return "call " + calleeText(r.func) + "(" + joinOperands(r.args) + ")";
            else if constexpr (std::is_same_v<T, rv::Aggregate>)
            {
                std::string head = aggregateName(r.kind.kind);
                if (!r.kind.name.empty())
                    head += " " + r.kind.name;
                if (r.kind.kind == AggregateKind::Kind::Enum)
                    head += "::" + std::to_string(r.kind.variant);
                return head + " {" + joinOperands(r.operands) + "}";
            }
            else if constexpr (std::is_same_v<T, rv::Cast>)
            {
                const char *kind = r.kind == CastKind::Numeric   ? "numeric"
                                   : r.kind == CastKind::Pointer ? "pointer"
                                                                 : "unsize";
                return std::string("cast<") + kind + "> " + r.operand.toString() + " as " +
                       r.type.toString();
            }
            else if constexpr (std::is_same_v<T, rv::Ref>)
                return std::string(r.mutability == Mutability::Mut ? "&mut " : "&") +
                       r.place.toString();
            else if constexpr (std::is_same_v<T, rv::Len>)
                return "Len(" + r.place.toString() + ")";
            else
                return "discriminant(" + r.place.toString() + ")";
        },
        rvalue);
}

} // namespace mir::core
