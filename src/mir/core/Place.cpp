//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/mir/core/Place.cpp
// Purpose: Operand constructors and the textual spelling of places.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "mir/core/Place.hpp"

#include <type_traits>

namespace mir::core
{

bool Place::hasDeref() const
{
    for (const auto &elem : projection)
    {
        if (std::holds_alternative<proj::Deref>(elem))
            return true;
    }
    return false;
}

std::string Place::toString() const
{
    std::string out = "_" + std::to_string(local);
    for (const auto &elem : projection)
    {
        std::visit(
            [&out](const auto &p)
            {
                using T = std::decay_t<decltype(p)>;
                if constexpr (std::is_same_v<T, proj::Deref>)
                    out = "(*" + out + ")";
                else if constexpr (std::is_same_v<T, proj::Field>)
                    out += "." + std::to_string(p.index);
                else if constexpr (std::is_same_v<T, proj::Index>)
                    out += "[_" + std::to_string(p.local) + "]";
                else
                {
                    out += "[" + std::to_string(p.from) + "..";
                    if (p.to)
                        out += std::to_string(*p.to);
                    out += "]";
                }
            },
            elem);
    }
    return out;
}

Operand Operand::copy(Place p)
{
    Operand op;
    op.kind = Kind::Copy;
    op.place = std::move(p);
    return op;
}

Operand Operand::move(Place p)
{
    Operand op;
    op.kind = Kind::Move;
    op.place = std::move(p);
    return op;
}

Operand Operand::constOf(core::Constant c)
{
    Operand op;
    op.kind = Kind::Constant;
    op.constant = std::move(c);
    return op;
}

bool Operand::operator==(const Operand &other) const
{
    if (kind != other.kind)
        return false;
    if (kind == Kind::Constant)
        return *constant == *other.constant;
    return place == other.place;
}

std::string Operand::toString() const
{
    switch (kind)
    {
        case Kind::Copy:
            return "copy " + place.toString();
        case Kind::Move:
            return "move " + place.toString();
        case Kind::Constant:
            return constant->toString();
    }
    return "";
}

} // namespace mir::core
