//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/mir/core/Place.hpp
// Purpose: Declares places (addressable locations) and operands.
// Key invariants: A place with an empty projection denotes the local itself;
//                 Index projections read the index local.
// Ownership/Lifetime: Value types.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "mir/core/Constant.hpp"
#include "mir/core/Type.hpp"
#include "mir/core/fwd.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mir::core
{

namespace proj
{
/// @brief `*place`.
struct Deref
{
    bool operator==(const Deref &) const = default;
};

/// @brief `place.N` with the field's type.
struct Field
{
    uint32_t index = 0;
    Type type;
    bool operator==(const Field &) const = default;
};

/// @brief `place[local]`.
struct Index
{
    LocalId local = 0;
    bool operator==(const Index &) const = default;
};

/// @brief `place[from..to]`, open-ended when @c to is empty.
struct Subslice
{
    uint64_t from = 0;
    std::optional<uint64_t> to;
    bool operator==(const Subslice &) const = default;
};
} // namespace proj

using PlaceElem = std::variant<proj::Deref, proj::Field, proj::Index, proj::Subslice>;

/// @brief Local variable plus an ordered projection path.
struct Place
{
    LocalId local = 0;
    std::vector<PlaceElem> projection;

    /// @brief Place naming @p id itself.
    static Place of(LocalId id)
    {
        return Place{id, {}};
    }

    [[nodiscard]] bool isLocal() const
    {
        return projection.empty();
    }

    /// @brief True when the projection dereferences a pointer.
    [[nodiscard]] bool hasDeref() const;

    bool operator==(const Place &) const = default;

    /// @brief Spelling such as `_3`, `(*_1).0`, `_2[_4]`.
    std::string toString() const;
};

/// @brief Input of an rvalue or terminator.
struct Operand
{
    enum class Kind
    {
        Copy,     ///< Non-consuming read of a place.
        Move,     ///< Consuming read of a place.
        Constant, ///< Typed literal.
    };

    Kind kind = Kind::Copy;
    Place place;
    std::optional<core::Constant> constant;

    static Operand copy(Place p);
    static Operand move(Place p);
    static Operand copy(LocalId id)
    {
        return copy(Place::of(id));
    }
    static Operand move(LocalId id)
    {
        return move(Place::of(id));
    }
    static Operand constOf(core::Constant c);

    [[nodiscard]] bool isConstant() const
    {
        return kind == Kind::Constant;
    }

    [[nodiscard]] bool isPlace() const
    {
        return kind != Kind::Constant;
    }

    /// @brief Constant payload; requires isConstant().
    [[nodiscard]] const core::Constant &getConstant() const
    {
        return *constant;
    }

    bool operator==(const Operand &other) const;

    std::string toString() const;
};

} // namespace mir::core
