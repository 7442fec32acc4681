//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/mir/core/Type.hpp
// Purpose: Declares the type descriptor attached to MIR locals, constants,
//          casts and aggregates.
// Key invariants: Array and Pointer carry exactly one element type; Function
//                 carries its parameters followed by the return type.
// Ownership/Lifetime: Value type; nested types are owned by value.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mir::core
{

/// @brief MIR type descriptor.
class Type
{
  public:
    /// @brief Enumerates the type categories known to the middle-end.
    enum class Kind
    {
        Integer,
        Integer32,
        Integer64,
        Float,
        Float32,
        Float64,
        String,
        Char,
        Boolean,
        Void,
        SizeT,
        UIntPtrT,
        Named,
        Array,
        Pointer,
        Function,
    };

    Kind kind; ///< Discriminator specifying the active kind

    /// @brief Construct a type of kind @p k.
    explicit Type(Kind k = Kind::Void);

    /// @brief User-defined type referenced by name.
    static Type named(std::string name);

    /// @brief Array of @p element with an optional static length.
    static Type array(Type element, std::optional<uint64_t> size = std::nullopt);

    /// @brief Pointer to @p target.
    static Type pointer(Type target, bool isMutable);

    /// @brief Function signature type.
    static Type function(std::vector<Type> params, Type ret);

    [[nodiscard]] bool isInteger() const;
    [[nodiscard]] bool isFloat() const;
    [[nodiscard]] bool isNumeric() const;
    [[nodiscard]] bool isPrimitive() const;

    [[nodiscard]] bool isBoolean() const
    {
        return kind == Kind::Boolean;
    }

    /// @brief Element type of an Array or target of a Pointer.
    [[nodiscard]] const Type &element() const;

    /// @brief Convert type to its textual spelling.
    std::string toString() const;

    bool operator==(const Type &other) const;

    /// @brief Name of a Named type.
    std::string name;

    /// @brief Nested types (see Key invariants above).
    std::vector<Type> nested;

    /// @brief Static length of an Array type.
    std::optional<uint64_t> arraySize;

    /// @brief Mutability of a Pointer type.
    bool isMutable = false;
};

/// @brief Convert kind @p k to its mnemonic string.
std::string kindToString(Type::Kind k);

} // namespace mir::core
