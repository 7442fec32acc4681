//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/mir/core/Terminator.hpp
// Purpose: Declares block terminators, the single control transfer closing
//          each basic block.
// Key invariants: Every block id named by a terminator exists in the owning
//                 function; SwitchInt keeps values and targets parallel.
// Ownership/Lifetime: Value types owned by their BasicBlock.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "mir/core/Place.hpp"
#include "mir/core/Rvalue.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mir::core
{

namespace assert_msg
{
struct BoundsCheck
{
    Operand len;
    Operand index;
    bool operator==(const BoundsCheck &) const = default;
};

struct Overflow
{
    BinOp op;
    Operand a;
    Operand b;
    bool operator==(const Overflow &) const = default;
};

struct DivisionByZero
{
    bool operator==(const DivisionByZero &) const = default;
};

struct RemainderByZero
{
    bool operator==(const RemainderByZero &) const = default;
};

struct Custom
{
    std::string text;
    bool operator==(const Custom &) const = default;
};
} // namespace assert_msg

using AssertMessage = std::variant<assert_msg::BoundsCheck,
                                   assert_msg::Overflow,
                                   assert_msg::DivisionByZero,
                                   assert_msg::RemainderByZero,
                                   assert_msg::Custom>;

namespace term
{
struct Goto
{
    BlockId target = 0;
    bool operator==(const Goto &) const = default;
};

/// @brief Multi-way branch on an integer discriminant.
struct SwitchInt
{
    Operand discriminant;
    Type switchType;
    std::vector<UInt128> values; ///< Parallel to @c targets.
    std::vector<BlockId> targets;
    BlockId otherwise = 0;
    bool operator==(const SwitchInt &) const = default;
};

struct Return
{
    bool operator==(const Return &) const = default;
};

/// @brief Placeholder or provably unreachable end of a block.
struct Unreachable
{
    bool operator==(const Unreachable &) const = default;
};

struct Call
{
    Operand func;
    std::vector<Operand> args;
    std::optional<Place> destination;
    std::optional<BlockId> target;
    std::optional<BlockId> cleanup;
    bool operator==(const Call &) const = default;
};

struct Drop
{
    Place place;
    BlockId target = 0;
    std::optional<BlockId> unwind;
    bool operator==(const Drop &) const = default;
};

struct Assert
{
    Operand condition;
    bool expected = true;
    AssertMessage message;
    BlockId target = 0;
    std::optional<BlockId> cleanup;
    bool operator==(const Assert &) const = default;
};
} // namespace term

/// @brief Control transfer closing a basic block.
struct Terminator
{
    using Kind = std::variant<term::Goto,
                              term::SwitchInt,
                              term::Return,
                              term::Unreachable,
                              term::Call,
                              term::Drop,
                              term::Assert>;

    Kind kind = term::Unreachable{};

    static Terminator gotoBlock(BlockId target)
    {
        return Terminator{term::Goto{target}};
    }

    static Terminator ret()
    {
        return Terminator{term::Return{}};
    }

    static Terminator unreachable()
    {
        return Terminator{term::Unreachable{}};
    }

    /// @brief Two-way branch: @p ifTrue when @p cond is non-zero.
    static Terminator branch(Operand cond, BlockId ifTrue, BlockId ifFalse);

    [[nodiscard]] bool isUnreachable() const
    {
        return std::holds_alternative<term::Unreachable>(kind);
    }

    [[nodiscard]] bool isReturn() const
    {
        return std::holds_alternative<term::Return>(kind);
    }

    /// @brief Successor block ids, duplicates removed, first occurrence kept.
    [[nodiscard]] std::vector<BlockId> successors() const;

    /// @brief Rewrite every successor equal to @p from into @p to.
    void replaceSuccessor(BlockId from, BlockId to);

    bool operator==(const Terminator &) const = default;
};

/// @brief Spelling of an assert message, e.g. `"division by zero"`.
std::string toString(const AssertMessage &msg);

} // namespace mir::core
