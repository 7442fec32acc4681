//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: mir/transform/ExprKey.cpp
// Purpose: Hashing, equality and construction of CSE expression keys.
//
//===----------------------------------------------------------------------===//

#include "mir/transform/ExprKey.hpp"

#include "mir/utils/Uses.hpp"

#include <algorithm>
#include <functional>
#include <string>

using namespace mir::core;

namespace mir::transform
{

namespace
{

inline void hashCombine(size_t &seed, size_t v) noexcept
{
    seed ^= v + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

/// Strict weak order used only to canonicalise commutative operands.
bool operandLess(const Operand &a, const Operand &b)
{
    if (a.isConstant() != b.isConstant())
        return !a.isConstant();
    if (!a.isConstant())
    {
        if (a.place.local != b.place.local)
            return a.place.local < b.place.local;
        return a.place.toString() < b.place.toString();
    }
    size_t ha = a.getConstant().hash();
    size_t hb = b.getConstant().hash();
    if (ha != hb)
        return ha < hb;
    return a.getConstant().toString() < b.getConstant().toString();
}

bool acceptable(const Operand &op, const std::set<LocalId> &addressTaken)
{
    if (op.isConstant())
        return true;
    if (op.place.hasDeref())
        return false;
    util::LocalSet reads;
    util::addOperandReads(op, reads);
    return std::none_of(
        reads.begin(), reads.end(), [&](LocalId id) { return addressTaken.count(id) > 0; });
}

} // namespace

size_t OperandHash::operator()(const Operand &op) const noexcept
{
    if (op.isConstant())
        return op.getConstant().hash();
    size_t h = std::hash<uint32_t>{}(op.place.local);
    hashCombine(h, std::hash<std::string>{}(op.place.toString()));
    return h;
}

bool OperandEq::operator()(const Operand &a, const Operand &b) const noexcept
{
    if (a.isConstant() != b.isConstant())
        return false;
    if (a.isConstant())
        return a.getConstant().identical(b.getConstant());
    return a.place == b.place;
}

bool ExprKey::operator==(const ExprKey &o) const noexcept
{
    if (shape != o.shape || op != o.op || operands.size() != o.operands.size())
        return false;
    OperandEq eq;
    for (size_t i = 0; i < operands.size(); ++i)
        if (!eq(operands[i], o.operands[i]))
            return false;
    return true;
}

bool ExprKey::reads(LocalId local) const
{
    util::LocalSet ids;
    for (const auto &operand : operands)
        util::addOperandReads(operand, ids);
    return ids.count(local) > 0;
}

size_t ExprKeyHash::operator()(const ExprKey &k) const noexcept
{
    size_t h = static_cast<size_t>(k.shape) * 1000003u + static_cast<size_t>(k.op);
    OperandHash oh;
    for (const auto &operand : k.operands)
        hashCombine(h, oh(operand));
    return h;
}

std::optional<ExprKey> makeExprKey(const Rvalue &rvalue, const std::set<LocalId> &addressTaken)
{
    ExprKey key;
    if (const auto *use = std::get_if<rv::Use>(&rvalue))
    {
        if (use->operand.isConstant())
            return std::nullopt;
        key.shape = ExprKey::Shape::Use;
        key.operands = {use->operand};
    }
    else if (const auto *bin = std::get_if<rv::BinaryOp>(&rvalue))
    {
        key.shape = ExprKey::Shape::Binary;
        key.op = static_cast<int>(bin->op);
        key.operands = {bin->left, bin->right};
        if (isCommutative(bin->op) && operandLess(key.operands[1], key.operands[0]))
            std::swap(key.operands[0], key.operands[1]);
    }
    else if (const auto *un = std::get_if<rv::UnaryOp>(&rvalue))
    {
        key.shape = ExprKey::Shape::Unary;
        key.op = static_cast<int>(un->op);
        key.operands = {un->operand};
    }
    else
    {
        return std::nullopt;
    }

    for (auto &operand : key.operands)
    {
        if (!acceptable(operand, addressTaken))
            return std::nullopt;
        if (operand.kind == Operand::Kind::Move)
            operand.kind = Operand::Kind::Copy;
    }
    return key;
}

} // namespace mir::transform
