//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/mir/transform/ConstFold.cpp
// Purpose: Implement the MIR constant-folding pass.
// Key invariants: Folding must never change observable behaviour. Division or
//                 remainder by zero and out-of-range float-to-int casts stay in
//                 the IR so they keep their runtime behaviour.
// Ownership/Lifetime: Operates on caller-owned functions in place.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Constant folding for MIR functions.
/// @details Rewrites Assign rvalues whose operands are literals into
///          `Use(const ...)` and replaces SwitchInt terminators that test a
///          literal with a Goto to the selected target.

#include "mir/transform/ConstFold.hpp"

#include "mir/core/Function.hpp"
#include "mir/transform/ConstEval.hpp"
#include "mir/transform/PassRegistry.hpp"

#include <optional>

using namespace mir::core;

namespace mir::transform
{

namespace
{

/// @brief Evaluate @p rvalue when every operand is a literal.
std::optional<Constant> foldRvalue(const Rvalue &rvalue)
{
    if (const auto *bin = std::get_if<rv::BinaryOp>(&rvalue))
    {
        if (bin->left.isConstant() && bin->right.isConstant())
            return foldBinary(bin->op, bin->left.getConstant(), bin->right.getConstant());
        return std::nullopt;
    }
    if (const auto *un = std::get_if<rv::UnaryOp>(&rvalue))
    {
        if (un->operand.isConstant())
            return foldUnary(un->op, un->operand.getConstant());
        return std::nullopt;
    }
    if (const auto *cast = std::get_if<rv::Cast>(&rvalue))
    {
        if (cast->operand.isConstant())
            return foldCast(cast->kind, cast->operand.getConstant(), cast->type);
    }
    return std::nullopt;
}

/// @brief Replace a switch over a literal with a jump to the chosen arm.
bool foldSwitch(Terminator &term)
{
    auto *sw = std::get_if<term::SwitchInt>(&term.kind);
    if (!sw || !sw->discriminant.isConstant())
        return false;
    auto value = switchValue(sw->discriminant.getConstant());
    if (!value)
        return false;

    BlockId target = sw->otherwise;
    for (size_t i = 0; i < sw->values.size() && i < sw->targets.size(); ++i)
    {
        if (sw->values[i] == *value)
        {
            target = sw->targets[i];
            break;
        }
    }
    term = Terminator::gotoBlock(target);
    return true;
}

} // namespace

bool constFold(Function &fn)
{
    bool changed = false;
    for (auto &bb : fn.blocks)
    {
        for (auto &stmt : bb.statements)
        {
            auto *assign = stmt.asAssign();
            if (!assign)
                continue;
            if (auto folded = foldRvalue(assign->rvalue))
            {
                assign->rvalue = rv::Use{Operand::constOf(std::move(*folded))};
                changed = true;
            }
        }
        changed |= foldSwitch(bb.terminator);
    }
    return changed;
}

void registerConstFoldPass(PassRegistry &registry)
{
    registry.registerFunctionPass(
        "constant-folding",
        PassRegistry::FunctionPassCallback(
            [](Function &fn, PassContext &)
            {
                return PassResult::from(constFold(fn));
            }));
}

} // namespace mir::transform
