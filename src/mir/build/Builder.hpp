//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the Builder class, the construction interface lowering
// uses to produce MIR functions.
//
// Usage Example:
//   Builder b;
//   BlockId entry = b.startFunction("add", {{"a", intTy}, {"b", intTy}}, intTy);
//   b.assign(Place::of(*b.returnLocal()), rv::BinaryOp{BinOp::Add, ...});
//   b.terminate(Terminator::ret());
//   Function fn = b.finish();
//
// Local and block ids are dense, start at zero and come from counters owned
// by the builder, so two builders never share id state. Scopes record the
// locals declared inside them; popScope() closes their lifetime regions with
// StorageDead statements in reverse declaration order.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "mir/core/Function.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mir::build
{

/// @brief Incremental constructor for one MIR function at a time.
class Builder
{
  public:
    using ParamSpec = std::pair<std::string, core::Type>;

    /// @brief Begin function @p name.
    /// @details Parameters become locals 0..n-1; a non-void return type also
    ///          allocates the return local. Any function under construction
    ///          is discarded.
    /// @return Id of the entry block, which becomes the active block.
    core::BlockId startFunction(std::string name,
                                const std::vector<ParamSpec> &params,
                                core::Type returnType);

    /// @brief Declare a local in the innermost open scope.
    core::LocalId newLocal(core::Type type, bool isMutable = true, std::string debugName = {});

    /// @brief Create an empty block terminated by an Unreachable placeholder.
    core::BlockId newBlock();

    /// @brief Make @p block the active block.
    void switchTo(core::BlockId block);

    [[nodiscard]] core::BlockId currentBlock() const
    {
        return current_;
    }

    /// @brief Append @p stmt to the active block.
    void push(core::Statement stmt);

    /// @brief Append `place = rvalue` to the active block.
    void assign(core::Place place, core::Rvalue rvalue, core::SourceInfo info = {});

    /// @brief Set the terminator of the active block.
    void terminate(core::Terminator term);

    void pushScope();

    /// @brief Close the innermost scope, emitting StorageDead for its locals.
    void popScope();

    [[nodiscard]] std::optional<core::LocalId> returnLocal() const
    {
        return fn_.returnLocal;
    }

    /// @brief Local bound to parameter @p index.
    [[nodiscard]] core::LocalId param(size_t index) const;

    [[nodiscard]] core::Function &function()
    {
        return fn_;
    }

    /// @brief Hand the function over; scopes still open emit nothing.
    core::Function finish();

  private:
    core::BasicBlock &active();

    core::Function fn_;
    core::BlockId current_ = 0;
    core::LocalId nextLocal_ = 0;
    core::BlockId nextBlock_ = 0;
    std::vector<std::vector<core::LocalId>> scopes_;
    bool started_ = false;
};

/// @brief Integer constant operand of type `int`.
core::Operand intConst(core::Int128 value);

/// @brief Boolean constant operand.
core::Operand boolConst(bool value);

/// @brief Float constant operand of type `float`.
core::Operand floatConst(double value);

/// @brief Callee operand naming function @p name (a direct call).
core::Operand funcRef(const std::string &name);

} // namespace mir::build
