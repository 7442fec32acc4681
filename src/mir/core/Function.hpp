//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the Function struct, the MIR definition of one function:
// its signature, its locals and its control-flow graph.
//
// Each Function consists of:
// - A name unique within the owning Program
// - An ordered parameter list; parameters occupy the first local ids
// - A local-id keyed table of declared locals
// - Basic blocks in code layout order, the entry block first
// - An optional return local that holds the value on Return
//
// Key Invariants:
// - The entry block id names a block of the function
// - Every local referenced by the body is declared in @c locals
// - Parameter locals count as used even when never read
//
// Ownership Model:
// - Program owns Functions by value
// - Function owns its locals and blocks; cross-function references go by name
//
//===----------------------------------------------------------------------===//

#pragma once

#include "mir/core/BasicBlock.hpp"
#include "mir/core/Type.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mir::core
{

/// @brief Declared local variable.
struct Local
{
    Type type;
    bool isMutable = true;
    std::optional<SourceInfo> sourceInfo;
    std::string debugName; ///< Optional source-level name for dumps.
};

/// @brief Formal parameter bound to a local.
struct Parameter
{
    std::string name;
    Type type;
    LocalId local = 0;
};

/// @brief MIR function definition.
/// @see docs/mir-guide.md#functions
struct Function
{
    std::string name;

    std::vector<Parameter> params;

    Type returnType;

    /// Declared locals keyed by id.
    std::map<LocalId, Local> locals;

    /// Blocks in layout order.
    /// @constraint The entry block is blocks.front().
    std::vector<BasicBlock> blocks;

    BlockId entry = 0;

    /// Local holding the value returned by a Return terminator.
    std::optional<LocalId> returnLocal;

    /// Vector width chosen for a vectorized loop header.
    std::map<BlockId, uint32_t> vectorHints;

    /// @brief Block with id @p id or nullptr.
    [[nodiscard]] BasicBlock *findBlock(BlockId id);
    [[nodiscard]] const BasicBlock *findBlock(BlockId id) const;

    /// @brief Position of block @p id in layout order, or nullopt.
    [[nodiscard]] std::optional<size_t> blockIndex(BlockId id) const;

    [[nodiscard]] bool isParam(LocalId id) const;

    /// @brief Type of local @p id; Void when the local is unknown.
    [[nodiscard]] Type localType(LocalId id) const;

    /// @brief Declare a fresh local of @p type and return its id.
    LocalId addLocal(Type type, bool isMutable = true);

    /// @brief Append a fresh empty block and return its id.
    BlockId addBlock();

    /// @brief One past the largest local id in use.
    [[nodiscard]] LocalId nextLocalId() const;

    /// @brief One past the largest block id in use.
    [[nodiscard]] BlockId nextBlockId() const;
};

} // namespace mir::core
