//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/mir/core/Function.cpp
// Purpose: Block lookup and fresh-id allocation for MIR functions.
// Key invariants: Fresh ids are strictly greater than every id in use.
// Ownership/Lifetime: Returned block pointers are invalidated by addBlock.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "mir/core/Function.hpp"

#include <algorithm>

namespace mir::core
{

BasicBlock *Function::findBlock(BlockId id)
{
    for (auto &bb : blocks)
        if (bb.id == id)
            return &bb;
    return nullptr;
}

const BasicBlock *Function::findBlock(BlockId id) const
{
    for (const auto &bb : blocks)
        if (bb.id == id)
            return &bb;
    return nullptr;
}

std::optional<size_t> Function::blockIndex(BlockId id) const
{
    for (size_t i = 0; i < blocks.size(); ++i)
        if (blocks[i].id == id)
            return i;
    return std::nullopt;
}

bool Function::isParam(LocalId id) const
{
    return std::any_of(
        params.begin(), params.end(), [id](const Parameter &p) { return p.local == id; });
}

Type Function::localType(LocalId id) const
{
    auto it = locals.find(id);
    return it == locals.end() ? Type(Type::Kind::Void) : it->second.type;
}

LocalId Function::addLocal(Type type, bool isMutable)
{
    LocalId id = nextLocalId();
    Local local;
    local.type = std::move(type);
    local.isMutable = isMutable;
    locals.emplace(id, std::move(local));
    return id;
}

BlockId Function::addBlock()
{
    BlockId id = nextBlockId();
    BasicBlock bb;
    bb.id = id;
    blocks.push_back(std::move(bb));
    return id;
}

LocalId Function::nextLocalId() const
{
    LocalId next = locals.empty() ? 0 : locals.rbegin()->first + 1;
    for (const auto &p : params)
        next = std::max(next, p.local + 1);
    if (returnLocal)
        next = std::max(next, *returnLocal + 1);
    return next;
}

BlockId Function::nextBlockId() const
{
    BlockId next = 0;
    for (const auto &bb : blocks)
        next = std::max(next, bb.id + 1);
    return next;
}

} // namespace mir::core
