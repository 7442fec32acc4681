//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Forward declarations and id aliases for the MIR core.  Headers that only
// pass functions or programs by reference include this instead of the full
// definitions.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace mir::core
{
/// @brief Dense per-function identifier of a local variable.
using LocalId = uint32_t;

/// @brief Dense per-function identifier of a basic block.
using BlockId = uint32_t;

struct Program;
struct Function;
struct BasicBlock;
struct Statement;
struct Terminator;
struct Place;
struct Constant;
class Type;
} // namespace mir::core
