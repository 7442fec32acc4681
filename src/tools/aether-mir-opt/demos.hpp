//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/aether-mir-opt/demos.hpp
// Purpose: Declare the bundled demo programs the aether-mir-opt tool
//          optimizes.
// Key invariants: Every demo passes the MIR validator and defines `main`.
// Ownership/Lifetime: Demos are returned by value.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "mir/core/Program.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace aether::tools::mir_opt
{

/// @brief Names accepted by makeDemo, in listing order.
const std::vector<std::string> &demoNames();

/// @brief Build the demo program called @p name.
/// @return The program or std::nullopt for an unknown name.
std::optional<mir::core::Program> makeDemo(std::string_view name);

} // namespace aether::tools::mir_opt
