//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/overload.hpp
// Purpose: Lambda overload set for std::visit over MIR variants.
//
//===----------------------------------------------------------------------===//

#pragma once

namespace mir::support
{

/// @brief Helper to combine several lambdas into a single visitor.
template <typename... Ts> struct Overload : Ts...
{
    using Ts::operator()...;
};

template <typename... Ts> Overload(Ts...) -> Overload<Ts...>;

} // namespace mir::support
