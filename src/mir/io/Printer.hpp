//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the Printer class, which renders MIR functions and
// programs as stable text. The output feeds the pass-manager instrumentation
// dumps ("IR before/after pass"), the aether-mir-opt tool and the tests that
// compare whole functions.
//
// Output shape:
//   fn name(_0: int, _1: int) -> int {
//       let mut _2: int;
//     bb0:
//       _2 = Add(copy _0, copy _1);
//       return;
//   }
//
// Blocks print in layout order. The printer is stateless.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "mir/core/Program.hpp"

#include <ostream>
#include <string>

namespace mir::io
{

/// @brief Renders MIR to text.
class Printer
{
  public:
    /// @brief Write function @p fn to @p os.
    static void write(const core::Function &fn, std::ostream &os);

    /// @brief Write every external declaration, constant and function of
    ///        @p program to @p os, in name order.
    static void write(const core::Program &program, std::ostream &os);

    static std::string toString(const core::Function &fn);

    static std::string toString(const core::Program &program);

    /// @brief Single-line spelling of @p stmt without indentation.
    static std::string toString(const core::Statement &stmt);

    /// @brief Single-line spelling of @p term without indentation.
    static std::string toString(const core::Terminator &term);
};

} // namespace mir::io
