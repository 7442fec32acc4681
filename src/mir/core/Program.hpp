//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/mir/core/Program.hpp
// Purpose: Declares the MIR program: functions, named constants, external
//          declarations and type definitions.
// Key invariants: All tables are keyed by name and ordered, so iteration is
//                 deterministic.
// Ownership/Lifetime: Program exclusively owns its functions. Calls refer to
//                     callees by name, never by pointer.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "mir/core/Constant.hpp"
#include "mir/core/Function.hpp"

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace mir::core
{

enum class CallingConvention
{
    Rust,
    C,
    System,
};

/// @brief Function implemented outside the program.
struct ExternalFunction
{
    std::string name;
    std::vector<Type> params;
    Type returnType;
    CallingConvention callingConvention = CallingConvention::C;
    bool isVariadic = false;
};

/// @brief Named user type.
struct TypeDefinition
{
    std::string name;
    std::vector<std::pair<std::string, Type>> fields;
};

struct Program
{
    std::map<std::string, Function, std::less<>> functions;
    std::map<std::string, Constant, std::less<>> constants;
    std::map<std::string, ExternalFunction, std::less<>> externalFunctions;
    std::map<std::string, TypeDefinition, std::less<>> typeDefinitions;

    [[nodiscard]] Function *findFunction(std::string_view name);
    [[nodiscard]] const Function *findFunction(std::string_view name) const;

    /// @brief Insert @p fn keyed by its name, replacing any previous entry.
    Function &addFunction(Function fn);
};

} // namespace mir::core
