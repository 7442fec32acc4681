//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/mir/core/Program.cpp
// Purpose: Name lookup helpers for MIR programs.
//
//===----------------------------------------------------------------------===//

#include "mir/core/Program.hpp"

namespace mir::core
{

Function *Program::findFunction(std::string_view name)
{
    auto it = functions.find(name);
    return it == functions.end() ? nullptr : &it->second;
}

const Function *Program::findFunction(std::string_view name) const
{
    auto it = functions.find(name);
    return it == functions.end() ? nullptr : &it->second;
}

Function &Program::addFunction(Function fn)
{
    std::string key = fn.name;
    auto [it, inserted] = functions.insert_or_assign(std::move(key), std::move(fn));
    (void)inserted;
    return it->second;
}

} // namespace mir::core
