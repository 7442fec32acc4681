//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/mir/io/Printer.cpp
// Purpose: Implements textual rendering of MIR.
// Key invariants: Output depends only on the IR (ordered containers), so two
//                 equal functions print identically.
// Ownership/Lifetime: Stateless; writes to caller-provided streams.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "mir/io/Printer.hpp"

#include "support/overload.hpp"

#include <sstream>

namespace mir::io
{

using namespace core;
using support::Overload;

namespace
{

std::string blockName(BlockId id)
{
    return "bb" + std::to_string(id);
}

std::string callText(const Operand &func, const std::vector<Operand> &args)
{
    std::string out = "call " + calleeText(func) + "(";
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (i)
            out += ", ";
        out += args[i].toString();
    }
    return out + ")";
}

/// Edge list such as `[return: bb1, unwind: bb4]`; empty when no edge.
std::string edgeList(const char *first,
                     std::optional<BlockId> target,
                     const char *second,
                     std::optional<BlockId> other)
{
    std::string out;
    if (target)
        out += std::string(first) + ": " + blockName(*target);
    if (other)
    {
        if (!out.empty())
            out += ", ";
        out += std::string(second) + ": " + blockName(*other);
    }
    return out.empty() ? out : " -> [" + out + "]";
}

} // namespace

std::string Printer::toString(const Statement &stmt)
{
    return std::visit(
        Overload{[](const stmt::Assign &s)
                 { return s.place.toString() + " = " + core::toString(s.rvalue) + ";"; },
                 [](const stmt::StorageLive &s)
                 { return "StorageLive(_" + std::to_string(s.local) + ");"; },
                 [](const stmt::StorageDead &s)
                 { return "StorageDead(_" + std::to_string(s.local) + ");"; },
                 [](const stmt::Nop &) { return std::string("nop;"); }},
        stmt.kind);
}

std::string Printer::toString(const Terminator &term)
{
    return std::visit(
        Overload{[](const term::Goto &t) { return "goto -> " + blockName(t.target) + ";"; },
                 [](const term::SwitchInt &t)
                 {
                     std::string out = "switchInt(" + t.discriminant.toString() + ") -> [";
                     for (size_t i = 0; i < t.targets.size(); ++i)
                     {
                         out += uint128ToString(i < t.values.size() ? t.values[i] : 0);
                         out += ": " + blockName(t.targets[i]) + ", ";
                     }
                     return out + "otherwise: " + blockName(t.otherwise) + "];";
                 },
                 [](const term::Return &) { return std::string("return;"); },
                 [](const term::Unreachable &) { return std::string("unreachable;"); },
                 [](const term::Call &t)
                 {
                     std::string out;
                     if (t.destination)
                         out = t.destination->toString() + " = ";
                     out += callText(t.func, t.args);
                     return out + edgeList("return", t.target, "unwind", t.cleanup) + ";";
                 },
                 [](const term::Drop &t)
                 {
                     std::string out = "drop(" + t.place.toString() + ") -> ";
                     if (!t.unwind)
                         return out + blockName(t.target) + ";";
                     return out + "[return: " + blockName(t.target) +
                            ", unwind: " + blockName(*t.unwind) + "];";
                 },
                 [](const term::Assert &t)
                 {
                     std::ostringstream os;
                     os << "assert(" << t.condition.toString() << ", "
                        << (t.expected ? "true" : "false") << ", \"" << core::toString(t.message)
                        << "\") -> ";
                     if (t.cleanup)
                         os << "[success: " << blockName(t.target)
                            << ", unwind: " << blockName(*t.cleanup) << "];";
                     else
                         os << blockName(t.target) << ";";
                     return os.str();
                 }},
        term.kind);
}

void Printer::write(const Function &fn, std::ostream &os)
{
    os << "fn " << fn.name << "(";
    for (size_t i = 0; i < fn.params.size(); ++i)
    {
        if (i)
            os << ", ";
        os << "_" << fn.params[i].local << ": " << fn.params[i].type.toString();
    }
    os << ") -> " << fn.returnType.toString() << " {\n";

    for (const auto &[id, local] : fn.locals)
    {
        if (fn.isParam(id))
            continue;
        os << "    let " << (local.isMutable ? "mut " : "") << "_" << id << ": "
           << local.type.toString() << ";";
        if (fn.returnLocal && *fn.returnLocal == id)
            os << " // return";
        else if (!local.debugName.empty())
            os << " // " << local.debugName;
        os << "\n";
    }

    for (const auto &bb : fn.blocks)
    {
        os << "  " << blockName(bb.id) << ":";
        if (auto it = fn.vectorHints.find(bb.id); it != fn.vectorHints.end())
            os << " // vector width " << it->second;
        os << "\n";
        for (const auto &s : bb.statements)
            os << "    " << toString(s) << "\n";
        os << "    " << toString(bb.terminator) << "\n";
    }
    os << "}\n";
}

void Printer::write(const Program &program, std::ostream &os)
{
    for (const auto &[name, ext] : program.externalFunctions)
    {
        os << "extern fn " << name << "(";
        for (size_t i = 0; i < ext.params.size(); ++i)
        {
            if (i)
                os << ", ";
            os << ext.params[i].toString();
        }
        if (ext.isVariadic)
            os << (ext.params.empty() ? "..." : ", ...");
        os << ") -> " << ext.returnType.toString() << ";\n";
    }
    for (const auto &[name, c] : program.constants)
        os << "const " << name << ": " << c.type.toString() << " = " << c.toString() << ";\n";

    bool first = program.externalFunctions.empty() && program.constants.empty();
    for (const auto &[name, fn] : program.functions)
    {
        if (!first)
            os << "\n";
        first = false;
        write(fn, os);
    }
}

std::string Printer::toString(const Function &fn)
{
    std::ostringstream os;
    write(fn, os);
    return os.str();
}

std::string Printer::toString(const Program &program)
{
    std::ostringstream os;
    write(program, os);
    return os.str();
}

} // namespace mir::io
