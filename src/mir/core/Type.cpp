//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/mir/core/Type.cpp
// Purpose: Implement construction, classification and rendering of MIR type
//          descriptors.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "mir/core/Type.hpp"

#include <utility>

namespace mir::core
{

Type::Type(Kind k) : kind(k) {}

Type Type::named(std::string name)
{
    Type t(Kind::Named);
    t.name = std::move(name);
    return t;
}

Type Type::array(Type element, std::optional<uint64_t> size)
{
    Type t(Kind::Array);
    t.nested.push_back(std::move(element));
    t.arraySize = size;
    return t;
}

Type Type::pointer(Type target, bool isMutable)
{
    Type t(Kind::Pointer);
    t.nested.push_back(std::move(target));
    t.isMutable = isMutable;
    return t;
}

Type Type::function(std::vector<Type> params, Type ret)
{
    Type t(Kind::Function);
    t.nested = std::move(params);
    t.nested.push_back(std::move(ret));
    return t;
}

bool Type::isInteger() const
{
    switch (kind)
    {
        case Kind::Integer:
        case Kind::Integer32:
        case Kind::Integer64:
        case Kind::SizeT:
        case Kind::UIntPtrT:
            return true;
        default:
            return false;
    }
}

bool Type::isFloat() const
{
    return kind == Kind::Float || kind == Kind::Float32 || kind == Kind::Float64;
}

bool Type::isNumeric() const
{
    return isInteger() || isFloat();
}

bool Type::isPrimitive() const
{
    return kind != Kind::Named && kind != Kind::Array && kind != Kind::Pointer &&
           kind != Kind::Function;
}

const Type &Type::element() const
{
    return nested.front();
}

bool Type::operator==(const Type &other) const
{
    return kind == other.kind && name == other.name && nested == other.nested &&
           arraySize == other.arraySize && isMutable == other.isMutable;
}

/// @brief Render a type kind to its canonical lower-case spelling.
std::string kindToString(Type::Kind k)
{
    switch (k)
    {
        case Type::Kind::Integer:
            return "int";
        case Type::Kind::Integer32:
            return "i32";
        case Type::Kind::Integer64:
            return "i64";
        case Type::Kind::Float:
            return "float";
        case Type::Kind::Float32:
            return "f32";
        case Type::Kind::Float64:
            return "f64";
        case Type::Kind::String:
            return "string";
        case Type::Kind::Char:
            return "char";
        case Type::Kind::Boolean:
            return "bool";
        case Type::Kind::Void:
            return "void";
        case Type::Kind::SizeT:
            return "size_t";
        case Type::Kind::UIntPtrT:
            return "uintptr_t";
        case Type::Kind::Named:
            return "named";
        case Type::Kind::Array:
            return "array";
        case Type::Kind::Pointer:
            return "ptr";
        case Type::Kind::Function:
            return "fn";
    }
    return "";
}

std::string Type::toString() const
{
    switch (kind)
    {
        case Kind::Named:
            return name;
        case Kind::Array:
        {
            std::string out = "[" + element().toString();
            if (arraySize)
                out += "; " + std::to_string(*arraySize);
            return out + "]";
        }
        case Kind::Pointer:
            return std::string(isMutable ? "*mut " : "*const ") + element().toString();
        case Kind::Function:
        {
            std::string out = "fn(";
            for (size_t i = 0; i + 1 < nested.size(); ++i)
            {
                if (i)
                    out += ", ";
                out += nested[i].toString();
            }
            return out + ") -> " + nested.back().toString();
        }
        default:
            return kindToString(kind);
    }
}

} // namespace mir::core
