//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/mir/core/Constant.cpp
// Purpose: Literal construction, comparison, hashing and rendering, plus the
//          wrapping 128-bit arithmetic shared by folding and evaluation.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "mir/core/Constant.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <functional>
#include <limits>
#include <sstream>

namespace mir::core
{

Constant Constant::boolean(bool v)
{
    return Constant{Type(Type::Kind::Boolean), v};
}

Constant Constant::integer(Int128 v, Type type)
{
    return Constant{std::move(type), v};
}

Constant Constant::floating(double v, Type type)
{
    return Constant{std::move(type), v};
}

Constant Constant::string(std::string v)
{
    return Constant{Type(Type::Kind::String), std::move(v)};
}

Constant Constant::character(uint32_t codePoint)
{
    return Constant{Type(Type::Kind::Char), CharValue{codePoint}};
}

Constant Constant::null(Type type)
{
    return Constant{std::move(type), NullValue{}};
}

bool Constant::operator==(const Constant &other) const
{
    if (!(type == other.type) || value.index() != other.value.index())
        return false;
    if (isFloat())
        return std::fabs(asFloat() - other.asFloat()) < std::numeric_limits<double>::epsilon();
    return value == other.value;
}

bool Constant::identical(const Constant &other) const
{
    if (!(type == other.type) || value.index() != other.value.index())
        return false;
    if (isFloat())
    {
        double a = asFloat();
        double b = other.asFloat();
        return std::memcmp(&a, &b, sizeof(double)) == 0;
    }
    return value == other.value;
}

size_t Constant::hash() const
{
    size_t h = std::hash<int>{}(static_cast<int>(type.kind)) * 31 + value.index();
    auto mix = [&h](size_t v) { h ^= v + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2); };
    switch (value.index())
    {
        case 0:
            mix(asBool() ? 1 : 0);
            break;
        case 1:
        {
            auto bits = static_cast<UInt128>(asInt());
            mix(static_cast<uint64_t>(bits));
            mix(static_cast<uint64_t>(bits >> 64));
            break;
        }
        case 2:
        {
            double d = asFloat();
            uint64_t bits = 0;
            std::memcpy(&bits, &d, sizeof(bits));
            mix(bits);
            break;
        }
        case 3:
            mix(std::hash<std::string>{}(asString()));
            break;
        case 4:
            mix(std::get<CharValue>(value).codePoint);
            break;
        default:
            break;
    }
    return h;
}

std::string uint128ToString(UInt128 v)
{
    if (v == 0)
        return "0";
    std::string digits;
    while (v != 0)
    {
        digits.push_back(static_cast<char>('0' + static_cast<int>(v % 10)));
        v /= 10;
    }
    std::reverse(digits.begin(), digits.end());
    return digits;
}

std::string int128ToString(Int128 v)
{
    if (v < 0)
        return "-" + uint128ToString(UInt128(0) - static_cast<UInt128>(v));
    return uint128ToString(static_cast<UInt128>(v));
}

Int128 wrappingAdd(Int128 a, Int128 b)
{
    return static_cast<Int128>(static_cast<UInt128>(a) + static_cast<UInt128>(b));
}

Int128 wrappingSub(Int128 a, Int128 b)
{
    return static_cast<Int128>(static_cast<UInt128>(a) - static_cast<UInt128>(b));
}

Int128 wrappingMul(Int128 a, Int128 b)
{
    return static_cast<Int128>(static_cast<UInt128>(a) * static_cast<UInt128>(b));
}

Int128 wrappingNeg(Int128 a)
{
    return static_cast<Int128>(UInt128(0) - static_cast<UInt128>(a));
}

std::string Constant::toString() const
{
    std::ostringstream os;
    os << "const ";
    switch (value.index())
    {
        case 0:
            os << (asBool() ? "true" : "false");
            break;
        case 1:
            os << int128ToString(asInt()) << '_' << type.toString();
            break;
        case 2:
            os << asFloat() << '_' << type.toString();
            break;
        case 3:
        {
            os << '"';
            for (char c : asString())
            {
                if (c == '"' || c == '\\')
                    os << '\\' << c;
                else if (c == '\n')
                    os << "\\n";
                else
                    os << c;
            }
            os << '"';
            break;
        }
        case 4:
            os << "'\\u{" << std::hex << std::get<CharValue>(value).codePoint << std::dec << "}'";
            break;
        default:
            os << "null";
            break;
    }
    return os.str();
}

} // namespace mir::core
