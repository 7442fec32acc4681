//===----------------------------------------------------------------------===//
//
// Part of the Aether project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the profile record format:
//
//   FUNC:<function>:<count>
//   BLOCK:<function>:<block>:<count>
//   BRANCH:<function>:<block>:<total>:<taken>
//   CALL:<caller>:<callee>:<count>
//   LOOP:<function>:<block>:<entries>:<total_iterations>:<max_iterations>
//
// Fields are colon separated and surrounding whitespace is trimmed. A line
// whose numeric field does not parse, or with fewer fields than its record
// needs, is skipped; so are blank lines, `#` comments and unknown kinds.
//
//===----------------------------------------------------------------------===//

#include "mir/profile/ProfileData.hpp"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <sstream>
#include <vector>

namespace mir::profile
{

namespace
{

std::string trim(const std::string &s)
{
    const char *ws = " \t\r\n";
    size_t begin = s.find_first_not_of(ws);
    if (begin == std::string::npos)
        return {};
    size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

std::vector<std::string> splitFields(const std::string &line)
{
    std::vector<std::string> fields;
    std::string field;
    std::istringstream in(line);
    while (std::getline(in, field, ':'))
        fields.push_back(trim(field));
    if (!line.empty() && line.back() == ':')
        fields.emplace_back();
    return fields;
}

template <typename T> std::optional<T> parseNumber(const std::string &text)
{
    T value{};
    const char *first = text.data();
    const char *last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (text.empty() || ec != std::errc() || ptr != last)
        return std::nullopt;
    return value;
}

double ratio(uint64_t num, uint64_t den)
{
    return den == 0 ? 0.0 : static_cast<double>(num) / static_cast<double>(den);
}

} // namespace

bool ProfileData::parseLine(const std::string &raw)
{
    const std::string line = trim(raw);
    if (line.empty() || line.front() == '#')
        return false;
    const std::vector<std::string> f = splitFields(line);
    if (f.size() < 3)
        return false;
    const std::string &kind = f[0];

    if (kind == "FUNC")
    {
        auto count = parseNumber<uint64_t>(f[2]);
        if (!count)
            return false;
        functionCounts[f[1]] = *count;
        return true;
    }
    if (kind == "BLOCK")
    {
        if (f.size() < 4)
            return false;
        auto block = parseNumber<core::BlockId>(f[2]);
        auto count = parseNumber<uint64_t>(f[3]);
        if (!block || !count)
            return false;
        blockCounts[f[1]][*block] = *count;
        return true;
    }
    if (kind == "BRANCH")
    {
        if (f.size() < 5)
            return false;
        auto block = parseNumber<core::BlockId>(f[2]);
        auto total = parseNumber<uint64_t>(f[3]);
        auto taken = parseNumber<uint64_t>(f[4]);
        if (!block || !total || !taken)
            return false;
        branches[f[1]][*block] = BranchProfile{*total, *taken, ratio(*taken, *total)};
        return true;
    }
    if (kind == "CALL")
    {
        if (f.size() < 4)
            return false;
        auto count = parseNumber<uint64_t>(f[3]);
        if (!count)
            return false;
        callCounts[f[1]][f[2]] = *count;
        return true;
    }
    if (kind == "LOOP")
    {
        if (f.size() < 6)
            return false;
        auto block = parseNumber<core::BlockId>(f[2]);
        auto entries = parseNumber<uint64_t>(f[3]);
        auto total = parseNumber<uint64_t>(f[4]);
        auto max = parseNumber<uint64_t>(f[5]);
        if (!block || !entries || !total || !max)
            return false;
        loops[f[1]][*block] = LoopProfile{*entries, *total, *max, ratio(*total, *entries)};
        return true;
    }
    return false;
}

ProfileData ProfileData::parse(std::istream &in)
{
    ProfileData data;
    std::string line;
    while (std::getline(in, line))
        data.parseLine(line);
    return data;
}

ProfileData ProfileData::parseString(const std::string &text)
{
    std::istringstream in(text);
    return parse(in);
}

support::Expected<ProfileData> ProfileData::loadFile(const std::string &path)
{
    std::ifstream in(path);
    if (!in)
        return support::makeError("cannot open profile data file '" + path + "'");
    return parse(in);
}

void ProfileData::serialize(std::ostream &out) const
{
    for (const auto &[fn, count] : functionCounts)
        out << "FUNC:" << fn << ':' << count << '\n';
    for (const auto &[fn, blocks] : blockCounts)
        for (const auto &[block, count] : blocks)
            out << "BLOCK:" << fn << ':' << block << ':' << count << '\n';
    for (const auto &[fn, blocks] : branches)
        for (const auto &[block, b] : blocks)
            out << "BRANCH:" << fn << ':' << block << ':' << b.total << ':' << b.taken << '\n';
    for (const auto &[caller, callees] : callCounts)
        for (const auto &[callee, count] : callees)
            out << "CALL:" << caller << ':' << callee << ':' << count << '\n';
    for (const auto &[fn, blocks] : loops)
        for (const auto &[block, l] : blocks)
            out << "LOOP:" << fn << ':' << block << ':' << l.entries << ':' << l.totalIterations
                << ':' << l.maxIterations << '\n';
}

support::Expected<void> ProfileData::saveFile(const std::string &path) const
{
    std::ofstream out(path);
    if (!out)
        return support::makeError("cannot write profile data file '" + path + "'");
    serialize(out);
    if (!out)
        return support::makeError("error writing profile data file '" + path + "'");
    return {};
}

uint64_t ProfileData::functionCount(const std::string &function) const
{
    auto it = functionCounts.find(function);
    return it == functionCounts.end() ? 0 : it->second;
}

ProfileStatistics ProfileData::statistics() const
{
    ProfileStatistics stats;
    stats.functions = functionCounts.size();
    for (const auto &[fn, blocks] : blockCounts)
        stats.blocks += blocks.size();
    for (const auto &[fn, blocks] : branches)
        stats.branches += blocks.size();
    for (const auto &[fn, callees] : callCounts)
        stats.calls += callees.size();
    for (const auto &[fn, blocks] : loops)
        stats.loops += blocks.size();
    for (const auto &[fn, count] : functionCounts)
    {
        stats.totalExecutions += count;
        if (!stats.hottestFunction || count > stats.hottestFunction->second)
            stats.hottestFunction = std::make_pair(fn, count);
    }
    return stats;
}

bool ProfileData::empty() const
{
    return functionCounts.empty() && blockCounts.empty() && branches.empty() &&
           callCounts.empty() && loops.empty();
}

} // namespace mir::profile
