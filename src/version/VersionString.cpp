//===----------------------------------------------------------------------===//
//
// Part of the pymagic project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/version/VersionString.cpp
// Purpose: Implement structural parsing of runtime version spellings.
// Key invariants: Parsing never allocates for rejected input.
// Ownership/Lifetime: Stateless helpers.
// Links: docs/versions.md
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Version-string tokenization used by the canonicalizer.
/// @details Catalog spellings are irregular ("2.7a0+3", "3.7.0beta3",
///          "3.000+12", "3.8.5Graal").  The helpers here only look at the
///          leading numeric components and a small fixed set of
///          implementation tags; everything else is treated as opaque.

#include "version/VersionString.hpp"

#include <array>
#include <cctype>

namespace pymagic::version
{
namespace
{
constexpr std::array<std::string_view, 6> kImplementationTags = {
    "pypy", "dropbox", "Jython", "Pyston", "pyston", "Graal"};

bool isDigit(char c)
{
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

/// @brief Longest digit run accepted as one version component.
constexpr size_t kMaxComponentDigits = 6;

/// @brief Consume a run of decimal digits starting at @p pos.
/// @return Parsed value, or std::nullopt when no digit is present or the run
///         is longer than kMaxComponentDigits.
std::optional<int> readNumber(std::string_view text, size_t &pos)
{
    const size_t start = pos;
    int value = 0;
    while (pos < text.size() && isDigit(text[pos]))
    {
        if (pos - start == kMaxComponentDigits)
            return std::nullopt;
        value = value * 10 + (text[pos] - '0');
        ++pos;
    }
    if (pos == start)
        return std::nullopt;
    return value;
}
} // namespace

std::string VersionTuple::toString() const
{
    std::string out = std::to_string(major) + "." + std::to_string(minor);
    if (micro)
        out += "." + std::to_string(*micro);
    return out;
}

/// @brief Extract "M.m[.u]" from the front of @p version.
/// @details The micro component is only taken when a '.' is directly followed
///          by digits; "3.000+4" therefore parses as (3, 0) and
///          "3.7.0beta3" as (3, 7, 0).
std::optional<VersionTuple> parseVersionTuple(std::string_view version)
{
    size_t pos = 0;
    auto major = readNumber(version, pos);
    if (!major || pos >= version.size() || version[pos] != '.')
        return std::nullopt;
    ++pos;
    auto minor = readNumber(version, pos);
    if (!minor)
        return std::nullopt;

    VersionTuple tuple;
    tuple.major = *major;
    tuple.minor = *minor;
    if (pos + 1 < version.size() && version[pos] == '.' && isDigit(version[pos + 1]))
    {
        ++pos;
        tuple.micro = readNumber(version, pos);
        if (!tuple.micro)
            return std::nullopt;
    }
    return tuple;
}

std::string_view implementationTag(std::string_view version)
{
    for (std::string_view tag : kImplementationTags)
    {
        const size_t at = version.find(tag);
        if (at != std::string_view::npos && at > 0)
            return version.substr(at, tag.size());
    }
    return {};
}

std::vector<std::string> splitVersionList(std::string_view list)
{
    std::vector<std::string> out;
    size_t pos = 0;
    while (pos < list.size())
    {
        while (pos < list.size() && std::isspace(static_cast<unsigned char>(list[pos])))
            ++pos;
        const size_t start = pos;
        while (pos < list.size() && !std::isspace(static_cast<unsigned char>(list[pos])))
            ++pos;
        if (pos > start)
            out.emplace_back(list.substr(start, pos - start));
    }
    return out;
}

} // namespace pymagic::version
