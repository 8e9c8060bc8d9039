//===----------------------------------------------------------------------===//
//
// Part of the pymagic project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/version/VersionString.hpp
// Purpose: Structural helpers for free-form runtime version strings.
// Key invariants: Helpers are pure; no registry state is consulted.
// Ownership/Lifetime: Returned views alias the caller's input.
// Links: docs/versions.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pymagic::version
{

/// @brief Numeric components extracted from a version spelling.
/// @details "3.6.1" yields (3, 6, 1); "3.6rc1" and "3.000+4" yield (3, 6) and
///          (3, 0) with no micro component.
struct VersionTuple
{
    int major = 0;
    int minor = 0;
    std::optional<int> micro;

    /// @brief Render as "M.m" or "M.m.u".
    std::string toString() const;

    bool operator==(const VersionTuple &other) const
    {
        return major == other.major && minor == other.minor && micro == other.micro;
    }
};

/// @brief Extract numeric components from @p version.
/// @details Accepts "M.m.u" followed by anything, or "M.m" optionally followed
///          by a pre-release tag or other trailing text.
/// @return Parsed tuple, or std::nullopt when @p version does not start with
///         "<digits>.<digits>".
std::optional<VersionTuple> parseVersionTuple(std::string_view version);

/// @brief Implementation tag embedded in a catalog version.
/// @details Tags follow the numeric part, e.g. "3.7pypy", "2.7.1b3Jython" or
///          "2.7pyston-0.6.1".
/// @return One of "pypy", "dropbox", "Jython", "Pyston", "pyston", "Graal", or
///         empty for CPython spellings.
std::string_view implementationTag(std::string_view version);

/// @brief Whether @p version belongs to an implementation other than CPython.
inline bool isAlternateImplementation(std::string_view version)
{
    return !implementationTag(version).empty();
}

/// @brief Split a whitespace-separated list of versions.
/// @details Used for catalog alias lists such as "3.5 3.5.0 3.5.1".
std::vector<std::string> splitVersionList(std::string_view list);

} // namespace pymagic::version
