//===----------------------------------------------------------------------===//
//
// Part of the pymagic project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/version/VersionCanonicalizer.hpp
// Purpose: Map arbitrary version spellings to one canonical version per
//          compatibility class.
// Key invariants: Every alias points directly at a canonical version (no
//                 chains); canonicalize(canonicalize(v)) == canonicalize(v).
// Ownership/Lifetime: Owns its tables; borrows an optional TraceSink.
// Links: docs/versions.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "version/VersionString.hpp"

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace pymagic::support
{
class TraceSink;
} // namespace pymagic::support

namespace pymagic::version
{

/// @brief Flat alias table from version spellings to canonical versions.
/// @invariant A canonical version maps to itself; aliases never map to aliases.
class VersionCanonicalizer
{
  public:
    /// @brief Route alias bindings to @p trace; may be null.
    void setTrace(support::TraceSink *trace);

    /// @brief Declare @p version canonical.
    /// @details Re-declaring is a no-op.  Fails with registry.alias_conflict
    ///          when @p version is already an alias of another version.
    support::Expected<void> registerCanonical(std::string_view version);

    /// @brief Bind every version in the whitespace-separated @p rawList to @p target.
    support::Expected<void> registerAlias(std::string_view rawList, std::string_view target);

    /// @brief Bind every version in @p rawVersions to @p target.
    /// @details Fails with registry.unknown_version when @p target is not
    ///          canonical, and with registry.alias_conflict when an entry is
    ///          already bound to a different canonical version.  Binding is
    ///          all-or-nothing: on failure no entry of the list is recorded.
    support::Expected<void> registerAlias(const std::vector<std::string> &rawVersions,
                                          std::string_view target);

    /// @brief Resolve @p version to its canonical version.
    /// @details Tries an exact match, then "M.m.u" and "M.m" built from the
    ///          leading components with the implementation tag re-attached
    ///          ("3.7.11pypy" tries "3.7.11pypy" then "3.7pypy").  A tagged
    ///          spelling never resolves to an untagged version.
    support::Expected<std::string> canonicalize(std::string_view version) const;

    /// @brief Whether @p version is registered literally (canonical or alias).
    bool isKnown(std::string_view version) const;

    /// @brief Whether @p version is itself a canonical version.
    bool isCanonical(std::string_view version) const;

    /// @brief Every literally registered spelling, sorted.
    std::vector<std::string> allKnownVersions() const;

    /// @brief Canonical versions in registration order.
    const std::vector<std::string> &canonicalVersions() const;

    /// @brief Numeric components of a known version.
    /// @details Fails with registry.unknown_version when @p version cannot be
    ///          canonicalized or carries no numeric components.
    support::Expected<VersionTuple> versionTuple(std::string_view version) const;

  private:
    const std::string *find(std::string_view version) const;

    std::unordered_map<std::string, std::string> canonicalOf_;
    std::vector<std::string> canonicalOrder_;
    support::TraceSink *trace_ = nullptr;
};

} // namespace pymagic::version
