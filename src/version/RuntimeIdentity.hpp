// File: src/version/RuntimeIdentity.hpp
// Purpose: Describe the live runtime as reported by an external probe.
// Key invariants: components holds at least major and minor when valid.
// Ownership/Lifetime: Plain value type.
// Links: docs/versions.md
#pragma once

#include "support/diag_expected.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace pymagic::version
{

/// @brief Release level reported alongside the numeric version.
enum class ReleaseLevel
{
    Alpha,
    Beta,
    Candidate,
    Final
};

/// @brief Lowercase spelling used when composing version strings ("candidate").
const char *toString(ReleaseLevel level);

/// @brief Identity of a runtime: numeric version, release level and implementation.
struct RuntimeIdentity
{
    std::vector<int> components;            ///< e.g. {3, 8, 10}
    ReleaseLevel releaseLevel = ReleaseLevel::Final;
    int serial = 0;                         ///< Pre-release serial; ignored when final
    std::string implementation;             ///< "CPython", "PyPy", ...; empty means CPython
};

/// @brief Catalog suffix for an implementation name.
/// @return "" for CPython, "pypy", "Jython", "Pyston" or "Graal"; unrecognised
///         names fail with registry.unresolved_runtime.
support::Expected<std::string> implementationSuffixFor(std::string_view implementation);

/// @brief Compose the catalog spelling of @p id, e.g. "3.8.0candidate1" or "3.7.13pypy".
/// @details Takes the first three components; non-final releases append the
///          level name and serial without a separator.
support::Expected<std::string> runtimeVersionString(const RuntimeIdentity &id);

} // namespace pymagic::version
