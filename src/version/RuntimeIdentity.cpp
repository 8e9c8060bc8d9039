//===----------------------------------------------------------------------===//
//
// Part of the pymagic project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/version/RuntimeIdentity.cpp
// Purpose: Turn a probed runtime identity into a catalog version spelling.
// Key invariants: Only implementations with catalog entries are accepted.
// Ownership/Lifetime: Stateless helpers.
// Links: docs/versions.md
//
//===----------------------------------------------------------------------===//

#include "version/RuntimeIdentity.hpp"

#include "common/RegistryDiag.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace pymagic::version
{
namespace
{
struct ImplementationSuffix
{
    std::string_view implementation;
    std::string_view suffix;
};

constexpr std::array<ImplementationSuffix, 6> kImplementationSuffixes = {{
    {"CPython", ""},
    {"PyPy", "pypy"},
    {"Jython", "Jython"},
    {"Pyston", "Pyston"},
    {"GraalVM", "Graal"},
    {"Graal", "Graal"},
}};

/// @brief Components beyond major.minor.micro are not part of the spelling.
constexpr size_t kMaxSpelledComponents = 3;
} // namespace

const char *toString(ReleaseLevel level)
{
    switch (level)
    {
        case ReleaseLevel::Alpha:
            return "alpha";
        case ReleaseLevel::Beta:
            return "beta";
        case ReleaseLevel::Candidate:
            return "candidate";
        case ReleaseLevel::Final:
            return "final";
    }
    return "";
}

support::Expected<std::string> implementationSuffixFor(std::string_view implementation)
{
    if (implementation.empty())
        return std::string{};
    for (const auto &entry : kImplementationSuffixes)
    {
        if (entry.implementation == implementation)
            return std::string(entry.suffix);
    }
    return makeRegistryError(RegistryDiagCode::UnresolvedRuntime,
                             "no catalog suffix for implementation '" +
                                 std::string(implementation) + "'");
}

support::Expected<std::string> runtimeVersionString(const RuntimeIdentity &id)
{
    if (id.components.size() < 2)
        return makeRegistryError(RegistryDiagCode::UnresolvedRuntime,
                                 "runtime version needs at least major and minor components");

    std::string text;
    const size_t count = std::min(id.components.size(), kMaxSpelledComponents);
    for (size_t i = 0; i < count; ++i)
    {
        if (i != 0)
            text += '.';
        text += std::to_string(id.components[i]);
    }

    if (id.releaseLevel != ReleaseLevel::Final)
    {
        text += toString(id.releaseLevel);
        text += std::to_string(id.serial);
    }

    auto suffix = implementationSuffixFor(id.implementation);
    if (!suffix)
        return suffix.error();
    text += suffix.value();
    return text;
}

} // namespace pymagic::version
