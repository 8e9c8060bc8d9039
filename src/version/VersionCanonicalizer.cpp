//===----------------------------------------------------------------------===//
//
// Part of the pymagic project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/version/VersionCanonicalizer.cpp
// Purpose: Implement alias registration and canonical version resolution.
// Key invariants: The alias table is flat; lookups are a single hash probe
//                 on the fast path.
// Ownership/Lifetime: See header.
// Links: docs/versions.md
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Canonical version resolution.
/// @details Registration validates eagerly so the read path never has to
///          follow chains or detect cycles.  The structural fallback exists
///          for point releases newer than the catalog (e.g. "3.6.16") and for
///          PyPy builds whose exact patch level is not listed.

#include "version/VersionCanonicalizer.hpp"

#include "common/RegistryDiag.hpp"
#include "support/trace.hpp"

#include <algorithm>

namespace pymagic::version
{

void VersionCanonicalizer::setTrace(support::TraceSink *trace)
{
    trace_ = trace;
}

const std::string *VersionCanonicalizer::find(std::string_view version) const
{
    auto it = canonicalOf_.find(std::string(version));
    if (it == canonicalOf_.end())
        return nullptr;
    return &it->second;
}

support::Expected<void> VersionCanonicalizer::registerCanonical(std::string_view version)
{
    if (version.empty())
        return makeRegistryError(RegistryDiagCode::UnknownVersion,
                                 "cannot register an empty canonical version");
    if (const std::string *existing = find(version))
    {
        if (*existing == version)
            return {};
        return makeRegistryError(RegistryDiagCode::AliasConflict,
                                 "'" + std::string(version) + "' is already an alias of '" +
                                     *existing + "'");
    }
    canonicalOf_.emplace(std::string(version), std::string(version));
    canonicalOrder_.emplace_back(version);
    return {};
}

support::Expected<void> VersionCanonicalizer::registerAlias(std::string_view rawList,
                                                            std::string_view target)
{
    return registerAlias(splitVersionList(rawList), target);
}

support::Expected<void> VersionCanonicalizer::registerAlias(
    const std::vector<std::string> &rawVersions, std::string_view target)
{
    if (!isCanonical(target))
        return makeRegistryError(RegistryDiagCode::UnknownVersion,
                                 "alias target '" + std::string(target) +
                                     "' is not a canonical version");

    // Validate the whole list before binding anything.
    for (const auto &raw : rawVersions)
    {
        const std::string *existing = find(raw);
        if (existing && *existing != target)
            return makeRegistryError(RegistryDiagCode::AliasConflict,
                                     "'" + raw + "' is already bound to '" + *existing +
                                         "', cannot rebind to '" + std::string(target) + "'");
    }

    for (const auto &raw : rawVersions)
    {
        if (canonicalOf_.emplace(raw, std::string(target)).second && trace_)
            trace_->onAlias(raw, target);
    }
    return {};
}

support::Expected<std::string> VersionCanonicalizer::canonicalize(std::string_view version) const
{
    if (const std::string *hit = find(version))
        return *hit;

    // Shapes keep the implementation tag, so a tagged spelling only resolves
    // within its own implementation.
    const std::string tag(implementationTag(version));
    if (auto tuple = parseVersionTuple(version))
    {
        std::vector<std::string> shapes;
        if (tuple->micro)
            shapes.push_back(tuple->toString() + tag);
        shapes.push_back(VersionTuple{tuple->major, tuple->minor, std::nullopt}.toString() + tag);

        for (const auto &shape : shapes)
        {
            if (const std::string *hit = find(shape))
                return *hit;
        }
    }

    return makeRegistryError(RegistryDiagCode::UnknownVersion,
                             "no canonical version for '" + std::string(version) + "'");
}

bool VersionCanonicalizer::isKnown(std::string_view version) const
{
    return find(version) != nullptr;
}

bool VersionCanonicalizer::isCanonical(std::string_view version) const
{
    const std::string *hit = find(version);
    return hit && *hit == version;
}

std::vector<std::string> VersionCanonicalizer::allKnownVersions() const
{
    std::vector<std::string> out;
    out.reserve(canonicalOf_.size());
    for (const auto &entry : canonicalOf_)
        out.push_back(entry.first);
    std::sort(out.begin(), out.end());
    return out;
}

const std::vector<std::string> &VersionCanonicalizer::canonicalVersions() const
{
    return canonicalOrder_;
}

/// @brief Components are read from the spelling the caller passed when it is
///        registered literally, otherwise from its canonical version.
/// @details "3.6.4" therefore yields (3, 6, 4) even though its canonical
///          version is "3.6rc1".  Implementation suffixes are ignored.
support::Expected<VersionTuple> VersionCanonicalizer::versionTuple(std::string_view version) const
{
    std::string spelling(version);
    if (!isKnown(version))
    {
        auto canonical = canonicalize(version);
        if (!canonical)
            return canonical.error();
        spelling = canonical.value();
    }
    if (auto tuple = parseVersionTuple(spelling))
        return *tuple;
    return makeRegistryError(RegistryDiagCode::UnknownVersion,
                             "version '" + spelling + "' has no numeric components");
}

} // namespace pymagic::version
