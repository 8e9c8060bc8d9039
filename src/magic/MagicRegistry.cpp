//===----------------------------------------------------------------------===//
//
// Part of the pymagic project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/magic/MagicRegistry.cpp
// Purpose: Implement magic registration and magic/version resolution.
// Key invariants: See header.
// Ownership/Lifetime: See header.
// Links: docs/magics.md
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Magic number registry.
/// @details The forward (int -> version) and reverse (magic -> versions)
///          indexes intentionally disagree on duplicates: the catalog contains
///          several magics that were bumped more than once during a single
///          pre-release, and a .pyc written by any of them must still be
///          recognised, while asking "which magic does 3.9.0a0 write" has one
///          answer, the newest.

#include "magic/MagicRegistry.hpp"

#include "common/RegistryDiag.hpp"
#include "support/diagnostics.hpp"
#include "support/trace.hpp"
#include "version/VersionCanonicalizer.hpp"

#include <algorithm>

namespace pymagic::magic
{

MagicRegistry::MagicRegistry(version::VersionCanonicalizer &canon) : canon_(canon) {}

void MagicRegistry::setTrace(support::TraceSink *trace)
{
    trace_ = trace;
}

void MagicRegistry::setDiagnostics(support::DiagnosticEngine *diags)
{
    diags_ = diags;
}

support::Expected<void> MagicRegistry::registerMagic(uint16_t magicInt, std::string_view version)
{
    if (auto ok = canon_.registerCanonical(version); !ok)
        return ok.error();

    const std::string key(version);
    const MagicIdentifier id = MagicIdentifier::fromInt(magicInt);

    auto &versions = versionsByMagic_[id];
    const bool added = versions.insert(key).second;
    if (added && versions.size() == 2 && diags_)
    {
        std::string names;
        for (const auto &v : versions)
            names += (names.empty() ? "" : ", ") + v;
        diags_->report(makeRegistryNote(RegistryDiagCode::SharedMagic,
                                        "magic " + std::to_string(magicInt) +
                                            " denotes several versions: " + names));
    }

    versionByInt_[magicInt] = key;
    magicByVersion_[key] = id;
    auto &ints = magicIntsByVersion_[key];
    if (std::find(ints.begin(), ints.end(), magicInt) == ints.end())
        ints.push_back(magicInt);

    if (trace_)
        trace_->onMagic(magicInt, key);
    return {};
}

support::Expected<void> MagicRegistry::registerSharedFormat(std::string_view version,
                                                            std::string_view existing)
{
    auto magic = magicFor(existing);
    if (!magic)
        return magic.error();
    if (auto ok = canon_.registerCanonical(version); !ok)
        return ok.error();

    const std::string key(version);
    magicByVersion_[key] = magic.value();
    auto &ints = magicIntsByVersion_[key];
    const uint16_t magicInt = magic.value().toInt();
    if (std::find(ints.begin(), ints.end(), magicInt) == ints.end())
        ints.push_back(magicInt);

    if (trace_)
        trace_->onMagic(magicInt, key);
    return {};
}

support::Expected<MagicIdentifier> MagicRegistry::magicFor(std::string_view version) const
{
    auto canonical = canon_.canonicalize(version);
    if (!canonical)
        return canonical.error();
    auto it = magicByVersion_.find(canonical.value());
    if (it == magicByVersion_.end())
        return makeRegistryError(RegistryDiagCode::UnknownVersion,
                                 "no magic registered for version '" + std::string(version) +
                                     "' (canonical '" + canonical.value() + "')");
    return it->second;
}

support::Expected<std::vector<uint16_t>> MagicRegistry::magicsFor(std::string_view version) const
{
    auto canonical = canon_.canonicalize(version);
    if (!canonical)
        return canonical.error();
    auto it = magicIntsByVersion_.find(canonical.value());
    if (it == magicIntsByVersion_.end())
        return makeRegistryError(RegistryDiagCode::UnknownVersion,
                                 "no magic registered for version '" + std::string(version) + "'");
    return it->second;
}

support::Expected<std::set<std::string>> MagicRegistry::versionsFor(
    const MagicIdentifier &magic) const
{
    auto it = versionsByMagic_.find(magic);
    if (it == versionsByMagic_.end())
        return makeRegistryError(RegistryDiagCode::UnknownMagic,
                                 "magic " + std::to_string(magic.toInt()) + " [" + magic.toHex() +
                                     "] is not registered");
    return it->second;
}

support::Expected<std::string> MagicRegistry::versionForInt(uint16_t magicInt) const
{
    auto it = versionByInt_.find(magicInt);
    if (it == versionByInt_.end())
        return makeRegistryError(RegistryDiagCode::UnknownMagic,
                                 "magic " + std::to_string(magicInt) + " is not registered");
    return it->second;
}

support::Expected<version::VersionTuple> MagicRegistry::versionTupleForMagic(
    uint16_t magicInt) const
{
    auto version = versionForInt(magicInt);
    if (!version)
        return version.error();
    return canon_.versionTuple(version.value());
}

support::Expected<MagicIdentifier> MagicRegistry::currentRuntimeMagic(
    const version::RuntimeIdentity &id) const
{
    auto spelling = version::runtimeVersionString(id);
    if (!spelling)
        return spelling.error();

    auto magic = magicFor(spelling.value());
    if (!magic)
        return makeRegistryError(RegistryDiagCode::UnresolvedRuntime,
                                 "cannot resolve runtime '" + spelling.value() +
                                     "': " + magic.error().message);
    return magic.value();
}

std::vector<uint16_t> MagicRegistry::allMagicInts() const
{
    std::vector<uint16_t> out;
    out.reserve(versionByInt_.size());
    for (const auto &entry : versionByInt_)
        out.push_back(entry.first);
    std::sort(out.begin(), out.end());
    return out;
}

const version::VersionCanonicalizer &MagicRegistry::canonicalizer() const
{
    return canon_;
}

} // namespace pymagic::magic
