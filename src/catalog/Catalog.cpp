//===----------------------------------------------------------------------===//
//
// Part of the pymagic project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/catalog/Catalog.cpp
// Purpose: Expand the X-macro catalogs and feed them to the registry
//          components.
// Key invariants: Magic entries are registered in file order.
// Ownership/Lifetime: Catalog tables have static storage duration.
// Links: docs/versions.md
//
//===----------------------------------------------------------------------===//

#include "catalog/Catalog.hpp"

#include "magic/MagicRegistry.hpp"
#include "version/VersionCanonicalizer.hpp"
#include "version/VersionString.hpp"

#include <cstdint>
#include <string>

namespace pymagic::catalog
{
namespace
{
struct MagicEntry
{
    uint16_t magic;
    const char *version;
};

struct SharedFormatEntry
{
    const char *version;
    const char *existing;
};

struct AliasEntry
{
    const char *spellings;
    const char *target;
};

constexpr MagicEntry kMagics[] = {
#define PYMAGIC_MAGIC(INT, VERSION) {INT, VERSION},
#include "catalog/MagicCatalog.def"
#undef PYMAGIC_MAGIC
};

constexpr SharedFormatEntry kSharedFormats[] = {
#define PYMAGIC_MAGIC(INT, VERSION)
#define PYMAGIC_SHARED_FORMAT(VERSION, EXISTING) {VERSION, EXISTING},
#include "catalog/MagicCatalog.def"
#undef PYMAGIC_SHARED_FORMAT
#undef PYMAGIC_MAGIC
};

constexpr AliasEntry kAliases[] = {
#define PYMAGIC_ALIASES(SPELLINGS, TARGET) {SPELLINGS, TARGET},
#include "catalog/VersionAliases.def"
#undef PYMAGIC_ALIASES
};
} // namespace

support::Expected<void> loadMagicCatalog(version::VersionCanonicalizer &canon,
                                         magic::MagicRegistry &magics,
                                         const support::Options &options)
{
    const bool alternates = options.includeAlternateImplementations;

    for (const auto &entry : kMagics)
    {
        if (!alternates && version::isAlternateImplementation(entry.version))
            continue;
        if (auto ok = magics.registerMagic(entry.magic, entry.version); !ok)
            return ok.error();
    }

    for (const auto &entry : kSharedFormats)
    {
        if (!alternates && version::isAlternateImplementation(entry.version))
            continue;
        if (auto ok = magics.registerSharedFormat(entry.version, entry.existing); !ok)
            return ok.error();
    }

    for (const auto &entry : kAliases)
    {
        if (!alternates && version::isAlternateImplementation(entry.target))
            continue;
        std::vector<std::string> spellings = version::splitVersionList(entry.spellings);
        if (!alternates)
        {
            std::vector<std::string> kept;
            for (auto &spelling : spellings)
            {
                if (!version::isAlternateImplementation(spelling))
                    kept.push_back(std::move(spelling));
            }
            spellings.swap(kept);
        }
        if (auto ok = canon.registerAlias(spellings, entry.target); !ok)
            return ok.error();
    }
    return {};
}

} // namespace pymagic::catalog
