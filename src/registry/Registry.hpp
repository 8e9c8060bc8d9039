//===----------------------------------------------------------------------===//
//
// Part of the pymagic project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/registry/Registry.hpp
// Purpose: Immutable bundle of the version, magic and opcode indexes built
//          from the catalog.
// Key invariants: A Registry is only ever observed fully built; every query
//                 is const and safe to call from many threads at once.
// Ownership/Lifetime: Owns its components at stable addresses; handed out as
//                     std::unique_ptr<const Registry> and never moved.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "magic/MagicRegistry.hpp"
#include "opcodes/InstructionSetBuilder.hpp"
#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/options.hpp"
#include "version/RuntimeIdentity.hpp"
#include "version/VersionCanonicalizer.hpp"

#include <memory>
#include <set>
#include <string>
#include <string_view>

namespace pymagic::registry
{

/// @brief Read-only view over a fully loaded catalog.
class Registry
{
    /// @brief Restricts construction to RegistryBuilder.
    struct Key
    {
        explicit Key() = default;
    };

  public:
    explicit Registry(Key);
    Registry(const Registry &) = delete;
    Registry &operator=(const Registry &) = delete;

    const version::VersionCanonicalizer &versions() const;
    const magic::MagicRegistry &magics() const;
    const opcodes::InstructionSetBuilder &instructionSets() const;

    /// @brief Notes recorded while loading, e.g. intentional opcode moves.
    const support::DiagnosticEngine &diagnostics() const;

    support::Expected<std::string> canonicalize(std::string_view version) const;
    support::Expected<magic::MagicIdentifier> magicFor(std::string_view version) const;
    support::Expected<std::set<std::string>> versionsFor(const magic::MagicIdentifier &magic) const;
    support::Expected<magic::MagicIdentifier> currentRuntimeMagic(
        const version::RuntimeIdentity &id) const;

    /// @brief Opcode table serving @p version, with release-family fallback.
    support::Expected<const opcodes::OpcodeTable *> opcodeTable(std::string_view version) const;

  private:
    friend class RegistryBuilder;

    version::VersionCanonicalizer canon_;
    magic::MagicRegistry magics_;
    opcodes::InstructionSetBuilder instructions_;
    support::DiagnosticEngine diags_;
};

/// @brief Loads the built-in catalog into a new Registry.
class RegistryBuilder
{
  public:
    explicit RegistryBuilder(support::Options options = {});

    /// @brief Build a registry from the catalog.
    /// @param diags Optional engine receiving every note and error produced
    ///        while loading.
    /// @return The registry, or the first catalog error.  No partially loaded
    ///         registry ever escapes.
    support::Expected<std::unique_ptr<const Registry>> build(
        support::DiagnosticEngine *diags = nullptr) const;

  private:
    support::Options options_;
};

} // namespace pymagic::registry
