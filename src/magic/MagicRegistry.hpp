//===----------------------------------------------------------------------===//
//
// Part of the pymagic project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/magic/MagicRegistry.hpp
// Purpose: Bidirectional index between bytecode magics and canonical versions.
// Key invariants: versionsFor() keeps every (magic, version) pair ever
//                 registered; versionForInt() and magicFor() follow the
//                 last registration.
// Ownership/Lifetime: Borrows the canonicalizer, which must outlive the
//                     registry; owns its index tables.
// Links: docs/magics.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "magic/MagicIdentifier.hpp"
#include "support/diag_expected.hpp"
#include "version/RuntimeIdentity.hpp"
#include "version/VersionString.hpp"

#include <cstdint>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace pymagic::support
{
class DiagnosticEngine;
class TraceSink;
} // namespace pymagic::support

namespace pymagic::version
{
class VersionCanonicalizer;
} // namespace pymagic::version

namespace pymagic::magic
{

/// @brief Magic number index populated from the catalog.
/// @invariant Every version stored here is canonical in the borrowed canonicalizer.
class MagicRegistry
{
  public:
    /// @brief Create an empty registry declaring canonical versions in @p canon.
    explicit MagicRegistry(version::VersionCanonicalizer &canon);

    MagicRegistry(const MagicRegistry &) = delete;
    MagicRegistry &operator=(const MagicRegistry &) = delete;

    /// @brief Route registration events to @p trace; may be null.
    void setTrace(support::TraceSink *trace);

    /// @brief Record notes about shared magics in @p diags; may be null.
    void setDiagnostics(support::DiagnosticEngine *diags);

    /// @brief Register @p magicInt as a bytecode format of @p version.
    /// @details @p version becomes canonical.  Registering a second version
    ///          for the same magic extends versionsFor(); registering a second
    ///          magic for the same version keeps both in magicsFor().  For
    ///          versionForInt() and magicFor() the last registration wins.
    support::Expected<void> registerMagic(uint16_t magicInt, std::string_view version);

    /// @brief Declare canonical @p version sharing the format of @p existing.
    /// @details The new version resolves through magicFor() but is not added
    ///          to versionsFor() of the shared magic.
    support::Expected<void> registerSharedFormat(std::string_view version,
                                                 std::string_view existing);

    /// @brief Magic for @p version, canonicalizing first.
    support::Expected<MagicIdentifier> magicFor(std::string_view version) const;

    /// @brief Every magic integer registered for @p version, in first-registration order.
    support::Expected<std::vector<uint16_t>> magicsFor(std::string_view version) const;

    /// @brief All canonical versions registered for @p magic.
    support::Expected<std::set<std::string>> versionsFor(const MagicIdentifier &magic) const;

    /// @brief Canonical version last registered for @p magicInt.
    support::Expected<std::string> versionForInt(uint16_t magicInt) const;

    /// @brief Numeric components of the version last registered for @p magicInt.
    support::Expected<version::VersionTuple> versionTupleForMagic(uint16_t magicInt) const;

    /// @brief Magic of the runtime described by @p id.
    /// @details Every failure is reported as registry.unresolved_runtime; the
    ///          message carries the underlying reason.
    support::Expected<MagicIdentifier> currentRuntimeMagic(
        const version::RuntimeIdentity &id) const;

    /// @brief Every registered magic integer, ascending.
    std::vector<uint16_t> allMagicInts() const;

    /// @brief Canonicalizer this registry resolves versions through.
    const version::VersionCanonicalizer &canonicalizer() const;

  private:
    version::VersionCanonicalizer &canon_;
    support::TraceSink *trace_ = nullptr;
    support::DiagnosticEngine *diags_ = nullptr;

    std::unordered_map<MagicIdentifier, std::set<std::string>> versionsByMagic_;
    std::unordered_map<uint16_t, std::string> versionByInt_;
    std::unordered_map<std::string, MagicIdentifier> magicByVersion_;
    std::unordered_map<std::string, std::vector<uint16_t>> magicIntsByVersion_;
};

} // namespace pymagic::magic
