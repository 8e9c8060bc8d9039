//===----------------------------------------------------------------------===//
//
// Part of the pymagic project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/opcodes/InstructionSetBuilder.hpp
// Purpose: Derive and publish per-version opcode tables.
// Key invariants: A table is published only after its whole edit sequence
//                 replayed cleanly; published tables never change and never
//                 share storage with each other.
// Ownership/Lifetime: Owns published tables; borrows the canonicalizer.
// Links: docs/opcodes.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "opcodes/EditOperation.hpp"
#include "opcodes/OpcodeTable.hpp"
#include "support/diag_expected.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
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

namespace pymagic::opcodes
{

/// @brief Builds opcode tables in derivation order and serves lookups.
class InstructionSetBuilder
{
  public:
    explicit InstructionSetBuilder(const version::VersionCanonicalizer &canon);

    InstructionSetBuilder(const InstructionSetBuilder &) = delete;
    InstructionSetBuilder &operator=(const InstructionSetBuilder &) = delete;

    /// @brief Route publication events to @p trace; may be null.
    void setTrace(support::TraceSink *trace);

    /// @brief Record notes about intentional redefinitions in @p diags; may be null.
    void setDiagnostics(support::DiagnosticEngine *diags);

    /// @brief Publish a root table from a literal catalog.
    /// @details Only uniqueness of names and codes is checked.
    support::Expected<const OpcodeTable *> defineRootTable(
        std::string_view version, const std::vector<OpcodeDefinition> &definitions);

    /// @brief Publish @p version by replaying @p edits over a copy of @p parentVersion.
    /// @details Fails with registry.unknown_version when either version does
    ///          not canonicalize or the parent has no published table, and with
    ///          registry.table_consistency when an edit collides or removes an
    ///          absent opcode, or the version is already published.  Nothing is
    ///          published on failure.
    support::Expected<const OpcodeTable *> defineTable(std::string_view version,
                                                       std::string_view parentVersion,
                                                       const std::vector<EditOperation> &edits);

    /// @brief Table serving @p version.
    /// @details Canonicalizes @p version; when its canonical version has no
    ///          table of its own, the most recently published table of the same
    ///          release family (major.minor plus implementation tag) is used.
    ///          Versions whose own table was rejected are never served.
    support::Expected<const OpcodeTable *> table(std::string_view version) const;

    /// @brief Code of @p name in @p version.
    support::Expected<uint8_t> lookup(std::string_view version, std::string_view name) const;

    /// @brief Mnemonic of @p code in @p version.
    support::Expected<std::string> lookup(std::string_view version, uint8_t code) const;

    /// @brief Categories of @p code in @p version.
    support::Expected<OpcodeFlags> classify(std::string_view version, uint8_t code) const;

    /// @brief Canonical versions with a published table, in publication order.
    const std::vector<std::string> &publishedVersions() const;

    /// @brief Parent of the table serving @p version; empty for roots.
    support::Expected<std::string> parentOf(std::string_view version) const;

  private:
    support::Expected<std::string> canonicalKey(std::string_view version) const;
    support::Expected<const OpcodeTable *> publish(std::unique_ptr<OpcodeTable> table,
                                                   size_t editCount);
    support::Diag reject(const std::string &key, support::Diag diag);
    static std::string familyKey(std::string_view canonical);

    const version::VersionCanonicalizer &canon_;
    support::TraceSink *trace_ = nullptr;
    support::DiagnosticEngine *diags_ = nullptr;

    std::unordered_map<std::string, std::unique_ptr<const OpcodeTable>> tables_;
    std::unordered_map<std::string, std::string> familyTable_;
    std::unordered_set<std::string> rejected_;
    std::vector<std::string> order_;
};

} // namespace pymagic::opcodes
