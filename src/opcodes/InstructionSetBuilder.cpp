//===----------------------------------------------------------------------===//
//
// Part of the pymagic project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/opcodes/InstructionSetBuilder.cpp
// Purpose: Replay edit sequences into published opcode tables.
// Key invariants: Replay happens on a private copy; the copy is moved into
//                 the published map only after the last edit succeeded.
// Ownership/Lifetime: See header.
// Links: docs/opcodes.md
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Opcode table derivation.
/// @details Each version is described by its parent and an ordered list of
///          edits, mirroring how CPython's opcode.py evolved release by
///          release.  Validation is strict: a Define that lands on a taken
///          name or code is a catalog bug, not an override; genuine overrides
///          are spelled Redefine and leave a note in the diagnostics.  Because
///          an unpublished parent cannot be found, a failure poisons every
///          version derived from it without extra bookkeeping.

#include "opcodes/InstructionSetBuilder.hpp"

#include "common/RegistryDiag.hpp"
#include "support/diagnostics.hpp"
#include "support/trace.hpp"
#include "version/VersionCanonicalizer.hpp"
#include "version/VersionString.hpp"

#include <utility>

namespace pymagic::opcodes
{
namespace
{
/// @brief Prefix @p diag's message with the edit that produced it.
support::Diag inEdit(support::Diag diag, size_t index, const EditOperation &edit)
{
    diag.message = "edit #" + std::to_string(index) + " (" + edit.toString() + "): " + diag.message;
    return diag;
}
} // namespace

InstructionSetBuilder::InstructionSetBuilder(const version::VersionCanonicalizer &canon)
    : canon_(canon)
{
}

void InstructionSetBuilder::setTrace(support::TraceSink *trace)
{
    trace_ = trace;
}

void InstructionSetBuilder::setDiagnostics(support::DiagnosticEngine *diags)
{
    diags_ = diags;
}

std::string InstructionSetBuilder::familyKey(std::string_view canonical)
{
    auto tuple = version::parseVersionTuple(canonical);
    if (!tuple)
        return {};
    return version::VersionTuple{tuple->major, tuple->minor, std::nullopt}.toString() +
           std::string(version::implementationTag(canonical));
}

support::Expected<std::string> InstructionSetBuilder::canonicalKey(std::string_view version) const
{
    return canon_.canonicalize(version);
}

support::Expected<const OpcodeTable *> InstructionSetBuilder::defineRootTable(
    std::string_view version, const std::vector<OpcodeDefinition> &definitions)
{
    auto key = canonicalKey(version);
    if (!key)
        return key.error();
    if (tables_.count(key.value()))
        return makeRegistryError(RegistryDiagCode::TableConsistency,
                                 "opcode table for " + key.value() + " is already published");

    auto table = std::make_unique<OpcodeTable>(OpcodeTable::Key{}, key.value(), std::string{});
    for (const auto &def : definitions)
    {
        if (auto ok = table->insert(def); !ok)
            return reject(key.value(), ok.error());
    }
    return publish(std::move(table), definitions.size());
}

support::Expected<const OpcodeTable *> InstructionSetBuilder::defineTable(
    std::string_view version, std::string_view parentVersion, const std::vector<EditOperation> &edits)
{
    auto key = canonicalKey(version);
    if (!key)
        return key.error();
    if (tables_.count(key.value()))
        return makeRegistryError(RegistryDiagCode::TableConsistency,
                                 "opcode table for " + key.value() + " is already published");

    auto parentKey = canonicalKey(parentVersion);
    if (!parentKey)
        return reject(key.value(), parentKey.error());
    auto parentIt = tables_.find(parentKey.value());
    if (parentIt == tables_.end())
        return reject(key.value(),
                      makeRegistryError(RegistryDiagCode::UnknownVersion,
                                        "cannot derive " + key.value() + ": parent " +
                                            parentKey.value() + " has no published opcode table"));

    auto table = std::make_unique<OpcodeTable>(*parentIt->second);
    table->rebase(key.value(), parentKey.value());

    for (size_t i = 0; i < edits.size(); ++i)
    {
        const EditOperation &edit = edits[i];
        support::Expected<void> ok;
        switch (edit.kind)
        {
            case EditOperation::Kind::Define:
            case EditOperation::Kind::Alias:
                ok = table->insert(edit.definition());
                break;
            case EditOperation::Kind::Remove:
                ok = table->erase(edit.name, edit.code);
                break;
            case EditOperation::Kind::Redefine:
                ok = table->redefine(edit.definition());
                if (ok && diags_)
                    diags_->report(makeRegistryNote(RegistryDiagCode::Redefinition,
                                                    key.value() + ": " + edit.toString()));
                break;
        }
        if (!ok)
            return reject(key.value(), inEdit(ok.error(), i, edit));
        if (trace_)
            trace_->onEdit(key.value(), edit.toString());
    }

    return publish(std::move(table), edits.size());
}

support::Diag InstructionSetBuilder::reject(const std::string &key, support::Diag diag)
{
    rejected_.insert(key);
    if (trace_)
        trace_->onTableRejected(key, diag);
    return diag;
}

support::Expected<const OpcodeTable *> InstructionSetBuilder::publish(
    std::unique_ptr<OpcodeTable> table, size_t editCount)
{
    table->finalize();
    const std::string key = table->version();
    if (trace_)
        trace_->onTablePublished(key, table->parent(), editCount, table->size());

    const OpcodeTable *published = table.get();
    rejected_.erase(key);
    tables_.emplace(key, std::move(table));
    order_.push_back(key);
    const std::string family = familyKey(key);
    if (!family.empty())
        familyTable_[family] = key;
    return published;
}

support::Expected<const OpcodeTable *> InstructionSetBuilder::table(std::string_view version) const
{
    auto key = canonicalKey(version);
    if (!key)
        return key.error();

    auto it = tables_.find(key.value());
    if (it != tables_.end())
        return it->second.get();

    // A version whose own table was rejected never borrows a sibling's.
    if (rejected_.count(key.value()))
        return makeRegistryError(RegistryDiagCode::UnknownVersion,
                                 "opcode table for " + key.value() + " was rejected");

    const std::string family = familyKey(key.value());
    if (!family.empty())
    {
        auto fam = familyTable_.find(family);
        if (fam != familyTable_.end())
            return tables_.at(fam->second).get();
    }
    return makeRegistryError(RegistryDiagCode::UnknownVersion,
                             "no opcode table published for " + std::string(version) +
                                 " (canonical " + key.value() + ")");
}

support::Expected<uint8_t> InstructionSetBuilder::lookup(std::string_view version,
                                                         std::string_view name) const
{
    auto t = table(version);
    if (!t)
        return t.error();
    return t.value()->code(name);
}

support::Expected<std::string> InstructionSetBuilder::lookup(std::string_view version,
                                                             uint8_t code) const
{
    auto t = table(version);
    if (!t)
        return t.error();
    return t.value()->name(code);
}

support::Expected<OpcodeFlags> InstructionSetBuilder::classify(std::string_view version,
                                                               uint8_t code) const
{
    auto t = table(version);
    if (!t)
        return t.error();
    return t.value()->classify(code);
}

const std::vector<std::string> &InstructionSetBuilder::publishedVersions() const
{
    return order_;
}

support::Expected<std::string> InstructionSetBuilder::parentOf(std::string_view version) const
{
    auto t = table(version);
    if (!t)
        return t.error();
    return t.value()->parent();
}

} // namespace pymagic::opcodes
