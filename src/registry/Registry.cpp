//===----------------------------------------------------------------------===//
//
// Part of the pymagic project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/registry/Registry.cpp
// Purpose: Assemble registry components and load the catalog into them.
// Key invariants: Components are wired before loading and unwired from the
//                 build-time trace sink before the registry is returned.
// Ownership/Lifetime: The builder owns the registry until build() succeeds.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Registry construction.
/// @details Loading order is magics, then shared formats and aliases, then
///          opcode tables, so every version an opcode table names is already
///          canonical.  The build-time TraceSink lives on the stack of build();
///          components keep no pointer to it afterwards.

#include "registry/Registry.hpp"

#include "catalog/Catalog.hpp"
#include "support/trace.hpp"

#include <string>
#include <utility>

namespace pymagic::registry
{

Registry::Registry(Key) : magics_(canon_), instructions_(canon_) {}

const version::VersionCanonicalizer &Registry::versions() const
{
    return canon_;
}

const magic::MagicRegistry &Registry::magics() const
{
    return magics_;
}

const opcodes::InstructionSetBuilder &Registry::instructionSets() const
{
    return instructions_;
}

const support::DiagnosticEngine &Registry::diagnostics() const
{
    return diags_;
}

support::Expected<std::string> Registry::canonicalize(std::string_view version) const
{
    return canon_.canonicalize(version);
}

support::Expected<magic::MagicIdentifier> Registry::magicFor(std::string_view version) const
{
    return magics_.magicFor(version);
}

support::Expected<std::set<std::string>> Registry::versionsFor(
    const magic::MagicIdentifier &magic) const
{
    return magics_.versionsFor(magic);
}

support::Expected<magic::MagicIdentifier> Registry::currentRuntimeMagic(
    const version::RuntimeIdentity &id) const
{
    return magics_.currentRuntimeMagic(id);
}

support::Expected<const opcodes::OpcodeTable *> Registry::opcodeTable(std::string_view version) const
{
    return instructions_.table(version);
}

RegistryBuilder::RegistryBuilder(support::Options options) : options_(std::move(options)) {}

support::Expected<std::unique_ptr<const Registry>> RegistryBuilder::build(
    support::DiagnosticEngine *diags) const
{
    auto reg = std::make_unique<Registry>(Registry::Key{});
    support::TraceSink trace(options_.trace);

    reg->canon_.setTrace(&trace);
    reg->magics_.setTrace(&trace);
    reg->magics_.setDiagnostics(&reg->diags_);
    reg->instructions_.setTrace(&trace);
    reg->instructions_.setDiagnostics(&reg->diags_);

    auto forward = [&]()
    {
        if (!diags)
            return;
        for (const auto &d : reg->diags_.diagnostics())
            diags->report(d);
    };

    auto status = catalog::loadMagicCatalog(reg->canon_, reg->magics_, options_);
    if (status)
        status = catalog::loadOpcodeCatalog(reg->instructions_);
    if (!status)
    {
        reg->diags_.report(status.error());
        trace.note("registry build failed: " + status.error().message);
        forward();
        return status.error();
    }

    reg->canon_.setTrace(nullptr);
    reg->magics_.setTrace(nullptr);
    reg->magics_.setDiagnostics(nullptr);
    reg->instructions_.setTrace(nullptr);
    reg->instructions_.setDiagnostics(nullptr);

    trace.note("registry built: " + std::to_string(reg->canon_.canonicalVersions().size()) +
               " canonical versions, " + std::to_string(reg->magics_.allMagicInts().size()) +
               " magics, " + std::to_string(reg->instructions_.publishedVersions().size()) +
               " opcode tables");
    forward();
    return std::unique_ptr<const Registry>(std::move(reg));
}

} // namespace pymagic::registry
