//===----------------------------------------------------------------------===//
//
// Part of the pymagic project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/catalog/Catalog.hpp
// Purpose: Load the built-in magic, alias and opcode catalogs into registry
//          components.
// Key invariants: Loading stops at the first error; callers discard the
//                 partially filled components.
// Ownership/Lifetime: Functions borrow the components they fill.
// Links: docs/versions.md, docs/opcodes.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "opcodes/EditOperation.hpp"
#include "opcodes/OpcodeTable.hpp"
#include "support/diag_expected.hpp"
#include "support/options.hpp"

#include <vector>

namespace pymagic::version
{
class VersionCanonicalizer;
} // namespace pymagic::version

namespace pymagic::magic
{
class MagicRegistry;
} // namespace pymagic::magic

namespace pymagic::opcodes
{
class InstructionSetBuilder;
} // namespace pymagic::opcodes

namespace pymagic::catalog
{

/// @brief Register every catalog magic, shared format and alias.
/// @details Entries carrying an alternate implementation tag are skipped when
///          @p options disables them.  Aliases are loaded after all magics so
///          every target is already canonical.
support::Expected<void> loadMagicCatalog(version::VersionCanonicalizer &canon,
                                         magic::MagicRegistry &magics,
                                         const support::Options &options);

/// @brief Publish every catalog opcode table in derivation order.
support::Expected<void> loadOpcodeCatalog(opcodes::InstructionSetBuilder &builder);

/// @name Opcode catalog entries
/// @{
std::vector<opcodes::OpcodeDefinition> python26Opcodes();
std::vector<opcodes::EditOperation> python27Edits();
std::vector<opcodes::OpcodeDefinition> python32Opcodes();
std::vector<opcodes::EditOperation> python33Edits();
std::vector<opcodes::EditOperation> python34Edits();
std::vector<opcodes::EditOperation> python35Edits();
std::vector<opcodes::EditOperation> python36Edits();
/// @}

} // namespace pymagic::catalog
