//===----------------------------------------------------------------------===//
//
// Part of the pymagic project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the structured error codes shared by the version, magic
// and opcode components. Every failure surfaced by the registry carries one of
// these codes so callers can tell "unknown version" apart from "corrupt table"
// without parsing message text.
//
// Key Responsibilities:
// - Define RegistryDiagCode and its stable string spelling
// - Construct error diagnostics tagged with a code
// - Recover the code from a diagnostic handed back through Expected
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <string>
#include <string_view>

namespace pymagic
{

/// @brief Identifier for structured registry diagnostics.
enum class RegistryDiagCode
{
    Unknown = 0,       ///< Unclassified diagnostic.
    UnknownVersion,    ///< Version string has no canonical mapping or no published table.
    UnknownMagic,      ///< Magic identifier was never registered.
    UnresolvedRuntime, ///< Live runtime identity could not be mapped to a magic.
    UnknownOpcode,     ///< Opcode name or code is absent from a version's table.
    TableConsistency,  ///< An edit would collide with or remove a nonexistent opcode.
    AliasConflict,     ///< A version string was bound to two different canonical targets.
    SharedMagic,       ///< Informational: one magic denotes several canonical versions.
    Redefinition       ///< Informational: an intentional Redefine edit was applied.
};

/// @brief Convert a registry diagnostic code to its textual prefix.
/// @return Stable string such as "registry.unknown_version"; empty for Unknown.
std::string_view toString(RegistryDiagCode code);

/// @brief Construct an error diagnostic tagged with @p code.
support::Diag makeRegistryError(RegistryDiagCode code, std::string message);

/// @brief Construct a note diagnostic tagged with @p code.
support::Diag makeRegistryNote(RegistryDiagCode code, std::string message);

/// @brief Recover the structured code from a diagnostic.
/// @return Matching code, or RegistryDiagCode::Unknown for foreign diagnostics.
RegistryDiagCode registryDiagCode(const support::Diag &diag);

} // namespace pymagic
