//===----------------------------------------------------------------------===//
//
// Part of the pymagic project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic code helpers shared across registry components.
//
//===----------------------------------------------------------------------===//
//
/// @file
/// @brief Registry diagnostic codes and their string spellings.
/// @details Codes are stored in @ref support::Diagnostic::code using the
///          spelling returned by @ref toString, which keeps printed output and
///          programmatic inspection in agreement.

#include "common/RegistryDiag.hpp"

#include <array>
#include <utility>

namespace
{
using pymagic::RegistryDiagCode;

constexpr std::array<RegistryDiagCode, 8> kAllCodes = {
    RegistryDiagCode::UnknownVersion,
    RegistryDiagCode::UnknownMagic,
    RegistryDiagCode::UnresolvedRuntime,
    RegistryDiagCode::UnknownOpcode,
    RegistryDiagCode::TableConsistency,
    RegistryDiagCode::AliasConflict,
    RegistryDiagCode::SharedMagic,
    RegistryDiagCode::Redefinition,
};

/// @brief Map a registry diagnostic code to its string prefix.
std::string_view diagCodeToPrefix(RegistryDiagCode code)
{
    switch (code)
    {
        case RegistryDiagCode::Unknown:
            return {};
        case RegistryDiagCode::UnknownVersion:
            return "registry.unknown_version";
        case RegistryDiagCode::UnknownMagic:
            return "registry.unknown_magic";
        case RegistryDiagCode::UnresolvedRuntime:
            return "registry.unresolved_runtime";
        case RegistryDiagCode::UnknownOpcode:
            return "registry.unknown_opcode";
        case RegistryDiagCode::TableConsistency:
            return "registry.table_consistency";
        case RegistryDiagCode::AliasConflict:
            return "registry.alias_conflict";
        case RegistryDiagCode::SharedMagic:
            return "registry.shared_magic";
        case RegistryDiagCode::Redefinition:
            return "registry.redefinition";
    }
    return {};
}
} // namespace

namespace pymagic
{

std::string_view toString(RegistryDiagCode code)
{
    return diagCodeToPrefix(code);
}

support::Diag makeRegistryError(RegistryDiagCode code, std::string message)
{
    return support::makeError(std::string(diagCodeToPrefix(code)), std::move(message));
}

support::Diag makeRegistryNote(RegistryDiagCode code, std::string message)
{
    return support::Diag{
        support::Severity::Note, std::string(diagCodeToPrefix(code)), std::move(message)};
}

/// @brief Recover the structured code by matching the stored prefix.
/// @details The catalogue is small, so a linear scan is sufficient.
RegistryDiagCode registryDiagCode(const support::Diag &diag)
{
    for (RegistryDiagCode code : kAllCodes)
    {
        if (diag.code == diagCodeToPrefix(code))
            return code;
    }
    return RegistryDiagCode::Unknown;
}

} // namespace pymagic
