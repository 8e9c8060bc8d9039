// File: src/opcodes/EditOperation.hpp
// Purpose: One step of deriving a version's opcode table from its parent.
// Key invariants: Remove ignores flags; all other kinds carry a full definition.
// Ownership/Lifetime: Value type.
// Links: docs/opcodes.md
#pragma once

#include "opcodes/OpcodeFlags.hpp"
#include "opcodes/OpcodeTable.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace pymagic::opcodes
{

/// @brief Tagged edit applied to a copy of the parent table.
struct EditOperation
{
    /// @brief Discriminator for edit kinds.
    enum class Kind
    {
        Define,  ///< Add a new opcode; name and code must be free.
        Remove,  ///< Drop an existing (name, code) pair.
        Alias,   ///< Like Define, but the opcode is excluded from the core set.
        Redefine ///< Intentionally replace an existing name's code and flags.
    };

    Kind kind = Kind::Define;
    std::string name;
    uint8_t code = 0;
    OpcodeFlags flags;

    static EditOperation define(std::string_view name, uint8_t code, OpcodeFlags flags = {});
    static EditOperation remove(std::string_view name, uint8_t code);
    static EditOperation alias(std::string_view name, uint8_t code, OpcodeFlags flags = {});
    static EditOperation redefine(std::string_view name, uint8_t code, OpcodeFlags flags = {});

    /// @brief Definition this edit installs; meaningless for Remove.
    OpcodeDefinition definition() const;

    /// @brief Human-readable form used in traces, e.g. "remove STORE_MAP 54".
    std::string toString() const;
};

/// @brief Lowercase name of @p kind.
const char *toString(EditOperation::Kind kind);

} // namespace pymagic::opcodes
