//===----------------------------------------------------------------------===//
//
// Part of the pymagic project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/opcodes/OpcodeTable.hpp
// Purpose: Named opcode set of one version and its derived classifications.
// Key invariants: name -> code and code -> name are bijective; derived sets
//                 are recomputed whenever the table is finalized.
// Ownership/Lifetime: Owns all storage by value, so copying a table yields a
//                     fully independent table.
// Links: docs/opcodes.md
//
//===----------------------------------------------------------------------===//
//
// Tables are only mutated by InstructionSetBuilder while a version is being
// derived; once published they are reachable through const pointers only.

#pragma once

#include "opcodes/OpcodeFlags.hpp"
#include "support/diag_expected.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace pymagic::opcodes
{

class InstructionSetBuilder;

/// @brief One opcode of one version.
struct OpcodeDefinition
{
    std::string name;  ///< Mnemonic, unique within a table
    uint8_t code = 0;  ///< Numeric opcode, unique within a table
    OpcodeFlags flags; ///< Operand categories
    bool alias = false; ///< Semantics-only marker, excluded from the core set

    bool operator==(const OpcodeDefinition &other) const
    {
        return name == other.name && code == other.code && flags == other.flags &&
               alias == other.alias;
    }
};

/// @brief Opcode table of one canonical version.
class OpcodeTable
{
    /// @brief Restricts construction to InstructionSetBuilder.
    struct Key
    {
        explicit Key() = default;
    };

  public:
    OpcodeTable(Key, std::string version, std::string parent);

    /// @brief Canonical version this table describes.
    const std::string &version() const;

    /// @brief Canonical version this table was derived from; empty for roots.
    const std::string &parent() const;

    /// @brief Numeric code of @p name; registry.unknown_opcode when absent.
    support::Expected<uint8_t> code(std::string_view name) const;

    /// @brief Mnemonic of @p code; registry.unknown_opcode when absent.
    support::Expected<std::string> name(uint8_t code) const;

    /// @brief Categories of @p code; registry.unknown_opcode when absent.
    support::Expected<OpcodeFlags> classify(uint8_t code) const;

    /// @brief Definition for @p code, or nullptr.
    const OpcodeDefinition *find(uint8_t code) const;

    /// @brief Definition for @p name, or nullptr.
    const OpcodeDefinition *find(std::string_view name) const;

    bool contains(uint8_t code) const;
    bool contains(std::string_view name) const;

    /// @brief Whether @p code is defined and takes an argument.
    bool hasArgument(uint8_t code) const;

    /// @brief Number of defined opcodes, aliases included.
    size_t size() const;

    /// @brief All definitions ordered by code.
    std::vector<OpcodeDefinition> definitions() const;

    /// @brief Codes carrying @p flag, ascending.
    const std::vector<uint8_t> &opcodesWith(OpcodeFlag flag) const;

    /// @brief Codes with a relative or absolute jump target, ascending.
    const std::vector<uint8_t> &jumpOpcodes() const;

    /// @brief Mnemonics of jumpOpcodes(), in the same order.
    std::vector<std::string> jumpOpNames() const;

    /// @brief Codes of non-alias definitions, ascending.
    const std::vector<uint8_t> &coreOpcodes() const;

    /// @brief Mnemonic -> code view of the whole table.
    const std::unordered_map<std::string, uint8_t> &opmap() const;

    /// @brief Whether both tables define identical name/code/flag sets.
    bool sameContents(const OpcodeTable &other) const;

  private:
    friend class InstructionSetBuilder;

    support::Expected<void> insert(OpcodeDefinition def);
    support::Expected<void> erase(std::string_view name, uint8_t code);
    support::Expected<void> redefine(OpcodeDefinition def);
    void finalize();
    void rebase(std::string version, std::string parent);

    std::string version_;
    std::string parent_;
    std::array<std::optional<OpcodeDefinition>, kOpcodeSpace> byCode_{};
    std::unordered_map<std::string, uint8_t> byName_;
    std::array<std::vector<uint8_t>, kNumOpcodeFlags> byFlag_{};
    std::vector<uint8_t> jumps_;
    std::vector<uint8_t> core_;
};

} // namespace pymagic::opcodes
