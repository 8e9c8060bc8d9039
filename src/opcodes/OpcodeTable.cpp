//===----------------------------------------------------------------------===//
//
// Part of the pymagic project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/opcodes/OpcodeTable.cpp
// Purpose: Implement opcode table queries and the construction-time mutators
//          used by InstructionSetBuilder.
// Key invariants: Mutators reject any change that would break bijectivity.
// Ownership/Lifetime: See header.
// Links: docs/opcodes.md
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Opcode table storage.
/// @details Codes index a fixed 256-entry array so code -> definition is a
///          direct load; names go through a hash map.  The derived category
///          lists are rebuilt in a single pass by finalize() after every
///          construction step, which keeps them trivially consistent with the
///          per-opcode flags.

#include "opcodes/OpcodeTable.hpp"

#include "common/RegistryDiag.hpp"

#include <utility>

namespace pymagic::opcodes
{
namespace
{
std::string describe(std::string_view name, uint8_t code)
{
    return std::string(name) + " (" + std::to_string(code) + ")";
}
} // namespace

OpcodeTable::OpcodeTable(Key, std::string version, std::string parent)
    : version_(std::move(version)), parent_(std::move(parent))
{
}

const std::string &OpcodeTable::version() const
{
    return version_;
}

const std::string &OpcodeTable::parent() const
{
    return parent_;
}

support::Expected<uint8_t> OpcodeTable::code(std::string_view name) const
{
    auto it = byName_.find(std::string(name));
    if (it == byName_.end())
        return makeRegistryError(RegistryDiagCode::UnknownOpcode,
                                 "opcode '" + std::string(name) + "' is not defined in " +
                                     version_);
    return it->second;
}

support::Expected<std::string> OpcodeTable::name(uint8_t code) const
{
    if (!byCode_[code])
        return makeRegistryError(RegistryDiagCode::UnknownOpcode,
                                 "opcode " + std::to_string(code) + " is not defined in " +
                                     version_);
    return byCode_[code]->name;
}

support::Expected<OpcodeFlags> OpcodeTable::classify(uint8_t code) const
{
    if (!byCode_[code])
        return makeRegistryError(RegistryDiagCode::UnknownOpcode,
                                 "opcode " + std::to_string(code) + " is not defined in " +
                                     version_);
    return byCode_[code]->flags;
}

const OpcodeDefinition *OpcodeTable::find(uint8_t code) const
{
    return byCode_[code] ? &*byCode_[code] : nullptr;
}

const OpcodeDefinition *OpcodeTable::find(std::string_view name) const
{
    auto it = byName_.find(std::string(name));
    if (it == byName_.end())
        return nullptr;
    return find(it->second);
}

bool OpcodeTable::contains(uint8_t code) const
{
    return byCode_[code].has_value();
}

bool OpcodeTable::contains(std::string_view name) const
{
    return byName_.count(std::string(name)) != 0;
}

bool OpcodeTable::hasArgument(uint8_t code) const
{
    return byCode_[code] && !byCode_[code]->flags.has(OpcodeFlag::NoArgument);
}

size_t OpcodeTable::size() const
{
    return byName_.size();
}

std::vector<OpcodeDefinition> OpcodeTable::definitions() const
{
    std::vector<OpcodeDefinition> out;
    out.reserve(byName_.size());
    for (const auto &slot : byCode_)
    {
        if (slot)
            out.push_back(*slot);
    }
    return out;
}

const std::vector<uint8_t> &OpcodeTable::opcodesWith(OpcodeFlag flag) const
{
    static const std::vector<uint8_t> kEmpty;
    const size_t index = flagIndex(flag);
    if (index >= byFlag_.size())
        return kEmpty;
    return byFlag_[index];
}

const std::vector<uint8_t> &OpcodeTable::jumpOpcodes() const
{
    return jumps_;
}

std::vector<std::string> OpcodeTable::jumpOpNames() const
{
    std::vector<std::string> out;
    out.reserve(jumps_.size());
    for (uint8_t code : jumps_)
        out.push_back(byCode_[code]->name);
    return out;
}

const std::vector<uint8_t> &OpcodeTable::coreOpcodes() const
{
    return core_;
}

const std::unordered_map<std::string, uint8_t> &OpcodeTable::opmap() const
{
    return byName_;
}

bool OpcodeTable::sameContents(const OpcodeTable &other) const
{
    return byCode_ == other.byCode_;
}

support::Expected<void> OpcodeTable::insert(OpcodeDefinition def)
{
    if (def.name.empty())
        return makeRegistryError(RegistryDiagCode::TableConsistency,
                                 version_ + ": opcode " + std::to_string(def.code) +
                                     " has an empty name");
    if (auto it = byName_.find(def.name); it != byName_.end())
        return makeRegistryError(RegistryDiagCode::TableConsistency,
                                 version_ + ": cannot define " + describe(def.name, def.code) +
                                     ", name already defined as code " +
                                     std::to_string(it->second));
    if (const auto &slot = byCode_[def.code])
        return makeRegistryError(RegistryDiagCode::TableConsistency,
                                 version_ + ": cannot define " + describe(def.name, def.code) +
                                     ", code already taken by " + slot->name);

    const uint8_t code = def.code;
    byName_.emplace(def.name, code);
    byCode_[code] = std::move(def);
    return {};
}

support::Expected<void> OpcodeTable::erase(std::string_view name, uint8_t code)
{
    auto it = byName_.find(std::string(name));
    if (it == byName_.end())
        return makeRegistryError(RegistryDiagCode::TableConsistency,
                                 version_ + ": cannot remove " + describe(name, code) +
                                     ", name is not defined");
    if (it->second != code)
        return makeRegistryError(RegistryDiagCode::TableConsistency,
                                 version_ + ": cannot remove " + describe(name, code) +
                                     ", name is defined as code " + std::to_string(it->second));

    byCode_[code].reset();
    byName_.erase(it);
    return {};
}

/// @brief Replace the definition of an existing name.
/// @details The target code must be free or already belong to the same name,
///          so an intentional override can move an opcode without shadowing
///          another one.
support::Expected<void> OpcodeTable::redefine(OpcodeDefinition def)
{
    auto it = byName_.find(def.name);
    if (it == byName_.end())
        return makeRegistryError(RegistryDiagCode::TableConsistency,
                                 version_ + ": cannot redefine " + describe(def.name, def.code) +
                                     ", name is not defined");
    const uint8_t oldCode = it->second;
    if (def.code != oldCode && byCode_[def.code])
        return makeRegistryError(RegistryDiagCode::TableConsistency,
                                 version_ + ": cannot redefine " + describe(def.name, def.code) +
                                     ", code already taken by " + byCode_[def.code]->name);

    byCode_[oldCode].reset();
    it->second = def.code;
    const uint8_t code = def.code;
    byCode_[code] = std::move(def);
    return {};
}

void OpcodeTable::finalize()
{
    for (auto &list : byFlag_)
        list.clear();
    jumps_.clear();
    core_.clear();

    for (size_t code = 0; code < byCode_.size(); ++code)
    {
        const auto &slot = byCode_[code];
        if (!slot)
            continue;
        const auto c = static_cast<uint8_t>(code);
        for (size_t i = 0; i < kAllOpcodeFlags.size(); ++i)
        {
            if (slot->flags.has(kAllOpcodeFlags[i]))
                byFlag_[i].push_back(c);
        }
        if (slot->flags.has(OpcodeFlag::RelativeJump) || slot->flags.has(OpcodeFlag::AbsoluteJump))
            jumps_.push_back(c);
        if (!slot->alias)
            core_.push_back(c);
    }
}

void OpcodeTable::rebase(std::string version, std::string parent)
{
    version_ = std::move(version);
    parent_ = std::move(parent);
}

} // namespace pymagic::opcodes
