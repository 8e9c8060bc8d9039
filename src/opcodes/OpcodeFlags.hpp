//===----------------------------------------------------------------------===//
//
// Part of the pymagic project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/opcodes/OpcodeFlags.hpp
// Purpose: Operand categories attached to each opcode definition.
// Key invariants: Each category occupies a distinct bit.
// Ownership/Lifetime: Value types only.
// Links: docs/opcodes.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace pymagic::opcodes
{

/// @brief First opcode that takes an argument in every supported version.
inline constexpr uint8_t kHaveArgument = 90;

/// @brief Number of distinct opcode values.
inline constexpr size_t kOpcodeSpace = 256;

/// @brief Operand category of an opcode.
enum class OpcodeFlag : uint16_t
{
    None = 0,
    RelativeJump = 1u << 0, ///< Argument is a jump offset from the next instruction (hasjrel).
    AbsoluteJump = 1u << 1, ///< Argument is an absolute jump target (hasjabs).
    ConstIndex = 1u << 2,   ///< Argument indexes co_consts (hasconst).
    LocalIndex = 1u << 3,   ///< Argument indexes co_varnames (haslocal).
    FreeIndex = 1u << 4,    ///< Argument indexes cell and free variables (hasfree).
    NameIndex = 1u << 5,    ///< Argument indexes co_names (hasname).
    CompareIndex = 1u << 6, ///< Argument selects a comparison operator (hascompare).
    NoArgument = 1u << 7    ///< Opcode takes no argument.
};

/// @brief Number of non-None categories.
inline constexpr size_t kNumOpcodeFlags = 8;

/// @brief Every non-None category, in bit order.
inline constexpr std::array<OpcodeFlag, kNumOpcodeFlags> kAllOpcodeFlags = {
    OpcodeFlag::RelativeJump,
    OpcodeFlag::AbsoluteJump,
    OpcodeFlag::ConstIndex,
    OpcodeFlag::LocalIndex,
    OpcodeFlag::FreeIndex,
    OpcodeFlag::NameIndex,
    OpcodeFlag::CompareIndex,
    OpcodeFlag::NoArgument,
};

/// @brief Short name of a category, matching the dis module's list names ("hasjrel").
const char *toString(OpcodeFlag flag);

/// @brief Position of @p flag within kAllOpcodeFlags.
size_t flagIndex(OpcodeFlag flag);

/// @brief Set of opcode categories.
class OpcodeFlags
{
  public:
    constexpr OpcodeFlags() = default;

    constexpr OpcodeFlags(OpcodeFlag flag) : bits_(static_cast<uint16_t>(flag)) {}

    /// @brief Whether every bit of @p flag is set.
    constexpr bool has(OpcodeFlag flag) const
    {
        const auto bit = static_cast<uint16_t>(flag);
        return bit != 0 && (bits_ & bit) == bit;
    }

    constexpr bool empty() const
    {
        return bits_ == 0;
    }

    constexpr uint16_t bits() const
    {
        return bits_;
    }

    constexpr OpcodeFlags operator|(OpcodeFlags other) const
    {
        OpcodeFlags out;
        out.bits_ = static_cast<uint16_t>(bits_ | other.bits_);
        return out;
    }

    constexpr OpcodeFlags &operator|=(OpcodeFlags other)
    {
        bits_ = static_cast<uint16_t>(bits_ | other.bits_);
        return *this;
    }

    constexpr bool operator==(OpcodeFlags other) const
    {
        return bits_ == other.bits_;
    }

    constexpr bool operator!=(OpcodeFlags other) const
    {
        return bits_ != other.bits_;
    }

    /// @brief Render as "hasjrel|noarg"; "-" when empty.
    std::string toString() const;

  private:
    uint16_t bits_ = 0;
};

constexpr OpcodeFlags operator|(OpcodeFlag lhs, OpcodeFlag rhs)
{
    return OpcodeFlags(lhs) | OpcodeFlags(rhs);
}

} // namespace pymagic::opcodes
