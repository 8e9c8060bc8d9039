//===----------------------------------------------------------------------===//
//
// Part of the pymagic project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/magic/MagicIdentifier.hpp
// Purpose: Four-byte bytecode magic as stored at the start of a compiled file,
//          and its integer encoding.
// Key invariants: toInt(fromInt(m)) == m for every 16-bit magic value.
// Ownership/Lifetime: Trivially copyable value type.
// Links: docs/magics.md
//
//===----------------------------------------------------------------------===//
//
// Byte layout:
// - Regular magics:  [magic lo][magic hi]['\r']['\n']
// - Legacy magics 39170 and 39171 (1.0 and 1.1): [magic lo][magic hi][0x99][0x00]
//
// The integer encoding is the little-endian u16 formed by the first two bytes;
// the trailer is implied by the value and never contributes to it.

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace pymagic::magic
{

/// @brief Magic integers that predate the CR/LF trailer convention.
inline constexpr uint16_t kLegacyMagic10 = 39170;
inline constexpr uint16_t kLegacyMagic11 = 39171;

/// @brief Size in bytes of a serialized magic.
inline constexpr size_t kMagicSize = 4;

/// @brief Opaque four-byte magic identifier.
struct MagicIdentifier
{
    std::array<uint8_t, kMagicSize> bytes{};

    /// @brief Encode @p magicInt using the layout rule for its value.
    static MagicIdentifier fromInt(uint16_t magicInt);

    /// @brief Wrap raw header bytes as read from a compiled file.
    /// @param data Pointer to at least kMagicSize bytes.
    static MagicIdentifier fromBytes(const uint8_t *data);

    /// @brief Integer encoding of the identifier.
    uint16_t toInt() const;

    /// @brief Whether the trailer matches the layout fromInt() would produce.
    bool hasCanonicalTrailer() const;

    /// @brief Render as four space-separated hex bytes, e.g. "03 f3 0d 0a".
    std::string toHex() const;

    bool operator==(const MagicIdentifier &other) const
    {
        return bytes == other.bytes;
    }

    bool operator!=(const MagicIdentifier &other) const
    {
        return !(*this == other);
    }

    bool operator<(const MagicIdentifier &other) const
    {
        return bytes < other.bytes;
    }
};

/// @brief Whether @p magicInt uses the legacy 0x99 0x00 trailer.
inline constexpr bool isLegacyMagic(uint16_t magicInt)
{
    return magicInt == kLegacyMagic10 || magicInt == kLegacyMagic11;
}

} // namespace pymagic::magic

namespace std
{
template <> struct hash<pymagic::magic::MagicIdentifier>
{
    size_t operator()(const pymagic::magic::MagicIdentifier &id) const noexcept
    {
        uint32_t packed = 0;
        for (size_t i = 0; i < pymagic::magic::kMagicSize; ++i)
            packed |= static_cast<uint32_t>(id.bytes[i]) << (8 * i);
        return hash<uint32_t>{}(packed);
    }
};
} // namespace std
