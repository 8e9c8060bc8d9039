//===----------------------------------------------------------------------===//
//
// Part of the pymagic project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/magic/MagicIdentifier.cpp
// Purpose: Encode and decode bytecode magic identifiers.
// Key invariants: Byte order is little-endian regardless of host.
// Ownership/Lifetime: Stateless.
// Links: docs/magics.md
//
//===----------------------------------------------------------------------===//

#include "magic/MagicIdentifier.hpp"

#include <cstdio>

namespace pymagic::magic
{
namespace
{
constexpr uint8_t kCR = '\r';
constexpr uint8_t kLF = '\n';
constexpr uint8_t kLegacyTrailer0 = 0x99;
constexpr uint8_t kLegacyTrailer1 = 0x00;
} // namespace

MagicIdentifier MagicIdentifier::fromInt(uint16_t magicInt)
{
    MagicIdentifier id;
    id.bytes[0] = static_cast<uint8_t>(magicInt & 0xFF);
    id.bytes[1] = static_cast<uint8_t>((magicInt >> 8) & 0xFF);
    if (isLegacyMagic(magicInt))
    {
        id.bytes[2] = kLegacyTrailer0;
        id.bytes[3] = kLegacyTrailer1;
    }
    else
    {
        id.bytes[2] = kCR;
        id.bytes[3] = kLF;
    }
    return id;
}

MagicIdentifier MagicIdentifier::fromBytes(const uint8_t *data)
{
    MagicIdentifier id;
    for (size_t i = 0; i < kMagicSize; ++i)
        id.bytes[i] = data[i];
    return id;
}

uint16_t MagicIdentifier::toInt() const
{
    return static_cast<uint16_t>(bytes[0] | (static_cast<uint16_t>(bytes[1]) << 8));
}

bool MagicIdentifier::hasCanonicalTrailer() const
{
    return *this == fromInt(toInt());
}

std::string MagicIdentifier::toHex() const
{
    char buf[3 * kMagicSize];
    std::snprintf(buf, sizeof(buf), "%02x %02x %02x %02x", bytes[0], bytes[1], bytes[2], bytes[3]);
    return std::string(buf);
}

} // namespace pymagic::magic
