// File: tests/unit/test_magic_identifier.cpp
// Purpose: Verify the 4-byte magic layout, including the pre-1.2 trailer.
// Key invariants: fromInt(toInt(m)) == m for every canonical identifier.
// Ownership/Lifetime: Standalone unit test executable.
// Links: docs/magics.md

#include <gtest/gtest.h>

#include "magic/MagicIdentifier.hpp"

#include <unordered_set>

using namespace pymagic::magic;

TEST(MagicIdentifier, LittleEndianWithCrLf)
{
    MagicIdentifier id = MagicIdentifier::fromInt(62211);
    EXPECT_EQ(id.bytes[0], 0x03);
    EXPECT_EQ(id.bytes[1], 0xf3);
    EXPECT_EQ(id.bytes[2], '\r');
    EXPECT_EQ(id.bytes[3], '\n');
    EXPECT_EQ(id.toInt(), 62211);
    EXPECT_EQ(id.toHex(), "03 f3 0d 0a");
}

TEST(MagicIdentifier, LegacyTrailer)
{
    MagicIdentifier v10 = MagicIdentifier::fromInt(kLegacyMagic10);
    EXPECT_EQ(v10.bytes[2], 0x99);
    EXPECT_EQ(v10.bytes[3], 0x00);
    EXPECT_EQ(v10.toInt(), 39170);

    MagicIdentifier v11 = MagicIdentifier::fromInt(kLegacyMagic11);
    EXPECT_EQ(v11.toHex(), "03 99 99 00");
    EXPECT_TRUE(isLegacyMagic(39171));
    EXPECT_FALSE(isLegacyMagic(3379));
}

TEST(MagicIdentifier, BytesRoundTrip)
{
    const uint8_t raw[4] = {0x33, 0x0d, 0x0d, 0x0a};
    MagicIdentifier id = MagicIdentifier::fromBytes(raw);
    EXPECT_EQ(id.toInt(), 3379);
    EXPECT_TRUE(id.hasCanonicalTrailer());
    EXPECT_EQ(MagicIdentifier::fromInt(id.toInt()), id);
}

TEST(MagicIdentifier, ForeignTrailerIsNotCanonical)
{
    const uint8_t raw[4] = {0x33, 0x0d, 0x00, 0x00};
    MagicIdentifier id = MagicIdentifier::fromBytes(raw);
    EXPECT_EQ(id.toInt(), 3379);
    EXPECT_FALSE(id.hasCanonicalTrailer());
    EXPECT_NE(MagicIdentifier::fromInt(3379), id);
}

TEST(MagicIdentifier, Hashable)
{
    std::unordered_set<MagicIdentifier> seen;
    seen.insert(MagicIdentifier::fromInt(3379));
    seen.insert(MagicIdentifier::fromInt(3379));
    seen.insert(MagicIdentifier::fromInt(3394));
    EXPECT_EQ(seen.size(), 2u);
}
