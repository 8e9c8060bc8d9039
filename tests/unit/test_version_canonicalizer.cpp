// File: tests/unit/test_version_canonicalizer.cpp
// Purpose: Exercise alias registration, conflict detection and the
//          canonicalization fallback ladder.
// Key invariants: canonicalize(canonicalize(v)) == canonicalize(v).
// Ownership/Lifetime: Standalone unit test executable.
// Links: docs/versions.md

#include <gtest/gtest.h>

#include "common/RegistryDiag.hpp"
#include "version/VersionCanonicalizer.hpp"

using namespace pymagic;
using namespace pymagic::version;

namespace
{
VersionCanonicalizer makeCanonicalizer()
{
    VersionCanonicalizer canon;
    for (const char *v : {"2.7", "2.7pypy", "3.6rc1", "3.6b2", "3.9pypy", "3.9.0beta5"})
        EXPECT_TRUE(canon.registerCanonical(v));
    EXPECT_TRUE(canon.registerAlias("3.6 3.6.0 3.6.15", "3.6rc1"));
    EXPECT_TRUE(canon.registerAlias("3.9 3.9.15pypy", "3.9.0beta5"));
    return canon;
}
} // namespace

TEST(VersionCanonicalizer, AliasResolves)
{
    VersionCanonicalizer canon;
    ASSERT_TRUE(canon.registerCanonical("2.7"));
    ASSERT_TRUE(canon.registerAlias("2.7.18", "2.7"));

    auto c = canon.canonicalize("2.7.18");
    ASSERT_TRUE(c);
    EXPECT_EQ(c.value(), "2.7");
    EXPECT_TRUE(canon.isKnown("2.7.18"));
    EXPECT_FALSE(canon.isCanonical("2.7.18"));
    EXPECT_TRUE(canon.isCanonical("2.7"));
}

TEST(VersionCanonicalizer, CanonicalizeIsIdempotent)
{
    auto canon = makeCanonicalizer();
    for (const auto &v : canon.allKnownVersions())
    {
        auto once = canon.canonicalize(v);
        ASSERT_TRUE(once) << v;
        auto twice = canon.canonicalize(once.value());
        ASSERT_TRUE(twice) << v;
        EXPECT_EQ(once.value(), twice.value()) << v;
    }
}

TEST(VersionCanonicalizer, UnknownVersion)
{
    auto canon = makeCanonicalizer();
    auto c = canon.canonicalize("4.0");
    ASSERT_FALSE(c);
    EXPECT_EQ(registryDiagCode(c.error()), RegistryDiagCode::UnknownVersion);

    EXPECT_FALSE(canon.canonicalize(""));
    EXPECT_FALSE(canon.canonicalize("nonsense"));
}

TEST(VersionCanonicalizer, StructuralFallback)
{
    auto canon = makeCanonicalizer();
    // Point release newer than anything listed.
    EXPECT_EQ(canon.canonicalize("3.6.16").value(), "3.6rc1");
    EXPECT_EQ(canon.canonicalize("2.7pypy").value(), "2.7pypy");
    // Tagged spellings resolve through the tagged major.minor shape.
    EXPECT_EQ(canon.canonicalize("3.9.19pypy").value(), "3.9pypy");
    EXPECT_EQ(canon.canonicalize("2.7.13pypy").value(), "2.7pypy");
    // Exact alias beats structure.
    EXPECT_EQ(canon.canonicalize("3.9.15pypy").value(), "3.9.0beta5");
}

TEST(VersionCanonicalizer, TaggedSpellingNeverFallsBackToCPython)
{
    auto canon = makeCanonicalizer();
    // "3.6.0" is listed, but there is no PyPy 3.6 entry.
    auto pypy = canon.canonicalize("3.6.0pypy");
    ASSERT_FALSE(pypy);
    EXPECT_EQ(registryDiagCode(pypy.error()), RegistryDiagCode::UnknownVersion);

    ASSERT_TRUE(canon.registerCanonical("2.7.7Pyston"));
    EXPECT_FALSE(canon.canonicalize("2.7.9Pyston"));
    EXPECT_FALSE(canon.canonicalize("2.7.18Graal"));
    EXPECT_EQ(canon.canonicalize("2.7.18").value(), "2.7");
}

TEST(VersionCanonicalizer, OverlongComponentsAreUnknown)
{
    auto canon = makeCanonicalizer();
    auto c = canon.canonicalize("2.4294967303");
    ASSERT_FALSE(c);
    EXPECT_EQ(registryDiagCode(c.error()), RegistryDiagCode::UnknownVersion);
    EXPECT_FALSE(canon.canonicalize("3.6.99999999999"));
}

TEST(VersionCanonicalizer, RebindingAliasConflicts)
{
    auto canon = makeCanonicalizer();
    auto r = canon.registerAlias("3.6.0", "3.6b2");
    ASSERT_FALSE(r);
    EXPECT_EQ(registryDiagCode(r.error()), RegistryDiagCode::AliasConflict);
    EXPECT_EQ(canon.canonicalize("3.6.0").value(), "3.6rc1");
}

TEST(VersionCanonicalizer, AliasingCanonicalConflicts)
{
    auto canon = makeCanonicalizer();
    auto r = canon.registerAlias("3.6b2", "3.6rc1");
    ASSERT_FALSE(r);
    EXPECT_EQ(registryDiagCode(r.error()), RegistryDiagCode::AliasConflict);
    EXPECT_TRUE(canon.isCanonical("3.6b2"));
}

TEST(VersionCanonicalizer, CanonicalOverAliasConflicts)
{
    auto canon = makeCanonicalizer();
    auto r = canon.registerCanonical("3.6.0");
    ASSERT_FALSE(r);
    EXPECT_EQ(registryDiagCode(r.error()), RegistryDiagCode::AliasConflict);
}

TEST(VersionCanonicalizer, FailedAliasListBindsNothing)
{
    auto canon = makeCanonicalizer();
    auto r = canon.registerAlias("3.6.20 3.6.21 3.6.0", "3.6b2");
    ASSERT_FALSE(r);
    EXPECT_FALSE(canon.isKnown("3.6.20"));
    EXPECT_FALSE(canon.isKnown("3.6.21"));
}

TEST(VersionCanonicalizer, DuplicateBindingIsNoOp)
{
    auto canon = makeCanonicalizer();
    const size_t before = canon.allKnownVersions().size();
    EXPECT_TRUE(canon.registerAlias("3.6.0 3.6.0", "3.6rc1"));
    EXPECT_TRUE(canon.registerCanonical("2.7"));
    EXPECT_EQ(canon.allKnownVersions().size(), before);
}

TEST(VersionCanonicalizer, AliasTargetMustBeCanonical)
{
    auto canon = makeCanonicalizer();
    auto r = canon.registerAlias("3.6.99", "3.6.0");
    ASSERT_FALSE(r);
    EXPECT_EQ(registryDiagCode(r.error()), RegistryDiagCode::UnknownVersion);

    auto missing = canon.registerAlias("5.0.1", "5.0");
    ASSERT_FALSE(missing);
    EXPECT_EQ(registryDiagCode(missing.error()), RegistryDiagCode::UnknownVersion);
}

TEST(VersionCanonicalizer, CanonicalOrderIsRegistrationOrder)
{
    auto canon = makeCanonicalizer();
    const auto &order = canon.canonicalVersions();
    ASSERT_EQ(order.size(), 6u);
    EXPECT_EQ(order.front(), "2.7");
    EXPECT_EQ(order.back(), "3.9.0beta5");
}

TEST(VersionCanonicalizer, VersionTupleUsesCallerSpelling)
{
    auto canon = makeCanonicalizer();
    EXPECT_EQ(canon.versionTuple("3.6.15").value(), (VersionTuple{3, 6, 15}));
    EXPECT_EQ(canon.versionTuple("3.6rc1").value(), (VersionTuple{3, 6, std::nullopt}));
    // Not listed: falls back to the canonical spelling.
    EXPECT_EQ(canon.versionTuple("3.6.16").value(), (VersionTuple{3, 6, std::nullopt}));
    EXPECT_FALSE(canon.versionTuple("7.7"));
}
