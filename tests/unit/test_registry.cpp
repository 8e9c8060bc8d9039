// File: tests/unit/test_registry.cpp
// Purpose: Build the registry facade and query it, including from several
//          threads at once.
// Key invariants: A built registry answers identically on every thread.
// Ownership/Lifetime: Standalone unit test executable.
// Links: docs/codemap.md

#include <gtest/gtest.h>

#include "common/RegistryDiag.hpp"
#include "pymagic/Registry.hpp"
#include "support/diagnostics.hpp"

#include <sstream>
#include <thread>
#include <vector>

using namespace pymagic;

namespace
{
std::string snapshot(const Registry &reg)
{
    std::ostringstream os;
    for (const char *v : {"2.7.18", "3.5.2", "3.6.15", "3.8.16pypy", "3.11.9", "3.2"})
    {
        os << v << ':' << reg.canonicalize(v).value() << ':' << reg.magicFor(v).value().toInt();
        auto table = reg.opcodeTable(v);
        if (table)
            os << ':' << table.value()->version() << ':' << table.value()->size();
        os << '\n';
    }
    for (uint16_t m : reg.magics().allMagicInts())
        os << m << '=' << reg.magics().versionForInt(m).value() << '\n';
    return os.str();
}
} // namespace

TEST(Registry, BuildsAndForwards)
{
    auto built = RegistryBuilder().build();
    ASSERT_TRUE(built) << built.error().message;
    const Registry &reg = *built.value();

    EXPECT_EQ(reg.canonicalize("2.7.18").value(), "2.7");
    EXPECT_EQ(reg.magicFor("2.7.18").value().toInt(), 62211);
    EXPECT_EQ(reg.versionsFor(magic::MagicIdentifier::fromInt(62211)).value(),
              (std::set<std::string>{"2.7"}));
    EXPECT_EQ(reg.opcodeTable("2.7.18").value()->version(), "2.7");

    version::RuntimeIdentity id{{2, 7, 18}, version::ReleaseLevel::Final, 0, "CPython"};
    EXPECT_EQ(reg.currentRuntimeMagic(id).value().toInt(), 62211);

    auto unknown = reg.canonicalize("9.9.9");
    ASSERT_FALSE(unknown);
    EXPECT_EQ(registryDiagCode(unknown.error()), RegistryDiagCode::UnknownVersion);
}

TEST(Registry, LoadingLeavesOnlyNotes)
{
    support::DiagnosticEngine diags;
    auto built = RegistryBuilder().build(&diags);
    ASSERT_TRUE(built);

    EXPECT_EQ(diags.errorCount(), 0u);
    EXPECT_EQ(diags.warningCount(), 0u);
    EXPECT_GT(diags.noteCount(), 0u);
    EXPECT_EQ(diags.diagnostics().size(), built.value()->diagnostics().diagnostics().size());

    bool sawShared = false;
    bool sawRedefinition = false;
    for (const auto &d : diags.diagnostics())
    {
        sawShared |= registryDiagCode(d) == RegistryDiagCode::SharedMagic;
        sawRedefinition |= registryDiagCode(d) == RegistryDiagCode::Redefinition;
    }
    EXPECT_TRUE(sawShared);
    EXPECT_TRUE(sawRedefinition);
}

TEST(Registry, BuildsAreIndependent)
{
    auto a = RegistryBuilder().build();
    auto b = RegistryBuilder().build();
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    EXPECT_NE(a.value().get(), b.value().get());
    EXPECT_EQ(snapshot(*a.value()), snapshot(*b.value()));
    EXPECT_TRUE(a.value()->opcodeTable("3.6")
                    .value()
                    ->sameContents(*b.value()->opcodeTable("3.6").value()));
}

TEST(Registry, ConcurrentReadsAgree)
{
    auto built = RegistryBuilder().build();
    ASSERT_TRUE(built);
    const Registry &reg = *built.value();
    const std::string expected = snapshot(reg);

    constexpr int kThreads = 8;
    std::vector<std::string> results(kThreads);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i)
    {
        threads.emplace_back(
            [&reg, &results, i]
            {
                for (int round = 0; round < 20; ++round)
                    results[i] = snapshot(reg);
            });
    }
    for (auto &t : threads)
        t.join();

    for (const auto &r : results)
        EXPECT_EQ(r, expected);
}

TEST(Registry, ComponentsReachableThroughAccessors)
{
    auto built = RegistryBuilder().build();
    ASSERT_TRUE(built);
    const Registry &reg = *built.value();

    EXPECT_TRUE(reg.versions().isCanonical("3.6rc1"));
    EXPECT_FALSE(reg.versions().isCanonical("3.6.15"));
    EXPECT_TRUE(reg.versions().isKnown("3.6.15"));
    EXPECT_EQ(&reg.magics().canonicalizer(), &reg.versions());
    EXPECT_EQ(reg.instructionSets().publishedVersions().size(), 7u);
    EXPECT_EQ(reg.instructionSets().lookup("3.6", "LOAD_CONST").value(), 100);
}
