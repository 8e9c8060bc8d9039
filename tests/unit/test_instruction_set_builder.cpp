// File: tests/unit/test_instruction_set_builder.cpp
// Purpose: Cover table derivation: edit replay, validation, publication and
//          version lookup with release-family fallback.
// Key invariants: Parents are never modified by derivation; a failed
//                 derivation publishes nothing.
// Ownership/Lifetime: Standalone unit test executable.
// Links: docs/opcodes.md

#include <gtest/gtest.h>

#include "common/RegistryDiag.hpp"
#include "opcodes/InstructionSetBuilder.hpp"
#include "support/diagnostics.hpp"
#include "version/VersionCanonicalizer.hpp"

using namespace pymagic;
using namespace pymagic::opcodes;

namespace
{
class InstructionSetBuilderTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        for (const char *v : {"1.0", "1.1", "1.2", "1.3", "2.0a1", "2.0rc1", "2.0pypy"})
            ASSERT_TRUE(canon.registerCanonical(v));
        ASSERT_TRUE(canon.registerAlias("2.0 2.0.1", "2.0rc1"));

        auto t0 = builder.defineRootTable(
            "1.0",
            {OpcodeDefinition{"LOAD_FAST", 124, OpcodeFlag::LocalIndex, false},
             OpcodeDefinition{"JUMP_FORWARD", 110, OpcodeFlag::RelativeJump, false}});
        ASSERT_TRUE(t0);
    }

    version::VersionCanonicalizer canon;
    InstructionSetBuilder builder{canon};
};
} // namespace

TEST_F(InstructionSetBuilderTest, RemoveThenDefineReusesCode)
{
    auto t1 = builder.defineTable(
        "1.1",
        "1.0",
        {EditOperation::remove("JUMP_FORWARD", 110),
         EditOperation::define("JUMP_FORWARD_NEW", 110, OpcodeFlag::RelativeJump)});
    ASSERT_TRUE(t1);

    EXPECT_EQ(builder.lookup("1.1", "JUMP_FORWARD_NEW").value(), 110);
    auto gone = builder.lookup("1.1", "JUMP_FORWARD");
    ASSERT_FALSE(gone);
    EXPECT_EQ(registryDiagCode(gone.error()), RegistryDiagCode::UnknownOpcode);

    // Parent untouched.
    EXPECT_EQ(builder.lookup("1.0", "JUMP_FORWARD").value(), 110);
    EXPECT_EQ(builder.lookup("1.0", uint8_t{110}).value(), "JUMP_FORWARD");
    EXPECT_EQ(builder.parentOf("1.1").value(), "1.0");
}

TEST_F(InstructionSetBuilderTest, WrongCodeRemovalPublishesNothing)
{
    auto t2 = builder.defineTable("1.2", "1.0", {EditOperation::remove("LOAD_FAST", 99)});
    ASSERT_FALSE(t2);
    EXPECT_EQ(registryDiagCode(t2.error()), RegistryDiagCode::TableConsistency);

    auto lookup = builder.lookup("1.2", "LOAD_FAST");
    ASSERT_FALSE(lookup);
    EXPECT_EQ(registryDiagCode(lookup.error()), RegistryDiagCode::UnknownVersion);
    EXPECT_FALSE(builder.table("1.2"));
    EXPECT_EQ(builder.publishedVersions(), (std::vector<std::string>{"1.0"}));
}

TEST_F(InstructionSetBuilderTest, RejectedVersionDoesNotBorrowFamilyTable)
{
    ASSERT_TRUE(canon.registerCanonical("1.1b9"));
    ASSERT_TRUE(canon.registerCanonical("1.1c1"));
    ASSERT_TRUE(builder.defineTable("1.1", "1.0", {}));

    auto rejected = builder.defineTable("1.1b9", "1.0", {EditOperation::remove("LOAD_FAST", 99)});
    ASSERT_FALSE(rejected);
    EXPECT_EQ(registryDiagCode(rejected.error()), RegistryDiagCode::TableConsistency);

    auto lookup = builder.lookup("1.1b9", "LOAD_FAST");
    ASSERT_FALSE(lookup);
    EXPECT_EQ(registryDiagCode(lookup.error()), RegistryDiagCode::UnknownVersion);
    auto table = builder.table("1.1b9");
    ASSERT_FALSE(table);
    EXPECT_EQ(registryDiagCode(table.error()), RegistryDiagCode::UnknownVersion);

    // The sibling and members never submitted keep their tables.
    EXPECT_EQ(builder.table("1.1").value()->version(), "1.1");
    EXPECT_EQ(builder.table("1.1c1").value()->version(), "1.1");
    EXPECT_EQ(builder.lookup("1.1", "LOAD_FAST").value(), 124);
    EXPECT_EQ(builder.publishedVersions(), (std::vector<std::string>{"1.0", "1.1"}));
}

TEST_F(InstructionSetBuilderTest, FailureStopsDescendants)
{
    ASSERT_FALSE(builder.defineTable("1.2", "1.0", {EditOperation::remove("NOPE", 1)}));
    auto child = builder.defineTable("1.3", "1.2", {});
    ASSERT_FALSE(child);
    EXPECT_EQ(registryDiagCode(child.error()), RegistryDiagCode::UnknownVersion);
}

TEST_F(InstructionSetBuilderTest, CollisionsAreErrors)
{
    auto nameTaken =
        builder.defineTable("1.1", "1.0", {EditOperation::define("LOAD_FAST", 125)});
    ASSERT_FALSE(nameTaken);
    EXPECT_EQ(registryDiagCode(nameTaken.error()), RegistryDiagCode::TableConsistency);

    auto codeTaken =
        builder.defineTable("1.1", "1.0", {EditOperation::define("STORE_FAST", 124)});
    ASSERT_FALSE(codeTaken);
    EXPECT_EQ(registryDiagCode(codeTaken.error()), RegistryDiagCode::TableConsistency);
    EXPECT_NE(codeTaken.error().message.find("edit #0"), std::string::npos);

    auto absent = builder.defineTable("1.1", "1.0", {EditOperation::remove("STORE_FAST", 125)});
    ASSERT_FALSE(absent);
    EXPECT_EQ(registryDiagCode(absent.error()), RegistryDiagCode::TableConsistency);

    EXPECT_FALSE(builder.table("1.1"));
}

TEST_F(InstructionSetBuilderTest, RepublishingIsAnError)
{
    ASSERT_TRUE(builder.defineTable("1.1", "1.0", {}));
    auto again = builder.defineTable("1.1", "1.0", {});
    ASSERT_FALSE(again);
    EXPECT_EQ(registryDiagCode(again.error()), RegistryDiagCode::TableConsistency);

    auto root = builder.defineRootTable("1.0", {});
    ASSERT_FALSE(root);
    EXPECT_EQ(registryDiagCode(root.error()), RegistryDiagCode::TableConsistency);
}

TEST_F(InstructionSetBuilderTest, UnknownVersions)
{
    auto noParent = builder.defineTable("1.1", "7.7", {});
    ASSERT_FALSE(noParent);
    EXPECT_EQ(registryDiagCode(noParent.error()), RegistryDiagCode::UnknownVersion);

    auto noVersion = builder.defineTable("7.7", "1.0", {});
    ASSERT_FALSE(noVersion);
    EXPECT_EQ(registryDiagCode(noVersion.error()), RegistryDiagCode::UnknownVersion);

    // Canonical but never given a table.
    auto unpublished = builder.defineTable("1.2", "1.1", {});
    ASSERT_FALSE(unpublished);
    EXPECT_EQ(registryDiagCode(unpublished.error()), RegistryDiagCode::UnknownVersion);
}

TEST_F(InstructionSetBuilderTest, RedefineMovesOpcodeAndLeavesNote)
{
    support::DiagnosticEngine diags;
    builder.setDiagnostics(&diags);

    auto t1 = builder.defineTable(
        "1.1", "1.0", {EditOperation::redefine("LOAD_FAST", 130, OpcodeFlag::LocalIndex)});
    ASSERT_TRUE(t1);
    EXPECT_EQ(builder.lookup("1.1", "LOAD_FAST").value(), 130);
    EXPECT_FALSE(builder.lookup("1.1", uint8_t{124}));
    EXPECT_EQ(t1.value()->size(), 2u);
    EXPECT_EQ(builder.lookup("1.0", "LOAD_FAST").value(), 124);

    ASSERT_EQ(diags.noteCount(), 1u);
    EXPECT_EQ(registryDiagCode(diags.diagnostics()[0]), RegistryDiagCode::Redefinition);
}

TEST_F(InstructionSetBuilderTest, RedefineInPlaceChangesFlags)
{
    auto t1 = builder.defineTable(
        "1.1", "1.0", {EditOperation::redefine("JUMP_FORWARD", 110, OpcodeFlag::AbsoluteJump)});
    ASSERT_TRUE(t1);
    EXPECT_TRUE(builder.classify("1.1", 110).value().has(OpcodeFlag::AbsoluteJump));
    EXPECT_TRUE(t1.value()->opcodesWith(OpcodeFlag::RelativeJump).empty());
    EXPECT_EQ(t1.value()->opcodesWith(OpcodeFlag::AbsoluteJump), (std::vector<uint8_t>{110}));
}

TEST_F(InstructionSetBuilderTest, RedefineRequiresExistingNameAndFreeCode)
{
    auto missing = builder.defineTable("1.1", "1.0", {EditOperation::redefine("NOPE", 5)});
    ASSERT_FALSE(missing);
    EXPECT_EQ(registryDiagCode(missing.error()), RegistryDiagCode::TableConsistency);

    auto taken = builder.defineTable("1.1", "1.0", {EditOperation::redefine("LOAD_FAST", 110)});
    ASSERT_FALSE(taken);
    EXPECT_EQ(registryDiagCode(taken.error()), RegistryDiagCode::TableConsistency);
}

TEST_F(InstructionSetBuilderTest, AliasExcludedFromCore)
{
    auto t1 = builder.defineTable(
        "1.1", "1.0", {EditOperation::alias("JUMP_IF_NOT_EXC_MATCH", 121, OpcodeFlag::AbsoluteJump)});
    ASSERT_TRUE(t1);
    const OpcodeTable *table = t1.value();
    EXPECT_EQ(table->size(), 3u);
    EXPECT_EQ(table->coreOpcodes(), (std::vector<uint8_t>{110, 124}));
    EXPECT_EQ(table->jumpOpcodes(), (std::vector<uint8_t>{110, 121}));
    ASSERT_NE(table->find("JUMP_IF_NOT_EXC_MATCH"), nullptr);
    EXPECT_TRUE(table->find("JUMP_IF_NOT_EXC_MATCH")->alias);
}

TEST_F(InstructionSetBuilderTest, DerivationIsDeterministic)
{
    version::VersionCanonicalizer otherCanon;
    InstructionSetBuilder other(otherCanon);
    for (const char *v : {"1.0", "1.1"})
        ASSERT_TRUE(otherCanon.registerCanonical(v));
    ASSERT_TRUE(other.defineRootTable(
        "1.0",
        {OpcodeDefinition{"LOAD_FAST", 124, OpcodeFlag::LocalIndex, false},
         OpcodeDefinition{"JUMP_FORWARD", 110, OpcodeFlag::RelativeJump, false}}));

    const std::vector<EditOperation> edits = {
        EditOperation::remove("JUMP_FORWARD", 110),
        EditOperation::define("JUMP_FORWARD_NEW", 110, OpcodeFlag::RelativeJump),
        EditOperation::define("NOP", 9, OpcodeFlag::NoArgument)};
    auto a = builder.defineTable("1.1", "1.0", edits);
    auto b = other.defineTable("1.1", "1.0", edits);
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    EXPECT_TRUE(a.value()->sameContents(*b.value()));
    EXPECT_FALSE(a.value()->sameContents(*builder.table("1.0").value()));
}

TEST_F(InstructionSetBuilderTest, LookupCanonicalizesAndFallsBackToFamily)
{
    ASSERT_TRUE(builder.defineRootTable(
        "2.0a1", {OpcodeDefinition{"NOP", 9, OpcodeFlag::NoArgument, false}}));
    ASSERT_TRUE(builder.defineTable("2.0rc1", "2.0a1", {EditOperation::define("POP_TOP", 1)}));

    // Alias of a published version.
    EXPECT_EQ(builder.table("2.0.1").value()->version(), "2.0rc1");
    // Structural match onto the family.
    EXPECT_EQ(builder.table("2.0.7").value()->version(), "2.0rc1");
    EXPECT_EQ(builder.table("2.0a1").value()->version(), "2.0a1");

    // Another implementation of the same release is a separate family.
    auto pypy = builder.table("2.0pypy");
    ASSERT_FALSE(pypy);
    EXPECT_EQ(registryDiagCode(pypy.error()), RegistryDiagCode::UnknownVersion);

    EXPECT_EQ(builder.publishedVersions(),
              (std::vector<std::string>{"1.0", "2.0a1", "2.0rc1"}));
}

TEST_F(InstructionSetBuilderTest, LatestFamilyMemberWins)
{
    ASSERT_TRUE(builder.defineTable("1.1", "1.0", {}));
    ASSERT_TRUE(canon.registerCanonical("1.1b9"));
    EXPECT_EQ(builder.table("1.1b9").value()->version(), "1.1");
    ASSERT_TRUE(canon.registerCanonical("1.1c1"));
    ASSERT_TRUE(builder.defineTable("1.1c1", "1.1", {}));
    EXPECT_EQ(builder.table("1.1b9").value()->version(), "1.1c1");
    // Exact tables are still served as-is.
    EXPECT_EQ(builder.table("1.1").value()->version(), "1.1");
}
