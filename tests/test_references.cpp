/**
 * @file test_references.cpp
 * @brief Tests for ${section.key} reference cleanup
 */

#include <gtest/gtest.h>
#include "inimerge/References.hpp"

#include <string>

using namespace inimerge;

// ============================================================================
// find_references
// ============================================================================

TEST(FindReferences, ExtractsSectionAndKey) {
    auto refs = find_references("${env:esp32.build_flags} -DX ${common.lib_deps}");
    ASSERT_EQ(refs.size(), 2u);
    EXPECT_EQ(refs[0], (Reference{"env:esp32", "build_flags"}));
    EXPECT_EQ(refs[1], (Reference{"common", "lib_deps"}));
}

TEST(FindReferences, SplitsAtLastDot) {
    auto refs = find_references("${env:board.v2.flags}");
    ASSERT_EQ(refs.size(), 1u);
    EXPECT_EQ(refs[0].section, "env:board.v2");
    EXPECT_EQ(refs[0].key, "flags");
}

TEST(FindReferences, IgnoresNonReferences) {
    EXPECT_TRUE(find_references("$HOME ${nodot} ${.key} ${sec.} plain").empty());
}

// ============================================================================
// reference_resolves
// ============================================================================

TEST(ReferenceResolves, ExistingNonEmptyOnly) {
    auto doc = parse_document("[a]\nfull = x\nempty =\n");
    auto policy = default_policy();

    EXPECT_TRUE(reference_resolves(doc, {"a", "full"}, "a", policy));
    EXPECT_FALSE(reference_resolves(doc, {"a", "empty"}, "a", policy));
    EXPECT_FALSE(reference_resolves(doc, {"a", "missing"}, "a", policy));
    EXPECT_FALSE(reference_resolves(doc, {"b", "full"}, "a", policy));
}

TEST(ReferenceResolves, ThisAndExternalSections) {
    auto doc = parse_document("[env:uno]\nboard = uno\n");
    auto policy = default_policy();

    EXPECT_TRUE(reference_resolves(doc, {"this", "board"}, "env:uno", policy));
    EXPECT_FALSE(reference_resolves(doc, {"this", "board"}, "other", policy));
    EXPECT_TRUE(reference_resolves(doc, {"sysenv", "HOME"}, "env:uno", policy));
}

// ============================================================================
// resolve_references
// ============================================================================

TEST(ResolveReferences, DropsDanglingLineAndClearsScalar) {
    auto doc = parse_document(
        "[env]\n"
        "build_flags =\n"
        "\t-DKEEP\n"
        "\t${gone.flags}\n"
        "board = ${gone.board}\n");
    MergeResult r;

    EXPECT_TRUE(resolve_references(doc, default_policy(), r));
    EXPECT_EQ(doc.find_value("env", "build_flags")->as_lines(), Lines{"-DKEEP"});
    EXPECT_TRUE(doc.find_value("env", "board")->empty());
    EXPECT_EQ(r.stats.references_cleaned, 2);
    EXPECT_EQ(r.stats.reference_passes, 1);
    EXPECT_TRUE(r.warnings.empty());
}

TEST(ResolveReferences, CascadesThroughEmptiedValues) {
    auto doc = parse_document(
        "[a]\nv = ${b.v}\n"
        "[b]\nv = ${c.v}\n");
    MergeResult r;

    EXPECT_TRUE(resolve_references(doc, default_policy(), r));
    EXPECT_TRUE(doc.find_value("a", "v")->empty());
    EXPECT_TRUE(doc.find_value("b", "v")->empty());
    EXPECT_EQ(r.stats.reference_passes, 2);
}

TEST(ResolveReferences, CycleOfLiveReferencesIsFixedPoint) {
    auto doc = parse_document(
        "[a]\nv = ${b.v}\n"
        "[b]\nv = ${a.v}\n");
    MergeResult r;

    EXPECT_TRUE(resolve_references(doc, default_policy(), r));
    EXPECT_EQ(doc.find_value("a", "v")->as_scalar(), "${b.v}");
    EXPECT_EQ(r.stats.references_cleaned, 0);
    EXPECT_EQ(r.stats.reference_passes, 0);
}

namespace {

// s0.v -> s1.v -> ... -> s{length-1}.v -> missing.v
std::string chain(int length) {
    std::string text;
    for (int i = 0; i < length; ++i) {
        const std::string next = (i + 1 < length) ? "s" + std::to_string(i + 1) : "missing";
        text += "[s" + std::to_string(i) + "]\nv = ${" + next + ".v}\n";
    }
    return text;
}

} // anonymous namespace

TEST(ResolveReferences, ChainWithinCapReachesFixedPoint) {
    auto doc = parse_document(chain(100));
    MergeResult r;

    EXPECT_TRUE(resolve_references(doc, default_policy(), r));
    EXPECT_EQ(r.stats.reference_passes, 100);
    EXPECT_EQ(r.stats.references_cleaned, 100);
    EXPECT_TRUE(r.warnings.empty());
}

TEST(ResolveReferences, ChainBeyondCapWarns) {
    auto doc = parse_document(chain(101));
    MergeResult r;

    EXPECT_FALSE(resolve_references(doc, default_policy(), r));
    EXPECT_EQ(r.stats.reference_passes, 100);
    ASSERT_EQ(r.warnings.size(), 1u);
    EXPECT_NE(r.warnings[0].find("fixed point"), std::string::npos);
    EXPECT_TRUE(r.success);
    // s0 still holds its reference: the cap stopped before reaching it
    EXPECT_FALSE(doc.find_value("s0", "v")->empty());
}

TEST(ResolveReferences, CapComesFromPolicy) {
    auto policy = default_policy();
    policy.max_reference_passes = 3;
    auto doc = parse_document(chain(5));
    MergeResult r;

    EXPECT_FALSE(resolve_references(doc, policy, r));
    EXPECT_EQ(r.stats.reference_passes, 3);
    EXPECT_EQ(r.warnings.size(), 1u);
}
