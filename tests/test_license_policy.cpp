/**
 * @file test_license_policy.cpp
 * @brief Tests for the injected license policy and license resolvers
 */

#include <gtest/gtest.h>
#include "autodeploy/Errors.hpp"
#include "autodeploy/LicensePolicy.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

using namespace autodeploy;

namespace {

LicensePolicy sample_policy() {
    return LicensePolicy::from_json(Value{
        {"MIT", {{"permissiveness", 3}, {"combinable_with", {"Apache-2.0", "GPL-3.0"}}, {"text", "MIT text"}}},
        {"Apache-2.0", {{"permissiveness", 2}}},
        {"GPL-3.0", {{"permissiveness", 1}}},
        {"GPL-3.0-or-later", {{"permissiveness", 1}}}
    });
}

} // anonymous namespace

// ============================================================================
// Policy table
// ============================================================================

TEST(LicensePolicyTest, PermissivenessFromTable) {
    auto policy = sample_policy();
    EXPECT_EQ(policy.permissiveness("MIT"), 3);
    EXPECT_EQ(policy.permissiveness("GPL-3.0"), 1);
}

TEST(LicensePolicyTest, UnknownRanksBelowEverything) {
    auto policy = sample_policy();
    EXPECT_EQ(policy.permissiveness("WTFPL"), LicensePolicy::kUnknownPermissiveness);
    EXPECT_LT(policy.permissiveness("WTFPL"), policy.permissiveness("GPL-3.0"));
}

TEST(LicensePolicyTest, CombinableIsSymmetric) {
    auto policy = sample_policy();
    EXPECT_TRUE(policy.combinable("MIT", "Apache-2.0"));
    EXPECT_TRUE(policy.combinable("Apache-2.0", "MIT"));
    EXPECT_FALSE(policy.combinable("Apache-2.0", "GPL-3.0"));
}

TEST(LicensePolicyTest, IdenticalLicensesAlwaysCombine) {
    auto policy = sample_policy();
    EXPECT_TRUE(policy.combinable("GPL-3.0", "GPL-3.0"));
    EXPECT_TRUE(policy.combinable("Custom", "Custom"));
}

TEST(LicensePolicyTest, UnknownCombinesOnlyWithItself) {
    auto policy = sample_policy();
    EXPECT_FALSE(policy.combinable("Custom", "MIT"));
    EXPECT_FALSE(policy.combinable("MIT", "Custom"));
}

TEST(LicensePolicyTest, TextLookup) {
    auto policy = sample_policy();
    EXPECT_EQ(policy.text("MIT"), "MIT text");
    EXPECT_EQ(policy.text("GPL-3.0"), "");
    EXPECT_EQ(policy.text("nope"), "");
}

TEST(LicensePolicyTest, NullTableIsEmpty) {
    EXPECT_TRUE(LicensePolicy::from_json(Value()).entries().empty());
}

TEST(LicensePolicyTest, MalformedEntriesNameTheKey) {
    try {
        LicensePolicy::from_json(Value{{"MIT", {{"permissiveness", "high"}}}});
        FAIL() << "expected TypeError";
    } catch (const TypeError& e) {
        EXPECT_EQ(e.path(), "licenses.MIT.permissiveness");
    }
    EXPECT_THROW(LicensePolicy::from_json(Value{{"MIT", 3}}), TypeError);
    EXPECT_THROW(LicensePolicy::from_json(Value{{"MIT", {{"combinable_with", {1}}}}}), TypeError);
    EXPECT_THROW(LicensePolicy::from_json(Value::array()), TypeError);
}

// ============================================================================
// Resolvers
// ============================================================================

TEST(PolicyLicenseResolverTest, DeclaredLicenseWithPolicyText) {
    auto policy = sample_policy();
    PolicyLicenseResolver resolver(policy);
    RepositoryDescriptor repo{"/src/a", "alpha", 1, "MIT"};
    LicenseInfo info = resolver.resolve(repo);
    EXPECT_EQ(info.identifier, "MIT");
    EXPECT_EQ(info.text, "MIT text");
}

TEST(PolicyLicenseResolverTest, UndeclaredIsUnknown) {
    auto policy = sample_policy();
    PolicyLicenseResolver resolver(policy);
    EXPECT_EQ(resolver.resolve(RepositoryDescriptor{"/src/a", "alpha", 1, ""}).identifier, "UNKNOWN");
}

TEST(LicenseFileResolverTest, SpdxLineWins) {
    auto policy = sample_policy();
    LicenseFileResolver resolver(policy);
    EXPECT_EQ(resolver.identify("Copyright 2020\n// SPDX-License-Identifier: Apache-2.0\nMIT\n"),
              "Apache-2.0");
}

TEST(LicenseFileResolverTest, LongestPolicyIdentifierWins) {
    auto policy = sample_policy();
    LicenseFileResolver resolver(policy);
    EXPECT_EQ(resolver.identify("Licensed under GPL-3.0-or-later.\n"), "GPL-3.0-or-later");
    EXPECT_EQ(resolver.identify("All rights reserved.\n"), "");
}

TEST(LicenseFileResolverTest, ReadsLicenseFileOrFallsBack) {
    auto policy = sample_policy();
    LicenseFileResolver resolver(policy);

    const fs::path root = fs::temp_directory_path() / ("autodeploy_lic_" + std::to_string(std::rand()));
    fs::create_directories(root);

    RepositoryDescriptor repo{root.string(), "alpha", 1, "GPL-3.0"};
    EXPECT_EQ(resolver.resolve(repo).identifier, "GPL-3.0");

    {
        std::ofstream out(root / "COPYING");
        out << "MIT License\n\nPermission is hereby granted...\n";
    }
    LicenseInfo info = resolver.resolve(repo);
    EXPECT_EQ(info.identifier, "MIT");
    EXPECT_EQ(info.text, "MIT text");

    std::error_code ec;
    fs::remove_all(root, ec);
}
