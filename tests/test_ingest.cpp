/**
 * @file test_ingest.cpp
 * @brief Tests for repository directory walking and license detection
 */

#include <gtest/gtest.h>
#include "autodeploy/Errors.hpp"
#include "autodeploy/Ingest.hpp"

#include "test_support.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

using namespace autodeploy;
using autodeploy::fixtures::sample_policy;

namespace {

/**
 * @brief RAII helper for a temporary repository checkout.
 */
class TempRepo {
public:
    TempRepo()
        : root_(fs::temp_directory_path() / ("autodeploy_repo_" + std::to_string(std::rand()))) {
        fs::create_directories(root_);
    }

    ~TempRepo() {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    void write(const std::string& relative, const std::string& content) const {
        const fs::path file = root_ / relative;
        fs::create_directories(file.parent_path());
        std::ofstream out(file, std::ios::binary);
        out << content;
    }

    std::string path() const { return root_.string(); }

private:
    fs::path root_;
};

const std::vector<std::string> kExtensions = {".c", ".h", ".cpp"};

} // anonymous namespace

TEST(IngestTest, SourceExtensionMatchIsCaseInsensitive) {
    EXPECT_TRUE(has_source_extension("src/a.c", kExtensions));
    EXPECT_TRUE(has_source_extension("SRC/A.C", kExtensions));
    EXPECT_TRUE(has_source_extension("x.CPP", {".Cpp"}));
    EXPECT_FALSE(has_source_extension("README.md", kExtensions));
    EXPECT_FALSE(has_source_extension("Makefile", kExtensions));
}

TEST(IngestTest, WalksRepositoryInSortedOrder) {
    TempRepo repo;
    repo.write("src/zeta.c", "int zeta;\n");
    repo.write("include/alpha.h", "int alpha(void);\n");
    repo.write("src/nested/beta.cpp", "int beta = 1;\n");
    repo.write("docs/notes.md", "# notes\n");

    LicensePolicy policy = sample_policy();
    PolicyLicenseResolver resolver(policy);
    RepositoryInput input = load_repository(RepositoryDescriptor{repo.path(), "core", 4, "MIT"}, resolver,
                                            kExtensions);

    EXPECT_EQ(input.id, "core");
    EXPECT_EQ(input.trust_rank, 4);
    EXPECT_EQ(input.license.identifier, "MIT");
    ASSERT_EQ(input.files.size(), 3u);
    EXPECT_EQ(input.files[0].path, "include/alpha.h");
    EXPECT_EQ(input.files[1].path, "src/nested/beta.cpp");
    EXPECT_EQ(input.files[2].path, "src/zeta.c");
    EXPECT_EQ(input.files[2].content, "int zeta;\n");
}

TEST(IngestTest, MissingRootRaisesFileNotFound) {
    LicensePolicy policy = sample_policy();
    PolicyLicenseResolver resolver(policy);
    EXPECT_THROW(load_repository(RepositoryDescriptor{"/nonexistent/autodeploy/repo", "gone", 1, ""},
                                 resolver, kExtensions),
                 FileNotFoundError);
}

TEST(IngestTest, UndeclaredLicenseIsUnknown) {
    TempRepo repo;
    LicensePolicy policy = sample_policy();
    PolicyLicenseResolver resolver(policy);
    RepositoryInput input = load_repository(RepositoryDescriptor{repo.path(), "bare", 1, ""}, resolver,
                                            kExtensions);
    EXPECT_EQ(input.license.identifier, "UNKNOWN");
    EXPECT_TRUE(input.license.text.empty());
    EXPECT_TRUE(input.files.empty());
}

TEST(IngestTest, LicenseFileOverridesDeclaration) {
    TempRepo repo;
    repo.write("LICENSE", "Copyright (c) 2024 Example\n\nSPDX-License-Identifier: Apache-2.0\n");

    LicensePolicy policy = sample_policy();
    LicenseFileResolver resolver(policy);
    LicenseInfo info = resolver.resolve(RepositoryDescriptor{repo.path(), "lib", 1, "MIT"});
    EXPECT_EQ(info.identifier, "Apache-2.0");
    EXPECT_EQ(info.text, "Licensed under the Apache License.");
}
