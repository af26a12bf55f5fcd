/**
 * @file test_loader.cpp
 * @brief Tests for settings and source file loading
 *
 * Tests cover:
 * - JSON settings files, including syntax error positions
 * - TOML settings files with nested tables and arrays
 * - Extension-based dispatch
 * - Raw file reading
 */

#include <gtest/gtest.h>
#include "autodeploy/Errors.hpp"
#include "autodeploy/Loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

using namespace autodeploy;

// ============================================================================
// Test fixtures and helpers
// ============================================================================

/**
 * @brief RAII helper for creating temporary files.
 */
class TempFile {
public:
    TempFile(const std::string& content, const std::string& extension = ".json")
        : path_(fs::temp_directory_path() /
                ("autodeploy_test_" + std::to_string(std::rand()) + extension)) {
        std::ofstream out(path_, std::ios::binary);
        out << content;
    }

    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

// ============================================================================
// JSON
// ============================================================================

TEST(LoadJsonTest, ParsesNestedSettings) {
    TempFile file(R"({"engine": {"pass_timeout_seconds": 5, "export_roots": ["main"]}})");
    Value v = load_json_file(file.path());
    EXPECT_EQ(v["engine"]["pass_timeout_seconds"], 5);
    EXPECT_EQ(v["engine"]["export_roots"], (Value{"main"}));
}

TEST(LoadJsonTest, MissingFileRaisesFileNotFound) {
    try {
        load_json_file("/nonexistent/autodeploy.json");
        FAIL() << "expected FileNotFoundError";
    } catch (const FileNotFoundError& e) {
        EXPECT_EQ(e.path(), "/nonexistent/autodeploy.json");
    }
}

TEST(LoadJsonTest, SyntaxErrorCarriesPosition) {
    TempFile file("{\n  \"engine\": {\n    \"worker_threads\": ,\n  }\n}");
    try {
        load_json_file(file.path());
        FAIL() << "expected ConfigParseError";
    } catch (const ConfigParseError& e) {
        EXPECT_EQ(e.file(), file.path());
        EXPECT_EQ(e.line(), 3);
        EXPECT_GT(e.column(), 1);
    }
}

// ============================================================================
// TOML
// ============================================================================

TEST(LoadTomlTest, TablesBecomeObjects) {
    TempFile file(
        "[engine]\n"
        "near_duplicate_threshold = 0.2\n"
        "allow_incompatible_cycles = true\n"
        "enabled_optimization_passes = [\"dead_code_elimination\"]\n"
        "\n"
        "[licenses.MIT]\n"
        "permissiveness = 3\n",
        ".toml");

    Value v = load_toml_file(file.path());
    EXPECT_DOUBLE_EQ(v["engine"]["near_duplicate_threshold"].get<double>(), 0.2);
    EXPECT_EQ(v["engine"]["allow_incompatible_cycles"], true);
    EXPECT_EQ(v["engine"]["enabled_optimization_passes"], (Value{"dead_code_elimination"}));
    EXPECT_EQ(v["licenses"]["MIT"]["permissiveness"], 3);
}

TEST(LoadTomlTest, ArrayOfTablesBecomesArrayOfObjects) {
    TempFile file(
        "[[repositories]]\n"
        "id = \"alpha\"\n"
        "path = \"/src/alpha\"\n"
        "trust_rank = 2\n"
        "\n"
        "[[repositories]]\n"
        "id = \"beta\"\n"
        "path = \"/src/beta\"\n",
        ".toml");

    Value v = load_toml_file(file.path());
    ASSERT_TRUE(v["repositories"].is_array());
    ASSERT_EQ(v["repositories"].size(), 2u);
    EXPECT_EQ(v["repositories"][0]["trust_rank"], 2);
    EXPECT_EQ(v["repositories"][1]["id"], "beta");
}

TEST(LoadTomlTest, SyntaxErrorCarriesPosition) {
    TempFile file("[engine]\nworker_threads = = 3\n", ".toml");
    try {
        load_toml_file(file.path());
        FAIL() << "expected ConfigParseError";
    } catch (const ConfigParseError& e) {
        EXPECT_EQ(e.line(), 2);
    }
}

// ============================================================================
// Dispatch and helpers
// ============================================================================

TEST(LoadConfigFileTest, DispatchesOnExtension) {
    TempFile json_file(R"({"logging": {"level": "warn"}})", ".JSON");
    TempFile toml_file("[logging]\nlevel = \"debug\"\n", ".toml");
    EXPECT_EQ(load_config_file(json_file.path())["logging"]["level"], "warn");
    EXPECT_EQ(load_config_file(toml_file.path())["logging"]["level"], "debug");
}

TEST(LoadConfigFileTest, EmptyPathYieldsEmptyObject) {
    EXPECT_EQ(load_config_file(""), Value::object());
}

TEST(LoadConfigFileTest, UnsupportedExtension) {
    TempFile file("level: info\n", ".yaml");
    EXPECT_THROW(load_config_file(file.path()), ConfigError);
}

TEST(LoadConfigFileTest, MissingFile) {
    EXPECT_THROW(load_config_file("/nonexistent/settings.toml"), FileNotFoundError);
}

TEST(FileExtensionTest, LowercasesAndKeepsDot) {
    EXPECT_EQ(get_file_extension("a/b/Settings.TOML"), ".toml");
    EXPECT_EQ(get_file_extension("src/util.c"), ".c");
    EXPECT_EQ(get_file_extension("Makefile"), "");
}

TEST(ReadTextFileTest, ReadsBytesVerbatim) {
    TempFile file("int x = 1;\r\n", ".c");
    EXPECT_EQ(read_text_file(file.path()), "int x = 1;\r\n");
}

TEST(ReadTextFileTest, MissingFile) {
    EXPECT_THROW(read_text_file("/nonexistent/x.c"), FileNotFoundError);
}
