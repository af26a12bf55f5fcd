/**
 * @file Loader.cpp
 * @brief Settings and source file loading
 */

#include "autodeploy/Loader.hpp"
#include "autodeploy/Errors.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace autodeploy {

namespace {

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

/// 1-based line and column of a byte offset
std::pair<int, int> locate(const std::string& content, std::size_t byte) {
    int line = 1;
    int column = 1;
    const std::size_t end = std::min(byte, content.size());
    for (std::size_t i = 0; i < end; ++i) {
        if (content[i] == '\n') {
            ++line;
            column = 1;
        } else {
            ++column;
        }
    }
    return {line, column};
}

template <typename T>
std::string stream_string(const T& v) {
    std::ostringstream ss;
    ss << v;
    return ss.str();
}

Value toml_to_json(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());
        case toml::node_type::integer:
            return Value(node.as_integer()->get());
        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());
        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());
        case toml::node_type::date:
            return Value(stream_string(node.as_date()->get()));
        case toml::node_type::time:
            return Value(stream_string(node.as_time()->get()));
        case toml::node_type::date_time:
            return Value(stream_string(node.as_date_time()->get()));
        case toml::node_type::array: {
            Value arr = Value::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_to_json(elem));
            }
            return arr;
        }
        case toml::node_type::table: {
            Value obj = Value::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_to_json(val);
            }
            return obj;
        }
        default:
            return Value(nullptr);
    }
}

} // anonymous namespace

std::string read_text_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

Value load_json_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string content = read_text_file(path);
    try {
        return Value::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        auto [line, column] = locate(content, e.byte > 0 ? e.byte - 1 : 0);
        throw ConfigParseError(path, line, column, e.what());
    }
}

Value load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    try {
        toml::table table = toml::parse_file(path);
        return toml_to_json(table);
    } catch (const toml::parse_error& e) {
        throw ConfigParseError(
            path,
            static_cast<int>(e.source().begin.line),
            static_cast<int>(e.source().begin.column),
            std::string(e.description())
        );
    }
}

std::string get_file_extension(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return ext;
}

Value load_config_file(const std::string& path) {
    if (path.empty()) {
        return Value::object();
    }
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string ext = get_file_extension(path);
    if (ext == ".json") {
        return load_json_file(path);
    }
    if (ext == ".toml") {
        return load_toml_file(path);
    }
    throw ConfigError("Unsupported settings file type: " + ext + " (expected .json or .toml)");
}

} // namespace autodeploy
