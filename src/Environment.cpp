/**
 * @file Environment.cpp
 * @brief Environment variable collection and key mapping
 */

#include "autodeploy/Environment.hpp"
#include "autodeploy/DotPath.hpp"
#include "autodeploy/Parse.hpp"

#include <algorithm>
#include <cctype>

#ifndef _WIN32
extern char** environ;
#endif

namespace autodeploy {

namespace {

bool starts_with_icase(const std::string& str, const std::string& prefix) {
    if (prefix.size() > str.size()) return false;
    return std::equal(prefix.begin(), prefix.end(), str.begin(), [](char a, char b) {
        return std::toupper(static_cast<unsigned char>(a)) ==
               std::toupper(static_cast<unsigned char>(b));
    });
}

std::string normalized_prefix(std::string prefix) {
    while (!prefix.empty() && prefix.back() == '_') {
        prefix.pop_back();
    }
    return prefix + "_";
}

} // anonymous namespace

std::string transform_env_name(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (std::size_t i = 0; i < name.size(); ++i) {
        char c = static_cast<char>(std::tolower(static_cast<unsigned char>(name[i])));
        if (c == '_') {
            if (i + 1 < name.size() && name[i + 1] == '_') {
                out += '_';
                ++i;
            } else {
                out += '.';
            }
        } else {
            out += c;
        }
    }
    return out;
}

std::vector<std::pair<std::string, std::string>> collect_env_vars(const std::string& prefix) {
    std::vector<std::pair<std::string, std::string>> result;
    const std::string match = normalized_prefix(prefix);

#ifndef _WIN32
    if (environ == nullptr) return result;
    for (char** env = environ; *env != nullptr; ++env) {
        std::string entry(*env);
        auto eq = entry.find('=');
        if (eq == std::string::npos) continue;
        std::string name = entry.substr(0, eq);
        if (starts_with_icase(name, match)) {
            result.emplace_back(std::move(name), entry.substr(eq + 1));
        }
    }
#endif

    std::sort(result.begin(), result.end());
    return result;
}

std::set<std::string> flatten_keys(const Value& data, const std::string& prefix) {
    std::set<std::string> keys;
    if (!data.is_object()) {
        if (!prefix.empty()) keys.insert(prefix);
        return keys;
    }
    for (auto it = data.begin(); it != data.end(); ++it) {
        std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();
        keys.insert(key);
        if (it.value().is_object()) {
            auto nested = flatten_keys(it.value(), key);
            keys.insert(nested.begin(), nested.end());
        }
    }
    return keys;
}

std::string remap_env_key(const std::string& dot_path, const std::set<std::string>& known_keys) {
    if (known_keys.count(dot_path) > 0) {
        return dot_path;
    }

    // Re-join trailing segments with '_' (longest dotted head first).
    const auto segments = split_dot_path(dot_path);
    for (std::size_t head = segments.size() - (segments.empty() ? 0 : 1); head > 0; --head) {
        std::string candidate;
        for (std::size_t i = 0; i < segments.size(); ++i) {
            if (i > 0) candidate += (i < head ? "." : "_");
            candidate += segments[i];
        }
        if (known_keys.count(candidate) > 0) {
            return candidate;
        }
    }
    return "";
}

Value env_overrides(const std::vector<std::pair<std::string, std::string>>& vars,
                    const std::string& prefix, const std::set<std::string>& known_keys) {
    Value result = Value::object();
    const std::string match = normalized_prefix(prefix);

    for (const auto& [name, raw] : vars) {
        if (!starts_with_icase(name, match)) continue;
        std::string key = remap_env_key(transform_env_name(name.substr(match.size())), known_keys);
        if (key.empty()) continue;
        set_by_dot(result, key, parse_value(raw));
    }
    return result;
}

} // namespace autodeploy
