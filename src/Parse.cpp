/**
 * @file Parse.cpp
 * @brief Implementation of value typing and override parsing
 */

#include "autodeploy/Parse.hpp"
#include "autodeploy/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <regex>

namespace autodeploy {

namespace {

std::string to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

const std::regex& integer_pattern() {
    static const std::regex re("^-?[0-9]+$");
    return re;
}

const std::regex& float_pattern() {
    static const std::regex re("^-?[0-9]+\\.[0-9]+([eE][+-]?[0-9]+)?$");
    return re;
}

void split_pairs(const std::string& entry, std::map<std::string, Value>& out) {
    int depth = 0;
    char quote = '\0';
    std::string buf;

    auto flush = [&]() {
        std::string pair = trim(buf);
        buf.clear();
        if (pair.empty()) return;

        auto pos = pair.find(':');
        if (pos == std::string::npos) {
            throw ConfigError("Invalid override '" + pair + "' (expected key:value)");
        }
        std::string key = trim(pair.substr(0, pos));
        if (key.empty()) {
            throw ConfigError("Invalid override '" + pair + "' (empty key)");
        }
        out[key] = parse_value(trim(pair.substr(pos + 1)));
    };

    for (std::size_t i = 0; i < entry.size(); ++i) {
        char c = entry[i];
        if (quote != '\0') {
            buf += c;
            if (c == quote && entry[i - 1] != '\\') quote = '\0';
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '{' || c == '[') {
            ++depth;
        } else if (c == '}' || c == ']') {
            --depth;
        } else if (c == ',' && depth == 0) {
            flush();
            continue;
        }
        buf += c;
    }
    flush();
}

} // anonymous namespace

Value parse_value(const std::string& str) {
    if (str.empty()) {
        return "";
    }

    const std::string lower = to_lower(str);
    if (lower == "true") return true;
    if (lower == "false") return false;
    if (lower == "null") return nullptr;

    if (std::regex_match(str, integer_pattern())) {
        try {
            return static_cast<std::int64_t>(std::stoll(str));
        } catch (const std::out_of_range&) {
            // Too large for int64: fall through and keep it as text.
        }
    }

    if (std::regex_match(str, float_pattern())) {
        try {
            return std::stod(str);
        } catch (const std::out_of_range&) {
            // Overflowing exponent: keep it as text.
        }
    }

    if ((str.front() == '{' && str.back() == '}') ||
        (str.front() == '[' && str.back() == ']')) {
        Value parsed = Value::parse(str, nullptr, false);
        if (!parsed.is_discarded()) {
            return parsed;
        }
    }

    if (str.size() >= 2 && str.front() == '"' && str.back() == '"') {
        Value parsed = Value::parse(str, nullptr, false);
        if (!parsed.is_discarded() && parsed.is_string()) {
            return parsed;
        }
    }

    return str;
}

std::map<std::string, Value> parse_overrides(const std::vector<std::string>& entries) {
    std::map<std::string, Value> out;
    for (const auto& entry : entries) {
        split_pairs(entry, out);
    }
    return out;
}

} // namespace autodeploy
