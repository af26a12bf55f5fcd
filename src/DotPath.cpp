/**
 * @file DotPath.cpp
 * @brief Implementation of dot-path utilities
 */

#include "autodeploy/DotPath.hpp"
#include "autodeploy/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace autodeploy {

std::vector<std::string> split_dot_path(const std::string& path) {
    std::vector<std::string> segments;
    std::string current;

    for (char c : path) {
        if (c != '.') {
            current += c;
        } else if (!current.empty()) {
            segments.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) {
        segments.push_back(current);
    }
    return segments;
}

std::string join_dot_path(const std::vector<std::string>& segments) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) oss << '.';
        oss << segments[i];
    }
    return oss.str();
}

namespace {

// "0" or a digit string without leading zeros
bool is_array_index(const std::string& segment) {
    if (segment.empty()) return false;
    if (segment[0] == '0' && segment.size() > 1) return false;
    return std::all_of(segment.begin(), segment.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

/**
 * @brief Step from `node` into child `seg`
 * @return The child, or nullptr if it does not exist
 * @throws TypeError if `node` is not a container
 */
const Value* step(const Value& node, const std::string& seg, const std::string& path) {
    if (node.is_object()) {
        auto it = node.find(seg);
        return it == node.end() ? nullptr : &*it;
    }
    if (node.is_array()) {
        if (!is_array_index(seg)) return nullptr;
        std::size_t idx = std::stoull(seg);
        return idx < node.size() ? &node[idx] : nullptr;
    }
    throw TypeError(path, "object or array", type_name(node));
}

} // anonymous namespace

const Value* get_by_dot(const Value& data, const std::string& path) {
    const Value* current = &data;
    for (const auto& seg : split_dot_path(path)) {
        current = step(*current, seg, path);
        if (current == nullptr) {
            throw KeyError(path, seg);
        }
    }
    return current;
}

const Value* get_by_dot(const Value& data, const std::string& path, const Value& default_val) {
    const Value* current = &data;
    for (const auto& seg : split_dot_path(path)) {
        current = step(*current, seg, path);
        if (current == nullptr) {
            return &default_val;
        }
    }
    return current;
}

bool contains_dot(const Value& data, const std::string& path) {
    const Value* current = &data;
    for (const auto& seg : split_dot_path(path)) {
        current = step(*current, seg, path);
        if (current == nullptr) {
            return false;
        }
    }
    return true;
}

void set_by_dot(Value& data, const std::string& path, const Value& value, bool create_missing) {
    const auto segments = split_dot_path(path);
    if (segments.empty()) {
        data = value;
        return;
    }

    Value* current = &data;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        const auto& seg = segments[i];
        const bool last = i + 1 == segments.size();

        if (current->is_array() && is_array_index(seg) && std::stoull(seg) < current->size()) {
            Value& child = (*current)[std::stoull(seg)];
            if (last) {
                child = value;
                return;
            }
            current = &child;
            continue;
        }

        if (!current->is_object()) {
            if (!create_missing) {
                throw TypeError(path, "object", type_name(*current));
            }
            *current = Value::object();
        }

        if (last) {
            (*current)[seg] = value;
            return;
        }

        if (!current->contains(seg)) {
            if (!create_missing) {
                throw KeyError(path, seg);
            }
            (*current)[seg] = Value::object();
        }
        current = &(*current)[seg];
    }
}

} // namespace autodeploy
