/**
 * @file DotPath.hpp
 * @brief Dot-notation access into the settings tree
 *
 * Settings keys are addressed as "engine.near_duplicate_threshold" or
 * "repositories.0.path". Numeric segments index into arrays.
 *
 * Lookup rules:
 * - get_by_dot() without default throws KeyError on a missing segment
 * - get_by_dot() with default returns the default for a missing segment,
 *   but still throws TypeError when asked to descend into a scalar
 * - contains_dot() returns false for a missing segment and throws
 *   TypeError for an impossible traversal
 * - set_by_dot() creates intermediate objects unless told not to
 */

#ifndef AUTODEPLOY_DOTPATH_HPP
#define AUTODEPLOY_DOTPATH_HPP

#include "autodeploy/Value.hpp"

#include <string>
#include <vector>

namespace autodeploy {

/**
 * @brief Split "a.b.c" into {"a", "b", "c"}; empty segments are dropped
 */
std::vector<std::string> split_dot_path(const std::string& path);

/**
 * @brief Join segments with '.'
 */
std::string join_dot_path(const std::vector<std::string>& segments);

/**
 * @brief Resolve a dot-path (strict)
 *
 * @param data Root value
 * @param path Dot-separated path; empty means the root itself
 * @return Pointer into `data`
 * @throws KeyError if a segment is missing or an array index is out of range
 * @throws TypeError if traversal reaches a scalar before the last segment
 */
const Value* get_by_dot(const Value& data, const std::string& path);

/**
 * @brief Resolve a dot-path, falling back to a default
 *
 * @return Pointer into `data`, or `&default_val` if a segment is missing
 * @throws TypeError if traversal reaches a scalar before the last segment
 */
const Value* get_by_dot(const Value& data, const std::string& path, const Value& default_val);

/**
 * @brief Store a value at a dot-path
 *
 * @param data Root value (modified in place)
 * @param path Dot-separated path
 * @param value Value to store
 * @param create_missing Create (or overwrite with) objects along the way
 * @throws KeyError if `create_missing` is false and a segment is missing
 * @throws TypeError if `create_missing` is false and a segment is not an object
 */
void set_by_dot(Value& data, const std::string& path, const Value& value,
                bool create_missing = true);

/**
 * @brief Check whether a dot-path resolves
 * @throws TypeError if traversal reaches a scalar before the last segment
 */
bool contains_dot(const Value& data, const std::string& path);

} // namespace autodeploy

#endif // AUTODEPLOY_DOTPATH_HPP
