/**
 * @file Parse.hpp
 * @brief Typing of string values from the environment and `--set` overrides
 *
 * Parsing order (first match wins):
 * - "true"/"false" (case-insensitive) become booleans
 * - "null" (case-insensitive) becomes null
 * - ^-?[0-9]+$ becomes an integer
 * - ^-?[0-9]+\.[0-9]+([eE][+-]?[0-9]+)?$ becomes a float
 * - {...} and [...] are parsed as JSON when well-formed
 * - "..." is unquoted (JSON escapes honoured)
 * - anything else stays a raw string
 */

#ifndef AUTODEPLOY_PARSE_HPP
#define AUTODEPLOY_PARSE_HPP

#include "autodeploy/Value.hpp"

#include <map>
#include <string>
#include <vector>

namespace autodeploy {

/**
 * @brief Parse a string into a typed Value
 *
 * ```cpp
 * parse_value("0.2")                       // 0.2
 * parse_value("[\"dead_code_elimination\"]") // array
 * parse_value("info")                      // "info"
 * ```
 */
Value parse_value(const std::string& str);

/**
 * @brief Parse `key:value` override strings
 *
 * Each entry may hold several comma-separated pairs; commas inside JSON
 * brackets or quotes do not split. Values are typed with parse_value().
 *
 * @param entries Raw strings as given on the command line
 * @return Dot-path keys mapped to typed values
 * @throws ConfigError if a pair has no ':' or an empty key
 */
std::map<std::string, Value> parse_overrides(const std::vector<std::string>& entries);

} // namespace autodeploy

#endif // AUTODEPLOY_PARSE_HPP
