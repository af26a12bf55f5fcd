/**
 * @file Value.hpp
 * @brief JSON value type shared by configuration, reports and output
 *
 * Uses nlohmann::json as the underlying value model for:
 * - Layered engine settings (defaults, files, environment, overrides)
 * - The license policy table
 * - JSON forms of the Merged Unit and the Conflict Report
 */

#ifndef AUTODEPLOY_VALUE_HPP
#define AUTODEPLOY_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace autodeploy {

/**
 * @brief JSON-like value type
 *
 * Alias for nlohmann::json. See the nlohmann::json documentation for the
 * complete API.
 */
using Value = nlohmann::json;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "array", "object")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    return "unknown";
}

} // namespace autodeploy

#endif // AUTODEPLOY_VALUE_HPP
