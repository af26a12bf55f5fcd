/**
 * @file Environment.hpp
 * @brief Environment variable layer of the settings
 *
 * Variables named `AUTODEPLOY_<KEY>` override settings keys:
 * - the prefix is matched case-insensitively and stripped
 * - the rest is lowercased, `__` becomes `_` and `_` becomes `.`
 * - a name that does not hit a known key exactly is retried with the
 *   trailing segments re-joined by `_`, so
 *   AUTODEPLOY_ENGINE_PASS_TIMEOUT_SECONDS reaches engine.pass_timeout_seconds
 * - names that still match no known key are discarded
 * - values are typed with parse_value()
 */

#ifndef AUTODEPLOY_ENVIRONMENT_HPP
#define AUTODEPLOY_ENVIRONMENT_HPP

#include "autodeploy/Value.hpp"

#include <set>
#include <string>
#include <utility>
#include <vector>

namespace autodeploy {

/// Default prefix of engine environment variables
inline constexpr const char* kEnvPrefix = "AUTODEPLOY";

/**
 * @brief Apply the underscore mapping to a variable name (prefix already stripped)
 *
 * - ENGINE_WORKER__THREADS -> engine.worker_threads
 * - LOGGING_LEVEL -> logging.level
 */
std::string transform_env_name(const std::string& name);

/**
 * @brief Collect `PREFIX_*` variables from the process environment
 * @return (name, value) pairs with the prefix still attached, sorted by name
 */
std::vector<std::pair<std::string, std::string>> collect_env_vars(const std::string& prefix);

/**
 * @brief Every dot-path present in `data`, objects included
 */
std::set<std::string> flatten_keys(const Value& data, const std::string& prefix = "");

/**
 * @brief Map a transformed name onto a known key
 * @return The matching key, or an empty string if none matches
 */
std::string remap_env_key(const std::string& dot_path, const std::set<std::string>& known_keys);

/**
 * @brief Build the environment layer
 *
 * @param vars (name, value) pairs as returned by collect_env_vars()
 * @param prefix Prefix to strip
 * @param known_keys Keys accepted from the environment
 * @return Nested object ready for deep_merge()
 */
Value env_overrides(const std::vector<std::pair<std::string, std::string>>& vars,
                    const std::string& prefix, const std::set<std::string>& known_keys);

} // namespace autodeploy

#endif // AUTODEPLOY_ENVIRONMENT_HPP
