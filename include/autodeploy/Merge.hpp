/**
 * @file Merge.hpp
 * @brief Deep merge of settings layers
 *
 * Objects merge key by key; any other value (scalar or array) replaces
 * what was below it. A null override leaves the base untouched.
 */

#ifndef AUTODEPLOY_MERGE_HPP
#define AUTODEPLOY_MERGE_HPP

#include "autodeploy/Value.hpp"

#include <vector>

namespace autodeploy {

/**
 * @brief Merge `override_val` over `base`
 *
 * Example:
 * ```cpp
 * Value base = {{"engine", {{"pass_timeout_seconds", 30}, {"worker_threads", 0}}}};
 * Value over = {{"engine", {{"pass_timeout_seconds", 5}}}};
 * deep_merge(base, over);
 * // {"engine": {"pass_timeout_seconds": 5, "worker_threads": 0}}
 * ```
 */
Value deep_merge(const Value& base, const Value& override_val);

/**
 * @brief Merge layers from lowest to highest precedence
 */
Value deep_merge_all(const std::vector<Value>& layers);

} // namespace autodeploy

#endif // AUTODEPLOY_MERGE_HPP
