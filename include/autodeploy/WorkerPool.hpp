/**
 * @file WorkerPool.hpp
 * @brief Fixed fan-out of index-parallel work onto std::thread
 */

#ifndef AUTODEPLOY_WORKER_POOL_HPP
#define AUTODEPLOY_WORKER_POOL_HPP

#include <cstddef>
#include <functional>

namespace autodeploy {

/**
 * @brief Number of threads to use for a configured value
 *
 * 0 means one per hardware thread (at least 1).
 */
std::size_t resolve_worker_count(int configured);

/**
 * @brief Run `fn(i)` for every i in [0, count) on up to `workers` threads
 *
 * Indices are handed out dynamically. If calls throw, the exception of
 * the lowest failing index is rethrown after all threads joined, so the
 * outcome does not depend on scheduling.
 */
void parallel_for(std::size_t count, std::size_t workers, const std::function<void(std::size_t)>& fn);

} // namespace autodeploy

#endif // AUTODEPLOY_WORKER_POOL_HPP
