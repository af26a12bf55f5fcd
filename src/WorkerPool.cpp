/**
 * @file WorkerPool.cpp
 * @brief parallel_for implementation
 */

#include "autodeploy/WorkerPool.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace autodeploy {

std::size_t resolve_worker_count(int configured) {
    if (configured > 0) {
        return static_cast<std::size_t>(configured);
    }
    return std::max(1U, std::thread::hardware_concurrency());
}

void parallel_for(std::size_t count, std::size_t workers, const std::function<void(std::size_t)>& fn) {
    if (count == 0) {
        return;
    }
    workers = std::max<std::size_t>(1, std::min(workers, count));

    if (workers == 1) {
        for (std::size_t i = 0; i < count; ++i) fn(i);
        return;
    }

    std::atomic<std::size_t> next{0};
    std::mutex error_mutex;
    std::size_t error_index = count;
    std::exception_ptr error;

    auto worker = [&]() {
        for (std::size_t i = next++; i < count; i = next++) {
            try {
                fn(i);
            } catch (...) {
                std::lock_guard<std::mutex> lock(error_mutex);
                if (i < error_index) {
                    error_index = i;
                    error = std::current_exception();
                }
            }
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (std::size_t t = 0; t < workers; ++t) {
        threads.emplace_back(worker);
    }
    for (auto& th : threads) {
        th.join();
    }

    if (error) {
        std::rethrow_exception(error);
    }
}

} // namespace autodeploy
