// Bounded worker pool for independent matrix cells.
#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace matrixrun::detail {

[[nodiscard]] inline std::size_t default_concurrency(std::size_t task_count) {
    const unsigned hw   = std::thread::hardware_concurrency();
    std::size_t    jobs = hw == 0 ? 1u : static_cast<std::size_t>(hw);
    jobs                = std::max<std::size_t>(1, std::min(jobs, task_count));
    return jobs;
}

// Calls func(i) for every i in [0, task_count), handing out indices in order.
// The first exception thrown by func is rethrown after all workers joined.
template <typename Func>
void parallel_for(std::size_t task_count, std::size_t jobs, Func &&func) {
    if (task_count == 0) {
        return;
    }
    jobs = std::max<std::size_t>(1, std::min(jobs, task_count));
    if (jobs == 1) {
        for (std::size_t i = 0; i < task_count; ++i) {
            func(i);
        }
        return;
    }

    std::atomic<std::size_t> next{0};
    std::exception_ptr       first_error;
    std::mutex               error_mutex;
    std::vector<std::thread> threads;
    threads.reserve(jobs);
    for (std::size_t t = 0; t < jobs; ++t) {
        threads.emplace_back([&] {
            while (true) {
                const std::size_t idx = next.fetch_add(1, std::memory_order_relaxed);
                if (idx >= task_count) {
                    return;
                }
                try {
                    func(idx);
                } catch (...) {
                    std::lock_guard<std::mutex> lock(error_mutex);
                    if (!first_error)
                        first_error = std::current_exception();
                    next.store(task_count, std::memory_order_relaxed);
                    return;
                }
            }
        });
    }
    for (auto &th : threads) {
        th.join();
    }
    if (first_error)
        std::rethrow_exception(first_error);
}

} // namespace matrixrun::detail
