/**
 * @file worker_pool.hpp
 * @brief std::jthread-based worker pool for concurrent backend polls.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <vector>

namespace thermal_guard {

/**
 * @brief Fixed-size pool of std::jthread workers.
 *
 * Callers wait on the returned futures with their own deadline. A task that
 * outlives its caller's deadline keeps its worker busy until it returns, so
 * the pool should be sized to at least the number of concurrent callers.
 */
class WorkerPool {
public:
    explicit WorkerPool(size_t num_threads = 0);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Submit a callable for execution. Exceptions surface through the future.
    template <std::invocable F>
    std::future<std::invoke_result_t<F>> submit(F&& func);

    [[nodiscard]] size_t busy_count() const noexcept;
    [[nodiscard]] size_t queued_count() const noexcept;
    [[nodiscard]] size_t thread_count() const noexcept;

private:
    void worker_loop(std::stop_token stop);

    std::queue<std::function<void()>> jobs_;
    mutable std::mutex jobs_mutex_;
    std::condition_variable_any jobs_cv_;
    std::atomic<size_t> busy_{0};
    std::vector<std::jthread> workers_;   ///< Last: joined before the state above is destroyed
};

// ── Template implementations ─────────────────

template <std::invocable F>
std::future<std::invoke_result_t<F>> WorkerPool::submit(F&& func) {
    using ReturnType = std::invoke_result_t<F>;
    auto promise = std::make_shared<std::promise<ReturnType>>();
    auto future = promise->get_future();

    {
        std::lock_guard lock(jobs_mutex_);
        jobs_.push([p = std::move(promise), f = std::forward<F>(func)]() mutable {
            try {
                if constexpr (std::is_void_v<ReturnType>) {
                    f();
                    p->set_value();
                } else {
                    p->set_value(f());
                }
            } catch (...) {
                p->set_exception(std::current_exception());
            }
        });
    }
    jobs_cv_.notify_one();
    return future;
}

}  // namespace thermal_guard
