/**
 * @file worker_pool.cpp
 * @brief WorkerPool implementation.
 * @author Dimitris Kafetzis
 */

#include "executor/worker_pool.hpp"

namespace thermal_guard {

WorkerPool::WorkerPool(size_t num_threads) {
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 2;
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this](std::stop_token stop) {
            worker_loop(stop);
        });
    }
}

WorkerPool::~WorkerPool() {
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    jobs_cv_.notify_all();
    workers_.clear();
}

void WorkerPool::worker_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        std::function<void()> job;
        {
            std::unique_lock lock(jobs_mutex_);
            jobs_cv_.wait(lock, stop, [this] { return !jobs_.empty(); });
            if (jobs_.empty()) continue;

            job = std::move(jobs_.front());
            jobs_.pop();
        }

        ++busy_;
        job();
        --busy_;
    }
}

size_t WorkerPool::busy_count() const noexcept {
    return busy_.load();
}

size_t WorkerPool::queued_count() const noexcept {
    std::lock_guard lock(jobs_mutex_);
    return jobs_.size();
}

size_t WorkerPool::thread_count() const noexcept {
    return workers_.size();
}

}  // namespace thermal_guard
