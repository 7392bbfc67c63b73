/**
 * @file worker_pool.hpp
 * @brief Fixed-size thread pool returning futures.
 *
 * The number of threads is set at construction and never grows, which
 * bounds the number of concurrent probes or polls regardless of how many
 * tasks are queued.
 *
 * @copyright Copyright (c) 2024 StorjCloud Contributors
 * @license MIT License
 */

#pragma once

#include "storjcloud/core/export.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace storjcloud {
namespace core {

class STORJCLOUD_CORE_API WorkerPool {
public:
    /**
     * @brief Start the worker threads.
     * @param threads Number of threads (must be > 0).
     * @param name Component tag used in log lines.
     * @throws std::invalid_argument if threads is 0.
     */
    explicit WorkerPool(size_t threads, std::string name = "WorkerPool");

    /**
     * @brief Drains queued tasks and joins all workers.
     */
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Queue a task.
     * @return Future for the task result; exceptions thrown by the task
     *         are delivered through the future.
     * @throws std::runtime_error after shutdown().
     */
    template<class F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using ReturnType = std::invoke_result_t<std::decay_t<F>>;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(f));
        std::future<ReturnType> result = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                throw std::runtime_error("submit on stopped " + name_);
            }
            tasks_.emplace([task]() { (*task)(); });
        }
        cv_.notify_one();
        return result;
    }

    /**
     * @brief Stop accepting tasks, run what is queued, join workers.
     * Idempotent.
     */
    void shutdown();

    size_t threadCount() const { return workers_.size(); }

    size_t pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tasks_.size();
    }

    size_t active() const { return active_.load(); }

private:
    void workerLoop();

    std::string name_;
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
    std::atomic<size_t> active_{0};
};

}  // namespace core
}  // namespace storjcloud
