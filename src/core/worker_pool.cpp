/**
 * @file worker_pool.cpp
 * @brief WorkerPool thread management.
 *
 * @copyright Copyright (c) 2024 StorjCloud Contributors
 * @license MIT License
 */

#include "storjcloud/core/worker_pool.hpp"
#include "storjcloud/utils/logger.hpp"

namespace storjcloud {
namespace core {

WorkerPool::WorkerPool(size_t threads, std::string name)
    : name_(std::move(name))
{
    if (threads == 0) {
        throw std::invalid_argument(name_ + " requires at least one thread");
    }

    workers_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back(&WorkerPool::workerLoop, this);
    }
    LOG_DEBUG(name_.c_str(), "Started {} worker threads", threads);
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && workers_.empty()) {
            return;
        }
        stopping_ = true;
    }
    cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

void WorkerPool::workerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });

            if (stopping_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        ++active_;
        // packaged_task captures exceptions into the future
        task();
        --active_;
    }
}

}  // namespace core
}  // namespace storjcloud
