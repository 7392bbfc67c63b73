/**
 * @file blocking_queue.hpp
 * @brief Unbounded multi-producer result channel.
 *
 * Producers push until the queue is closed. Consumers block in pop()
 * with a timeout; once closed, pop() drains what is left and then
 * returns nullopt immediately.
 *
 * @copyright Copyright (c) 2024 StorjCloud Contributors
 * @license MIT License
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace storjcloud {
namespace core {

template<typename T>
class BlockingQueue {
public:
    BlockingQueue() = default;

    ~BlockingQueue() {
        close();
    }

    BlockingQueue(const BlockingQueue&) = delete;
    BlockingQueue& operator=(const BlockingQueue&) = delete;

    /**
     * @return False if the queue was already closed (item dropped).
     */
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    /**
     * @brief Wait up to timeout for the next item.
     * @return The item, or nullopt on timeout or when closed and empty.
     */
    std::optional<T> pop(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this]() { return closed_ || !items_.empty(); });

        if (items_.empty()) {
            return std::nullopt;
        }

        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    bool closed_ = false;
};

}  // namespace core
}  // namespace storjcloud
