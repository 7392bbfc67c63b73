/**
 * @file cancellation.cpp
 * @brief CancellationToken implementation.
 *
 * @copyright Copyright (c) 2024 StorjCloud Contributors
 * @license MIT License
 */

#include "storjcloud/utils/cancellation.hpp"

namespace storjcloud {
namespace utils {

CancellationToken::Ptr CancellationToken::create() {
    return Ptr(new CancellationToken());
}

CancellationToken::Ptr CancellationToken::createChild() {
    Ptr child(new CancellationToken());

    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_.load(std::memory_order_acquire)) {
        child->cancelled_.store(true, std::memory_order_release);
        return child;
    }

    // Drop expired children so long-running parents do not grow unbounded
    std::vector<std::weak_ptr<CancellationToken>> alive;
    alive.reserve(children_.size() + 1);
    for (auto& weak : children_) {
        if (!weak.expired()) {
            alive.push_back(std::move(weak));
        }
    }
    alive.push_back(child);
    children_ = std::move(alive);
    return child;
}

void CancellationToken::cancel() {
    std::vector<std::weak_ptr<CancellationToken>> children;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        children.swap(children_);
    }
    cv_.notify_all();

    for (auto& weak : children) {
        if (auto child = weak.lock()) {
            child->cancel();
        }
    }
}

bool CancellationToken::waitFor(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]() {
        return cancelled_.load(std::memory_order_acquire);
    });
}

}  // namespace utils
}  // namespace storjcloud
