/**
 * @file cancellation.hpp
 * @brief Hierarchical cancellation signal shared by workers.
 *
 * A token is cancelled once and stays cancelled. Cancelling a token
 * cancels every child created from it; cancelling a child leaves the
 * parent untouched. Workers poll isCancelled() at their suspension
 * points, and sleepers use waitFor() so that a cancel wakes them early.
 *
 * @copyright Copyright (c) 2024 StorjCloud Contributors
 * @license MIT License
 */

#pragma once

#include "storjcloud/utils/export.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

namespace storjcloud {
namespace utils {

class STORJCLOUD_UTILS_API CancellationToken {
public:
    using Ptr = std::shared_ptr<CancellationToken>;

    /**
     * @brief Create a root token.
     */
    static Ptr create();

    /**
     * @brief Create a token cancelled together with this one.
     * A child of an already-cancelled token starts cancelled.
     */
    Ptr createChild();

    /**
     * @brief Cancel this token and all of its children. Idempotent.
     */
    void cancel();

    bool isCancelled() const {
        return cancelled_.load(std::memory_order_acquire);
    }

    /**
     * @brief Block until cancelled or the timeout elapses.
     * @return True if the token was cancelled.
     */
    bool waitFor(std::chrono::milliseconds timeout) const;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

private:
    CancellationToken() = default;

    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::vector<std::weak_ptr<CancellationToken>> children_;
};

/**
 * @brief Null-safe check used by code that takes an optional token.
 */
inline bool isCancelled(const CancellationToken* token) {
    return token != nullptr && token->isCancelled();
}

}  // namespace utils
}  // namespace storjcloud
