/**
 * @file sync_engine.hpp
 * @brief Scheduled, batched polling of registered nodes.
 *
 * Each tick takes a snapshot of the registered-node list, splits it into
 * ordered batches and runs them concurrently. Nodes of a batch are polled
 * concurrently, retried per policy, and their metrics pushed to the
 * dashboard. A per-tick deadline cancels stragglers; after cancellation
 * the tick waits at most the grace period and reports what completed.
 *
 * State machine:
 * @code
 *   IDLE -> TICKING -> AWAITING_BATCHES -> IDLE
 *     \________________________________________-> CANCELLED (terminal)
 * @endcode
 *
 * @copyright Copyright (c) 2024 StorjCloud Contributors
 * @license MIT License
 */

#pragma once

#include "storjcloud/core/node.hpp"
#include "storjcloud/core/worker_pool.hpp"
#include "storjcloud/services/dashboard_client.hpp"
#include "storjcloud/services/export.hpp"
#include "storjcloud/services/metrics_poller.hpp"
#include "storjcloud/utils/cancellation.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace storjcloud {
namespace services {

enum class BackoffPolicy {
    FIXED,
    EXPONENTIAL
};

STORJCLOUD_SERVICES_API const char* backoffPolicyToString(BackoffPolicy policy);

struct SyncSettings {
    std::chrono::milliseconds interval{300000};
    size_t batchSize = 10;
    size_t maxConcurrentBatches = 2;
    bool retryFailed = true;
    int retryAttempts = 3;                          ///< Retries after the first poll
    BackoffPolicy backoff = BackoffPolicy::EXPONENTIAL;
    std::chrono::milliseconds retryDelay{1000};
    std::chrono::milliseconds maxRetryDelay{30000};
    std::chrono::milliseconds pollTimeout{10000};   ///< Per node status request
    std::chrono::milliseconds tickDeadline{120000};
    std::chrono::milliseconds gracePeriod{5000};
    bool refreshEachTick = true;                    ///< Refetch the node list every tick
    bool exitOnDashboardUnreachable = false;
};

enum class SyncState {
    IDLE,
    TICKING,
    AWAITING_BATCHES,
    CANCELLED
};

STORJCLOUD_SERVICES_API const char* syncStateToString(SyncState state);

enum class SystemicError {
    NONE,
    AUTHENTICATION,          ///< Dashboard answered 401
    DASHBOARD_UNREACHABLE    ///< Node list or every push failed at transport level
};

/**
 * @brief Result for one node in one tick.
 */
struct SyncOutcome {
    core::RegisteredNode node;
    bool success = false;
    std::optional<std::string> error;
    PollError pollError = PollError::NONE;     ///< Final poll failure, if any
    ApiStatus pushStatus = ApiStatus::OK;      ///< Push result when a push was attempted
    bool pushed = false;
    int retriesUsed = 0;
};

/**
 * @brief Aggregate of one tick. Outcomes are in completion order.
 */
struct TickSummary {
    uint64_t tick = 0;
    size_t nodes = 0;
    size_t batches = 0;
    size_t succeeded = 0;
    size_t failed = 0;
    std::vector<SyncOutcome> outcomes;
    bool deadlineExceeded = false;
    bool cancelled = false;
    SystemicError systemicError = SystemicError::NONE;
    std::string systemicMessage;

    void record(SyncOutcome outcome) {
        if (outcome.success) {
            ++succeeded;
        } else {
            ++failed;
        }
        outcomes.push_back(std::move(outcome));
    }
};

class STORJCLOUD_SERVICES_API SyncEngine {
public:
    using Batch = std::vector<core::RegisteredNode>;

    /**
     * @throws core::ConfigurationError if batch size or batch concurrency is 0.
     */
    SyncEngine(SyncSettings settings,
               std::shared_ptr<DashboardApi> dashboard,
               std::shared_ptr<NodePoller> poller);

    ~SyncEngine();

    SyncEngine(const SyncEngine&) = delete;
    SyncEngine& operator=(const SyncEngine&) = delete;

    /**
     * @brief Stable split into consecutive batches of at most batchSize.
     */
    static std::vector<Batch> partition(const std::vector<core::RegisteredNode>& nodes,
                                        size_t batchSize);

    /**
     * @brief Delay before retry number retryIndex (0-based).
     */
    std::chrono::milliseconds backoffDelay(int retryIndex) const;

    /**
     * @brief Run one tick. Never throws for dashboard or node failures;
     * systemic failures are reported in the summary.
     */
    TickSummary runTick(utils::CancellationToken& cancel);

    /**
     * @brief Tick immediately, then every interval until cancelled.
     * @throws core::AuthenticationError when the dashboard rejects the token.
     * @throws core::DashboardUnavailableError when the dashboard is
     *         unreachable for a tick and exitOnDashboardUnreachable is set.
     */
    void run(utils::CancellationToken& cancel);

    SyncState state() const { return state_.load(); }

    uint64_t ticks() const { return ticks_.load(); }

    const SyncSettings& settings() const { return settings_; }

private:
    struct TickState;

    std::shared_ptr<const std::vector<core::RegisteredNode>> snapshotNodes(
        TickSummary& summary, utils::CancellationToken& cancel);

    void runBatch(const Batch& batch,
                  const std::shared_ptr<utils::CancellationToken>& token,
                  const std::shared_ptr<TickState>& state);

    SyncOutcome processNode(const core::RegisteredNode& node,
                            utils::CancellationToken& token,
                            TickState& state);

    void escalate(const TickSummary& summary);

    SyncSettings settings_;
    std::shared_ptr<DashboardApi> dashboard_;
    std::shared_ptr<NodePoller> poller_;

    // nodePool_ is declared first so it outlives batch tasks waiting on it
    std::unique_ptr<core::WorkerPool> nodePool_;
    std::unique_ptr<core::WorkerPool> batchPool_;

    std::shared_ptr<const std::vector<core::RegisteredNode>> cachedNodes_;
    std::atomic<SyncState> state_{SyncState::IDLE};
    std::atomic<uint64_t> ticks_{0};
};

}  // namespace services
}  // namespace storjcloud
