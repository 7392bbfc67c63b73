/**
 * @file sync_engine.cpp
 * @brief SyncEngine implementation.
 *
 * @copyright Copyright (c) 2024 StorjCloud Contributors
 * @license MIT License
 */

#include "storjcloud/services/sync_engine.hpp"
#include "storjcloud/core/errors.hpp"
#include "storjcloud/utils/logger.hpp"
#include "storjcloud/utils/string_utils.hpp"

#include <algorithm>
#include <future>

namespace storjcloud {
namespace services {

namespace {

constexpr std::chrono::milliseconds kWaitSlice(100);

}  // namespace

/// Shared between the tick and its workers; outlives an abandoned tick.
struct SyncEngine::TickState {
    std::mutex mutex;
    TickSummary summary;
    size_t pushesAttempted = 0;
    size_t pushesUnreachable = 0;
    bool unauthorized = false;
    std::string authMessage;
};

const char* backoffPolicyToString(BackoffPolicy policy) {
    switch (policy) {
        case BackoffPolicy::FIXED:       return "fixed";
        case BackoffPolicy::EXPONENTIAL: return "exponential";
        default:                         return "unknown";
    }
}

const char* syncStateToString(SyncState state) {
    switch (state) {
        case SyncState::IDLE:             return "Idle";
        case SyncState::TICKING:          return "Ticking";
        case SyncState::AWAITING_BATCHES: return "AwaitingBatches";
        case SyncState::CANCELLED:        return "Cancelled";
        default:                          return "Unknown";
    }
}

SyncEngine::SyncEngine(SyncSettings settings,
                       std::shared_ptr<DashboardApi> dashboard,
                       std::shared_ptr<NodePoller> poller)
    : settings_(settings)
    , dashboard_(std::move(dashboard))
    , poller_(std::move(poller))
{
    if (settings_.batchSize == 0) {
        throw core::ConfigurationError("sync batch size must be at least 1");
    }
    if (settings_.maxConcurrentBatches == 0) {
        throw core::ConfigurationError("concurrent batches must be at least 1");
    }
    if (settings_.retryAttempts < 0) {
        settings_.retryAttempts = 0;
    }

    nodePool_ = std::make_unique<core::WorkerPool>(
        settings_.batchSize * settings_.maxConcurrentBatches, "SyncNodePool");
    batchPool_ = std::make_unique<core::WorkerPool>(settings_.maxConcurrentBatches, "SyncBatchPool");
}

SyncEngine::~SyncEngine() {
    batchPool_.reset();
    nodePool_.reset();
}

std::vector<SyncEngine::Batch> SyncEngine::partition(const std::vector<core::RegisteredNode>& nodes,
                                                     size_t batchSize) {
    std::vector<Batch> batches;
    if (batchSize == 0) {
        return batches;
    }
    for (size_t i = 0; i < nodes.size(); i += batchSize) {
        size_t end = std::min(nodes.size(), i + batchSize);
        batches.emplace_back(nodes.begin() + i, nodes.begin() + end);
    }
    return batches;
}

std::chrono::milliseconds SyncEngine::backoffDelay(int retryIndex) const {
    if (settings_.backoff == BackoffPolicy::FIXED) {
        return std::min(settings_.retryDelay, settings_.maxRetryDelay);
    }
    auto delay = settings_.retryDelay;
    for (int i = 0; i < retryIndex && delay < settings_.maxRetryDelay; ++i) {
        delay *= 2;
    }
    return std::min(delay, settings_.maxRetryDelay);
}

std::shared_ptr<const std::vector<core::RegisteredNode>> SyncEngine::snapshotNodes(
    TickSummary& summary, utils::CancellationToken& cancel) {
    if (!settings_.refreshEachTick && cachedNodes_ && !cachedNodes_->empty()) {
        return cachedNodes_;
    }

    std::vector<core::RegisteredNode> nodes;
    ApiResult result = dashboard_->listNodes(nodes, &cancel);
    switch (result.status) {
        case ApiStatus::OK:
            cachedNodes_ = std::make_shared<const std::vector<core::RegisteredNode>>(std::move(nodes));
            return cachedNodes_;
        case ApiStatus::UNAUTHORIZED:
            summary.systemicError = SystemicError::AUTHENTICATION;
            summary.systemicMessage = result.message;
            break;
        case ApiStatus::UNREACHABLE:
            summary.systemicError = SystemicError::DASHBOARD_UNREACHABLE;
            summary.systemicMessage = "cannot fetch node list: " + result.message;
            break;
        case ApiStatus::CANCELLED:
            summary.cancelled = true;
            break;
        default:
            LOG_ERROR("Sync", "Failed to get nodes: {}", result.message);
            break;
    }
    return nullptr;
}

TickSummary SyncEngine::runTick(utils::CancellationToken& cancel) {
    TickSummary summary;
    summary.tick = ++ticks_;

    if (cancel.isCancelled()) {
        summary.cancelled = true;
        return summary;
    }

    state_ = SyncState::TICKING;
    auto nodes = snapshotNodes(summary, cancel);
    if (!nodes || nodes->empty()) {
        if (nodes) {
            LOG_DEBUG("Sync", "No registered nodes found");
        }
        state_ = SyncState::IDLE;
        return summary;
    }

    auto batches = partition(*nodes, settings_.batchSize);
    auto tickToken = cancel.createChild();
    auto state = std::make_shared<TickState>();

    LOG_INFO("Sync", "Tick {}: syncing {} nodes in {} batches",
             summary.tick, nodes->size(), batches.size());

    state_ = SyncState::AWAITING_BATCHES;
    std::vector<std::future<void>> pending;
    pending.reserve(batches.size());
    for (auto& batch : batches) {
        pending.push_back(batchPool_->submit([this, batch, tickToken, state]() {
            runBatch(batch, tickToken, state);
        }));
    }

    const auto deadline = std::chrono::steady_clock::now() + settings_.tickDeadline;
    bool interrupted = false;
    for (auto& future : pending) {
        while (!interrupted && future.wait_for(kWaitSlice) != std::future_status::ready) {
            if (cancel.isCancelled()) {
                summary.cancelled = true;
                interrupted = true;
            } else if (std::chrono::steady_clock::now() >= deadline) {
                summary.deadlineExceeded = true;
                interrupted = true;
            }
        }
        if (interrupted) {
            break;
        }
    }

    if (interrupted) {
        LOG_WARN("Sync", "Tick {} {}; waiting up to {} ms for in-flight polls", summary.tick,
                 summary.cancelled ? "cancelled" : "exceeded its deadline",
                 settings_.gracePeriod.count());
        tickToken->cancel();
        const auto graceEnd = std::chrono::steady_clock::now() + settings_.gracePeriod;
        for (auto& future : pending) {
            if (future.wait_until(graceEnd) != std::future_status::ready) {
                LOG_WARN("Sync", "Abandoning batches still running after grace period");
                break;
            }
        }
    }

    for (auto& future : pending) {
        if (future.valid() && future.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready) {
            try {
                future.get();
            } catch (const std::exception& e) {
                LOG_ERROR("Sync", "Batch failed: {}", e.what());
            }
        }
    }

    {
        std::lock_guard<std::mutex> lock(state->mutex);
        summary.nodes = nodes->size();
        summary.batches = batches.size();
        summary.succeeded = state->summary.succeeded;
        summary.failed = state->summary.failed;
        summary.outcomes = state->summary.outcomes;

        if (state->unauthorized) {
            summary.systemicError = SystemicError::AUTHENTICATION;
            summary.systemicMessage = state->authMessage;
        } else if (state->pushesAttempted > 0 && state->pushesUnreachable == state->pushesAttempted) {
            summary.systemicError = SystemicError::DASHBOARD_UNREACHABLE;
            summary.systemicMessage = "all " + std::to_string(state->pushesAttempted) +
                                      " metric pushes failed to reach the dashboard";
        }
    }

    state_ = SyncState::IDLE;
    return summary;
}

void SyncEngine::runBatch(const Batch& batch,
                          const std::shared_ptr<utils::CancellationToken>& token,
                          const std::shared_ptr<TickState>& state) {
    if (token->isCancelled()) {
        return;
    }

    std::vector<std::future<void>> nodes;
    nodes.reserve(batch.size());
    for (const auto& node : batch) {
        nodes.push_back(nodePool_->submit([this, node, token, state]() {
            if (token->isCancelled()) {
                return;
            }
            SyncOutcome outcome = processNode(node, *token, *state);
            std::lock_guard<std::mutex> lock(state->mutex);
            state->summary.record(std::move(outcome));
        }));
    }

    for (auto& future : nodes) {
        future.wait();
    }
    LOG_DEBUG("Sync", "Batch of {} finished", batch.size());
}

SyncOutcome SyncEngine::processNode(const core::RegisteredNode& node,
                                    utils::CancellationToken& token,
                                    TickState& state) {
    SyncOutcome outcome;
    outcome.node = node;
    const std::string shortId = utils::short_id(node.nodeId.empty() ? node.id : node.nodeId);

    PollResult poll;
    int retries = 0;
    while (true) {
        poll = poller_->poll(node, &token);
        if (poll.ok()) {
            break;
        }

        outcome.pollError = poll.error;
        outcome.retriesUsed = retries;
        outcome.error = std::string(pollErrorToString(poll.error)) +
                        (poll.message.empty() ? "" : ": " + poll.message);

        if (poll.error == PollError::CANCELLED || token.isCancelled()) {
            outcome.pollError = PollError::CANCELLED;
            return outcome;
        }
        if (!settings_.retryFailed || retries >= settings_.retryAttempts) {
            LOG_WARN("Sync", "Failed to fetch data for node {} after {} retries: {}",
                     shortId, retries, *outcome.error);
            return outcome;
        }

        auto delay = backoffDelay(retries);
        LOG_DEBUG("Sync", "Node {} poll failed ({}), retry {}/{} in {} ms", shortId,
                  pollErrorToString(poll.error), retries + 1, settings_.retryAttempts, delay.count());
        if (token.waitFor(delay)) {
            outcome.pollError = PollError::CANCELLED;
            return outcome;
        }
        ++retries;
    }

    outcome.retriesUsed = retries;
    outcome.pollError = PollError::NONE;
    outcome.error.reset();

    ApiResult push = dashboard_->pushMetrics(node, *poll.snapshot, &token);
    outcome.pushStatus = push.status;
    outcome.pushed = push.status != ApiStatus::CANCELLED;

    {
        std::lock_guard<std::mutex> lock(state.mutex);
        if (outcome.pushed) {
            ++state.pushesAttempted;
        }
        if (push.status == ApiStatus::UNREACHABLE) {
            ++state.pushesUnreachable;
        }
        if (push.status == ApiStatus::UNAUTHORIZED && !state.unauthorized) {
            state.unauthorized = true;
            state.authMessage = push.message;
        }
    }

    if (push.ok()) {
        outcome.success = true;
        LOG_DEBUG("Sync", "Synced node {}", shortId);
    } else {
        outcome.error = "push " + std::string(apiStatusToString(push.status)) +
                        (push.message.empty() ? "" : ": " + push.message);
        LOG_ERROR("Sync", "Failed to update node {}: {}", shortId, *outcome.error);
        if (push.status == ApiStatus::UNAUTHORIZED) {
            token.cancel();
        }
    }
    return outcome;
}

void SyncEngine::escalate(const TickSummary& summary) {
    switch (summary.systemicError) {
        case SystemicError::AUTHENTICATION:
            state_ = SyncState::CANCELLED;
            LOG_ERROR("Sync", "Authentication failed - check API token");
            throw core::AuthenticationError("dashboard rejected the API token (" +
                                            summary.systemicMessage + ")");
        case SystemicError::DASHBOARD_UNREACHABLE:
            if (settings_.exitOnDashboardUnreachable) {
                state_ = SyncState::CANCELLED;
                throw core::DashboardUnavailableError(summary.systemicMessage);
            }
            LOG_WARN("Sync", "Dashboard unreachable: {}", summary.systemicMessage);
            break;
        default:
            break;
    }
}

void SyncEngine::run(utils::CancellationToken& cancel) {
    LOG_INFO("Sync", "Sync daemon started (interval {} s, batch size {}, {} concurrent batches)",
             settings_.interval.count() / 1000, settings_.batchSize, settings_.maxConcurrentBatches);

    while (!cancel.isCancelled()) {
        TickSummary summary = runTick(cancel);

        if (summary.nodes > 0) {
            LOG_INFO("Sync", "Tick {} completed: {} succeeded, {} failed{}", summary.tick,
                     summary.succeeded, summary.failed,
                     summary.deadlineExceeded ? " (deadline exceeded)" : "");
        }
        for (const auto& outcome : summary.outcomes) {
            if (!outcome.success && outcome.pollError != PollError::CANCELLED) {
                LOG_WARN("Sync", "Node {} failed this tick: {}",
                         utils::short_id(outcome.node.nodeId), outcome.error.value_or("unknown"));
            }
        }

        escalate(summary);

        // Timer and cancellation race; whichever fires first wins
        if (cancel.waitFor(settings_.interval)) {
            break;
        }
    }

    state_ = SyncState::CANCELLED;
    LOG_INFO("Sync", "Sync daemon stopped after {} ticks", ticks_.load());
}

}  // namespace services
}  // namespace storjcloud
