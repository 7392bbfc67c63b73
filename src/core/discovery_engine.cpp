/**
 * @file discovery_engine.cpp
 * @brief DiscoveryEngine implementation.
 *
 * @copyright Copyright (c) 2024 StorjCloud Contributors
 * @license MIT License
 */

#include "storjcloud/core/discovery_engine.hpp"
#include "storjcloud/core/blocking_queue.hpp"
#include "storjcloud/core/errors.hpp"
#include "storjcloud/core/worker_pool.hpp"
#include "storjcloud/net/address.hpp"
#include "storjcloud/utils/logger.hpp"
#include "storjcloud/utils/string_utils.hpp"

#include <algorithm>
#include <map>
#include <set>

namespace storjcloud {
namespace core {

namespace {

struct ProbeOutcome {
    Candidate candidate;
    ProbeResult result;
};

constexpr std::chrono::milliseconds kResultPollInterval(100);

}  // namespace

DiscoveryEngine::DiscoveryEngine(std::shared_ptr<NodeProber> prober)
    : prober_(std::move(prober))
{
}

ScanReport DiscoveryEngine::scan(const std::string& host,
                                 CandidateSource& source,
                                 size_t concurrency,
                                 const utils::CancellationToken* cancel) {
    if (concurrency == 0) {
        throw ConfigurationError("discovery concurrency must be at least 1");
    }

    auto hostIp = net::resolveIPv4(host);
    if (!hostIp) {
        throw EnvironmentError("cannot resolve host '" + host + "'");
    }

    std::vector<Candidate> candidates;
    source.reset();
    while (auto candidate = source.next()) {
        if (candidate->host.empty()) {
            candidate->host = host;
        }
        candidates.push_back(std::move(*candidate));
    }
    if (candidates.empty()) {
        throw ConfigurationError("no candidates to probe from " + source.describe());
    }

    ScanReport report;
    report.candidates = candidates.size();

    // Probes need a literal address; resolve each distinct host once
    std::map<std::string, std::optional<std::string>> resolved;
    resolved[host] = hostIp;

    std::vector<Candidate> probeable;
    for (auto& candidate : candidates) {
        auto it = resolved.find(candidate.host);
        if (it == resolved.end()) {
            it = resolved.emplace(candidate.host, net::resolveIPv4(candidate.host)).first;
        }
        if (!it->second) {
            report.rejections.push_back({candidate, RejectReason::UNREACHABLE,
                                         "cannot resolve " + candidate.host});
            continue;
        }
        candidate.host = *it->second;
        probeable.push_back(std::move(candidate));
    }

    LOG_INFO("Discovery", "Probing {} candidates from {} ({} workers)",
             probeable.size(), source.describe(), std::min(concurrency, probeable.size()));

    if (!probeable.empty()) {
        BlockingQueue<ProbeOutcome> results;
        WorkerPool pool(std::min(concurrency, probeable.size()), "DiscoveryPool");

        for (const auto& candidate : probeable) {
            pool.submit([this, candidate, cancel, &results]() {
                ProbeOutcome outcome{candidate, {}};
                try {
                    outcome.result = prober_->probe(candidate, cancel);
                } catch (const std::exception& e) {
                    outcome.result.reason = RejectReason::INVALID_RESPONSE;
                    outcome.result.detail = e.what();
                }
                results.push(std::move(outcome));
            });
        }

        std::set<std::string> seen;
        size_t received = 0;
        while (received < probeable.size()) {
            auto outcome = results.pop(kResultPollInterval);
            if (!outcome) {
                continue;
            }
            ++received;

            if (!outcome->result.confirmed()) {
                LOG_DEBUG("Discovery", "{} rejected: {} ({})", outcome->candidate.endpoint(),
                          rejectReasonToString(outcome->result.reason), outcome->result.detail);
                if (outcome->result.reason == RejectReason::CANCELLED) {
                    report.cancelled = true;
                }
                report.rejections.push_back({outcome->candidate, outcome->result.reason,
                                             outcome->result.detail});
                continue;
            }

            Node& node = *outcome->result.node;
            if (!seen.insert(node.nodeId()).second) {
                ++report.duplicates;
                LOG_DEBUG("Discovery", "Duplicate node {} on {}", utils::short_id(node.nodeId()),
                          outcome->candidate.endpoint());
                continue;
            }

            LOG_INFO("Discovery", "Node {} on {} (Status: {}, Used: {} GB)",
                     utils::short_id(node.nodeId()), outcome->candidate.endpoint(),
                     nodeHealthToString(node.status),
                     utils::format_gb(node.diskSpace.used));
            report.nodes.push_back(std::move(node));
        }
        results.close();
    }

    if (utils::isCancelled(cancel)) {
        report.cancelled = true;
    }

    LOG_INFO("Discovery", "Scan complete: {} nodes, {} rejected, {} duplicates",
             report.nodes.size(), report.rejections.size(), report.duplicates);
    return report;
}

}  // namespace core
}  // namespace storjcloud
