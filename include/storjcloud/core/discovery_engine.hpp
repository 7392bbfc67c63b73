/**
 * @file discovery_engine.hpp
 * @brief Concurrent candidate probing with identity deduplication.
 *
 * Probes run on a fixed-size worker pool and report through a result
 * queue. The first confirmed result for a node ID wins; later results
 * for the same ID are dropped. Individual probe failures never fail the
 * scan.
 *
 * @copyright Copyright (c) 2024 StorjCloud Contributors
 * @license MIT License
 */

#pragma once

#include "storjcloud/core/candidate_source.hpp"
#include "storjcloud/core/export.hpp"
#include "storjcloud/core/node.hpp"
#include "storjcloud/core/port_validator.hpp"
#include "storjcloud/utils/cancellation.hpp"

#include <memory>
#include <string>
#include <vector>

namespace storjcloud {
namespace core {

struct Rejection {
    Candidate candidate;
    RejectReason reason = RejectReason::UNREACHABLE;
    std::string detail;
};

struct ScanReport {
    std::vector<Node> nodes;            ///< Completion order, unique by node ID
    std::vector<Rejection> rejections;
    size_t candidates = 0;
    size_t duplicates = 0;              ///< Confirmed probes dropped by dedup
    bool cancelled = false;
};

class STORJCLOUD_CORE_API DiscoveryEngine {
public:
    explicit DiscoveryEngine(std::shared_ptr<NodeProber> prober);

    /**
     * @brief Probe every candidate of the source.
     * @param host Scan host; candidates without a host use it.
     * @param source Candidate source (reset before use).
     * @param concurrency Maximum concurrent probes.
     * @param cancel Optional cancellation token.
     * @throws ConfigurationError if concurrency is 0 or the source is empty.
     * @throws EnvironmentError if the host does not resolve.
     */
    ScanReport scan(const std::string& host,
                    CandidateSource& source,
                    size_t concurrency,
                    const utils::CancellationToken* cancel = nullptr);

private:
    std::shared_ptr<NodeProber> prober_;
};

}  // namespace core
}  // namespace storjcloud
