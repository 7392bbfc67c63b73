/**
 * @file candidate_source.hpp
 * @brief Lazy, restartable producers of discovery candidates.
 *
 * Every source yields a finite sequence. reset() rewinds it (and for
 * container sources refreshes the container list), so a scan can be
 * repeated against the same source object.
 *
 * @copyright Copyright (c) 2024 StorjCloud Contributors
 * @license MIT License
 */

#pragma once

#include "storjcloud/core/container_runtime.hpp"
#include "storjcloud/core/export.hpp"
#include "storjcloud/core/node.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace storjcloud {
namespace core {

/// Environment variable with the dashboard address, used when 14002 is not published.
constexpr const char* kConsoleAddressVar = "CONSOLE_ADDRESS";

/// Environment variable carrying the external storage address.
constexpr const char* kStorageAddressVar = "ADDRESS";

/**
 * @class CandidateSource
 * @brief Abstract candidate producer.
 */
class STORJCLOUD_CORE_API CandidateSource {
public:
    virtual ~CandidateSource() = default;

    /**
     * @brief Rewind to the first candidate.
     */
    virtual void reset() = 0;

    /**
     * @brief Next candidate, or nullopt at the end of the sequence.
     */
    virtual std::optional<Candidate> next() = 0;

    virtual std::string describe() const = 0;
};

/**
 * @class PortListSource
 * @brief Explicit ports on one host, in the given order.
 */
class STORJCLOUD_CORE_API PortListSource : public CandidateSource {
public:
    PortListSource(std::string host, std::vector<uint16_t> ports);

    void reset() override { index_ = 0; }
    std::optional<Candidate> next() override;
    std::string describe() const override;

private:
    std::string host_;
    std::vector<uint16_t> ports_;
    size_t index_ = 0;
};

/**
 * @class PortRangeSource
 * @brief Inclusive port range on one host.
 */
class STORJCLOUD_CORE_API PortRangeSource : public CandidateSource {
public:
    /**
     * @throws ConfigurationError if first > last or first is 0.
     */
    PortRangeSource(std::string host, uint16_t first, uint16_t last);

    void reset() override { cursor_ = first_; done_ = false; }
    std::optional<Candidate> next() override;
    std::string describe() const override;

private:
    std::string host_;
    uint16_t first_;
    uint16_t last_;
    uint16_t cursor_;
    bool done_ = false;
};

/**
 * @class ContainerSource
 * @brief Candidates derived from running storage node containers.
 *
 * Per container: the published binding of 14002/tcp wins; otherwise
 * CONSOLE_ADDRESS (a malformed value drops the container); otherwise the
 * first published TCP binding of a container port in 14000..15000. A
 * container with none of these yields nothing. Runtime failures are
 * logged and yield nothing; cancellation stops container inspection.
 */
class STORJCLOUD_CORE_API ContainerSource : public CandidateSource {
public:
    /**
     * @param cancel Optional token passed to every runtime request.
     */
    ContainerSource(std::shared_ptr<ContainerRuntime> runtime, std::string host,
                    const utils::CancellationToken* cancel = nullptr);

    void reset() override;
    std::optional<Candidate> next() override;
    std::string describe() const override;

private:
    std::shared_ptr<ContainerRuntime> runtime_;
    std::string host_;
    const utils::CancellationToken* cancel_;
    std::vector<Candidate> candidates_;
    size_t index_ = 0;
    bool loaded_ = false;
};

/**
 * @class ChainedSource
 * @brief Concatenation of several sources.
 */
class STORJCLOUD_CORE_API ChainedSource : public CandidateSource {
public:
    explicit ChainedSource(std::vector<std::unique_ptr<CandidateSource>> sources);

    void reset() override;
    std::optional<Candidate> next() override;
    std::string describe() const override;

private:
    std::vector<std::unique_ptr<CandidateSource>> sources_;
    size_t current_ = 0;
};

/**
 * @brief True for containers running a storage node image or named like one.
 */
STORJCLOUD_CORE_API bool isStorageNodeContainer(const ContainerInfo& container);

/**
 * @brief Derive the dashboard candidate for one container.
 * @param container Listed container.
 * @param env Container environment ("KEY=VALUE").
 * @param host Scan host substituted for wildcard addresses.
 * @return The candidate, or nullopt if the container exposes no dashboard
 *         or carries a malformed CONSOLE_ADDRESS (logged).
 */
STORJCLOUD_CORE_API std::optional<Candidate> candidateFromContainer(
    const ContainerInfo& container,
    const std::vector<std::string>& env,
    const std::string& host);

}  // namespace core
}  // namespace storjcloud
