/**
 * @file HttpSegmentUploader.hpp
 * @brief Delivers artifacts to the storage server over HTTP with bounded retries.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <string>
#include "domain/SegmentUploader.hpp"

namespace audiovault::infrastructure {

/**
 * @struct UploaderSettings
 * @brief Endpoint and retry policy.
 */
struct UploaderSettings {
    std::string serverUrl = "http://localhost:5050"; ///< scheme://host:port
    int maxRetries = 2;                                ///< Total attempts = maxRetries + 1.
    std::chrono::milliseconds retryDelay{1000};
    std::chrono::seconds uploadTimeout{15};
    std::chrono::seconds probeTimeout{3};
};

/**
 * @class HttpSegmentUploader
 * @brief domain::SegmentUploader speaking the storage server's multipart protocol.
 *
 * Connection failures, timeouts and non-201 statuses are retried. Anything
 * else aborts the attempt loop at once. Counters are atomics because the
 * status snapshot is read from other threads.
 */
class HttpSegmentUploader : public domain::SegmentUploader {
public:
    explicit HttpSegmentUploader(UploaderSettings settings);

    bool probe() override;
    bool deliver(const domain::CompressedArtifact& artifact, const domain::SegmentMetadata& metadata) override;
    bool isReachable() const override { return m_reachable.load(); }

    int deliveredCount() const { return m_delivered.load(); }
    int attemptCount() const { return m_attempts.load(); }
    const std::string& serverUrl() const { return m_settings.serverUrl; }

private:
    enum class AttemptOutcome { Delivered, Retry, Abort };

    AttemptOutcome attempt(const std::string& filename,
                           const std::string& content,
                           const std::string& metadataJson,
                           int attemptNumber);

    UploaderSettings m_settings;
    std::atomic<bool> m_reachable{true};
    std::atomic<int> m_delivered{0};
    std::atomic<int> m_attempts{0};
};

} // namespace audiovault::infrastructure
