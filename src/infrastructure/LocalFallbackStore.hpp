/**
 * @file LocalFallbackStore.hpp
 * @brief Durable local persistence for artifacts that could not be delivered.
 */

#pragma once

#include <atomic>
#include <string>
#include "domain/AudioSegment.hpp"
#include "domain/SegmentMetadata.hpp"

namespace audiovault::infrastructure {

/**
 * @class LocalFallbackStore
 * @brief Copies artifacts into a directory laid out like the server's storage (artifact + .json sidecar).
 */
class LocalFallbackStore {
public:
    static constexpr const char* kServerUnreachable = "storage_server_unreachable";

    explicit LocalFallbackStore(const std::string& directory);

    /**
     * @brief Persists an artifact and its annotated sidecar.
     * @param reason Stored as local_fallback_reason.
     * @return False only when the disk refused the write; the error is logged, never thrown.
     */
    bool store(const domain::CompressedArtifact& artifact,
               const domain::SegmentMetadata& metadata,
               const std::string& reason);

    const std::string& directory() const { return m_directory; }
    int storedCount() const { return m_stored.load(); }

private:
    std::string m_directory;
    std::atomic<int> m_stored{0};
};

} // namespace audiovault::infrastructure
