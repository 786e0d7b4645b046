/**
 * @file SegmentMetadata.hpp
 * @brief Metadata record that travels with every artifact and is stored as its sidecar.
 */

#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "domain/AudioSegment.hpp"

namespace audiovault::domain {

/**
 * @struct SegmentMetadata
 * @brief Recorder-side description of an artifact.
 *
 * Server-side enrichment (received_at, stored_filename, ...) is added to the
 * JSON form directly, so unknown keys survive a round trip through a sidecar.
 */
struct SegmentMetadata {
    std::string timestamp;          ///< ISO-8601 local time of the segment start.
    std::int64_t timestampUnixMs = 0;
    double durationSeconds = 0.0;
    int sampleRate = 0;
    std::uint64_t numSamples = 0;
    std::string format;             ///< "opus" or "wav".
    std::string originalFilename;
    std::uintmax_t fileSizeBytes = 0;

    /** @brief Builds the record for an artifact encoded from a segment. */
    static SegmentMetadata Describe(const PendingSegment& segment,
                                    const CompressedArtifact& artifact,
                                    int sampleRate);

    nlohmann::json toJson() const;
};

/** @brief Sidecar sits next to the artifact: same stem, ".json" extension. */
std::string SidecarPathFor(const std::string& artifactPath);

/** @brief ISO-8601 local timestamp with microseconds, e.g. 2026-10-18T16:44:02.123456. */
std::string FormatIsoTimestamp(std::chrono::system_clock::time_point tp);

} // namespace audiovault::domain
