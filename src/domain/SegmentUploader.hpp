/**
 * @file SegmentUploader.hpp
 * @brief Interface for delivering artifacts to the remote storage service.
 */

#pragma once

#include "domain/AudioSegment.hpp"
#include "domain/SegmentMetadata.hpp"

namespace audiovault::domain {

/**
 * @class SegmentUploader
 * @brief Abstract delivery transport.
 */
class SegmentUploader {
public:
    virtual ~SegmentUploader() = default;

    /** @brief Cheap liveness check, run once when a session starts. */
    virtual bool probe() = 0;

    /**
     * @brief Delivers one artifact with its metadata.
     * @return True once the remote store acknowledged it; false means the caller must fall back.
     */
    virtual bool deliver(const CompressedArtifact& artifact, const SegmentMetadata& metadata) = 0;

    /** @brief Outcome of the most recent network attempt. */
    virtual bool isReachable() const = 0;
};

} // namespace audiovault::domain
