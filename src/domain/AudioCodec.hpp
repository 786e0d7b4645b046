/**
 * @file AudioCodec.hpp
 * @brief Interface for turning a captured segment into an artifact on disk.
 */

#pragma once

#include <string>
#include "domain/AudioSegment.hpp"

namespace audiovault::domain {

/**
 * @class AudioCodec
 * @brief Abstract encoder used by the recorder worker.
 *
 * Implementations must always produce an artifact: when compression is not
 * possible the segment is written uncompressed instead.
 */
class AudioCodec {
public:
    virtual ~AudioCodec() = default;

    /**
     * @brief Encodes a segment into a file inside outputDir.
     * @param segment Samples and start time.
     * @param sampleRate Capture sample rate in Hz.
     * @param baseName File name without extension.
     * @param outputDir Directory that receives the artifact.
     * @return The written artifact (Opus, or Wav on fallback).
     */
    virtual CompressedArtifact compress(const PendingSegment& segment,
                                        int sampleRate,
                                        const std::string& baseName,
                                        const std::string& outputDir) = 0;
};

} // namespace audiovault::domain
