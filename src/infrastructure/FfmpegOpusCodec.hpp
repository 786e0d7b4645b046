/**
 * @file FfmpegOpusCodec.hpp
 * @brief Opus encoding through an external ffmpeg process, with WAV fallback.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <string>
#include "domain/AudioCodec.hpp"

namespace audiovault::infrastructure {

/**
 * @struct EncoderSettings
 * @brief How the encoder is invoked.
 */
struct EncoderSettings {
    std::string binary = "ffmpeg";
    std::string bitrate = "32k";
    int frameDurationMs = 20;
    std::chrono::milliseconds timeout{30000};
};

/**
 * @class FfmpegOpusCodec
 * @brief domain::AudioCodec backed by ffmpeg/libopus.
 *
 * Availability is decided by the caller when the session is built and never
 * changes afterwards. A failed invocation downgrades only that segment to WAV.
 */
class FfmpegOpusCodec : public domain::AudioCodec {
public:
    FfmpegOpusCodec(EncoderSettings settings, bool encoderAvailable);

    domain::CompressedArtifact compress(const domain::PendingSegment& segment,
                                        int sampleRate,
                                        const std::string& baseName,
                                        const std::string& outputDir) override;

    bool isEncoderAvailable() const { return m_encoderAvailable; }

    /** @brief Number of segments that fell back to WAV after a failed invocation. */
    int failedInvocations() const { return m_failedInvocations.load(); }

    /** @brief Ratio of the last successful compression (raw bytes / encoded bytes). */
    double lastCompressionRatio() const { return m_lastRatio.load(); }

private:
    domain::CompressedArtifact writeRaw(const domain::PendingSegment& segment,
                                        int sampleRate,
                                        const std::string& wavPath) const;

    EncoderSettings m_settings;
    const bool m_encoderAvailable;
    std::atomic<int> m_failedInvocations{0};
    std::atomic<double> m_lastRatio{0.0};
};

} // namespace audiovault::infrastructure
