/**
 * @file FfmpegDecoder.hpp
 * @brief Decodes stored artifacts back to 16-bit PCM WAV through ffmpeg.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include "infrastructure/ProcessRunner.hpp"

namespace audiovault::infrastructure {

class FfmpegDecoder {
public:
    FfmpegDecoder(std::string binary, std::chrono::milliseconds timeout);

    /** @brief True when the decoder binary was found on PATH at construction. */
    bool isAvailable() const { return m_available; }

    /**
     * @brief ffmpeg -y -i in -c:a pcm_s16le -ar rate -ac 1 out
     * @param exactSamples When set, the output is padded or trimmed to exactly this many
     *        samples, undoing codec frame padding.
     */
    CommandResult decode(const std::string& inputPath,
                         const std::string& outputPath,
                         int sampleRate,
                         std::optional<std::uint64_t> exactSamples = std::nullopt) const;

private:
    std::string m_binary;
    std::chrono::milliseconds m_timeout;
    bool m_available;
};

} // namespace audiovault::infrastructure
