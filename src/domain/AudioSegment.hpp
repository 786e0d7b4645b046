/**
 * @file AudioSegment.hpp
 * @brief Domain entities for captured audio segments and the artifacts encoded from them.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace audiovault::domain {

/**
 * @struct PendingSegment
 * @brief A fixed-length slice of captured samples waiting to be encoded and delivered.
 */
struct PendingSegment {
    std::vector<float> samples;                        ///< Mono float samples in [-1, 1].
    std::chrono::system_clock::time_point startedAt;   ///< Wall-clock time of the first sample.
};

/**
 * @enum AudioFormat
 * @brief On-disk representation of an artifact.
 */
enum class AudioFormat {
    Opus, ///< Compressed by the external encoder.
    Wav   ///< Uncompressed 16-bit PCM fallback.
};

inline std::string FormatExtension(AudioFormat format) {
    switch (format) {
        case AudioFormat::Opus: return "opus";
        case AudioFormat::Wav: return "wav";
    }
    return "wav";
}

/**
 * @struct CompressedArtifact
 * @brief The file produced from one PendingSegment.
 */
struct CompressedArtifact {
    std::string path;
    std::uintmax_t sizeBytes = 0;
    AudioFormat format = AudioFormat::Wav;
    double durationSeconds = 0.0;
};

} // namespace audiovault::domain
