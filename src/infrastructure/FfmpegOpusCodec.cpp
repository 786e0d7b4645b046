/**
 * @file FfmpegOpusCodec.cpp
 * @brief Implementation of FfmpegOpusCodec.
 */

#include "infrastructure/FfmpegOpusCodec.hpp"
#include "infrastructure/AudioUtils.hpp"
#include "infrastructure/ProcessRunner.hpp"
#include "infrastructure/ScopedTempFile.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace audiovault::infrastructure {

namespace fs = std::filesystem;

FfmpegOpusCodec::FfmpegOpusCodec(EncoderSettings settings, bool encoderAvailable)
    : m_settings(std::move(settings))
    , m_encoderAvailable(encoderAvailable)
{}

domain::CompressedArtifact FfmpegOpusCodec::compress(const domain::PendingSegment& segment,
                                                     int sampleRate,
                                                     const std::string& baseName,
                                                     const std::string& outputDir) {
    fs::path base = fs::path(outputDir) / baseName;
    fs::path wavPath = base;
    wavPath += ".wav";

    if (!m_encoderAvailable) {
        return writeRaw(segment, sampleRate, wavPath.string());
    }

    fs::path opusPath = base;
    opusPath += ".opus";

    ScopedTempFile tmpWav(".wav");
    if (!AudioUtils::WriteWavFile(segment.samples, sampleRate, tmpWav.string())) {
        throw std::runtime_error("cannot write temporary WAV " + tmpWav.string());
    }

    std::vector<std::string> cmd = {
        m_settings.binary,
        "-y",
        "-loglevel", "error",
        "-i", tmpWav.string(),
        "-c:a", "libopus",
        "-b:a", m_settings.bitrate,
        "-ar", std::to_string(sampleRate),
        "-ac", "1",
        "-application", "voip",
        "-frame_duration", std::to_string(m_settings.frameDurationMs),
        opusPath.string()
    };

    CommandResult result = ProcessRunner::Run(cmd, m_settings.timeout);
    if (!result.succeeded()) {
        ++m_failedInvocations;
        if (result.timedOut) {
            std::cerr << "[FfmpegOpusCodec] Encoder timed out after "
                      << m_settings.timeout.count() << " ms" << std::endl;
        } else {
            std::cerr << "[FfmpegOpusCodec] Encoder exited with " << result.exitCode
                      << ": " << result.output << std::endl;
        }
        std::error_code ec;
        fs::remove(opusPath, ec);
        domain::CompressedArtifact raw = writeRaw(segment, sampleRate, wavPath.string());
        std::cerr << "[FfmpegOpusCodec] Fell back to WAV: " << raw.path << std::endl;
        return raw;
    }

    domain::CompressedArtifact artifact;
    artifact.path = opusPath.string();
    artifact.sizeBytes = fs::file_size(opusPath);
    artifact.format = domain::AudioFormat::Opus;
    artifact.durationSeconds = sampleRate > 0
        ? static_cast<double>(segment.samples.size()) / sampleRate
        : 0.0;

    std::uintmax_t wavSize = fs::file_size(tmpWav.path());
    double ratio = artifact.sizeBytes > 0
        ? static_cast<double>(wavSize) / static_cast<double>(artifact.sizeBytes)
        : 0.0;
    m_lastRatio = ratio;
    std::cout << "[FfmpegOpusCodec] Compressed: " << wavSize << "B -> " << artifact.sizeBytes
              << "B (" << std::fixed << std::setprecision(1) << ratio << "x)"
              << std::defaultfloat << std::endl;

    return artifact;
}

domain::CompressedArtifact FfmpegOpusCodec::writeRaw(const domain::PendingSegment& segment,
                                                     int sampleRate,
                                                     const std::string& wavPath) const {
    if (!AudioUtils::WriteWavFile(segment.samples, sampleRate, wavPath)) {
        throw std::runtime_error("cannot write WAV " + wavPath);
    }

    domain::CompressedArtifact artifact;
    artifact.path = wavPath;
    artifact.sizeBytes = fs::file_size(wavPath);
    artifact.format = domain::AudioFormat::Wav;
    artifact.durationSeconds = sampleRate > 0
        ? static_cast<double>(segment.samples.size()) / sampleRate
        : 0.0;
    return artifact;
}

} // namespace audiovault::infrastructure
