/**
 * @file SegmentMetadata.cpp
 * @brief Implementation of SegmentMetadata.
 */

#include "domain/SegmentMetadata.hpp"
#include <cmath>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace audiovault::domain {

namespace {

std::tm ToLocalTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    return tm;
}

double RoundTo2(double value) {
    return std::round(value * 100.0) / 100.0;
}

} // namespace

SegmentMetadata SegmentMetadata::Describe(const PendingSegment& segment,
                                          const CompressedArtifact& artifact,
                                          int sampleRate) {
    SegmentMetadata meta;
    meta.timestamp = FormatIsoTimestamp(segment.startedAt);
    meta.timestampUnixMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        segment.startedAt.time_since_epoch()).count();
    meta.durationSeconds = sampleRate > 0
        ? static_cast<double>(segment.samples.size()) / sampleRate
        : 0.0;
    meta.sampleRate = sampleRate;
    meta.numSamples = segment.samples.size();
    meta.format = FormatExtension(artifact.format);
    meta.originalFilename = std::filesystem::path(artifact.path).filename().string();
    meta.fileSizeBytes = artifact.sizeBytes;
    return meta;
}

nlohmann::json SegmentMetadata::toJson() const {
    return {
        {"timestamp", timestamp},
        {"timestamp_unix", timestampUnixMs},
        {"duration_seconds", RoundTo2(durationSeconds)},
        {"sample_rate", sampleRate},
        {"num_samples", numSamples},
        {"format", format},
        {"original_filename", originalFilename},
        {"file_size_bytes", fileSizeBytes}
    };
}

std::string SidecarPathFor(const std::string& artifactPath) {
    std::filesystem::path p(artifactPath);
    p.replace_extension(".json");
    return p.string();
}

std::string FormatIsoTimestamp(std::chrono::system_clock::time_point tp) {
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm = ToLocalTime(tt);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        tp.time_since_epoch()).count() % 1000000;
    if (micros < 0) micros += 1000000;

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setw(6) << std::setfill('0') << micros;
    return ss.str();
}

} // namespace audiovault::domain
