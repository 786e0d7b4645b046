/**
 * @file SegmentRecorder.cpp
 * @brief Implementation of SegmentRecorder.
 */

#include "application/SegmentRecorder.hpp"
#include "domain/SegmentMetadata.hpp"
#include "infrastructure/PathUtils.hpp"

#include <cmath>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace audiovault::application {

namespace fs = std::filesystem;

namespace {

std::string SegmentBaseName(std::chrono::system_clock::time_point tp) {
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm = {};
    localtime_r(&tt, &tm);
    std::ostringstream ss;
    ss << "audio_" << std::put_time(&tm, "%Y-%m-%d_%H-%M-%S");
    return ss.str();
}

/** Removes a scratch directory and everything in it on scope exit. */
class ScratchDirGuard {
public:
    explicit ScratchDirGuard(fs::path dir) : m_dir(std::move(dir)) {}
    ~ScratchDirGuard() {
        std::error_code ec;
        fs::remove_all(m_dir, ec);
    }
    ScratchDirGuard(const ScratchDirGuard&) = delete;
    ScratchDirGuard& operator=(const ScratchDirGuard&) = delete;

    const fs::path& path() const { return m_dir; }

private:
    fs::path m_dir;
};

double Round2(double v) {
    return std::round(v * 100.0) / 100.0;
}

} // namespace

nlohmann::json RecorderStatus::toJson() const {
    return {
        {"running", running},
        {"storage_server_url", storageServerUrl},
        {"server_reachable", serverReachable},
        {"segment_seconds", segmentSeconds},
        {"segments_processed", segmentsProcessed},
        {"uploaded", uploaded},
        {"local_fallback", localFallback},
        {"total_duration", Round2(totalDurationSeconds)},
        {"buffer_seconds", Round2(bufferedSeconds)}
    };
}

SegmentRecorder::SegmentRecorder(RecorderSettings settings,
                                 std::shared_ptr<domain::AudioCodec> codec,
                                 std::shared_ptr<domain::SegmentUploader> uploader,
                                 std::shared_ptr<infrastructure::LocalFallbackStore> fallback)
    : m_settings(std::move(settings))
    , m_codec(std::move(codec))
    , m_uploader(std::move(uploader))
    , m_fallback(std::move(fallback))
    , m_buffer(m_settings.sampleRate, m_settings.segmentSeconds,
               [this](domain::PendingSegment&& segment) { m_queue.push(std::move(segment)); })
{}

SegmentRecorder::~SegmentRecorder() {
    stop();
}

void SegmentRecorder::start() {
    if (m_running) {
        std::cerr << "[SegmentRecorder] Already running." << std::endl;
        return;
    }

    m_buffer.reset(std::chrono::system_clock::now());
    bool reachable = m_uploader->probe();

    std::packaged_task<void()> task([this] { workerLoop(); });
    m_workerDone = task.get_future();
    m_running = true;
    m_worker = std::thread(std::move(task));

    std::cout << "[SegmentRecorder] Started" << std::endl;
    std::cout << "[SegmentRecorder]   Storage server: " << m_settings.storageServerUrl << std::endl;
    std::cout << "[SegmentRecorder]   Segment duration: " << m_settings.segmentSeconds << "s" << std::endl;
    std::cout << "[SegmentRecorder]   Sample rate: " << m_settings.sampleRate << "Hz" << std::endl;
    std::cout << "[SegmentRecorder]   Server reachable: "
              << (reachable ? "yes" : "no (will save locally to " + m_fallback->directory() + ")")
              << std::endl;
}

void SegmentRecorder::stop() {
    if (!m_running.exchange(false)) {
        return;
    }

    std::cout << "[SegmentRecorder] Stopping..." << std::endl;
    m_buffer.flush();
    m_queue.push(ShutdownSignal{});

    if (m_workerDone.valid() &&
        m_workerDone.wait_for(m_settings.stopTimeout) != std::future_status::ready) {
        std::cerr << "[SegmentRecorder] Worker still draining after " << m_settings.stopTimeout.count()
                  << "s (" << m_queue.size() << " queued); waiting for it to finish." << std::endl;
    }
    if (m_worker.joinable()) {
        m_worker.join();
    }

    RecorderStatus status = getStatus();
    std::cout << "[SegmentRecorder] Stopped. Segments: " << status.segmentsProcessed
              << " | Uploaded: " << status.uploaded
              << " | Local fallback: " << status.localFallback
              << " | Duration: " << std::fixed << std::setprecision(1) << status.totalDurationSeconds << "s"
              << std::defaultfloat << std::endl;
}

void SegmentRecorder::onAudioChunk(const float* samples, std::size_t count) {
    if (!m_running) {
        return;
    }
    // A chunk racing stop() is refused here once the final flush has closed the buffer.
    m_buffer.append(samples, count);
}

RecorderStatus SegmentRecorder::getStatus() const {
    RecorderStatus status;
    status.running = m_running.load();
    status.storageServerUrl = m_settings.storageServerUrl;
    status.serverReachable = m_uploader->isReachable();
    status.segmentSeconds = m_settings.segmentSeconds;
    status.segmentsProcessed = m_segmentCount.load();
    status.uploaded = m_uploadCount.load();
    status.localFallback = m_fallbackCount.load();
    status.totalDurationSeconds = static_cast<double>(m_totalSamples.load()) / m_settings.sampleRate;
    status.bufferedSeconds = static_cast<double>(m_buffer.bufferedSamples()) / m_settings.sampleRate;
    return status;
}

void SegmentRecorder::workerLoop() {
    while (true) {
        QueueEntry entry = m_queue.pop();

        if (std::holds_alternative<ShutdownSignal>(entry)) {
            // Anything pushed after the signal is still real audio.
            while (auto late = m_queue.tryPop()) {
                if (auto* segment = std::get_if<domain::PendingSegment>(&*late)) {
                    processSegment(*segment);
                }
            }
            return;
        }

        processSegment(std::get<domain::PendingSegment>(entry));
    }
}

void SegmentRecorder::processSegment(const domain::PendingSegment& segment) {
    try {
        ScratchDirGuard scratch(infrastructure::PathUtils::CreateScratchDir("audio_seg_"));

        domain::CompressedArtifact artifact = m_codec->compress(
            segment, m_settings.sampleRate, SegmentBaseName(segment.startedAt), scratch.path().string());

        ++m_segmentCount;
        m_totalSamples += segment.samples.size();

        domain::SegmentMetadata metadata =
            domain::SegmentMetadata::Describe(segment, artifact, m_settings.sampleRate);

        if (m_uploader->deliver(artifact, metadata)) {
            ++m_uploadCount;
            return;
        }

        if (m_fallback->store(artifact, metadata, infrastructure::LocalFallbackStore::kServerUnreachable)) {
            ++m_fallbackCount;
        } else {
            std::cerr << "[SegmentRecorder] Segment " << metadata.originalFilename
                      << " could not be delivered or saved locally." << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "[SegmentRecorder] Failed to process audio segment: " << e.what() << std::endl;
    }
}

} // namespace audiovault::application
