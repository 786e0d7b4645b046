/**
 * @file SegmentRecorder.hpp
 * @brief Recording session: cuts captured audio into segments and delivers them from a worker thread.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>

#include "application/DeliveryQueue.hpp"
#include "application/SegmentBuffer.hpp"
#include "domain/AudioCodec.hpp"
#include "domain/SegmentUploader.hpp"
#include "infrastructure/LocalFallbackStore.hpp"

namespace audiovault::application {

/**
 * @struct RecorderSettings
 * @brief Fixed for the lifetime of a session.
 */
struct RecorderSettings {
    int sampleRate = 16000;
    int segmentSeconds = 30;
    std::string storageServerUrl;             ///< Reported in the status snapshot only.
    std::chrono::seconds stopTimeout{15};     ///< How long stop() waits before warning about a slow drain.
};

/**
 * @struct RecorderStatus
 * @brief Point-in-time view of a session; counters may lag by one segment.
 */
struct RecorderStatus {
    bool running = false;
    std::string storageServerUrl;
    bool serverReachable = false;
    int segmentSeconds = 0;
    int segmentsProcessed = 0;
    int uploaded = 0;
    int localFallback = 0;
    double totalDurationSeconds = 0.0;
    double bufferedSeconds = 0.0;

    nlohmann::json toJson() const;
};

/**
 * @class SegmentRecorder
 * @brief Two execution contexts: the capture callback (onAudioChunk) and one worker thread.
 *
 * The capture side never touches disk or network. The worker encodes each
 * segment, tries remote delivery and falls back to the local store, strictly
 * in capture order. A failure while processing one segment is logged and the
 * worker moves on.
 */
class SegmentRecorder {
public:
    SegmentRecorder(RecorderSettings settings,
                    std::shared_ptr<domain::AudioCodec> codec,
                    std::shared_ptr<domain::SegmentUploader> uploader,
                    std::shared_ptr<infrastructure::LocalFallbackStore> fallback);
    ~SegmentRecorder();

    SegmentRecorder(const SegmentRecorder&) = delete;
    SegmentRecorder& operator=(const SegmentRecorder&) = delete;

    /** @brief Probes the server and launches the worker. */
    void start();

    /** @brief Flushes the partial segment and waits until every queued segment is processed. */
    void stop();

    /** @brief Capture callback. Ignored while the session is stopped. */
    void onAudioChunk(const float* samples, std::size_t count);

    RecorderStatus getStatus() const;

    bool isRunning() const { return m_running.load(); }
    std::size_t samplesPerSegment() const { return m_buffer.samplesPerSegment(); }
    std::size_t bufferedSamples() const { return m_buffer.bufferedSamples(); }

private:
    void workerLoop();
    void processSegment(const domain::PendingSegment& segment);

    RecorderSettings m_settings;
    std::shared_ptr<domain::AudioCodec> m_codec;
    std::shared_ptr<domain::SegmentUploader> m_uploader;
    std::shared_ptr<infrastructure::LocalFallbackStore> m_fallback;

    DeliveryQueue m_queue;
    SegmentBuffer m_buffer;

    std::atomic<bool> m_running{false};
    std::thread m_worker;
    std::future<void> m_workerDone;

    std::atomic<int> m_segmentCount{0};
    std::atomic<int> m_uploadCount{0};
    std::atomic<int> m_fallbackCount{0};
    std::atomic<std::uint64_t> m_totalSamples{0};
};

} // namespace audiovault::application
