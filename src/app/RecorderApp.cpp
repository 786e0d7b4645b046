/**
 * @file RecorderApp.cpp
 * @brief Implementation of RecorderApp.
 */

#include "app/RecorderApp.hpp"
#include "app/SignalWait.hpp"
#include "application/SegmentRecorder.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/FfmpegOpusCodec.hpp"
#include "infrastructure/HttpSegmentUploader.hpp"
#include "infrastructure/LocalFallbackStore.hpp"
#include "infrastructure/ProcessRunner.hpp"
#include "infrastructure/SdlCaptureSource.hpp"

#include <iostream>
#include <memory>

namespace audiovault::app {

using namespace audiovault::infrastructure;

RecorderApp::RecorderApp(std::string configDir) : m_configDir(std::move(configDir)) {}

int RecorderApp::Run() {
    RecorderConfig cfg = ConfigLoader::LoadRecorderConfig(m_configDir);

    bool encoderAvailable = ProcessRunner::FindExecutable(cfg.encoderBinary).has_value();
    if (!encoderAvailable) {
        std::cerr << "[RecorderApp] " << cfg.encoderBinary
                  << " not found on PATH. Audio will be saved as uncompressed WAV." << std::endl;
    }

    EncoderSettings encoder;
    encoder.binary = cfg.encoderBinary;
    encoder.bitrate = cfg.bitrate;
    encoder.timeout = std::chrono::seconds(cfg.encoderTimeoutSeconds);
    auto codec = std::make_shared<FfmpegOpusCodec>(encoder, encoderAvailable);

    UploaderSettings upload;
    upload.serverUrl = cfg.storageServerUrl;
    upload.maxRetries = cfg.maxRetries;
    upload.retryDelay = std::chrono::milliseconds(cfg.retryDelayMs);
    upload.uploadTimeout = std::chrono::seconds(cfg.uploadTimeoutSeconds);
    upload.probeTimeout = std::chrono::seconds(cfg.probeTimeoutSeconds);
    auto uploader = std::make_shared<HttpSegmentUploader>(upload);

    auto fallback = std::make_shared<LocalFallbackStore>(cfg.fallbackDir);

    application::RecorderSettings settings;
    settings.sampleRate = cfg.sampleRate;
    settings.segmentSeconds = cfg.segmentSeconds;
    settings.storageServerUrl = cfg.storageServerUrl;
    settings.stopTimeout = std::chrono::seconds(cfg.stopTimeoutSeconds);

    application::SegmentRecorder recorder(settings, codec, uploader, fallback);

    SdlCaptureSource capture(cfg.sampleRate, cfg.chunkSamples,
        [&recorder](const float* samples, std::size_t count) { recorder.onAudioChunk(samples, count); });

    InstallStopHandlers();
    recorder.start();

    std::string error;
    if (!capture.open(error)) {
        std::cerr << "[RecorderApp] " << error << std::endl;
        recorder.stop();
        return 1;
    }

    WaitForStopSignal();

    capture.close();
    recorder.stop();
    std::cout << "[RecorderApp] " << recorder.getStatus().toJson().dump() << std::endl;
    return 0;
}

} // namespace audiovault::app
