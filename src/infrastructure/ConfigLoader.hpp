/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading recorder and storage-server settings (settings.json + environment).
 *
 * settings.json holds a "recorder" and a "storage" object. Environment
 * variables override the file; missing or malformed keys keep their defaults.
 */

#pragma once

#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace audiovault::infrastructure {

struct RecorderConfig {
    std::string storageServerUrl = "http://localhost:5050";
    int segmentSeconds = 30;
    int sampleRate = 16000;
    int chunkSamples = 512;
    std::string bitrate = "32k";
    std::string fallbackDir = "audio_storage_fallback";
    int maxRetries = 2;
    int retryDelayMs = 1000;
    int uploadTimeoutSeconds = 15;
    int probeTimeoutSeconds = 3;
    std::string encoderBinary = "ffmpeg";
    int encoderTimeoutSeconds = 30;
    int stopTimeoutSeconds = 15;
};

struct StorageConfig {
    int port = 5050;
    std::string bindAddress = "0.0.0.0";
    std::string storageDir = "audio_storage";
    std::string decoderBinary = "ffmpeg";
    int decoderTimeoutSeconds = 60;
    std::size_t maxUploadBytes = 50 * 1024 * 1024;
    int defaultSampleRate = 16000;
};

class ConfigLoader {
public:
    /**
     * @brief Reads the "recorder" section of settings.json in configDir, then applies
     *        STORAGE_SERVER_URL and AUDIO_SEGMENT_SECONDS.
     */
    static RecorderConfig LoadRecorderConfig(const std::string& configDir);

    /** @brief Reads the "storage" section, then applies STORAGE_PORT and STORAGE_DIR. */
    static StorageConfig LoadStorageConfig(const std::string& configDir);

    /** @brief Parses settings.json; nullopt if missing or unreadable. */
    static std::optional<nlohmann::json> ReadSettings(const std::string& configDir);
};

} // namespace audiovault::infrastructure
