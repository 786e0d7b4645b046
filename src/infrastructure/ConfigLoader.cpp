/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace audiovault::infrastructure {

namespace {

template <typename T>
void ReadKey(const nlohmann::json& section, const char* key, T& target) {
    if (!section.contains(key)) return;
    try {
        target = section.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': " << e.what() << std::endl;
    }
}

std::optional<std::string> Env(const char* name) {
    const char* value = std::getenv(name);
    if (value && *value) return std::string(value);
    return std::nullopt;
}

void EnvInt(const char* name, int& target) {
    auto value = Env(name);
    if (!value) return;
    try {
        target = std::stoi(*value);
    } catch (const std::exception&) {
        std::cerr << "[ConfigLoader] Ignoring " << name << "=" << *value << ": not an integer" << std::endl;
    }
}

} // namespace

std::optional<nlohmann::json> ConfigLoader::ReadSettings(const std::string& configDir) {
    std::filesystem::path configPath = std::filesystem::path(configDir) / "settings.json";
    if (!std::filesystem::exists(configPath)) {
        return std::nullopt;
    }

    try {
        std::ifstream f(configPath);
        nlohmann::json j;
        f >> j;
        return j;
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
    }
    return std::nullopt;
}

RecorderConfig ConfigLoader::LoadRecorderConfig(const std::string& configDir) {
    RecorderConfig cfg;

    auto settings = ReadSettings(configDir);
    if (settings && settings->contains("recorder") && (*settings)["recorder"].is_object()) {
        const auto& r = (*settings)["recorder"];
        ReadKey(r, "storage_server_url", cfg.storageServerUrl);
        ReadKey(r, "segment_seconds", cfg.segmentSeconds);
        ReadKey(r, "sample_rate", cfg.sampleRate);
        ReadKey(r, "chunk_samples", cfg.chunkSamples);
        ReadKey(r, "bitrate", cfg.bitrate);
        ReadKey(r, "fallback_dir", cfg.fallbackDir);
        ReadKey(r, "max_retries", cfg.maxRetries);
        ReadKey(r, "retry_delay_ms", cfg.retryDelayMs);
        ReadKey(r, "upload_timeout_seconds", cfg.uploadTimeoutSeconds);
        ReadKey(r, "probe_timeout_seconds", cfg.probeTimeoutSeconds);
        ReadKey(r, "encoder_binary", cfg.encoderBinary);
        ReadKey(r, "encoder_timeout_seconds", cfg.encoderTimeoutSeconds);
        ReadKey(r, "stop_timeout_seconds", cfg.stopTimeoutSeconds);
    }

    if (auto url = Env("STORAGE_SERVER_URL")) cfg.storageServerUrl = *url;
    EnvInt("AUDIO_SEGMENT_SECONDS", cfg.segmentSeconds);

    if (cfg.segmentSeconds <= 0) {
        std::cerr << "[ConfigLoader] segment_seconds must be positive, using 30" << std::endl;
        cfg.segmentSeconds = 30;
    }
    if (cfg.sampleRate <= 0) {
        std::cerr << "[ConfigLoader] sample_rate must be positive, using 16000" << std::endl;
        cfg.sampleRate = 16000;
    }
    // SDL takes the chunk size as a 16-bit sample count.
    if (cfg.chunkSamples <= 0 || cfg.chunkSamples > 65535) {
        std::cerr << "[ConfigLoader] chunk_samples must be in 1..65535, using 512" << std::endl;
        cfg.chunkSamples = 512;
    }
    if (cfg.maxRetries < 0) cfg.maxRetries = 0;
    return cfg;
}

StorageConfig ConfigLoader::LoadStorageConfig(const std::string& configDir) {
    StorageConfig cfg;

    auto settings = ReadSettings(configDir);
    if (settings && settings->contains("storage") && (*settings)["storage"].is_object()) {
        const auto& s = (*settings)["storage"];
        ReadKey(s, "port", cfg.port);
        ReadKey(s, "bind_address", cfg.bindAddress);
        ReadKey(s, "storage_dir", cfg.storageDir);
        ReadKey(s, "decoder_binary", cfg.decoderBinary);
        ReadKey(s, "decoder_timeout_seconds", cfg.decoderTimeoutSeconds);
        ReadKey(s, "max_upload_bytes", cfg.maxUploadBytes);
        ReadKey(s, "default_sample_rate", cfg.defaultSampleRate);
    }

    EnvInt("STORAGE_PORT", cfg.port);
    if (auto dir = Env("STORAGE_DIR")) cfg.storageDir = *dir;
    return cfg;
}

} // namespace audiovault::infrastructure
