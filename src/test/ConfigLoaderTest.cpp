#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"

using namespace audiovault::infrastructure;
namespace fs = std::filesystem;

namespace {

void ClearEnv() {
    ::unsetenv("STORAGE_SERVER_URL");
    ::unsetenv("AUDIO_SEGMENT_SECONDS");
    ::unsetenv("STORAGE_PORT");
    ::unsetenv("STORAGE_DIR");
}

void WriteSettings(const fs::path& dir, const std::string& body) {
    std::ofstream out(dir / "settings.json");
    out << body;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Config Loader Test..." << std::endl;
    ClearEnv();
    fs::path dir = PathUtils::CreateScratchDir("config_test_");

    // 1. No settings.json: defaults.
    {
        RecorderConfig r = ConfigLoader::LoadRecorderConfig(dir.string());
        assert(r.storageServerUrl == "http://localhost:5050");
        assert(r.segmentSeconds == 30);
        assert(r.sampleRate == 16000);
        assert(r.fallbackDir == "audio_storage_fallback");
        assert(r.maxRetries == 2);

        StorageConfig s = ConfigLoader::LoadStorageConfig(dir.string());
        assert(s.port == 5050);
        assert(s.storageDir == "audio_storage");
        assert(s.maxUploadBytes == 50u * 1024 * 1024);
        std::cout << "[PASS] Defaults without settings.json." << std::endl;
    }

    // 2. File values, with a badly typed key falling back to its default.
    WriteSettings(dir, R"({
        "recorder": {
            "storage_server_url": "http://recorder-host:6000",
            "segment_seconds": 10,
            "bitrate": "24k",
            "max_retries": "many"
        },
        "storage": { "port": 7070, "storage_dir": "/srv/audio" }
    })");
    {
        RecorderConfig r = ConfigLoader::LoadRecorderConfig(dir.string());
        assert(r.storageServerUrl == "http://recorder-host:6000");
        assert(r.segmentSeconds == 10);
        assert(r.bitrate == "24k");
        assert(r.maxRetries == 2);

        StorageConfig s = ConfigLoader::LoadStorageConfig(dir.string());
        assert(s.port == 7070);
        assert(s.storageDir == "/srv/audio");
        std::cout << "[PASS] settings.json values applied." << std::endl;
    }

    // 3. Environment wins over the file; junk and non-positive values are ignored.
    ::setenv("STORAGE_SERVER_URL", "http://env-host:5051", 1);
    ::setenv("AUDIO_SEGMENT_SECONDS", "5", 1);
    ::setenv("STORAGE_PORT", "not-a-port", 1);
    ::setenv("STORAGE_DIR", "/tmp/env_storage", 1);
    {
        RecorderConfig r = ConfigLoader::LoadRecorderConfig(dir.string());
        assert(r.storageServerUrl == "http://env-host:5051");
        assert(r.segmentSeconds == 5);

        StorageConfig s = ConfigLoader::LoadStorageConfig(dir.string());
        assert(s.port == 7070);
        assert(s.storageDir == "/tmp/env_storage");
    }
    WriteSettings(dir, R"({ "recorder": { "chunk_samples": 70000 } })");
    {
        RecorderConfig r = ConfigLoader::LoadRecorderConfig(dir.string());
        assert(r.chunkSamples == 512);
    }
    WriteSettings(dir, R"({ "recorder": { "chunk_samples": -4 } })");
    {
        RecorderConfig r = ConfigLoader::LoadRecorderConfig(dir.string());
        assert(r.chunkSamples == 512);
    }
    WriteSettings(dir, R"({ "recorder": { "chunk_samples": 1024 } })");
    {
        RecorderConfig r = ConfigLoader::LoadRecorderConfig(dir.string());
        assert(r.chunkSamples == 1024);
        std::cout << "[PASS] chunk_samples limited to SDL's 16-bit range." << std::endl;
    }
    ::setenv("AUDIO_SEGMENT_SECONDS", "0", 1);
    {
        RecorderConfig r = ConfigLoader::LoadRecorderConfig(dir.string());
        assert(r.segmentSeconds == 30);
        std::cout << "[PASS] Environment overrides." << std::endl;
    }
    ClearEnv();

    // 4. Unparseable file behaves like no file.
    WriteSettings(dir, "{ broken");
    {
        assert(!ConfigLoader::ReadSettings(dir.string()).has_value());
        RecorderConfig r = ConfigLoader::LoadRecorderConfig(dir.string());
        assert(r.segmentSeconds == 30);
        std::cout << "[PASS] Malformed settings.json ignored." << std::endl;
    }

    fs::remove_all(dir);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
