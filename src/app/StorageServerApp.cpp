/**
 * @file StorageServerApp.cpp
 * @brief Implementation of StorageServerApp.
 */

#include "app/StorageServerApp.hpp"
#include "app/SignalWait.hpp"
#include "application/IngestService.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/FfmpegDecoder.hpp"
#include "infrastructure/StorageCatalog.hpp"
#include "infrastructure/StorageHttpServer.hpp"

#include <atomic>
#include <iostream>
#include <memory>
#include <thread>

namespace audiovault::app {

using namespace audiovault::infrastructure;

StorageServerApp::StorageServerApp(std::string configDir) : m_configDir(std::move(configDir)) {}

int StorageServerApp::Run() {
    StorageConfig cfg = ConfigLoader::LoadStorageConfig(m_configDir);

    std::shared_ptr<StorageCatalog> catalog;
    try {
        catalog = std::make_shared<StorageCatalog>(cfg.storageDir);
    } catch (const std::exception& e) {
        std::cerr << "[StorageServerApp] Cannot prepare storage directory " << cfg.storageDir
                  << ": " << e.what() << std::endl;
        return 1;
    }

    auto decoder = std::make_shared<FfmpegDecoder>(cfg.decoderBinary,
                                                   std::chrono::seconds(cfg.decoderTimeoutSeconds));
    auto service = std::make_shared<application::IngestService>(catalog, decoder, cfg.defaultSampleRate);
    StorageHttpServer server(service, cfg.maxUploadBytes);

    std::cout << "[StorageServerApp] Storage: " << catalog->storageDir().string() << std::endl;
    std::cout << "[StorageServerApp] " << cfg.decoderBinary << ": "
              << (decoder->isAvailable() ? "available" : "not found") << std::endl;

    InstallStopHandlers();

    std::atomic<bool> listenFailed{false};
    std::thread serverThread([&]() {
        if (!server.listen(cfg.bindAddress, cfg.port)) {
            listenFailed = true;
        }
    });

    while (!StopRequested() && !listenFailed) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    server.stop();
    serverThread.join();

    if (listenFailed) {
        std::cerr << "[StorageServerApp] Could not listen on " << cfg.bindAddress << ":" << cfg.port << std::endl;
        return 1;
    }
    std::cout << "[StorageServerApp] Stopped." << std::endl;
    return 0;
}

} // namespace audiovault::app
