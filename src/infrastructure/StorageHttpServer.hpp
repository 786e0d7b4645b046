/**
 * @file StorageHttpServer.hpp
 * @brief REST surface of the storage server on top of cpp-httplib.
 */

#pragma once

#include <memory>
#include <string>
#include "application/IngestService.hpp"

namespace httplib {
class Server;
}

namespace audiovault::infrastructure {

/**
 * @class StorageHttpServer
 * @brief Routes:
 *  - POST /upload
 *  - GET  /health
 *  - GET  /files
 *  - GET  /files/<filename>
 *  - POST /decompress/<filename>?download=true|false
 */
class StorageHttpServer {
public:
    StorageHttpServer(std::shared_ptr<application::IngestService> service, std::size_t maxUploadBytes);
    ~StorageHttpServer();

    StorageHttpServer(const StorageHttpServer&) = delete;
    StorageHttpServer& operator=(const StorageHttpServer&) = delete;

    /** @brief Binds and serves until stop(). Returns false if the address could not be bound. */
    bool listen(const std::string& host, int port);

    /** @brief Binds to a free port on host; returns the port, or -1 on failure. Call listenAfterBind() next. */
    int bindToAnyPort(const std::string& host);

    /** @brief Serves on a socket previously bound by bindToAnyPort(). */
    bool listenAfterBind();

    void stop();
    bool isRunning() const;

    /** @brief Blocks until the listener accepts connections (for tests and embedding). */
    void waitUntilReady() const;

private:
    void registerRoutes();

    std::shared_ptr<application::IngestService> m_service;
    std::unique_ptr<httplib::Server> m_server;
};

} // namespace audiovault::infrastructure
