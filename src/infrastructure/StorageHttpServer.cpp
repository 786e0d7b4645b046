/**
 * @file StorageHttpServer.cpp
 * @brief Implementation of StorageHttpServer.
 */

#include "infrastructure/StorageHttpServer.hpp"
#include <httplib.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>

namespace audiovault::infrastructure {

using json = nlohmann::json;

namespace {

void SendJson(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

void SendError(httplib::Response& res, int status, const std::string& message) {
    SendJson(res, status, {{"error", message}});
}

bool SendFile(httplib::Response& res, const std::filesystem::path& path, const std::string& contentType) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    res.status = 200;
    res.set_header("Content-Disposition", "attachment; filename=\"" + path.filename().string() + "\"");
    res.set_content(ss.str(), contentType);
    return true;
}

} // namespace

StorageHttpServer::StorageHttpServer(std::shared_ptr<application::IngestService> service, std::size_t maxUploadBytes)
    : m_service(std::move(service))
    , m_server(std::make_unique<httplib::Server>()) {
    m_server->set_payload_max_length(maxUploadBytes);
    registerRoutes();
}

StorageHttpServer::~StorageHttpServer() {
    stop();
}

void StorageHttpServer::registerRoutes() {
    m_server->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        SendJson(res, 200, m_service->health());
    });

    m_server->Post("/upload", [this](const httplib::Request& req, httplib::Response& res) {
        application::UploadRequest upload;
        upload.sourceAddress = req.remote_addr;
        if (req.has_file("file")) {
            const auto file = req.get_file_value("file");
            upload.hasFile = true;
            upload.filename = file.filename;
            upload.content = file.content;
        }
        if (req.has_file("metadata")) {
            upload.metadataJson = req.get_file_value("metadata").content;
        }

        application::UploadOutcome outcome = m_service->upload(upload);
        if (!outcome.accepted) {
            SendError(res, 400, outcome.error);
            return;
        }
        SendJson(res, 201, {
            {"status", "ok"},
            {"filename", outcome.stored.filename},
            {"size_bytes", outcome.stored.sizeBytes},
            {"metadata_saved", outcome.metadataSaved}
        });
    });

    m_server->Get("/files", [this](const httplib::Request&, httplib::Response& res) {
        json files = json::array();
        for (const auto& file : m_service->listFiles()) {
            files.push_back(file.toJson());
        }
        SendJson(res, 200, {{"count", files.size()}, {"files", files}});
    });

    m_server->Get(R"(/files/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        const std::string filename = req.matches[1];
        auto path = m_service->locate(filename);
        if (!path || !SendFile(res, *path, "application/octet-stream")) {
            SendError(res, 404, "File not found: " + filename);
        }
    });

    m_server->Post(R"(/decompress/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        const std::string filename = req.matches[1];
        application::DecompressOutcome outcome = m_service->decompress(filename);

        switch (outcome.status) {
            case application::DecompressOutcome::Status::NotFound:
                SendError(res, 404, outcome.error);
                return;
            case application::DecompressOutcome::Status::DecoderUnavailable:
            case application::DecompressOutcome::Status::DecoderFailed:
                SendError(res, 500, outcome.error);
                return;
            case application::DecompressOutcome::Status::Ok:
                break;
        }

        std::string download = req.has_param("download") ? req.get_param_value("download") : "false";
        std::transform(download.begin(), download.end(), download.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (download == "true") {
            if (!SendFile(res, outcome.outputPath, "audio/wav")) {
                SendError(res, 500, "Decoded file disappeared: " + outcome.outputName);
            }
            return;
        }

        SendJson(res, 200, {
            {"status", "ok"},
            {"input", outcome.inputName},
            {"output", outcome.outputName},
            {"input_size", outcome.inputSize},
            {"output_size", outcome.outputSize},
            {"expansion_ratio", outcome.expansionRatio()}
        });
    });

    m_server->set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string message = "Internal error";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            message = e.what();
        } catch (...) {
            message = "Unknown error";
        }
        std::cerr << "[StorageHttpServer] " << req.method << " " << req.path << " failed: " << message << std::endl;
        SendError(res, 500, message);
    });
}

bool StorageHttpServer::listen(const std::string& host, int port) {
    std::cout << "[StorageHttpServer] Listening on " << host << ":" << port << std::endl;
    return m_server->listen(host, port);
}

int StorageHttpServer::bindToAnyPort(const std::string& host) {
    return m_server->bind_to_any_port(host);
}

bool StorageHttpServer::listenAfterBind() {
    return m_server->listen_after_bind();
}

void StorageHttpServer::stop() {
    if (m_server && m_server->is_running()) {
        m_server->stop();
    }
}

bool StorageHttpServer::isRunning() const {
    return m_server && m_server->is_running();
}

void StorageHttpServer::waitUntilReady() const {
    m_server->wait_until_ready();
}

} // namespace audiovault::infrastructure
