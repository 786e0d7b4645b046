/**
 * @file HttpSegmentUploader.cpp
 * @brief Implementation of HttpSegmentUploader.
 */

#include "infrastructure/HttpSegmentUploader.hpp"
#include <httplib.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace audiovault::infrastructure {

namespace fs = std::filesystem;

namespace {

std::string ReadBinaryFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("cannot open artifact " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        throw std::runtime_error("cannot read artifact " + path);
    }
    return ss.str();
}

} // namespace

HttpSegmentUploader::HttpSegmentUploader(UploaderSettings settings)
    : m_settings(std::move(settings)) {}

bool HttpSegmentUploader::probe() {
    httplib::Client cli(m_settings.serverUrl);
    cli.set_connection_timeout(m_settings.probeTimeout);
    cli.set_read_timeout(m_settings.probeTimeout);

    auto res = cli.Get("/health");
    if (res && res->status == 200) {
        m_reachable = true;
        std::cout << "[HttpSegmentUploader] Storage server is online: " << m_settings.serverUrl << std::endl;
        return true;
    }

    m_reachable = false;
    std::cerr << "[HttpSegmentUploader] Storage server unreachable at " << m_settings.serverUrl << std::endl;
    return false;
}

bool HttpSegmentUploader::deliver(const domain::CompressedArtifact& artifact,
                                  const domain::SegmentMetadata& metadata) {
    const std::string filename = fs::path(artifact.path).filename().string();
    const int totalAttempts = m_settings.maxRetries + 1;

    std::string content;
    std::string metadataJson;
    try {
        content = ReadBinaryFile(artifact.path);
        metadataJson = metadata.toJson().dump();
    } catch (const std::exception& e) {
        std::cerr << "[HttpSegmentUploader] Upload error: " << e.what() << std::endl;
        return false;
    }

    for (int attemptNumber = 1; attemptNumber <= totalAttempts; ++attemptNumber) {
        AttemptOutcome outcome = attempt(filename, content, metadataJson, attemptNumber);
        if (outcome == AttemptOutcome::Delivered) {
            std::cout << "[HttpSegmentUploader] Uploaded " << filename << " ("
                      << metadata.fileSizeBytes << "B, " << metadata.durationSeconds << "s)" << std::endl;
            return true;
        }
        if (outcome == AttemptOutcome::Abort) {
            return false;
        }
        if (attemptNumber < totalAttempts) {
            std::this_thread::sleep_for(m_settings.retryDelay);
        }
    }
    return false;
}

HttpSegmentUploader::AttemptOutcome HttpSegmentUploader::attempt(const std::string& filename,
                                                                 const std::string& content,
                                                                 const std::string& metadataJson,
                                                                 int attemptNumber) {
    const int totalAttempts = m_settings.maxRetries + 1;
    ++m_attempts;

    try {
        httplib::Client cli(m_settings.serverUrl);
        cli.set_connection_timeout(m_settings.uploadTimeout);
        cli.set_read_timeout(m_settings.uploadTimeout);
        cli.set_write_timeout(m_settings.uploadTimeout);

        httplib::MultipartFormDataItems items = {
            {"file", content, filename, "application/octet-stream"},
            {"metadata", metadataJson, "", ""}
        };

        auto res = cli.Post("/upload", items);
        if (res) {
            if (res->status == 201) {
                m_reachable = true;
                ++m_delivered;
                return AttemptOutcome::Delivered;
            }
            std::cerr << "[HttpSegmentUploader] Server returned " << res->status << ": " << res->body
                      << " (attempt " << attemptNumber << "/" << totalAttempts << ")" << std::endl;
            return AttemptOutcome::Retry;
        }

        switch (res.error()) {
            case httplib::Error::Connection:
                if (attemptNumber == 1) {
                    std::cerr << "[HttpSegmentUploader] Storage server unreachable (attempt "
                              << attemptNumber << "/" << totalAttempts << ")" << std::endl;
                }
                m_reachable = false;
                return AttemptOutcome::Retry;
            case httplib::Error::ConnectionTimeout:
            case httplib::Error::Read:
            case httplib::Error::Write:
                std::cerr << "[HttpSegmentUploader] Upload timed out (attempt "
                          << attemptNumber << "/" << totalAttempts << ")" << std::endl;
                return AttemptOutcome::Retry;
            default:
                std::cerr << "[HttpSegmentUploader] Upload error: " << httplib::to_string(res.error()) << std::endl;
                return AttemptOutcome::Abort;
        }
    } catch (const std::exception& e) {
        std::cerr << "[HttpSegmentUploader] Upload error: " << e.what() << std::endl;
        return AttemptOutcome::Abort;
    }
}

} // namespace audiovault::infrastructure
