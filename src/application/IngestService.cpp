/**
 * @file IngestService.cpp
 * @brief Implementation of IngestService.
 */

#include "application/IngestService.hpp"
#include "domain/SegmentMetadata.hpp"

#include <cmath>
#include <cstdint>
#include <iostream>

namespace audiovault::application {

namespace fs = std::filesystem;
using json = nlohmann::json;

double DecompressOutcome::expansionRatio() const {
    if (inputSize == 0) return 0.0;
    double ratio = static_cast<double>(outputSize) / static_cast<double>(inputSize);
    return std::round(ratio * 10.0) / 10.0;
}

IngestService::IngestService(std::shared_ptr<infrastructure::StorageCatalog> catalog,
                             std::shared_ptr<infrastructure::FfmpegDecoder> decoder,
                             int defaultSampleRate)
    : m_catalog(std::move(catalog))
    , m_decoder(std::move(decoder))
    , m_defaultSampleRate(defaultSampleRate) {}

UploadOutcome IngestService::upload(const UploadRequest& request) {
    UploadOutcome outcome;
    if (!request.hasFile) {
        outcome.error = "No file provided";
        return outcome;
    }
    if (request.filename.empty()) {
        outcome.error = "Empty filename";
        return outcome;
    }
    const std::string baseName = fs::path(request.filename).filename().string();
    if (!infrastructure::StorageCatalog::IsSafeName(baseName)) {
        outcome.error = "Invalid filename";
        return outcome;
    }
    if (infrastructure::StorageCatalog::HasSidecarExtension(baseName)) {
        outcome.error = "Invalid filename: .json is reserved for metadata";
        return outcome;
    }

    outcome.stored = m_catalog->saveArtifact(request.filename, request.content);

    json metadata = json::object();
    if (request.metadataJson && !request.metadataJson->empty()) {
        json parsed = json::parse(*request.metadataJson, nullptr, false);
        if (!parsed.is_discarded() && parsed.is_object()) {
            metadata = std::move(parsed);
        } else {
            std::cerr << "[IngestService] Malformed metadata for " << outcome.stored.filename
                      << ", storing an empty record." << std::endl;
        }
    }

    metadata["received_at"] = domain::FormatIsoTimestamp(std::chrono::system_clock::now());
    metadata["stored_filename"] = outcome.stored.filename;
    metadata["stored_size_bytes"] = outcome.stored.sizeBytes;
    metadata["source_ip"] = request.sourceAddress;

    outcome.metadataSaved = m_catalog->writeSidecar(outcome.stored.filename, metadata);
    outcome.stored.metadata = metadata;
    outcome.accepted = true;

    std::cout << "[IngestService] Received: " << outcome.stored.filename << " ("
              << outcome.stored.sizeBytes << "B) from " << request.sourceAddress << std::endl;
    return outcome;
}

std::vector<domain::StoredFile> IngestService::listFiles() const {
    return m_catalog->list();
}

std::optional<fs::path> IngestService::locate(const std::string& filename) const {
    return m_catalog->locate(filename);
}

DecompressOutcome IngestService::decompress(const std::string& filename) {
    DecompressOutcome outcome;
    outcome.inputName = filename;

    if (!m_decoder->isAvailable()) {
        outcome.status = DecompressOutcome::Status::DecoderUnavailable;
        outcome.error = "ffmpeg is not installed on the storage server";
        return outcome;
    }

    auto input = m_catalog->locate(filename);
    if (!input) {
        outcome.status = DecompressOutcome::Status::NotFound;
        outcome.error = "File not found: " + filename;
        return outcome;
    }

    int sampleRate = m_defaultSampleRate;
    std::optional<std::uint64_t> numSamples;
    if (auto meta = m_catalog->readSidecar(filename)) {
        if (meta->contains("sample_rate") && (*meta)["sample_rate"].is_number_integer()) {
            sampleRate = (*meta)["sample_rate"].get<int>();
        }
        if (meta->contains("num_samples") && (*meta)["num_samples"].is_number_unsigned()) {
            numSamples = (*meta)["num_samples"].get<std::uint64_t>();
        }
    }

    outcome.outputName = input->stem().string() + ".wav";
    outcome.outputPath = m_catalog->decompressedDir() / outcome.outputName;

    infrastructure::CommandResult result =
        m_decoder->decode(input->string(), outcome.outputPath.string(), sampleRate, numSamples);
    if (!result.succeeded()) {
        outcome.status = DecompressOutcome::Status::DecoderFailed;
        outcome.error = result.timedOut ? "Decompression timed out" : "Decompression failed: " + result.output;
        return outcome;
    }

    outcome.inputSize = fs::file_size(*input);
    outcome.outputSize = fs::file_size(outcome.outputPath);

    std::cout << "[IngestService] Decompressed: " << filename << " -> " << outcome.outputName
              << " (" << outcome.inputSize << "B -> " << outcome.outputSize << "B)" << std::endl;
    return outcome;
}

json IngestService::health() const {
    return {
        {"status", "ok"},
        {"server", "AudioVault Storage Server"},
        {"storage_dir", m_catalog->storageDir().string()},
        {"file_count", m_catalog->fileCount()},
        {"codec_available", m_decoder->isAvailable()},
        {"timestamp", domain::FormatIsoTimestamp(std::chrono::system_clock::now())}
    };
}

} // namespace audiovault::application
