/**
 * @file IngestService.hpp
 * @brief Storage-server use cases: ingest, catalog, download lookup and decompression.
 */

#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "domain/StoredFile.hpp"
#include "infrastructure/FfmpegDecoder.hpp"
#include "infrastructure/StorageCatalog.hpp"

namespace audiovault::application {

/**
 * @struct UploadRequest
 * @brief One multipart upload as received by the HTTP layer.
 */
struct UploadRequest {
    bool hasFile = false;
    std::string filename;
    std::string content;
    std::optional<std::string> metadataJson;
    std::string sourceAddress;
};

struct UploadOutcome {
    bool accepted = false;
    std::string error;          ///< Set when !accepted.
    domain::StoredFile stored;
    bool metadataSaved = false;
};

struct DecompressOutcome {
    enum class Status { Ok, NotFound, DecoderUnavailable, DecoderFailed };

    Status status = Status::Ok;
    std::string error;
    std::string inputName;
    std::string outputName;
    std::filesystem::path outputPath;
    std::uintmax_t inputSize = 0;
    std::uintmax_t outputSize = 0;

    /** @brief output/input rounded to one decimal, 0 for an empty input. */
    double expansionRatio() const;
};

/**
 * @class IngestService
 * @brief Stateless request handling on top of StorageCatalog; every call reads the disk afresh.
 */
class IngestService {
public:
    IngestService(std::shared_ptr<infrastructure::StorageCatalog> catalog,
                  std::shared_ptr<infrastructure::FfmpegDecoder> decoder,
                  int defaultSampleRate);

    /**
     * @brief Stores an artifact under a collision-free name and writes its enriched sidecar.
     *
     * Malformed metadata JSON is replaced by an empty record.
     */
    UploadOutcome upload(const UploadRequest& request);

    std::vector<domain::StoredFile> listFiles() const;

    std::optional<std::filesystem::path> locate(const std::string& filename) const;

    /**
     * @brief Decodes a stored artifact into decompressed/<stem>.wav at the sidecar's sample rate.
     *
     * When the sidecar records num_samples, the decoded file has exactly that many samples.
     */
    DecompressOutcome decompress(const std::string& filename);

    nlohmann::json health() const;

private:
    std::shared_ptr<infrastructure::StorageCatalog> m_catalog;
    std::shared_ptr<infrastructure::FfmpegDecoder> m_decoder;
    int m_defaultSampleRate;
};

} // namespace audiovault::application
