/**
 * @file StorageCatalog.hpp
 * @brief Filesystem layout of the storage server: artifacts, sidecars and decoded copies.
 */

#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/StoredFile.hpp"

namespace audiovault::infrastructure {

/**
 * @class StorageCatalog
 * @brief Owns the storage directory. Stored artifacts are never overwritten.
 */
class StorageCatalog {
public:
    explicit StorageCatalog(const std::string& storageDir);

    /**
     * @brief Writes an uploaded artifact under a collision-free name.
     *
     * Name choice, the artifact write and a placeholder sidecar happen under
     * one lock, so concurrent uploads of the same name never share a path.
     * @return The stored entry (filename may carry a numeric suffix).
     * @throws std::invalid_argument for unsafe names and ".json" names.
     */
    domain::StoredFile saveArtifact(const std::string& requestedName, const std::string& content);

    /** @brief Writes the sidecar of a stored artifact. */
    bool writeSidecar(const std::string& storedName, const nlohmann::json& metadata);

    /** @brief Reads the sidecar of a stored artifact; nullopt if absent or malformed. */
    std::optional<nlohmann::json> readSidecar(const std::string& storedName) const;

    /** @brief All artifacts, sorted by name, sidecars attached. */
    std::vector<domain::StoredFile> list() const;

    /** @brief Number of regular files in the storage directory (sidecars included). */
    std::size_t fileCount() const;

    /** @brief Path of a stored artifact; nullopt for unknown or unsafe names. */
    std::optional<std::filesystem::path> locate(const std::string& filename) const;

    const std::filesystem::path& storageDir() const { return m_storageDir; }
    const std::filesystem::path& decompressedDir() const { return m_decompressedDir; }

    static bool IsSafeName(const std::string& filename);

    /** @brief ".json" is reserved for sidecars; an artifact with it would be its own sidecar. */
    static bool HasSidecarExtension(const std::string& filename);

private:
    std::filesystem::path m_storageDir;
    std::filesystem::path m_decompressedDir;
    std::mutex m_saveMutex;
};

} // namespace audiovault::infrastructure
