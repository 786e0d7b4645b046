/**
 * @file LocalFallbackStore.cpp
 * @brief Implementation of LocalFallbackStore.
 */

#include "infrastructure/LocalFallbackStore.hpp"
#include "infrastructure/PathUtils.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>

namespace audiovault::infrastructure {

namespace fs = std::filesystem;

LocalFallbackStore::LocalFallbackStore(const std::string& directory)
    : m_directory(directory) {}

bool LocalFallbackStore::store(const domain::CompressedArtifact& artifact,
                               const domain::SegmentMetadata& metadata,
                               const std::string& reason) {
    try {
        fs::create_directories(m_directory);

        fs::path dest = PathUtils::ResolveUniquePath(m_directory, fs::path(artifact.path).filename().string());
        fs::copy_file(artifact.path, dest);

        nlohmann::json sidecar = metadata.toJson();
        sidecar["saved_locally"] = true;
        sidecar["local_fallback_reason"] = reason;

        const std::string sidecarPath = domain::SidecarPathFor(dest.string());
        bool written = false;
        {
            std::ofstream ofs(sidecarPath);
            if (ofs.is_open()) {
                ofs << sidecar.dump(2);
                ofs.flush();
                written = !ofs.fail();
            }
        }
        if (!written) {
            // An artifact without its sidecar is not a complete local copy.
            std::error_code ec;
            fs::remove(sidecarPath, ec);
            fs::remove(dest, ec);
            std::cerr << "[LocalFallbackStore] Sidecar write failed for " << dest
                      << "; local copy removed." << std::endl;
            return false;
        }

        ++m_stored;
        std::cerr << "[LocalFallbackStore] Saved locally (fallback): " << dest.filename().string()
                  << " (" << metadata.fileSizeBytes << "B)" << std::endl;
        return true;
    } catch (const fs::filesystem_error& e) {
        std::cerr << "[LocalFallbackStore] Error persisting " << artifact.path << ": " << e.what() << std::endl;
    }
    return false;
}

} // namespace audiovault::infrastructure
