/**
 * @file StorageCatalog.cpp
 * @brief Implementation of StorageCatalog.
 */

#include "infrastructure/StorageCatalog.hpp"
#include "infrastructure/PathUtils.hpp"
#include "domain/SegmentMetadata.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace audiovault::infrastructure {

namespace fs = std::filesystem;

namespace {

std::string FileTimeToIso(fs::file_time_type ftime) {
    auto sctp = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        ftime - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
    return domain::FormatIsoTimestamp(sctp);
}

bool IsSidecar(const fs::path& p) {
    return StorageCatalog::HasSidecarExtension(p.filename().string());
}

} // namespace

StorageCatalog::StorageCatalog(const std::string& storageDir)
    : m_storageDir(storageDir)
    , m_decompressedDir(fs::path(storageDir) / "decompressed") {
    fs::create_directories(m_storageDir);
    fs::create_directories(m_decompressedDir);
}

bool StorageCatalog::IsSafeName(const std::string& filename) {
    if (filename.empty() || filename == "." || filename == "..") return false;
    return filename.find('/') == std::string::npos && filename.find('\\') == std::string::npos;
}

bool StorageCatalog::HasSidecarExtension(const std::string& filename) {
    std::string ext = fs::path(filename).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".json";
}

domain::StoredFile StorageCatalog::saveArtifact(const std::string& requestedName, const std::string& content) {
    std::string name = fs::path(requestedName).filename().string();
    if (!IsSafeName(name)) {
        throw std::invalid_argument("invalid filename: " + requestedName);
    }
    if (HasSidecarExtension(name)) {
        throw std::invalid_argument("reserved extension: " + requestedName);
    }

    std::lock_guard<std::mutex> lock(m_saveMutex);
    fs::path target = PathUtils::ResolveUniquePath(m_storageDir, name);
    {
        std::ofstream ofs(target, std::ios::binary);
        if (!ofs.is_open()) {
            throw std::runtime_error("cannot create " + target.string());
        }
        ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
        ofs.flush();
        if (ofs.fail()) {
            throw std::runtime_error("write failed for " + target.string());
        }
    }
    // Reserve the sidecar path too: "a.wav" must not claim the "a.json" of an "a.opus" in flight.
    {
        std::ofstream placeholder(domain::SidecarPathFor(target.string()));
        placeholder << "{}";
        if (!placeholder) {
            std::cerr << "[StorageCatalog] Could not reserve sidecar for " << target.filename() << std::endl;
        }
    }

    domain::StoredFile stored;
    stored.filename = target.filename().string();
    stored.sizeBytes = fs::file_size(target);
    stored.modified = FileTimeToIso(fs::last_write_time(target));
    return stored;
}

bool StorageCatalog::writeSidecar(const std::string& storedName, const nlohmann::json& metadata) {
    fs::path sidecar = domain::SidecarPathFor((m_storageDir / storedName).string());
    std::ofstream ofs(sidecar);
    if (!ofs.is_open()) {
        std::cerr << "[StorageCatalog] Failed to open sidecar: " << sidecar << std::endl;
        return false;
    }
    ofs << metadata.dump(2);
    ofs.flush();
    return !ofs.fail();
}

std::optional<nlohmann::json> StorageCatalog::readSidecar(const std::string& storedName) const {
    fs::path sidecar = domain::SidecarPathFor((m_storageDir / storedName).string());
    if (!fs::exists(sidecar)) return std::nullopt;

    try {
        std::ifstream f(sidecar);
        return nlohmann::json::parse(f);
    } catch (const std::exception& e) {
        std::cerr << "[StorageCatalog] Unreadable sidecar " << sidecar << ": " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::vector<domain::StoredFile> StorageCatalog::list() const {
    std::vector<domain::StoredFile> files;
    if (!fs::exists(m_storageDir)) return files;

    for (const auto& entry : fs::directory_iterator(m_storageDir)) {
        if (entry.is_directory() || IsSidecar(entry.path())) {
            continue;
        }
        if (!entry.is_regular_file()) {
            continue;
        }

        domain::StoredFile info;
        info.filename = entry.path().filename().string();
        info.sizeBytes = entry.file_size();
        info.modified = FileTimeToIso(entry.last_write_time());
        info.metadata = readSidecar(info.filename);
        files.push_back(std::move(info));
    }

    std::sort(files.begin(), files.end(),
              [](const domain::StoredFile& a, const domain::StoredFile& b) { return a.filename < b.filename; });
    return files;
}

std::size_t StorageCatalog::fileCount() const {
    std::size_t count = 0;
    if (!fs::exists(m_storageDir)) return count;
    for (const auto& entry : fs::directory_iterator(m_storageDir)) {
        if (entry.is_regular_file()) ++count;
    }
    return count;
}

std::optional<fs::path> StorageCatalog::locate(const std::string& filename) const {
    if (!IsSafeName(filename)) return std::nullopt;
    fs::path p = m_storageDir / filename;
    if (!fs::is_regular_file(p)) return std::nullopt;
    return p;
}

} // namespace audiovault::infrastructure
