#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <vector>

namespace audiovault::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

fs::path PathUtils::GetAppConfigDir() {
    return GetConfigHome() / "AudioVault";
}

fs::path PathUtils::ResolveUniquePath(const fs::path& dir, const std::string& filename) {
    fs::path candidate = dir / filename;
    const std::string stem = fs::path(filename).stem().string();
    const std::string ext = fs::path(filename).extension().string();

    auto taken = [](const fs::path& p) {
        fs::path sidecar = p;
        sidecar.replace_extension(".json");
        return fs::exists(p) || fs::exists(sidecar);
    };

    int counter = 1;
    while (taken(candidate)) {
        candidate = dir / (stem + "_" + std::to_string(counter) + ext);
        ++counter;
    }
    return candidate;
}

fs::path PathUtils::CreateScratchDir(const std::string& prefix) {
    std::string pattern = (fs::temp_directory_path() / (prefix + "XXXXXX")).string();
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');
    if (::mkdtemp(buf.data()) == nullptr) {
        throw std::runtime_error("mkdtemp failed for " + pattern);
    }
    return fs::path(buf.data());
}

} // namespace audiovault::infrastructure
