// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace audiovault::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetConfigHome();

    /** @brief Directory holding settings.json ($XDG_CONFIG_HOME/AudioVault). */
    static std::filesystem::path GetAppConfigDir();

    /**
     * @brief First free path for filename inside dir.
     *
     * "a.opus" becomes "a_1.opus", "a_2.opus", ... while the candidate or its
     * ".json" sidecar exists.
     */
    static std::filesystem::path ResolveUniquePath(const std::filesystem::path& dir, const std::string& filename);

    /** @brief Creates a fresh, empty directory under the system temp dir. */
    static std::filesystem::path CreateScratchDir(const std::string& prefix);
};

} // namespace audiovault::infrastructure
