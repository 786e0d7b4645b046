#include <cstdlib>
#include <string>

#include "app/StorageServerApp.hpp"
#include "infrastructure/PathUtils.hpp"

using namespace audiovault;

int main() {
    const char* configDir = std::getenv("AUDIOVAULT_CONFIG_DIR");
    std::string dir = (configDir && *configDir)
        ? std::string(configDir)
        : infrastructure::PathUtils::GetAppConfigDir().string();

    app::StorageServerApp server(dir);
    return server.Run();
}
