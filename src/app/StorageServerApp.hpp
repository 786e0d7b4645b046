/**
 * @file StorageServerApp.hpp
 * @brief Storage server process.
 */

#pragma once

#include <string>

namespace audiovault::app {

class StorageServerApp {
public:
    explicit StorageServerApp(std::string configDir);

    /**
     * @brief Serves the REST surface until SIGINT/SIGTERM.
     * @return Exit code (0 for success).
     */
    int Run();

private:
    std::string m_configDir;
};

} // namespace audiovault::app
