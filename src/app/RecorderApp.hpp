/**
 * @file RecorderApp.hpp
 * @brief Recorder process: microphone capture feeding a delivery session.
 */

#pragma once

#include <string>

namespace audiovault::app {

/**
 * @class RecorderApp
 * @brief Wires configuration, codec, transport and fallback store into a SegmentRecorder.
 */
class RecorderApp {
public:
    /**
     * @param configDir Directory containing settings.json.
     */
    explicit RecorderApp(std::string configDir);

    /**
     * @brief Records until SIGINT/SIGTERM, then flushes and drains.
     * @return Exit code (0 for success).
     */
    int Run();

private:
    std::string m_configDir;
};

} // namespace audiovault::app
