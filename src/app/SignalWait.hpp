#pragma once

namespace audiovault::app {

/** @brief Routes SIGINT and SIGTERM to WaitForStopSignal(). */
void InstallStopHandlers();

/** @brief Blocks the calling thread until SIGINT or SIGTERM arrives. */
void WaitForStopSignal();

/** @brief True once a stop signal was received. */
bool StopRequested();

} // namespace audiovault::app
