#include "app/SignalWait.hpp"

#include <chrono>
#include <csignal>
#include <thread>

#include <signal.h>

namespace audiovault::app {

namespace {

volatile std::sig_atomic_t g_stopRequested = 0;

void HandleStop(int) {
    g_stopRequested = 1;
}

} // namespace

void InstallStopHandlers() {
    struct sigaction sa {};
    sa.sa_handler = &HandleStop;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

void WaitForStopSignal() {
    while (!g_stopRequested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

bool StopRequested() {
    return g_stopRequested != 0;
}

} // namespace audiovault::app
