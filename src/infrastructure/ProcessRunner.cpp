/**
 * @file ProcessRunner.cpp
 * @brief Implementation of ProcessRunner.
 */

#include "infrastructure/ProcessRunner.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace audiovault::infrastructure {

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kMaxCapturedOutput = 8192;
constexpr auto kPollInterval = std::chrono::milliseconds(5);

/** Closes both ends of a pipe on scope exit. */
class PipeGuard {
public:
    PipeGuard() : m_fd{-1, -1} {}
    ~PipeGuard() { closeRead(); closeWrite(); }

    PipeGuard(const PipeGuard&) = delete;
    PipeGuard& operator=(const PipeGuard&) = delete;

    bool create() { return pipe(m_fd) == 0; }
    int readEnd() const { return m_fd[0]; }
    int writeEnd() const { return m_fd[1]; }

    void closeRead() {
        if (m_fd[0] >= 0) { close(m_fd[0]); m_fd[0] = -1; }
    }
    void closeWrite() {
        if (m_fd[1] >= 0) { close(m_fd[1]); m_fd[1] = -1; }
    }

private:
    int m_fd[2];
};

void Drain(int fd, std::string& out) {
    char buf[1024];
    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n <= 0) return;
        std::size_t room = kMaxCapturedOutput > out.size() ? kMaxCapturedOutput - out.size() : 0;
        out.append(buf, std::min<std::size_t>(static_cast<std::size_t>(n), room));
    }
}

bool IsExecutableFile(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec) && access(p.c_str(), X_OK) == 0;
}

} // namespace

CommandResult ProcessRunner::Run(const std::vector<std::string>& argv,
                                 std::chrono::milliseconds timeout) {
    CommandResult result;
    if (argv.empty()) {
        result.output = "empty command line";
        return result;
    }

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        cargv.push_back(const_cast<char*>(arg.c_str()));
    }
    cargv.push_back(nullptr);

    PipeGuard outPipe;
    if (!outPipe.create()) {
        result.output = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }

    pid_t child = fork();
    if (child < 0) {
        result.output = std::string("fork failed: ") + std::strerror(errno);
        return result;
    }

    if (child == 0) {
        outPipe.closeRead();
        dup2(outPipe.writeEnd(), STDOUT_FILENO);
        dup2(outPipe.writeEnd(), STDERR_FILENO);
        outPipe.closeWrite();
        int devNull = open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
            close(devNull);
        }
        execvp(cargv[0], cargv.data());
        _exit(127);
    }

    outPipe.closeWrite();
    int flags = fcntl(outPipe.readEnd(), F_GETFL, 0);
    if (flags >= 0) {
        fcntl(outPipe.readEnd(), F_SETFL, flags | O_NONBLOCK);
    }

    result.started = true;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        Drain(outPipe.readEnd(), result.output);

        int status = 0;
        pid_t w = waitpid(child, &status, WNOHANG);
        if (w == child) {
            Drain(outPipe.readEnd(), result.output);
            if (WIFEXITED(status)) {
                result.exitCode = WEXITSTATUS(status);
            }
            // exec failure inside the child surfaces as 127
            if (result.exitCode == 127 && result.output.empty()) {
                result.output = "could not execute " + argv[0];
            }
            return result;
        }
        if (w < 0 && errno != EINTR) {
            result.output += std::string("\nwaitpid failed: ") + std::strerror(errno);
            return result;
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            kill(child, SIGKILL);
            waitpid(child, &status, 0);
            result.timedOut = true;
            return result;
        }
        std::this_thread::sleep_for(kPollInterval);
    }
}

std::optional<std::string> ProcessRunner::FindExecutable(const std::string& name) {
    if (name.empty()) return std::nullopt;

    if (name.find('/') != std::string::npos) {
        if (IsExecutableFile(name)) return fs::absolute(name).string();
        return std::nullopt;
    }

    const char* pathEnv = std::getenv("PATH");
    if (!pathEnv || !*pathEnv) return std::nullopt;

    std::stringstream ss(pathEnv);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) dir = ".";
        fs::path candidate = fs::path(dir) / name;
        if (IsExecutableFile(candidate)) {
            return candidate.string();
        }
    }
    return std::nullopt;
}

} // namespace audiovault::infrastructure
