#include "dvs/process_streamer.hpp"

#include "core/time_utils.hpp"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <vector>

#ifdef __linux__
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace durin::dvs {

namespace {

constexpr int kLogPollMs = 50;

#ifdef __linux__
bool reap(pid_t pid, int timeout_ms) {
    const int64_t deadline = nowSteadyNs() + static_cast<int64_t>(timeout_ms) * 1000000LL;
    while (true) {
        int status = 0;
        const pid_t rc = waitpid(pid, &status, WNOHANG);
        if (rc == pid || (rc < 0 && errno == ECHILD)) {
            return true;
        }
        if (nowSteadyNs() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}
#endif

}  // namespace

std::string findOnPath(const std::string& name) {
#ifdef __linux__
    if (name.empty()) {
        return {};
    }
    if (name.find('/') != std::string::npos) {
        return access(name.c_str(), X_OK) == 0 ? name : std::string{};
    }
    const char* path = std::getenv("PATH");
    if (path == nullptr) {
        return {};
    }
    const std::string dirs(path);
    std::size_t begin = 0;
    while (begin <= dirs.size()) {
        const std::size_t end = dirs.find(':', begin);
        std::string dir = dirs.substr(begin, end == std::string::npos ? std::string::npos : end - begin);
        if (dir.empty()) {
            dir = ".";
        }
        const std::string candidate = dir + "/" + name;
        if (access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
        if (end == std::string::npos) {
            break;
        }
        begin = end + 1;
    }
#else
    (void)name;
#endif
    return {};
}

ProcessStreamer::ProcessStreamer(const DvsConfig& cfg) : cfg_(cfg), binary_path_(findOnPath(cfg.streamer_binary)) {
    if (binary_path_.empty()) {
        std::cerr << "warning: dvs: " << cfg_.streamer_binary << " not found on PATH, streaming disabled\n";
    }
}

ProcessStreamer::~ProcessStreamer() {
    stopStream();
}

bool ProcessStreamer::isStreaming() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return child_ > 0;
}

pid_t ProcessStreamer::pid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return child_;
}

void ProcessStreamer::startStream(const std::string& host, uint16_t port) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (binary_path_.empty()) {
        return;
    }
    stopLocked();

#ifdef __linux__
    int pipe_fds[2] = {-1, -1};
    if (pipe2(pipe_fds, O_CLOEXEC) < 0) {
        std::cerr << "dvs: pipe failed: " << std::strerror(errno) << "\n";
        return;
    }

    // argv is built before fork; the child only calls async-signal-safe functions.
    const std::string port_text = std::to_string(port);
    std::vector<std::string> args = {binary_path_, "input", cfg_.camera_input, "output", "udp", host, port_text};
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& a : args) {
        argv.push_back(a.data());
    }
    argv.push_back(nullptr);

    const pid_t pid = fork();
    if (pid < 0) {
        std::cerr << "dvs: fork failed: " << std::strerror(errno) << "\n";
        ::close(pipe_fds[0]);
        ::close(pipe_fds[1]);
        return;
    }
    if (pid == 0) {
        dup2(pipe_fds[1], STDOUT_FILENO);
        dup2(pipe_fds[1], STDERR_FILENO);
        execv(argv[0], argv.data());
        _exit(127);
    }

    ::close(pipe_fds[1]);
    child_ = pid;
    output_fd_ = pipe_fds[0];
    log_stop_.store(false);
    log_thread_ = std::thread(&ProcessStreamer::forwardOutput, output_fd_, &log_stop_);
    std::cerr << "dvs: started " << cfg_.streamer_binary << " (pid " << pid << ") -> " << host << ":" << port << "\n";
#else
    (void)host;
    (void)port;
#endif
}

void ProcessStreamer::stopStream() {
    std::lock_guard<std::mutex> lock(mutex_);
    stopLocked();
}

void ProcessStreamer::stopLocked() {
#ifdef __linux__
    if (child_ > 0) {
        if (kill(child_, SIGTERM) < 0 && errno != ESRCH) {
            std::cerr << "warning: dvs: SIGTERM failed: " << std::strerror(errno) << "\n";
        }
        if (!reap(child_, cfg_.streamer_stop_grace_ms)) {
            std::cerr << "warning: dvs: " << cfg_.streamer_binary << " ignored SIGTERM, killing\n";
            if (kill(child_, SIGKILL) < 0 && errno != ESRCH) {
                std::cerr << "warning: dvs: SIGKILL failed: " << std::strerror(errno) << "\n";
            }
            int status = 0;
            while (waitpid(child_, &status, 0) < 0 && errno == EINTR) {
            }
        }
        child_ = -1;
    }
    log_stop_.store(true);
    if (log_thread_.joinable()) {
        log_thread_.join();
    }
    if (output_fd_ >= 0) {
        ::close(output_fd_);
        output_fd_ = -1;
    }
#endif
}

void ProcessStreamer::forwardOutput(int fd, const std::atomic<bool>* stop) {
#ifdef __linux__
    std::string pending;
    char buf[256];
    while (!stop->load()) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        const int rc = poll(&pfd, 1, kLogPollMs);
        if (rc == 0 || (rc < 0 && errno == EINTR)) {
            continue;
        }
        if (rc < 0) {
            break;
        }
        const ssize_t n = read(fd, buf, sizeof(buf));
        if (n <= 0) {
            break;
        }
        pending.append(buf, static_cast<std::size_t>(n));
        std::size_t nl = 0;
        while ((nl = pending.find('\n')) != std::string::npos) {
            std::cerr << "dvs: streamer: " << pending.substr(0, nl) << "\n";
            pending.erase(0, nl + 1);
        }
    }
    if (!pending.empty()) {
        std::cerr << "dvs: streamer: " << pending << "\n";
    }
#else
    (void)fd;
    (void)stop;
#endif
}

}  // namespace durin::dvs
