/**
 * @file posix_process_runner.cpp
 * @brief openMonkey source file.
 */

#include "openmonkey/transport/posix_process_runner.hpp"

#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace omk {
namespace {

constexpr std::chrono::milliseconds kReapPollInterval{10};
constexpr std::chrono::milliseconds kCancelPollInterval{100};

struct LaunchedChild {
    pid_t pid = -1;
    int outputFd = -1;
};

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

std::string errnoText(const char* what, int error) {
    return std::string(what) + ": " + std::strerror(error);
}

// Status pipe carries errno from a failed execvp; EOF on it means exec succeeded.
bool launchChild(const std::vector<std::string>& argv, LaunchedChild& outChild, std::string& outError) {
    if (argv.empty()) {
        outError = "empty command line";
        return false;
    }

    int outputPipe[2] = {-1, -1};
    int statusPipe[2] = {-1, -1};
    if (::pipe2(outputPipe, O_CLOEXEC) != 0) {
        outError = errnoText("pipe", errno);
        return false;
    }
    if (::pipe2(statusPipe, O_CLOEXEC) != 0) {
        outError = errnoText("pipe", errno);
        closeFd(outputPipe[0]);
        closeFd(outputPipe[1]);
        return false;
    }

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1U);
    for (const auto& arg : argv) {
        cargv.push_back(const_cast<char*>(arg.c_str()));
    }
    cargv.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid == -1) {
        outError = errnoText("fork", errno);
        closeFd(outputPipe[0]);
        closeFd(outputPipe[1]);
        closeFd(statusPipe[0]);
        closeFd(statusPipe[1]);
        return false;
    }

    if (pid == 0) {
        const int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
        }
        ::dup2(outputPipe[1], STDOUT_FILENO);
        ::dup2(outputPipe[1], STDERR_FILENO);
        ::execvp(cargv[0], cargv.data());
        const int execErrno = errno;
        (void)::write(statusPipe[1], &execErrno, sizeof(execErrno));
        ::_exit(127);
    }

    closeFd(outputPipe[1]);
    closeFd(statusPipe[1]);

    int execErrno = 0;
    ssize_t n = 0;
    do {
        n = ::read(statusPipe[0], &execErrno, sizeof(execErrno));
    } while (n < 0 && errno == EINTR);
    closeFd(statusPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(execErrno))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        closeFd(outputPipe[0]);
        outError = errnoText(("exec " + argv.front()).c_str(), execErrno);
        return false;
    }

    outChild.pid = pid;
    outChild.outputFd = outputPipe[0];
    return true;
}

int decodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

int reapChild(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    return decodeWaitStatus(status);
}

// Reads fd until EOF. Returns false on a read error other than EINTR.
template <typename Sink>
bool drainFd(int fd, Sink&& sink) {
    std::array<char, 4096> buffer{};
    while (true) {
        const ssize_t n = ::read(fd, buffer.data(), buffer.size());
        if (n == 0) {
            return true;
        }
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        sink(buffer.data(), static_cast<std::size_t>(n));
    }
}

// Polls for exit until `deadline`. Returns true and sets outExitCode once reaped.
bool reapBefore(pid_t pid, std::chrono::steady_clock::time_point deadline, int& outExitCode) {
    while (true) {
        int status = 0;
        const pid_t rc = ::waitpid(pid, &status, WNOHANG);
        if (rc == pid) {
            outExitCode = decodeWaitStatus(status);
            return true;
        }
        if (rc < 0 && errno != EINTR) {
            outExitCode = -1;
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(kReapPollInterval);
    }
}

class PosixBackgroundProcess final : public IBackgroundProcess {
public:
    PosixBackgroundProcess(LaunchedChild child, std::ostream* output, std::chrono::milliseconds stopGrace)
        : pid_(child.pid), outputFd_(child.outputFd), stopGrace_(stopGrace) {
        pump_ = std::thread([this, output]() {
            (void)drainFd(outputFd_, [output](const char* data, std::size_t size) {
                if (output != nullptr) {
                    output->write(data, static_cast<std::streamsize>(size));
                    output->flush();
                }
            });
            closeFd(outputFd_);
        });
    }

    ~PosixBackgroundProcess() override {
        std::string ignored;
        (void)requestStop(ignored);
        (void)wait();
    }

    bool requestStop(std::string& outError) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (reaped_) {
            return true;
        }
        stopRequested_ = true;
        if (::kill(pid_, SIGTERM) != 0) {
            // Exited on its own but not yet reaped.
            if (errno == ESRCH) {
                return true;
            }
            outError = errnoText("kill", errno);
            return false;
        }
        return true;
    }

    int wait() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!reaped_) {
            if (stopRequested_ &&
                !reapBefore(pid_, std::chrono::steady_clock::now() + stopGrace_, exitCode_)) {
                (void)::kill(pid_, SIGKILL);
                forceKilled_ = true;
                exitCode_ = reapChild(pid_);
            } else if (!stopRequested_) {
                exitCode_ = reapChild(pid_);
            }
            reaped_ = true;
        }
        if (pump_.joinable()) {
            pump_.join();
        }
        return exitCode_;
    }

    bool running() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (reaped_) {
            return false;
        }
        int status = 0;
        const pid_t rc = ::waitpid(pid_, &status, WNOHANG);
        if (rc == pid_) {
            exitCode_ = decodeWaitStatus(status);
            reaped_ = true;
            return false;
        }
        return rc == 0;
    }

    bool forceKilled() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return forceKilled_;
    }

private:
    pid_t pid_ = -1;
    int outputFd_ = -1;
    std::chrono::milliseconds stopGrace_;
    std::thread pump_;
    mutable std::mutex mutex_;
    mutable bool reaped_ = false;
    mutable int exitCode_ = -1;
    bool stopRequested_ = false;
    bool forceKilled_ = false;
};

// Foreground drain that polls `keepRunning` between reads. Once it returns
// false the child gets SIGTERM, then SIGKILL after `stopGrace`; draining goes
// on until the pipe closes.
template <typename Sink>
bool drainCancellable(const LaunchedChild& child, const std::function<bool()>& keepRunning,
                      std::chrono::milliseconds stopGrace, Sink&& sink, bool& outInterrupted) {
    std::array<char, 4096> buffer{};
    bool killed = false;
    std::chrono::steady_clock::time_point killDeadline;
    while (true) {
        if (!outInterrupted && !keepRunning()) {
            outInterrupted = true;
            (void)::kill(child.pid, SIGTERM);
            killDeadline = std::chrono::steady_clock::now() + stopGrace;
        } else if (outInterrupted && !killed && std::chrono::steady_clock::now() >= killDeadline) {
            (void)::kill(child.pid, SIGKILL);
            killed = true;
        }

        pollfd pfd{child.outputFd, POLLIN, 0};
        const int rc = ::poll(&pfd, 1, static_cast<int>(kCancelPollInterval.count()));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        if (rc == 0) {
            continue;
        }
        const ssize_t n = ::read(child.outputFd, buffer.data(), buffer.size());
        if (n == 0) {
            return true;
        }
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            return false;
        }
        sink(buffer.data(), static_cast<std::size_t>(n));
    }
}

} // namespace

PosixProcessRunner::PosixProcessRunner(std::chrono::milliseconds stopGrace) : stopGrace_(stopGrace) {}

ProcessResult PosixProcessRunner::run(const ProcessRequest& request) {
    ProcessResult result;

    LaunchedChild child;
    if (!launchChild(request.argv, child, result.error)) {
        result.launched = false;
        result.exitCode = 127;
        return result;
    }
    result.launched = true;

    auto sink = [&](const char* data, std::size_t size) {
        if (request.output != nullptr) {
            request.output->write(data, static_cast<std::streamsize>(size));
        }
        if (request.captureOutput) {
            result.output.append(data, size);
        }
    };
    const bool drained = request.keepRunning
        ? drainCancellable(child, request.keepRunning, stopGrace_, sink, result.interrupted)
        : drainFd(child.outputFd, sink);
    if (!drained) {
        result.error = errnoText("read", errno);
    }
    closeFd(child.outputFd);
    if (request.output != nullptr) {
        request.output->flush();
    }

    result.exitCode = reapChild(child.pid);
    return result;
}

std::unique_ptr<IBackgroundProcess> PosixProcessRunner::spawn(const ProcessRequest& request,
                                                              std::string& outError) {
    outError.clear();
    LaunchedChild child;
    if (!launchChild(request.argv, child, outError)) {
        return nullptr;
    }
    return std::make_unique<PosixBackgroundProcess>(child, request.output, stopGrace_);
}

} // namespace omk
