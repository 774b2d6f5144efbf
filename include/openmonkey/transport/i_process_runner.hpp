/**
 * @file i_process_runner.hpp
 * @brief openMonkey source file.
 */

#pragma once

#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace omk {

/**
 * @brief One local process invocation.
 *
 * stdout and stderr are merged. When `output` is set the merged stream is
 * written there; when `captureOutput` is set it is also collected into
 * ProcessResult::output. A foreground run polls `keepRunning` while it waits
 * and terminates the process once it returns false.
 */
struct ProcessRequest {
    std::vector<std::string> argv;
    std::ostream* output = nullptr;
    bool captureOutput = false;
    std::function<bool()> keepRunning;
};

struct ProcessResult {
    bool launched = false;
    int exitCode = -1;
    bool interrupted = false;
    std::string output;
    std::string error;
};

/**
 * @brief Long-lived process whose output is pumped into a sink by an owned thread.
 */
class IBackgroundProcess {
public:
    virtual ~IBackgroundProcess() = default;

    /**
     * @brief Ask the process to terminate.
     * @return false only when the signal could not be delivered to a live process.
     */
    virtual bool requestStop(std::string& outError) = 0;
    /**
     * @brief Block until the process exited and its output was drained.
     *
     * After requestStop(), a process still alive at the end of the stop grace
     * period is killed outright.
     * @return process exit status, 128 + signal number when killed by a signal.
     */
    virtual int wait() = 0;
    virtual bool running() const = 0;
    /**
     * @brief True when wait() had to escalate past the termination request.
     */
    virtual bool forceKilled() const = 0;
};

/**
 * @brief Abstract process channel used by the device client.
 *
 * Implementations execute command lines either in the foreground (blocking
 * until exit) or as background streams.
 */
class IProcessRunner {
public:
    virtual ~IProcessRunner() = default;

    /**
     * @brief Run a process to completion.
     */
    virtual ProcessResult run(const ProcessRequest& request) = 0;

    /**
     * @brief Start a background process writing into request.output.
     * @return nullptr on launch failure, with outError set.
     */
    virtual std::unique_ptr<IBackgroundProcess> spawn(const ProcessRequest& request,
                                                      std::string& outError) = 0;
};

std::string joinCommandLine(const std::vector<std::string>& argv);

} // namespace omk
