/**
 * @file posix_process_runner.hpp
 * @brief openMonkey source file.
 */

#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "openmonkey/transport/i_process_runner.hpp"

namespace omk {

/**
 * @brief fork/execvp based process channel.
 *
 * The child's stdout and stderr share one pipe. Foreground runs drain the pipe
 * on the calling thread; background processes drain it on a pump thread owned
 * by the returned handle. Executables are resolved through PATH.
 *
 * Termination is SIGTERM first; a process still alive after `stopGrace` gets
 * SIGKILL.
 */
class PosixProcessRunner final : public IProcessRunner {
public:
    static constexpr std::chrono::milliseconds kDefaultStopGrace{2000};

    explicit PosixProcessRunner(std::chrono::milliseconds stopGrace = kDefaultStopGrace);

    ProcessResult run(const ProcessRequest& request) override;
    std::unique_ptr<IBackgroundProcess> spawn(const ProcessRequest& request,
                                              std::string& outError) override;

private:
    std::chrono::milliseconds stopGrace_;
};

} // namespace omk
