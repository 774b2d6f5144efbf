/**
 * @file log_capture.hpp
 * @brief openMonkey source file.
 */

#pragma once

#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include "openmonkey/device/device_client.hpp"

namespace omk {

/**
 * @brief Owns one background log stream and the file it writes into.
 *
 * Move-only. `stop()` terminates the stream, waits for the process and its
 * pump, then closes the file. It runs at most once; the destructor calls it.
 * A stream that ignores termination is killed by the runner after its grace
 * period. Termination races, forced kills and close errors are logged, never
 * thrown.
 */
class CaptureHandle {
public:
    CaptureHandle() = default;
    CaptureHandle(std::unique_ptr<std::ofstream> file, std::unique_ptr<IBackgroundProcess> process,
                  std::string outputPath);
    ~CaptureHandle();

    CaptureHandle(CaptureHandle&& other) noexcept;
    CaptureHandle& operator=(CaptureHandle&& other) noexcept;
    CaptureHandle(const CaptureHandle&) = delete;
    CaptureHandle& operator=(const CaptureHandle&) = delete;

    /**
     * @brief Stop and join the stream. Later calls are no-ops.
     * @return false if any step of the teardown reported a problem.
     */
    bool stop() noexcept;
    bool active() const noexcept;
    const std::string& outputPath() const noexcept;

private:
    // Destroyed in reverse order: the process is joined before the file closes.
    std::unique_ptr<std::ofstream> file_;
    std::unique_ptr<IBackgroundProcess> process_;
    std::string outputPath_;
};

class LogCapture {
public:
    explicit LogCapture(DeviceClient& device);

    /**
     * @brief Clear the device log buffer and start streaming it into `outputPath`.
     * @throws CommandError if the buffer cannot be cleared or the stream cannot start.
     * @throws std::runtime_error if `outputPath` cannot be opened.
     */
    CaptureHandle start(const std::string& outputPath, const std::vector<std::string>& filterSpec = {});

private:
    DeviceClient& device_;
};

} // namespace omk
