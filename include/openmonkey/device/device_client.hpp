/**
 * @file device_client.hpp
 * @brief openMonkey source file.
 */

#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

#include "openmonkey/device/command_error.hpp"
#include "openmonkey/transport/i_process_runner.hpp"

namespace omk {

struct DeviceClientOptions {
    std::string adbPath = "adb";
    std::string serial;
    /**
     * @brief Polled during every foreground command; false terminates the command.
     */
    std::function<bool()> keepRunning;
};

/**
 * @brief Synchronous device-control session for exactly one device.
 *
 * Every primitive is an adb invocation (`adb [-s serial] ...`) issued through
 * the process channel. Foreground commands are serialized by the session; the
 * background log stream is an independent process. Any non-zero exit, and
 * any command cut short by `keepRunning`, raises CommandError. No retries are
 * performed here.
 */
class DeviceClient {
public:
    explicit DeviceClient(IProcessRunner& runner, DeviceClientOptions options = {});

    DeviceClient(const DeviceClient&) = delete;
    DeviceClient& operator=(const DeviceClient&) = delete;

    void execute(const std::vector<std::string>& args);
    std::string executeCapturing(const std::vector<std::string>& args);
    /**
     * @brief Run and stream merged stdout/stderr into `output`.
     */
    void executeInto(const std::vector<std::string>& args, std::ostream& output);

    void shell(const std::vector<std::string>& args);
    std::string shellCapturing(const std::vector<std::string>& args);

    /**
     * @brief Block until the adb daemon reports the device as connected.
     */
    void waitReady();
    std::string getProperty(const std::string& name);
    void reboot();
    /**
     * @brief `level` from `dumpsys battery`.
     * @throws CommandError when the dump carries no integer level in 0..100.
     */
    int getBatteryLevel();
    /**
     * @brief Send the MENU key event, which unlocks a non-secure keyguard.
     */
    void dismissKeyguard();
    void clearLog();
    void bugreport(std::ostream& output);

    /**
     * @brief Start a `logcat` stream writing into `output`.
     * @throws CommandError when the process cannot be launched.
     */
    std::unique_ptr<IBackgroundProcess> spawnLogStream(const std::vector<std::string>& filterSpec,
                                                       std::ostream& output);

    std::vector<std::string> commandLine(const std::vector<std::string>& args) const;
    const DeviceClientOptions& options() const noexcept;

private:
    ProcessResult invoke(const std::vector<std::string>& args, std::ostream* output, bool capture);

    IProcessRunner& runner_;
    DeviceClientOptions options_;
    std::mutex mutex_;
};

} // namespace omk
