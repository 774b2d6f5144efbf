/**
 * @file device_client.cpp
 * @brief openMonkey source file.
 */

#include "openmonkey/device/device_client.hpp"

#include <string>

#include "openmonkey/core/string_utils.hpp"
#include "openmonkey/device/property_dump.hpp"

namespace omk {
namespace {

std::vector<std::string> prefixed(const char* head, const std::vector<std::string>& tail) {
    std::vector<std::string> args;
    args.reserve(tail.size() + 1U);
    args.emplace_back(head);
    args.insert(args.end(), tail.begin(), tail.end());
    return args;
}

} // namespace

CommandError::CommandError(std::string command, int exitCode, const std::string& detail)
    : std::runtime_error("command '" + command + "' failed with exit code " + std::to_string(exitCode) +
                         (detail.empty() ? std::string{} : ": " + detail)),
      command_(std::move(command)),
      exitCode_(exitCode) {}

DeviceClient::DeviceClient(IProcessRunner& runner, DeviceClientOptions options)
    : runner_(runner), options_(std::move(options)) {}

std::vector<std::string> DeviceClient::commandLine(const std::vector<std::string>& args) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 3U);
    argv.push_back(options_.adbPath);
    if (!options_.serial.empty()) {
        argv.emplace_back("-s");
        argv.push_back(options_.serial);
    }
    argv.insert(argv.end(), args.begin(), args.end());
    return argv;
}

const DeviceClientOptions& DeviceClient::options() const noexcept { return options_; }

ProcessResult DeviceClient::invoke(const std::vector<std::string>& args, std::ostream* output, bool capture) {
    ProcessRequest request;
    request.argv = commandLine(args);
    request.output = output;
    request.captureOutput = capture;
    request.keepRunning = options_.keepRunning;

    ProcessResult result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result = runner_.run(request);
    }

    if (result.interrupted) {
        throw CommandError(joinCommandLine(request.argv), result.exitCode, "interrupted by stop request");
    }
    if (!result.launched) {
        throw CommandError(joinCommandLine(request.argv), result.exitCode, result.error);
    }
    if (result.exitCode != 0) {
        throw CommandError(joinCommandLine(request.argv), result.exitCode, trimCopy(result.output));
    }
    return result;
}

void DeviceClient::execute(const std::vector<std::string>& args) { (void)invoke(args, nullptr, false); }

std::string DeviceClient::executeCapturing(const std::vector<std::string>& args) {
    return invoke(args, nullptr, true).output;
}

void DeviceClient::executeInto(const std::vector<std::string>& args, std::ostream& output) {
    (void)invoke(args, &output, false);
}

void DeviceClient::shell(const std::vector<std::string>& args) { execute(prefixed("shell", args)); }

std::string DeviceClient::shellCapturing(const std::vector<std::string>& args) {
    return executeCapturing(prefixed("shell", args));
}

void DeviceClient::waitReady() { execute({"wait-for-device"}); }

std::string DeviceClient::getProperty(const std::string& name) {
    return trimCopy(shellCapturing({"getprop", name}));
}

void DeviceClient::reboot() { execute({"reboot"}); }

int DeviceClient::getBatteryLevel() {
    const auto dump = shellCapturing({"dumpsys", "battery"});
    const auto level = integerProperty(parsePropertyDump(dump), "level");
    if (!level) {
        throw CommandError(joinCommandLine(commandLine({"shell", "dumpsys", "battery"})), 0,
                           "battery dump has no integer 'level'");
    }
    if (*level < 0 || *level > 100) {
        throw CommandError(joinCommandLine(commandLine({"shell", "dumpsys", "battery"})), 0,
                           "battery level " + std::to_string(*level) + " outside 0..100");
    }
    return static_cast<int>(*level);
}

void DeviceClient::dismissKeyguard() { shell({"input", "keyevent", "82"}); }

void DeviceClient::clearLog() { execute({"logcat", "-c"}); }

void DeviceClient::bugreport(std::ostream& output) { executeInto({"bugreport"}, output); }

std::unique_ptr<IBackgroundProcess> DeviceClient::spawnLogStream(const std::vector<std::string>& filterSpec,
                                                                 std::ostream& output) {
    std::vector<std::string> args{"logcat", "-v", "threadtime"};
    args.insert(args.end(), filterSpec.begin(), filterSpec.end());

    ProcessRequest request;
    request.argv = commandLine(args);
    request.output = &output;

    std::string error;
    auto process = runner_.spawn(request, error);
    if (!process) {
        throw CommandError(joinCommandLine(request.argv), 127, error);
    }
    return process;
}

} // namespace omk
