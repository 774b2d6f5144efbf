#include "openmonkey/transport/runner_factory.hpp"

#include <algorithm>
#include <cctype>

#include "openmonkey/core/string_utils.hpp"
#include "openmonkey/transport/mock_process_runner.hpp"
#include "openmonkey/transport/posix_process_runner.hpp"

namespace omk {

bool RunnerFactory::parseDeviceSpec(const std::string& spec,
                                    RunnerFactoryConfig& outConfig,
                                    std::string& outError) {
    outError.clear();
    const auto trimmed = trimCopy(spec);
    if (trimmed.empty()) {
        outError = "device spec is empty";
        return false;
    }

    if (trimmed == "mock") {
        outConfig.kind = RunnerKind::Mock;
        outConfig.serial.clear();
        return true;
    }

    if (trimmed == "adb") {
        outConfig.kind = RunnerKind::Adb;
        outConfig.serial.clear();
        return true;
    }

    constexpr const char* kAdbPrefix = "adb:";
    if (trimmed.rfind(kAdbPrefix, 0) == 0) {
        outConfig.kind = RunnerKind::Adb;
        outConfig.serial = trimCopy(trimmed.substr(4));
        if (outConfig.serial.empty()) {
            outError = "adb device spec requires a serial, e.g. adb:emulator-5554";
            return false;
        }
        if (std::any_of(outConfig.serial.begin(), outConfig.serial.end(),
                        [](unsigned char c) { return std::isspace(c); })) {
            outError = "adb serial must not contain whitespace";
            return false;
        }
        return true;
    }

    outError = "unsupported device spec '" + spec + "', expected 'mock', 'adb' or 'adb:<serial>'";
    return false;
}

std::unique_ptr<IProcessRunner> RunnerFactory::create(const RunnerFactoryConfig& config,
                                                      std::string& outError) {
    outError.clear();

    if (config.kind == RunnerKind::Mock) {
        return std::make_unique<MockProcessRunner>(config.adbPath);
    }

    if (config.kind != RunnerKind::Adb) {
        outError = "unsupported runner kind";
        return nullptr;
    }

    if (config.adbPath.empty()) {
        outError = "adb runner requires adbPath";
        return nullptr;
    }
    return std::make_unique<PosixProcessRunner>();
}

} // namespace omk
