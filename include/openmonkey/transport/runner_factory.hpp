#pragma once

#include <memory>
#include <string>

#include "openmonkey/transport/i_process_runner.hpp"

namespace omk {

enum class RunnerKind {
    Mock,
    Adb,
};

struct RunnerFactoryConfig {
    RunnerKind kind = RunnerKind::Adb;
    std::string adbPath = "adb";
    std::string serial;
};

/**
 * @brief Create process runners from a small device spec.
 *
 * Device spec format for parseDeviceSpec:
 * - mock
 * - adb
 * - adb:<serial>
 */
class RunnerFactory {
public:
    static bool parseDeviceSpec(const std::string& spec,
                                RunnerFactoryConfig& outConfig,
                                std::string& outError);

    static std::unique_ptr<IProcessRunner> create(const RunnerFactoryConfig& config,
                                                  std::string& outError);
};

} // namespace omk
