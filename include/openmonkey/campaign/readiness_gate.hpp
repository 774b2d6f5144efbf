/**
 * @file readiness_gate.hpp
 * @brief openMonkey source file.
 */

#pragma once

#include <ostream>

#include "openmonkey/campaign/polling.hpp"
#include "openmonkey/device/device_client.hpp"

namespace omk {

/**
 * @brief Waits for a rebooted device to report a completed boot.
 *
 * After `wait-for-device`, `sys.boot_completed` is polled until it reads
 * exactly "1". The keyguard is then dismissed on a best-effort basis: a failed
 * dismissal is logged and the run proceeds.
 */
class ReadinessGate {
public:
    static constexpr std::chrono::milliseconds kDefaultPollInterval{2000};

    explicit ReadinessGate(DeviceClient& device, PollingOptions polling = defaultPolling(),
                           std::ostream* log = nullptr);

    GateOutcome waitUntilBooted();
    GateOutcome rebootAndWait();

    static PollingOptions defaultPolling();

private:
    DeviceClient& device_;
    PollingOptions polling_;
    std::ostream* log_ = nullptr;
};

} // namespace omk
