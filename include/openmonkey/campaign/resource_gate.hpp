/**
 * @file resource_gate.hpp
 * @brief openMonkey source file.
 */

#pragma once

#include <ostream>

#include "openmonkey/campaign/polling.hpp"
#include "openmonkey/device/device_client.hpp"

namespace omk {

/**
 * @brief Holds the campaign until the battery is strictly above a threshold.
 */
class ResourceGate {
public:
    static constexpr std::chrono::milliseconds kDefaultPollInterval{60000};

    explicit ResourceGate(DeviceClient& device, PollingOptions polling = defaultPolling(),
                          std::ostream* log = nullptr);

    /**
     * @brief Poll the battery level until `level > threshold`.
     * @throws CommandError if the device cannot report a level.
     */
    GateOutcome waitForChargeAbove(int threshold);

    static PollingOptions defaultPolling();

private:
    DeviceClient& device_;
    PollingOptions polling_;
    std::ostream* log_ = nullptr;
};

} // namespace omk
