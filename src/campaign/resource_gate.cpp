/**
 * @file resource_gate.cpp
 * @brief openMonkey source file.
 */

#include "openmonkey/campaign/resource_gate.hpp"

namespace omk {

ResourceGate::ResourceGate(DeviceClient& device, PollingOptions polling, std::ostream* log)
    : device_(device), polling_(std::move(polling)), log_(log) {}

PollingOptions ResourceGate::defaultPolling() {
    PollingOptions options;
    options.interval = kDefaultPollInterval;
    return options;
}

GateOutcome ResourceGate::waitForChargeAbove(int threshold) {
    GateOutcome outcome;
    while (true) {
        ++outcome.polls;
        const int level = device_.getBatteryLevel();
        if (level > threshold) {
            outcome.satisfied = true;
            return outcome;
        }
        if (log_ != nullptr) {
            *log_ << "[omk] battery at " << level << "%, waiting for more than " << threshold << "%\n";
        }
        if (pollingCancelled(polling_)) {
            return outcome;
        }
        pollingSleep(polling_);
    }
}

} // namespace omk
