/**
 * @file readiness_gate.cpp
 * @brief openMonkey source file.
 */

#include "openmonkey/campaign/readiness_gate.hpp"

#include <iostream>

namespace omk {

ReadinessGate::ReadinessGate(DeviceClient& device, PollingOptions polling, std::ostream* log)
    : device_(device), polling_(std::move(polling)), log_(log) {}

PollingOptions ReadinessGate::defaultPolling() {
    PollingOptions options;
    options.interval = kDefaultPollInterval;
    return options;
}

GateOutcome ReadinessGate::waitUntilBooted() {
    GateOutcome outcome;
    device_.waitReady();

    while (true) {
        ++outcome.polls;
        if (device_.getProperty("sys.boot_completed") == "1") {
            break;
        }
        if (pollingCancelled(polling_)) {
            return outcome;
        }
        pollingSleep(polling_);
    }
    outcome.satisfied = true;

    try {
        device_.dismissKeyguard();
    } catch (const CommandError& ex) {
        std::cerr << "[omk] keyguard dismissal failed, continuing: " << ex.what() << '\n';
    }

    if (log_ != nullptr) {
        *log_ << "[omk] device booted after " << outcome.polls << " poll(s)\n";
    }
    return outcome;
}

GateOutcome ReadinessGate::rebootAndWait() {
    device_.reboot();
    return waitUntilBooted();
}

} // namespace omk
