#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <thread>

namespace omk {

/**
 * @brief Pacing and cancellation for an unbounded polling wait.
 *
 * Without `keepWaiting` the wait never gives up.
 */
struct PollingOptions {
    std::chrono::milliseconds interval{1000};
    std::function<void(std::chrono::milliseconds)> sleep;
    std::function<bool()> keepWaiting;
};

struct GateOutcome {
    bool satisfied = false;
    std::size_t polls = 0;
};

inline void pollingSleep(const PollingOptions& options) {
    if (options.sleep) {
        options.sleep(options.interval);
    } else {
        std::this_thread::sleep_for(options.interval);
    }
}

inline bool pollingCancelled(const PollingOptions& options) {
    return options.keepWaiting && !options.keepWaiting();
}

} // namespace omk
