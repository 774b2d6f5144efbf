/**
 * @file run_types.hpp
 * @brief openMonkey source file.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace omk {

enum class FailureFilter : std::uint8_t {
    None,
    Crash,
    Anr,
};

enum class RunStatus : std::uint8_t {
    Clean,
    Failed,
};

enum class RunState : std::uint8_t {
    Idle,
    Rebooting,
    AwaitingCharge,
    Capturing,
    StressRunning,
    Clean,
    Failed,
    ArtifactCollection,
    Done,
};

/**
 * @brief Immutable per-run input derived from the campaign options.
 */
struct RunConfig {
    std::uint64_t eventCount = 125000;
    std::vector<std::string> packages;
    FailureFilter failureFilter = FailureFilter::None;
    std::string descriptionFilter;
    std::string outputDirectory;
    std::uint32_t totalRuns = 1;
    std::uint32_t runIndex = 1;
    int batteryThreshold = 20;
};

struct RunArtifacts {
    std::string monkeyLog;
    std::string deviceLog;
    std::string bugreport;
    std::string report;
};

/**
 * @brief Outcome record for one completed run.
 */
struct RunResult {
    std::uint32_t runIndex = 0;
    RunStatus status = RunStatus::Clean;
    RunArtifacts artifacts;
    std::string failureCause;
    bool bugreportCollected = false;
    bool reportRendered = false;
    /**
     * @brief Stress step was cut short by a stop request; no artifacts collected.
     */
    bool interrupted = false;
    std::chrono::system_clock::time_point startedAt{};
    std::chrono::system_clock::time_point finishedAt{};
};

struct CampaignSummary {
    std::uint32_t runsCompleted = 0;
    std::uint32_t cleanRuns = 0;
    std::uint32_t failedRuns = 0;
    // Interrupted runs are kept in `results` but not counted as completed.
    std::uint32_t interruptedRuns = 0;
    double failureRate = 0.0;
    bool stoppedEarly = false;
    std::vector<RunResult> results;
};

inline const char* toString(FailureFilter filter) {
    switch (filter) {
    case FailureFilter::None:
        return "none";
    case FailureFilter::Crash:
        return "crash";
    case FailureFilter::Anr:
        return "anr";
    }
    return "unknown";
}

inline const char* toString(RunStatus status) {
    switch (status) {
    case RunStatus::Clean:
        return "clean";
    case RunStatus::Failed:
        return "failed";
    }
    return "unknown";
}

inline const char* toString(RunState state) {
    switch (state) {
    case RunState::Idle:
        return "IDLE";
    case RunState::Rebooting:
        return "REBOOTING";
    case RunState::AwaitingCharge:
        return "AWAITING-CHARGE";
    case RunState::Capturing:
        return "CAPTURING";
    case RunState::StressRunning:
        return "STRESS-RUNNING";
    case RunState::Clean:
        return "CLEAN";
    case RunState::Failed:
        return "FAILED";
    case RunState::ArtifactCollection:
        return "ARTIFACT-COLLECTION";
    case RunState::Done:
        return "DONE";
    }
    return "UNKNOWN";
}

inline std::optional<FailureFilter> parseFailureFilter(const std::string& text) {
    if (text.empty() || text == "none") {
        return FailureFilter::None;
    }
    if (text == "crash") {
        return FailureFilter::Crash;
    }
    if (text == "anr") {
        return FailureFilter::Anr;
    }
    return std::nullopt;
}

} // namespace omk
