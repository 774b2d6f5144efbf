/**
 * @file run_orchestrator.cpp
 * @brief openMonkey source file.
 */

#include "openmonkey/campaign/run_orchestrator.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <thread>

#include "openmonkey/campaign/artifact_naming.hpp"
#include "openmonkey/campaign/stress_command.hpp"

namespace omk {
namespace {

PollingOptions withDefaults(PollingOptions polling, const OrchestratorOptions& options) {
    if (!polling.sleep && options.sleep) {
        polling.sleep = options.sleep;
    }
    if (!polling.keepWaiting && options.keepRunning) {
        polling.keepWaiting = options.keepRunning;
    }
    return polling;
}

std::vector<std::string> shellArguments(const RunConfig& config) {
    auto args = StressCommand::buildArguments(config);
    args.insert(args.begin(), "shell");
    return args;
}

} // namespace

RunOrchestrator::RunOrchestrator(DeviceClient& device, ReportRenderer& renderer, OrchestratorOptions options)
    : device_(device),
      renderer_(renderer),
      options_(std::move(options)),
      readiness_(device, withDefaults(options_.bootPolling, options_), options_.log),
      resources_(device, withDefaults(options_.chargePolling, options_), options_.log),
      capture_(device) {}

void RunOrchestrator::onStateChange(StateCallback callback) { stateCallback_ = std::move(callback); }

RunState RunOrchestrator::state() const noexcept { return state_; }

bool RunOrchestrator::cancelled() const {
    return options_.keepRunning && !options_.keepRunning();
}

void RunOrchestrator::transition(std::uint32_t runIndex, RunState next) {
    state_ = next;
    if (stateCallback_) {
        stateCallback_(runIndex, next);
    }
}

void RunOrchestrator::settle() {
    if (options_.settleDelay.count() <= 0) {
        return;
    }
    if (options_.sleep) {
        options_.sleep(options_.settleDelay);
    } else {
        std::this_thread::sleep_for(options_.settleDelay);
    }
}

bool RunOrchestrator::collectBugreport(const RunArtifacts& artifacts) {
    std::ofstream report(artifacts.bugreport, std::ios::out | std::ios::trunc);
    if (!report) {
        std::cerr << "[omk] cannot open " << artifacts.bugreport << " for bugreport\n";
        return false;
    }
    try {
        device_.bugreport(report);
    } catch (const CommandError& ex) {
        std::cerr << "[omk] bugreport collection failed: " << ex.what() << '\n';
        return false;
    }
    return true;
}

RunResult RunOrchestrator::runOnce(const RunConfig& config) {
    RunResult result;
    result.runIndex = config.runIndex;
    result.startedAt = std::chrono::system_clock::now();
    result.artifacts = ArtifactNaming::artifacts(config.outputDirectory, config.totalRuns, config.runIndex);

    transition(config.runIndex, RunState::Idle);
    if (options_.log != nullptr) {
        *options_.log << "[omk] run " << config.runIndex << "/" << config.totalRuns << ": rebooting device\n";
    }

    transition(config.runIndex, RunState::Rebooting);
    if (!readiness_.rebootAndWait().satisfied) {
        throw std::runtime_error("boot wait cancelled");
    }
    settle();

    transition(config.runIndex, RunState::AwaitingCharge);
    if (!resources_.waitForChargeAbove(config.batteryThreshold).satisfied) {
        throw std::runtime_error("charge wait cancelled");
    }

    transition(config.runIndex, RunState::Capturing);
    // Declaration order matters: on unwind the capture is joined before the stress log closes.
    std::ofstream monkeyLog(result.artifacts.monkeyLog, std::ios::out | std::ios::trunc);
    if (!monkeyLog) {
        throw std::runtime_error("cannot open stress log: " + result.artifacts.monkeyLog);
    }
    CaptureHandle capture = capture_.start(result.artifacts.deviceLog, options_.logFilterSpec);

    transition(config.runIndex, RunState::StressRunning);
    if (options_.log != nullptr) {
        *options_.log << "[omk] run " << config.runIndex << ": injecting " << config.eventCount << " events\n";
    }
    try {
        device_.executeInto(shellArguments(config), monkeyLog);
        result.status = RunStatus::Clean;
        transition(config.runIndex, RunState::Clean);
    } catch (const CommandError& ex) {
        result.status = RunStatus::Failed;
        result.failureCause = ex.what();
        result.interrupted = cancelled();
        transition(config.runIndex, RunState::Failed);
        if (!result.interrupted) {
            result.bugreportCollected = collectBugreport(result.artifacts);
        }
    }

    transition(config.runIndex, RunState::ArtifactCollection);
    monkeyLog.close();
    (void)capture.stop();

    if (result.interrupted) {
        std::cerr << "[omk] run " << config.runIndex << ": interrupted by stop request\n";
    } else if (result.status == RunStatus::Failed) {
        std::string error;
        result.reportRendered = renderer_.render(result.artifacts, error);
        if (!result.reportRendered) {
            std::cerr << "[omk] report rendering failed for run " << config.runIndex << ": " << error << '\n';
        }
        if (options_.log != nullptr) {
            *options_.log << "[omk] run " << config.runIndex << ": failed (" << result.failureCause << ")\n";
        }
    } else if (options_.log != nullptr) {
        *options_.log << "[omk] run " << config.runIndex << ": clean\n";
    }

    result.finishedAt = std::chrono::system_clock::now();
    transition(config.runIndex, RunState::Done);
    return result;
}

void RunOrchestrator::prepareOutputDirectory(const std::string& directory) {
    namespace fs = std::filesystem;
    if (directory.empty()) {
        throw std::runtime_error("output directory is empty");
    }
    const fs::path path(directory);
    if (fs::exists(path) && !fs::is_directory(path)) {
        throw std::runtime_error("output path exists and is not a directory: " + directory);
    }
    fs::create_directories(path);
}

CampaignSummary RunOrchestrator::runCampaign(const RunConfig& base, StopPredicate stopRequested) {
    prepareOutputDirectory(base.outputDirectory);

    CampaignSummary summary;
    for (std::uint32_t index = 1; index <= base.totalRuns; ++index) {
        if ((stopRequested && stopRequested()) || cancelled()) {
            summary.stoppedEarly = true;
            break;
        }

        RunConfig config = base;
        config.runIndex = index;
        auto result = runOnce(config);

        if (result.interrupted) {
            ++summary.interruptedRuns;
            summary.stoppedEarly = true;
            summary.results.push_back(std::move(result));
            break;
        }
        ++summary.runsCompleted;
        if (result.status == RunStatus::Failed) {
            ++summary.failedRuns;
        } else {
            ++summary.cleanRuns;
        }
        summary.results.push_back(std::move(result));
    }

    if (summary.runsCompleted > 0U) {
        summary.failureRate =
            static_cast<double>(summary.failedRuns) / static_cast<double>(summary.runsCompleted);
    }
    state_ = RunState::Idle;
    return summary;
}

} // namespace omk
