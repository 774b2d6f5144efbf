/**
 * @file openmonkey.cpp
 * @brief Reboot/monkey stress campaign runner.
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

#include "openmonkey/campaign/report_renderer.hpp"
#include "openmonkey/campaign/run_orchestrator.hpp"
#include "openmonkey/config/campaign_options.hpp"
#include "openmonkey/config/campaign_validator.hpp"
#include "openmonkey/device/device_client.hpp"
#include "openmonkey/transport/runner_factory.hpp"

namespace {

std::atomic_bool gStopRequested{false};

void handleSignal(int) {
    gStopRequested.store(true);
}

void printSummary(const omk::CampaignSummary& summary, const std::string& outputDirectory) {
    std::cout << "runs=" << summary.runsCompleted
              << " clean=" << summary.cleanRuns
              << " failed=" << summary.failedRuns
              << (summary.interruptedRuns > 0U ? " interrupted=" + std::to_string(summary.interruptedRuns)
                                               : std::string{})
              << " fail_rate=" << std::fixed << std::setprecision(3) << summary.failureRate
              << (summary.stoppedEarly ? " (stopped early)" : "") << '\n';
    for (const auto& result : summary.results) {
        if (result.status == omk::RunStatus::Failed && !result.interrupted) {
            std::cout << "  run " << result.runIndex << " " << omk::toString(result.status) << ": "
                      << result.artifacts.monkeyLog
                      << (result.reportRendered ? " report=" + result.artifacts.report : std::string{})
                      << '\n';
        }
    }
    std::cout << "artifacts in " << outputDirectory << '\n';
}

} // namespace

int main(int argc, char** argv) {
    omk::CampaignOptions options;
    std::string error;
    if (!omk::CampaignOptionsParser::parse(argc, argv, options, error)) {
        std::cerr << error << '\n';
        omk::CampaignOptionsParser::printUsage(std::cerr, argv[0]);
        return 1;
    }
    if (options.showHelp) {
        omk::CampaignOptionsParser::printUsage(std::cout, argv[0]);
        return 0;
    }
    omk::CampaignOptionsParser::applyEnvironment(options);
    omk::CampaignOptionsParser::applyDefaults(options, std::chrono::system_clock::now());

    const auto issues = omk::CampaignValidator::validate(options);
    for (const auto& issue : issues) {
        std::cerr << (issue.severity == omk::ValidationSeverity::Error ? "error: " : "warning: ")
                  << issue.message << '\n';
    }
    if (omk::CampaignValidator::hasErrors(issues)) {
        return 1;
    }

    omk::RunnerFactoryConfig runnerConfig;
    runnerConfig.adbPath = options.adbPath;
    if (!omk::RunnerFactory::parseDeviceSpec(options.deviceSpec, runnerConfig, error)) {
        std::cerr << error << '\n';
        return 1;
    }
    auto runner = omk::RunnerFactory::create(runnerConfig, error);
    if (!runner) {
        std::cerr << "runner creation failed: " << error << '\n';
        return 1;
    }

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    const auto keepRunning = [] { return !gStopRequested.load(); };

    try {
        omk::DeviceClient device(*runner, {.adbPath = runnerConfig.adbPath,
                                           .serial = runnerConfig.serial,
                                           .keepRunning = keepRunning});
        omk::ReportRenderer renderer(*runner, options.reportTool);

        omk::OrchestratorOptions orchestratorOptions;
        orchestratorOptions.bootPolling.interval = options.bootPollInterval;
        orchestratorOptions.chargePolling.interval = options.chargePollInterval;
        orchestratorOptions.settleDelay = options.settleDelay;
        orchestratorOptions.log = &std::cout;
        orchestratorOptions.keepRunning = keepRunning;
        if (runnerConfig.kind == omk::RunnerKind::Mock) {
            orchestratorOptions.sleep = [](std::chrono::milliseconds) {};
        }

        omk::RunOrchestrator orchestrator(device, renderer, orchestratorOptions);
        std::cout << "[omk] " << options.runs << " run(s) x " << options.events << " events on "
                  << options.packages.size() << " package(s), filter="
                  << omk::toString(options.failureFilter) << ", output=" << options.outputDirectory << '\n';
        const auto summary = orchestrator.runCampaign(omk::CampaignOptionsParser::toRunConfig(options),
                                                      [] { return gStopRequested.load(); });
        printSummary(summary, options.outputDirectory);
    } catch (const std::exception& ex) {
        if (gStopRequested.load()) {
            std::cerr << "stopped: " << ex.what() << '\n';
            return 130;
        }
        std::cerr << "fatal: " << ex.what() << '\n';
        return 1;
    }

    return 0;
}
