/**
 * @file mock_campaign_demo.cpp
 * @brief openMonkey source file.
 */

#include <chrono>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>

#include "openmonkey/campaign/report_renderer.hpp"
#include "openmonkey/campaign/run_orchestrator.hpp"
#include "openmonkey/device/device_client.hpp"
#include "openmonkey/transport/mock_process_runner.hpp"

int main() {
    const auto outputDir = std::filesystem::temp_directory_path() / "omk_mock_campaign_demo";

    omk::MockProcessRunner runner;
    runner.setBootCompletedSequence({"", "0", "1"});
    runner.setBatteryLevels({18, 42});
    runner.setStressOutput(":Monkey: seed=1 count=5000\nEvents injected: 5000\n");
    // Run 2 hits a crash; the rest complete.
    runner.setStressExitCodes({0, 1, 0});
    runner.setLogcatLines({"I/ActivityManager: Start proc com.android.settings"});

    omk::DeviceClient device(runner);
    omk::ReportRenderer renderer(runner, "chkbugreport");

    omk::OrchestratorOptions options;
    options.sleep = [](std::chrono::milliseconds) {};
    options.log = &std::cout;
    omk::RunOrchestrator orchestrator(device, renderer, options);
    orchestrator.onStateChange([](std::uint32_t runIndex, omk::RunState state) {
        std::cout << "  run " << runIndex << " -> " << omk::toString(state) << '\n';
    });

    omk::RunConfig config;
    config.eventCount = 5000;
    config.packages = {"com.android.settings", "com.android.calculator2"};
    config.outputDirectory = outputDir.string();
    config.totalRuns = 3;

    try {
        const auto summary = orchestrator.runCampaign(config);
        std::cout << "runs=" << summary.runsCompleted << " clean=" << summary.cleanRuns
                  << " failed=" << summary.failedRuns << " fail_rate=" << summary.failureRate << '\n';
    } catch (const std::exception& ex) {
        std::cerr << "campaign failed: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
