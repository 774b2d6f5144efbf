/**
 * @file run_orchestrator_tests.cpp
 * @brief openMonkey source file.
 */

#include <algorithm>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

#include "openmonkey/campaign/report_renderer.hpp"
#include "openmonkey/campaign/run_orchestrator.hpp"
#include "openmonkey/campaign/stress_command.hpp"
#include "openmonkey/transport/mock_process_runner.hpp"

namespace {

namespace fs = std::filesystem;

bool contains(const std::vector<std::string>& args, const std::string& value) {
    return std::find(args.begin(), args.end(), value) != args.end();
}

std::size_t entryCount(const fs::path& directory) {
    return static_cast<std::size_t>(
        std::distance(fs::directory_iterator(directory), fs::directory_iterator{}));
}

fs::path freshDirectory(const std::string& name) {
    const auto path = fs::temp_directory_path() / name;
    fs::remove_all(path);
    return path;
}

omk::OrchestratorOptions quietOptions(std::vector<std::chrono::milliseconds>* sleeps = nullptr) {
    omk::OrchestratorOptions options;
    options.sleep = [sleeps](std::chrono::milliseconds duration) {
        if (sleeps != nullptr) {
            sleeps->push_back(duration);
        }
    };
    return options;
}

omk::RunConfig singleRun(const fs::path& directory) {
    omk::RunConfig config;
    config.eventCount = 1000;
    config.packages = {"com.example.app"};
    config.outputDirectory = directory.string();
    config.totalRuns = 1;
    config.batteryThreshold = 20;
    return config;
}

} // namespace

int main() {
    using namespace std::chrono_literals;

    // Stress arguments: packages, filter flags, description, event count last.
    {
        omk::RunConfig config;
        config.eventCount = 5000;
        config.packages = {"com.android.settings", "com.android.browser"};

        auto args = omk::StressCommand::buildArguments(config);
        assert(args.front() == "monkey");
        assert(args.back() == "5000");
        assert(contains(args, "--monitor-native-crashes"));
        assert(!contains(args, "--ignore-crashes"));
        assert(!contains(args, "--ignore-timeouts"));
        assert(!contains(args, "--match-description"));
        assert(std::count(args.begin(), args.end(), "-p") == 2);
        const auto settings = std::find(args.begin(), args.end(), "com.android.settings");
        assert(settings != args.end() && *(settings - 1) == "-p");

        config.failureFilter = omk::FailureFilter::Crash;
        args = omk::StressCommand::buildArguments(config);
        assert(contains(args, "--ignore-timeouts"));
        assert(!contains(args, "--ignore-crashes"));
        assert(!contains(args, "--ignore-native-crashes"));

        config.failureFilter = omk::FailureFilter::Anr;
        config.descriptionFilter = "Sign in";
        args = omk::StressCommand::buildArguments(config);
        assert(contains(args, "--ignore-crashes"));
        assert(contains(args, "--ignore-native-crashes"));
        assert(!contains(args, "--ignore-timeouts"));
        const auto match = std::find(args.begin(), args.end(), "--match-description");
        assert(match != args.end() && *(match + 1) == "Sign in");
        assert(args.back() == "5000");
    }

    // One clean run: exactly the stress log and the device log.
    {
        const auto dir = freshDirectory("omk_orchestrator_clean");
        omk::MockProcessRunner runner;
        runner.setBatteryLevels({50});
        runner.setStressOutput("Events injected: 1000\n");
        runner.setLogcatLines({"I/ActivityManager: Displayed com.example.app/.Main"});
        omk::DeviceClient device(runner);
        omk::ReportRenderer renderer(runner, "chkbugreport");

        std::vector<std::chrono::milliseconds> sleeps;
        omk::RunOrchestrator orchestrator(device, renderer, quietOptions(&sleeps));

        std::vector<omk::RunState> states;
        std::size_t runningAtDone = 99;
        orchestrator.onStateChange([&](std::uint32_t runIndex, omk::RunState state) {
            assert(runIndex == 1U);
            states.push_back(state);
            if (state == omk::RunState::Done) {
                runningAtDone = runner.backgroundRunning();
            }
        });

        const auto summary = orchestrator.runCampaign(singleRun(dir));
        assert(summary.runsCompleted == 1U);
        assert(summary.cleanRuns == 1U);
        assert(summary.failedRuns == 0U);
        assert(summary.failureRate == 0.0);
        assert(!summary.stoppedEarly);
        assert(summary.results.front().status == omk::RunStatus::Clean);
        assert(!summary.results.front().bugreportCollected);

        assert(fs::exists(dir / "0-monkey.txt"));
        assert(fs::exists(dir / "0-logcat.txt"));
        assert(entryCount(dir) == 2U);
        assert(runningAtDone == 0U);
        assert(runner.backgroundStopRequests() == 1U);
        assert(runner.countCommands("bugreport") == 0U);

        const std::vector<omk::RunState> expected{
            omk::RunState::Idle,           omk::RunState::Rebooting,   omk::RunState::AwaitingCharge,
            omk::RunState::Capturing,      omk::RunState::StressRunning, omk::RunState::Clean,
            omk::RunState::ArtifactCollection, omk::RunState::Done};
        assert(states == expected);
        assert(orchestrator.state() == omk::RunState::Idle);

        const auto monkey = runner.lastCommand("monkey");
        assert(monkey[1] == "shell");
        assert(monkey.back() == "1000");
        assert(contains(monkey, "com.example.app"));

        // Settle delay after boot.
        assert(std::find(sleeps.begin(), sleeps.end(), 30000ms) != sleeps.end());

        std::ifstream log(dir / "0-monkey.txt");
        std::string line;
        std::getline(log, line);
        assert(line == "Events injected: 1000");
        fs::remove_all(dir);
    }

    // A failed run collects a bugreport and renders a report.
    {
        const auto dir = freshDirectory("omk_orchestrator_failed");
        omk::MockProcessRunner runner;
        runner.setStressOutput("// CRASH: com.example.app (pid 4242)\n");
        runner.setStressExitCodes({1});
        omk::DeviceClient device(runner);
        omk::ReportRenderer renderer(runner, "chkbugreport");
        omk::RunOrchestrator orchestrator(device, renderer, quietOptions());

        std::vector<omk::RunState> states;
        orchestrator.onStateChange([&](std::uint32_t, omk::RunState state) { states.push_back(state); });

        const auto summary = orchestrator.runCampaign(singleRun(dir));
        assert(summary.failedRuns == 1U);
        assert(summary.failureRate == 1.0);
        const auto& result = summary.results.front();
        assert(result.status == omk::RunStatus::Failed);
        assert(result.failureCause.find("exit code 1") != std::string::npos);
        assert(result.bugreportCollected);
        assert(result.reportRendered);
        assert(std::find(states.begin(), states.end(), omk::RunState::Failed) != states.end());
        assert(std::find(states.begin(), states.end(), omk::RunState::Clean) == states.end());

        assert(fs::exists(dir / "0-monkey.txt"));
        assert(fs::exists(dir / "0-logcat.txt"));
        assert(fs::exists(dir / "0-bugreport.txt"));
        assert(fs::exists(dir / "0.html"));
        assert(fs::file_size(dir / "0-bugreport.txt") > 0U);

        const auto report = runner.lastCommand("chkbugreport");
        assert((report == std::vector<std::string>{"chkbugreport", "--monkey", (dir / "0-monkey.txt").string(),
                                                   "--logcat", (dir / "0-logcat.txt").string(),
                                                   "--bugreport", (dir / "0-bugreport.txt").string(),
                                                   "--output", (dir / "0.html").string()}));
        fs::remove_all(dir);
    }

    // Bugreport and report failures are recorded but do not stop the campaign.
    {
        const auto dir = freshDirectory("omk_orchestrator_partial");
        omk::MockProcessRunner runner;
        runner.setStressExitCodes({1, 0});
        runner.failCommand("bugreport", 1);
        runner.setReportTool("chkbugreport", 3);
        omk::DeviceClient device(runner);
        omk::ReportRenderer renderer(runner, "chkbugreport");
        omk::RunOrchestrator orchestrator(device, renderer, quietOptions());

        auto config = singleRun(dir);
        config.totalRuns = 2;
        const auto summary = orchestrator.runCampaign(config);
        assert(summary.runsCompleted == 2U);
        assert(summary.failedRuns == 1U);
        assert(summary.cleanRuns == 1U);
        assert(!summary.results[0].bugreportCollected);
        assert(!summary.results[0].reportRendered);
        assert(!fs::exists(dir / "0.html"));
        assert(summary.results[1].status == omk::RunStatus::Clean);
        fs::remove_all(dir);
    }

    // Three runs with the middle one failing.
    {
        const auto dir = freshDirectory("omk_orchestrator_campaign");
        omk::MockProcessRunner runner;
        runner.setStressExitCodes({0, 1, 0});
        runner.setBatteryLevels({10, 15, 25, 90});
        omk::DeviceClient device(runner);
        omk::ReportRenderer renderer(runner, "chkbugreport");
        omk::RunOrchestrator orchestrator(device, renderer, quietOptions());

        auto config = singleRun(dir);
        config.totalRuns = 3;
        const auto summary = orchestrator.runCampaign(config);
        assert(summary.runsCompleted == 3U);
        assert(summary.cleanRuns == 2U);
        assert(summary.failedRuns == 1U);
        assert(summary.failureRate > 0.33 && summary.failureRate < 0.34);
        assert(summary.results[1].runIndex == 2U);
        assert(summary.results[1].status == omk::RunStatus::Failed);
        assert(runner.countCommands("reboot") == 3U);
        assert(runner.countCommands("dumpsys") == 5U);
        assert(fs::exists(dir / "2-monkey.txt"));
        assert(fs::exists(dir / "1.html"));
        assert(!fs::exists(dir / "0.html"));
        assert(!fs::exists(dir / "2.html"));
        fs::remove_all(dir);
    }

    // An unexpected stress error propagates after the capture is stopped.
    {
        const auto dir = freshDirectory("omk_orchestrator_exception");
        omk::MockProcessRunner runner;
        runner.injectStressException("transport lost");
        omk::DeviceClient device(runner);
        omk::ReportRenderer renderer(runner, "chkbugreport");
        omk::RunOrchestrator orchestrator(device, renderer, quietOptions());

        bool threw = false;
        try {
            (void)orchestrator.runCampaign(singleRun(dir));
        } catch (const omk::CommandError&) {
            assert(false);
        } catch (const std::runtime_error& ex) {
            threw = true;
            assert(std::string(ex.what()) == "transport lost");
        }
        assert(threw);
        assert(runner.backgroundStarted() == 1U);
        assert(runner.backgroundRunning() == 0U);
        assert(runner.countCommands("bugreport") == 0U);
        fs::remove_all(dir);
    }

    // Setup failures end the campaign before any stress run.
    {
        const auto dir = freshDirectory("omk_orchestrator_setup");
        omk::MockProcessRunner runner;
        runner.failCommand("reboot", 1);
        omk::DeviceClient device(runner);
        omk::ReportRenderer renderer(runner, "chkbugreport");
        omk::RunOrchestrator orchestrator(device, renderer, quietOptions());

        bool threw = false;
        try {
            (void)orchestrator.runCampaign(singleRun(dir));
        } catch (const omk::CommandError& ex) {
            threw = true;
            assert(ex.exitCode() == 1);
        }
        assert(threw);
        assert(runner.countCommands("monkey") == 0U);

        runner.clearCommandFailures();
        runner.failSpawns(true);
        threw = false;
        try {
            (void)orchestrator.runCampaign(singleRun(dir));
        } catch (const omk::CommandError&) {
            threw = true;
        }
        assert(threw);
        assert(runner.countCommands("monkey") == 0U);
        fs::remove_all(dir);
    }

    // Cancelling the boot wait is fatal.
    {
        const auto dir = freshDirectory("omk_orchestrator_cancel");
        omk::MockProcessRunner runner;
        runner.setBootCompletedSequence({"0"});
        omk::DeviceClient device(runner);
        omk::ReportRenderer renderer(runner, "chkbugreport");
        auto options = quietOptions();
        options.bootPolling.keepWaiting = [] { return false; };
        omk::RunOrchestrator orchestrator(device, renderer, options);

        bool threw = false;
        try {
            (void)orchestrator.runCampaign(singleRun(dir));
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);
        assert(runner.countCommands("dumpsys") == 0U);
        fs::remove_all(dir);
    }

    // The stop predicate is honored between runs.
    {
        const auto dir = freshDirectory("omk_orchestrator_stop");
        omk::MockProcessRunner runner;
        omk::DeviceClient device(runner);
        omk::ReportRenderer renderer(runner, "chkbugreport");
        omk::RunOrchestrator orchestrator(device, renderer, quietOptions());

        auto config = singleRun(dir);
        config.totalRuns = 5;
        std::size_t checks = 0;
        const auto summary = orchestrator.runCampaign(config, [&checks] { return ++checks > 2U; });
        assert(summary.runsCompleted == 2U);
        assert(summary.stoppedEarly);
        assert(runner.countCommands("monkey") == 2U);
        // Five runs pad to one digit.
        assert(fs::exists(dir / "1-monkey.txt"));
        fs::remove_all(dir);
    }

    // A stop request during the charge wait cancels the gate and ends the campaign.
    {
        const auto dir = freshDirectory("omk_orchestrator_stop_charge");
        omk::MockProcessRunner runner;
        runner.setBatteryLevels({10});
        omk::DeviceClient device(runner);
        omk::ReportRenderer renderer(runner, "chkbugreport");

        bool stop = false;
        auto options = quietOptions();
        options.sleep = [&stop](std::chrono::milliseconds) { stop = true; };
        options.keepRunning = [&stop] { return !stop; };
        omk::RunOrchestrator orchestrator(device, renderer, options);

        auto config = singleRun(dir);
        config.totalRuns = 3;
        bool threw = false;
        try {
            (void)orchestrator.runCampaign(config);
        } catch (const std::runtime_error& ex) {
            threw = true;
            assert(std::string(ex.what()) == "charge wait cancelled");
        }
        assert(threw);
        assert(stop);
        assert(runner.countCommands("dumpsys") == 1U);
        assert(runner.countCommands("monkey") == 0U);
        fs::remove_all(dir);
    }

    // A stress step cut short by a stop request is recorded as interrupted, not failed.
    {
        const auto dir = freshDirectory("omk_orchestrator_interrupted");
        omk::MockProcessRunner runner;
        bool stop = false;
        omk::DeviceClientOptions deviceOptions;
        deviceOptions.keepRunning = [&stop] { return !stop; };
        omk::DeviceClient device(runner, deviceOptions);
        omk::ReportRenderer renderer(runner, "chkbugreport");

        auto options = quietOptions();
        options.keepRunning = [&stop] { return !stop; };
        omk::RunOrchestrator orchestrator(device, renderer, options);
        orchestrator.onStateChange([&stop](std::uint32_t, omk::RunState state) {
            if (state == omk::RunState::StressRunning) {
                stop = true;
            }
        });

        auto config = singleRun(dir);
        config.totalRuns = 3;
        const auto summary = orchestrator.runCampaign(config);
        assert(summary.stoppedEarly);
        assert(summary.interruptedRuns == 1U);
        assert(summary.runsCompleted == 0U);
        assert(summary.failedRuns == 0U);
        assert(summary.failureRate == 0.0);
        assert(summary.results.size() == 1U);

        const auto& result = summary.results.front();
        assert(result.interrupted);
        assert(result.status == omk::RunStatus::Failed);
        assert(!result.bugreportCollected);
        assert(!result.reportRendered);
        assert(result.failureCause.find("interrupted") != std::string::npos);

        assert(runner.countCommands("monkey") == 1U);
        assert(runner.countCommands("bugreport") == 0U);
        assert(runner.countCommands("chkbugreport") == 0U);
        assert(runner.backgroundRunning() == 0U);
        assert(!fs::exists(dir / "0-bugreport.txt"));
        assert(!fs::exists(dir / "0.html"));
        fs::remove_all(dir);
    }

    // The output path must be a directory.
    {
        const auto file = freshDirectory("omk_orchestrator_not_a_dir");
        {
            std::ofstream(file) << "occupied\n";
        }
        omk::MockProcessRunner runner;
        omk::DeviceClient device(runner);
        omk::ReportRenderer renderer(runner, "chkbugreport");
        omk::RunOrchestrator orchestrator(device, renderer, quietOptions());

        bool threw = false;
        try {
            (void)orchestrator.runCampaign(singleRun(file));
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);
        assert(runner.history().empty());
        fs::remove(file);
    }

    std::cout << "run_orchestrator_tests passed\n";
    return 0;
}
