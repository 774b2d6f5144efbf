/**
 * @file campaign_end_to_end_tests.cpp
 * @brief openMonkey source file.
 */

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

#include "openmonkey/campaign/report_renderer.hpp"
#include "openmonkey/campaign/run_orchestrator.hpp"
#include "openmonkey/transport/posix_process_runner.hpp"

namespace {

namespace fs = std::filesystem;

// Stand-in for adb: answers the commands a campaign issues. The second stress
// invocation crashes.
constexpr const char* kFakeAdb = R"SH(#!/bin/sh
here=$(dirname "$0")
if [ "$1" = "-s" ]; then
  shift 2
fi
case "$1" in
  wait-for-device|reboot) exit 0 ;;
  bugreport) echo "== dumpstate: fake =="; exit 0 ;;
  logcat)
    if [ "$2" = "-c" ]; then exit 0; fi
    echo "I/fake: capture started"
    exec sleep 30 ;;
  shell)
    case "$2" in
      getprop) echo 1 ;;
      dumpsys) printf 'Current Battery Service state:\n  level: 77\n' ;;
      input) exit 0 ;;
      monkey)
        n=$(cat "$here/stress_count" 2>/dev/null || echo 0)
        n=$((n + 1))
        echo "$n" > "$here/stress_count"
        echo ":Monkey: run $n"
        if [ "$n" -eq 2 ]; then
          echo "// CRASH: com.example.app"
          exit 1
        fi
        echo "Events injected: 100" ;;
      *) exit 1 ;;
    esac ;;
  *) exit 1 ;;
esac
)SH";

constexpr const char* kFakeReportTool = R"SH(#!/bin/sh
while [ $# -gt 0 ]; do
  if [ "$1" = "--output" ]; then
    echo "<html><body>fake report</body></html>" > "$2"
  fi
  shift
done
)SH";

fs::path writeScript(const fs::path& path, const char* body) {
    {
        std::ofstream out(path);
        out << body;
    }
    fs::permissions(path, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec,
                    fs::perm_options::replace);
    return path;
}

std::string readFile(const fs::path& path) {
    std::ifstream in(path);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace

int main() {
    const auto root = fs::temp_directory_path() / "omk_campaign_end_to_end_tests";
    fs::remove_all(root);
    fs::create_directories(root / "tools");

    const auto adb = writeScript(root / "tools" / "adb", kFakeAdb);
    const auto reportTool = writeScript(root / "tools" / "chkbugreport", kFakeReportTool);

    omk::PosixProcessRunner runner;
    omk::DeviceClient device(runner, {.adbPath = adb.string(), .serial = "emulator-5554"});
    omk::ReportRenderer renderer(runner, reportTool.string());

    omk::OrchestratorOptions options;
    options.settleDelay = std::chrono::milliseconds(0);
    options.sleep = [](std::chrono::milliseconds) {};
    omk::RunOrchestrator orchestrator(device, renderer, options);

    omk::RunConfig config;
    config.eventCount = 100;
    config.packages = {"com.example.app"};
    config.outputDirectory = (root / "artifacts").string();
    config.totalRuns = 3;

    const auto started = std::chrono::steady_clock::now();
    const auto summary = orchestrator.runCampaign(config);
    // Captures are terminated, not waited out.
    assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(25));

    assert(summary.runsCompleted == 3U);
    assert(summary.cleanRuns == 2U);
    assert(summary.failedRuns == 1U);
    assert(summary.results[1].status == omk::RunStatus::Failed);
    assert(summary.results[1].bugreportCollected);
    assert(summary.results[1].reportRendered);

    const auto artifacts = root / "artifacts";
    assert(readFile(artifacts / "0-monkey.txt").find("Events injected: 100") != std::string::npos);
    assert(readFile(artifacts / "1-monkey.txt").find("// CRASH: com.example.app") != std::string::npos);
    assert(readFile(artifacts / "1-bugreport.txt").find("dumpstate") != std::string::npos);
    assert(readFile(artifacts / "1.html").find("fake report") != std::string::npos);
    assert(!fs::exists(artifacts / "0.html"));
    assert(!fs::exists(artifacts / "2-bugreport.txt"));
    assert(fs::exists(artifacts / "2-logcat.txt"));

    fs::remove_all(root);
    std::cout << "campaign_end_to_end_tests passed\n";
    return 0;
}
