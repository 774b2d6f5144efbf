#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "openmonkey/transport/i_process_runner.hpp"

namespace omk {

/**
 * @brief Scripted device simulation answering adb command lines.
 *
 * Understands the subset of adb used by DeviceClient plus one report tool.
 * Sequenced values (boot flag, battery level, monkey exit code) are consumed
 * per call; the last value repeats once the sequence is exhausted.
 */
class MockProcessRunner final : public IProcessRunner {
public:
    explicit MockProcessRunner(std::string adbPath = "adb");

    ProcessResult run(const ProcessRequest& request) override;
    std::unique_ptr<IBackgroundProcess> spawn(const ProcessRequest& request,
                                              std::string& outError) override;

    void setBootCompletedSequence(std::vector<std::string> values);
    void setBatteryLevels(std::vector<int> levels);
    void setBatteryDump(std::string dump);
    void setProperty(const std::string& name, std::string value);
    void setStressExitCodes(std::vector<int> codes);
    void setStressOutput(std::string text);
    void injectStressException(std::string message);
    void setLogcatLines(std::vector<std::string> lines);
    void setLogcatExitsEarly(bool exitsEarly);
    void setLogcatIgnoresStop(bool ignoresStop);
    void failSpawns(bool fail);
    void setBugreportText(std::string text);
    void setReportTool(std::string toolPath, int exitCode = 0);
    void failCommand(const std::string& verb, int exitCode);
    void clearCommandFailures();

    const std::vector<std::vector<std::string>>& history() const;
    std::size_t countCommands(const std::string& verb) const;
    std::vector<std::string> lastCommand(const std::string& verb) const;
    std::size_t backgroundStarted() const;
    std::size_t backgroundStopRequests() const;
    std::size_t backgroundRunning() const;

private:
    struct BackgroundCounters {
        std::size_t started = 0;
        std::size_t stopRequests = 0;
        std::size_t running = 0;
    };

    // Strips "adb [-s serial]" and returns the adb verb, or the tool name.
    std::vector<std::string> stripAdbPrefix(const std::vector<std::string>& argv) const;
    static std::string verbOf(const std::vector<std::string>& args);
    ProcessResult answer(const std::vector<std::string>& args, const ProcessRequest& request);
    ProcessResult renderReport(const std::vector<std::string>& argv);
    std::string batteryDump();

    std::string adbPath_;
    std::deque<std::string> bootCompleted_{"1"};
    std::deque<int> batteryLevels_{100};
    std::string batteryDumpOverride_;
    std::unordered_map<std::string, std::string> properties_;
    std::deque<int> stressExitCodes_{0};
    std::string stressOutput_;
    std::string stressException_;
    std::vector<std::string> logcatLines_;
    bool logcatExitsEarly_ = false;
    bool logcatIgnoresStop_ = false;
    bool failSpawns_ = false;
    std::string bugreportText_ = "== dumpstate ==\n";
    std::string reportTool_ = "chkbugreport";
    int reportToolExitCode_ = 0;
    std::unordered_map<std::string, int> commandFailures_;
    std::vector<std::vector<std::string>> history_;
    std::shared_ptr<BackgroundCounters> background_ = std::make_shared<BackgroundCounters>();
};

} // namespace omk
