/**
 * @file mock_process_runner.cpp
 * @brief openMonkey source file.
 */

#include "openmonkey/transport/mock_process_runner.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace omk {
namespace {

class MockBackgroundProcess final : public IBackgroundProcess {
public:
    MockBackgroundProcess(std::shared_ptr<void> owner, std::size_t& stopRequests,
                          std::size_t& running, bool alive, bool ignoresStop)
        : owner_(std::move(owner)), stopRequests_(stopRequests), running_(running), alive_(alive),
          ignoresStop_(ignoresStop) {
        if (alive_) {
            ++running_;
        }
    }

    ~MockBackgroundProcess() override { (void)wait(); }

    bool requestStop(std::string&) override {
        ++stopRequests_;
        stopRequested_ = true;
        return true;
    }

    int wait() override {
        if (alive_) {
            alive_ = false;
            --running_;
            if (ignoresStop_ && stopRequested_) {
                forceKilled_ = true;
                return 137;
            }
        }
        return 0;
    }

    bool running() const override { return alive_; }
    bool forceKilled() const override { return forceKilled_; }

private:
    std::shared_ptr<void> owner_;
    std::size_t& stopRequests_;
    std::size_t& running_;
    bool alive_ = false;
    bool ignoresStop_ = false;
    bool stopRequested_ = false;
    bool forceKilled_ = false;
};

std::string valueAfter(const std::vector<std::string>& argv, const std::string& flag) {
    const auto it = std::find(argv.begin(), argv.end(), flag);
    if (it == argv.end() || std::next(it) == argv.end()) {
        return {};
    }
    return *std::next(it);
}

template <typename T>
T consume(std::deque<T>& sequence) {
    const T value = sequence.front();
    if (sequence.size() > 1U) {
        sequence.pop_front();
    }
    return value;
}

} // namespace

MockProcessRunner::MockProcessRunner(std::string adbPath) : adbPath_(std::move(adbPath)) {}

ProcessResult MockProcessRunner::run(const ProcessRequest& request) {
    history_.push_back(request.argv);

    if (request.argv.empty()) {
        ProcessResult result;
        result.exitCode = 127;
        result.error = "empty command line";
        return result;
    }

    if (request.argv.front() == reportTool_) {
        return renderReport(request.argv);
    }

    if (request.argv.front() != adbPath_) {
        ProcessResult result;
        result.exitCode = 127;
        result.error = "exec " + request.argv.front() + ": No such file or directory";
        return result;
    }

    return answer(stripAdbPrefix(request.argv), request);
}

std::unique_ptr<IBackgroundProcess> MockProcessRunner::spawn(const ProcessRequest& request,
                                                             std::string& outError) {
    outError.clear();
    history_.push_back(request.argv);
    if (failSpawns_) {
        outError = "exec " + joinCommandLine(request.argv) + ": injected spawn failure";
        return nullptr;
    }

    if (request.output != nullptr) {
        for (const auto& line : logcatLines_) {
            *request.output << line << '\n';
        }
        request.output->flush();
    }

    ++background_->started;
    return std::make_unique<MockBackgroundProcess>(background_, background_->stopRequests,
                                                   background_->running, !logcatExitsEarly_,
                                                   logcatIgnoresStop_);
}

void MockProcessRunner::setBootCompletedSequence(std::vector<std::string> values) {
    if (!values.empty()) {
        bootCompleted_.assign(values.begin(), values.end());
    }
}

void MockProcessRunner::setBatteryLevels(std::vector<int> levels) {
    if (!levels.empty()) {
        batteryLevels_.assign(levels.begin(), levels.end());
    }
}

void MockProcessRunner::setBatteryDump(std::string dump) { batteryDumpOverride_ = std::move(dump); }

void MockProcessRunner::setProperty(const std::string& name, std::string value) {
    properties_[name] = std::move(value);
}

void MockProcessRunner::setStressExitCodes(std::vector<int> codes) {
    if (!codes.empty()) {
        stressExitCodes_.assign(codes.begin(), codes.end());
    }
}

void MockProcessRunner::setStressOutput(std::string text) { stressOutput_ = std::move(text); }
void MockProcessRunner::injectStressException(std::string message) { stressException_ = std::move(message); }
void MockProcessRunner::setLogcatLines(std::vector<std::string> lines) { logcatLines_ = std::move(lines); }
void MockProcessRunner::setLogcatExitsEarly(bool exitsEarly) { logcatExitsEarly_ = exitsEarly; }
void MockProcessRunner::setLogcatIgnoresStop(bool ignoresStop) { logcatIgnoresStop_ = ignoresStop; }
void MockProcessRunner::failSpawns(bool fail) { failSpawns_ = fail; }
void MockProcessRunner::setBugreportText(std::string text) { bugreportText_ = std::move(text); }

void MockProcessRunner::setReportTool(std::string toolPath, int exitCode) {
    reportTool_ = std::move(toolPath);
    reportToolExitCode_ = exitCode;
}

void MockProcessRunner::failCommand(const std::string& verb, int exitCode) { commandFailures_[verb] = exitCode; }
void MockProcessRunner::clearCommandFailures() { commandFailures_.clear(); }

const std::vector<std::vector<std::string>>& MockProcessRunner::history() const { return history_; }

std::size_t MockProcessRunner::countCommands(const std::string& verb) const {
    return static_cast<std::size_t>(std::count_if(history_.begin(), history_.end(), [&](const auto& argv) {
        return verbOf(stripAdbPrefix(argv)) == verb;
    }));
}

std::vector<std::string> MockProcessRunner::lastCommand(const std::string& verb) const {
    for (auto it = history_.rbegin(); it != history_.rend(); ++it) {
        if (verbOf(stripAdbPrefix(*it)) == verb) {
            return *it;
        }
    }
    return {};
}

std::size_t MockProcessRunner::backgroundStarted() const { return background_->started; }
std::size_t MockProcessRunner::backgroundStopRequests() const { return background_->stopRequests; }
std::size_t MockProcessRunner::backgroundRunning() const { return background_->running; }

std::vector<std::string> MockProcessRunner::stripAdbPrefix(const std::vector<std::string>& argv) const {
    if (argv.empty() || argv.front() != adbPath_) {
        return argv;
    }
    std::size_t first = 1U;
    if (argv.size() > 2U && argv[1] == "-s") {
        first = 3U;
    }
    return std::vector<std::string>(argv.begin() + static_cast<std::ptrdiff_t>(std::min(first, argv.size())),
                                    argv.end());
}

std::string MockProcessRunner::verbOf(const std::vector<std::string>& args) {
    if (args.empty()) {
        return {};
    }
    if (args.front() == "shell") {
        return args.size() > 1U ? args[1] : std::string{};
    }
    return args.front();
}

ProcessResult MockProcessRunner::answer(const std::vector<std::string>& args, const ProcessRequest& request) {
    ProcessResult result;
    result.launched = true;
    result.exitCode = 0;

    const auto verb = verbOf(args);
    if (request.keepRunning && !request.keepRunning()) {
        // Terminated by SIGTERM before producing output.
        result.interrupted = true;
        result.exitCode = 143;
        return result;
    }

    const auto failure = commandFailures_.find(verb);
    if (failure != commandFailures_.end()) {
        result.exitCode = failure->second;
        result.output = "error: injected failure for '" + verb + "'\n";
        if (request.output != nullptr) {
            *request.output << result.output;
        }
        return result;
    }

    std::string text;
    if (verb == "getprop") {
        const std::string name = args.size() > 2U ? args[2] : std::string{};
        if (name == "sys.boot_completed") {
            text = consume(bootCompleted_) + "\n";
        } else {
            const auto it = properties_.find(name);
            text = (it == properties_.end() ? std::string{} : it->second) + "\n";
        }
    } else if (verb == "dumpsys") {
        if (args.size() > 2U && args[2] == "battery") {
            text = batteryDump();
        }
    } else if (verb == "monkey") {
        if (!stressException_.empty()) {
            throw std::runtime_error(stressException_);
        }
        text = stressOutput_;
        result.exitCode = consume(stressExitCodes_);
    } else if (verb == "bugreport") {
        text = bugreportText_;
    } else if (verb == "wait-for-device" || verb == "reboot" || verb == "input" || verb == "logcat") {
        // Accepted without output.
    } else {
        result.exitCode = 1;
        text = "error: unknown command '" + verb + "'\n";
    }

    if (request.output != nullptr) {
        *request.output << text;
        request.output->flush();
    }
    if (request.captureOutput) {
        result.output = text;
    }
    return result;
}

ProcessResult MockProcessRunner::renderReport(const std::vector<std::string>& argv) {
    ProcessResult result;
    result.launched = true;
    result.exitCode = reportToolExitCode_;
    if (reportToolExitCode_ != 0) {
        result.output = "report tool failed\n";
        return result;
    }

    const auto outputPath = valueAfter(argv, "--output");
    std::ofstream html(outputPath);
    if (!html) {
        result.exitCode = 2;
        result.output = "cannot write " + outputPath + "\n";
        return result;
    }
    html << "<html><body><h1>Report</h1><ul>"
         << "<li>" << valueAfter(argv, "--monkey") << "</li>"
         << "<li>" << valueAfter(argv, "--logcat") << "</li>"
         << "<li>" << valueAfter(argv, "--bugreport") << "</li>"
         << "</ul></body></html>\n";
    return result;
}

std::string MockProcessRunner::batteryDump() {
    if (!batteryDumpOverride_.empty()) {
        return batteryDumpOverride_;
    }
    std::ostringstream os;
    os << "Current Battery Service state:\n"
       << "  AC powered: false\n"
       << "  USB powered: true\n"
       << "  Wireless powered: false\n"
       << "  status: 2\n"
       << "  health: 2\n"
       << "  present: true\n"
       << "  level: " << consume(batteryLevels_) << "\n"
       << "  scale: 100\n"
       << "  voltage: 4120\n"
       << "  temperature: 285\n"
       << "  technology: Li-ion\n";
    return os.str();
}

} // namespace omk
