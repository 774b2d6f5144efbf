/**
 * @file campaign_options.cpp
 * @brief openMonkey source file.
 */

#include "openmonkey/config/campaign_options.hpp"

#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <type_traits>

#include "openmonkey/config/campaign_profile_loader.hpp"

namespace omk {
namespace {

template <typename T>
bool parseNumber(const std::string& text, const char* label, T& outValue, std::string& outError) {
    try {
        std::size_t consumed = 0;
        if constexpr (std::is_signed<T>::value) {
            const auto value = std::stoll(text, &consumed, 10);
            if (consumed != text.size() || value < std::numeric_limits<T>::min() ||
                value > std::numeric_limits<T>::max()) {
                throw std::invalid_argument(text);
            }
            outValue = static_cast<T>(value);
        } else {
            if (!text.empty() && text.front() == '-') {
                throw std::invalid_argument(text);
            }
            const auto value = std::stoull(text, &consumed, 10);
            if (consumed != text.size() || value > std::numeric_limits<T>::max()) {
                throw std::invalid_argument(text);
            }
            outValue = static_cast<T>(value);
        }
        return true;
    } catch (const std::exception&) {
        outError = std::string("Invalid ") + label + ": " + text;
        return false;
    }
}

template <typename T>
T parseIntegralEnv(const char* name, T defaultValue) {
    const char* value = std::getenv(name);
    if (value == nullptr) {
        return defaultValue;
    }
    T parsed = defaultValue;
    std::string ignored;
    return parseNumber(value, name, parsed, ignored) ? parsed : defaultValue;
}

bool isFlag(const std::string& arg, const char* shortName, const char* longName) {
    return arg == shortName || arg == longName;
}

} // namespace

const std::vector<std::string>& defaultPackages() {
    static const std::vector<std::string> packages{
        "com.android.browser",
        "com.android.calculator2",
        "com.android.calendar",
        "com.android.camera2",
        "com.android.contacts",
        "com.android.deskclock",
        "com.android.dialer",
        "com.android.documentsui",
        "com.android.email",
        "com.android.gallery3d",
        "com.android.messaging",
        "com.android.mms",
        "com.android.music",
        "com.android.providers.downloads.ui",
        "com.android.quicksearchbox",
        "com.android.settings",
        "com.android.soundrecorder",
        "com.android.stk",
        "com.android.vpndialogs",
    };
    return packages;
}

std::string defaultOutputDirectory(std::chrono::system_clock::time_point now) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&seconds, &local);
    std::ostringstream os;
    os << "monkey-" << std::put_time(&local, "%Y%m%d-%H%M%S");
    return os.str();
}

bool CampaignOptionsParser::parse(int argc, const char* const* argv, CampaignOptions& outOptions,
                                  std::string& outError) {
    outError.clear();

    // Profile first, so that flags given alongside it override its values.
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            if (i + 1 >= argc) {
                outError = "--config requires a file path";
                return false;
            }
            outOptions.profilePath = argv[i + 1];
            if (!CampaignProfileLoader::loadFromJsonFile(outOptions.profilePath, outOptions, outError)) {
                return false;
            }
        }
    }

    bool packagesFromFlags = false;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto nextValue = [&](std::string& outValue) {
            if (i + 1 >= argc) {
                outError = arg + " requires a value";
                return false;
            }
            outValue = argv[++i];
            return true;
        };

        std::string value;
        if (isFlag(arg, "-h", "--help")) {
            outOptions.showHelp = true;
            return true;
        }
        if (arg == "--config") {
            ++i;
            continue;
        }
        if (isFlag(arg, "-o", "--output-dir")) {
            if (!nextValue(outOptions.outputDirectory)) {
                return false;
            }
        } else if (isFlag(arg, "-r", "--runs")) {
            if (!nextValue(value) || !parseNumber(value, "run count", outOptions.runs, outError)) {
                return false;
            }
        } else if (isFlag(arg, "-e", "--events")) {
            if (!nextValue(value) || !parseNumber(value, "event count", outOptions.events, outError)) {
                return false;
            }
        } else if (isFlag(arg, "-p", "--package")) {
            if (!nextValue(value)) {
                return false;
            }
            if (!packagesFromFlags) {
                outOptions.packages.clear();
                packagesFromFlags = true;
            }
            outOptions.packages.push_back(value);
        } else if (isFlag(arg, "-f", "--filter")) {
            if (!nextValue(value)) {
                return false;
            }
            const auto filter = parseFailureFilter(value);
            if (!filter) {
                outError = "Unknown failure filter: " + value + " (expected crash or anr)";
                return false;
            }
            outOptions.failureFilter = *filter;
        } else if (isFlag(arg, "-d", "--description")) {
            if (!nextValue(outOptions.descriptionFilter)) {
                return false;
            }
        } else if (isFlag(arg, "-t", "--battery-threshold")) {
            if (!nextValue(value) ||
                !parseNumber(value, "battery threshold", outOptions.batteryThreshold, outError)) {
                return false;
            }
        } else if (isFlag(arg, "-s", "--device")) {
            if (!nextValue(outOptions.deviceSpec)) {
                return false;
            }
        } else if (arg == "--report-tool") {
            if (!nextValue(outOptions.reportTool)) {
                return false;
            }
        } else {
            outError = "Unknown option: " + arg;
            return false;
        }
    }
    return true;
}

void CampaignOptionsParser::applyEnvironment(CampaignOptions& options) {
    if (const char* adb = std::getenv("OMK_ADB"); adb != nullptr && *adb != '\0') {
        options.adbPath = adb;
    }
    if (const char* tool = std::getenv("OMK_REPORT_TOOL"); tool != nullptr && *tool != '\0') {
        options.reportTool = tool;
    }
    options.settleDelay = std::chrono::seconds(
        parseIntegralEnv<std::int64_t>("OMK_SETTLE_SECONDS",
                                       std::chrono::duration_cast<std::chrono::seconds>(options.settleDelay).count()));
    options.bootPollInterval = std::chrono::milliseconds(
        parseIntegralEnv<std::int64_t>("OMK_BOOT_POLL_MS", options.bootPollInterval.count()));
    options.chargePollInterval = std::chrono::milliseconds(
        parseIntegralEnv<std::int64_t>("OMK_CHARGE_POLL_MS", options.chargePollInterval.count()));
}

void CampaignOptionsParser::applyDefaults(CampaignOptions& options, std::chrono::system_clock::time_point now) {
    if (options.packages.empty()) {
        options.packages = defaultPackages();
    }
    if (options.outputDirectory.empty()) {
        options.outputDirectory = defaultOutputDirectory(now);
    }
}

RunConfig CampaignOptionsParser::toRunConfig(const CampaignOptions& options) {
    RunConfig config;
    config.eventCount = options.events;
    config.packages = options.packages;
    config.failureFilter = options.failureFilter;
    config.descriptionFilter = options.descriptionFilter;
    config.outputDirectory = options.outputDirectory;
    config.totalRuns = options.runs;
    config.runIndex = 1;
    config.batteryThreshold = options.batteryThreshold;
    return config;
}

void CampaignOptionsParser::printUsage(std::ostream& out, const char* argv0) {
    out << "Usage: " << argv0 << " [options]\n"
        << "  -o, --output-dir DIR        artifact directory (default monkey-<timestamp>)\n"
        << "  -r, --runs N                number of runs (default 10000)\n"
        << "  -e, --events N              events per run (default 125000)\n"
        << "  -p, --package PKG           target package, repeatable (default: system apps)\n"
        << "  -f, --filter crash|anr      only report this failure class\n"
        << "  -d, --description TEXT      only report failures matching TEXT\n"
        << "  -t, --battery-threshold N   wait while battery <= N percent (default 20)\n"
        << "  -s, --device SPEC           adb | adb:<serial> | mock (default adb)\n"
        << "      --report-tool PATH      report renderer for failed runs (default chkbugreport)\n"
        << "      --config FILE           JSON campaign profile\n"
        << "  -h, --help                  show this help\n"
        << "Environment:\n"
        << "  OMK_ADB, OMK_REPORT_TOOL, OMK_SETTLE_SECONDS, OMK_BOOT_POLL_MS, OMK_CHARGE_POLL_MS\n";
}

} // namespace omk
