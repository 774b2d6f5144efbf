/**
 * @file campaign_options.hpp
 * @brief openMonkey source file.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "openmonkey/core/run_types.hpp"

namespace omk {

/**
 * @brief Everything a campaign needs, gathered from profile, flags and environment.
 */
struct CampaignOptions {
    std::string outputDirectory;
    std::uint32_t runs = 10000;
    std::uint64_t events = 125000;
    std::vector<std::string> packages;
    FailureFilter failureFilter = FailureFilter::None;
    std::string descriptionFilter;
    int batteryThreshold = 20;
    std::string deviceSpec = "adb";
    std::string adbPath = "adb";
    std::string reportTool = "chkbugreport";
    std::string profilePath;
    std::chrono::milliseconds settleDelay{30000};
    std::chrono::milliseconds bootPollInterval{2000};
    std::chrono::milliseconds chargePollInterval{60000};
    bool showHelp = false;
};

/**
 * @brief Packages exercised when none are given.
 */
const std::vector<std::string>& defaultPackages();

/**
 * @brief `monkey-YYYYMMDD-HHMMSS` in local time.
 */
std::string defaultOutputDirectory(std::chrono::system_clock::time_point now);

class CampaignOptionsParser {
public:
    /**
     * @brief Parse command-line flags on top of an optional `--config` profile.
     *
     * The profile is loaded first so explicit flags win. Repeated `-p` flags
     * replace the profile's package list.
     */
    static bool parse(int argc, const char* const* argv, CampaignOptions& outOptions, std::string& outError);

    /**
     * @brief Apply OMK_* environment overrides for tool paths and pacing.
     */
    static void applyEnvironment(CampaignOptions& options);

    /**
     * @brief Fill the package list and output directory when left empty.
     */
    static void applyDefaults(CampaignOptions& options, std::chrono::system_clock::time_point now);

    static RunConfig toRunConfig(const CampaignOptions& options);

    static void printUsage(std::ostream& out, const char* argv0);
};

} // namespace omk
