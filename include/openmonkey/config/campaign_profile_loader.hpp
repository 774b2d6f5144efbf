/**
 * @file campaign_profile_loader.hpp
 * @brief openMonkey source file.
 */

#pragma once

#include <string>

#include "openmonkey/config/campaign_options.hpp"

namespace omk {

/**
 * @brief Loads campaign settings from a flat JSON profile.
 *
 * Recognized keys: "runs", "events", "batteryThreshold" (numbers), "filter",
 * "description", "outputDir", "device" (strings) and "packages" (array of
 * strings). Keys present in the file overwrite `inOutOptions`; others are
 * left untouched.
 */
class CampaignProfileLoader {
public:
    static bool loadFromJsonFile(const std::string& filePath,
                                 CampaignOptions& inOutOptions,
                                 std::string& outError);
    static bool loadFromJsonText(const std::string& json,
                                 CampaignOptions& inOutOptions,
                                 std::string& outError);
};

} // namespace omk
