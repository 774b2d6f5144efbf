/**
 * @file campaign_profile_loader.cpp
 * @brief openMonkey source file.
 */

#include "openmonkey/config/campaign_profile_loader.hpp"

#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace omk {
namespace {

bool readFile(const std::string& path, std::string& out, std::string& outError) {
    std::ifstream file(path);
    if (!file) {
        outError = "Cannot open file: " + path;
        return false;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    out = buffer.str();
    return true;
}

std::uint64_t parseCount(const std::string& text, const std::string& key) {
    std::size_t consumed = 0;
    const auto value = std::stoull(text, &consumed, 10);
    if (consumed != text.size()) {
        throw std::invalid_argument("invalid value for " + key);
    }
    return value;
}

} // namespace

bool CampaignProfileLoader::loadFromJsonFile(const std::string& filePath,
                                             CampaignOptions& inOutOptions,
                                             std::string& outError) {
    outError.clear();
    std::string json;
    if (!readFile(filePath, json, outError)) {
        return false;
    }
    return loadFromJsonText(json, inOutOptions, outError);
}

bool CampaignProfileLoader::loadFromJsonText(const std::string& json,
                                             CampaignOptions& inOutOptions,
                                             std::string& outError) {
    outError.clear();
    CampaignOptions parsed = inOutOptions;

    try {
        // Minimal JSON extraction by regex for flat members:
        // { "runs": 50, "filter": "crash", "packages": ["com.a", "com.b"] }
        const std::regex numberRe("\"(runs|events|batteryThreshold)\"\\s*:\\s*(-?[0-9]+)");
        const std::regex stringRe("\"(filter|description|outputDir|device)\"\\s*:\\s*\"([^\"]*)\"");
        const std::regex packagesRe("\"packages\"\\s*:\\s*\\[([^\\]]*)\\]");
        const std::regex quotedRe("\"([^\"]+)\"");

        bool foundAny = false;
        for (std::sregex_iterator it(json.begin(), json.end(), numberRe), end; it != end; ++it) {
            const auto key = (*it)[1].str();
            const auto text = (*it)[2].str();
            if (key == "batteryThreshold") {
                parsed.batteryThreshold = std::stoi(text);
            } else if (text.front() == '-') {
                outError = "Negative value for " + key;
                return false;
            } else if (key == "runs") {
                const auto runs = parseCount(text, key);
                if (runs > 0xFFFFFFFFULL) {
                    outError = "Run count out of range: " + text;
                    return false;
                }
                parsed.runs = static_cast<std::uint32_t>(runs);
            } else {
                parsed.events = parseCount(text, key);
            }
            foundAny = true;
        }

        for (std::sregex_iterator it(json.begin(), json.end(), stringRe), end; it != end; ++it) {
            const auto key = (*it)[1].str();
            const auto value = (*it)[2].str();
            if (key == "filter") {
                const auto filter = parseFailureFilter(value);
                if (!filter) {
                    outError = "Unknown failure filter: " + value;
                    return false;
                }
                parsed.failureFilter = *filter;
            } else if (key == "description") {
                parsed.descriptionFilter = value;
            } else if (key == "outputDir") {
                parsed.outputDirectory = value;
            } else {
                parsed.deviceSpec = value;
            }
            foundAny = true;
        }

        std::smatch packagesMatch;
        if (std::regex_search(json, packagesMatch, packagesRe)) {
            const auto list = packagesMatch[1].str();
            parsed.packages.clear();
            for (std::sregex_iterator it(list.begin(), list.end(), quotedRe), end; it != end; ++it) {
                parsed.packages.push_back((*it)[1].str());
            }
            foundAny = true;
        }

        if (!foundAny) {
            outError = "No campaign profile entries found";
            return false;
        }
    } catch (const std::exception& ex) {
        outError = std::string("Campaign profile parse error: ") + ex.what();
        return false;
    }

    inOutOptions = std::move(parsed);
    return true;
}

} // namespace omk
