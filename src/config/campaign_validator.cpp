/**
 * @file campaign_validator.cpp
 * @brief openMonkey source file.
 */

#include "openmonkey/config/campaign_validator.hpp"

#include <cctype>
#include <sstream>
#include <unordered_set>

namespace omk {

bool CampaignValidator::isValidPackageName(const std::string& name) {
    std::size_t segments = 0;
    bool segmentStart = true;
    for (const char ch : name) {
        const auto c = static_cast<unsigned char>(ch);
        if (c == '.') {
            if (segmentStart) {
                return false;
            }
            segmentStart = true;
            continue;
        }
        if (segmentStart) {
            if (!std::isalpha(c)) {
                return false;
            }
            ++segments;
            segmentStart = false;
            continue;
        }
        if (!std::isalnum(c) && c != '_') {
            return false;
        }
    }
    return !segmentStart && segments >= 2U;
}

std::vector<ValidationIssue> CampaignValidator::validate(const CampaignOptions& options) {
    std::vector<ValidationIssue> issues;

    if (options.runs == 0U) {
        issues.push_back({ValidationSeverity::Error, "Run count must be greater than zero"});
    }
    if (options.events == 0U) {
        issues.push_back({ValidationSeverity::Error, "Event count must be greater than zero"});
    }

    if (options.packages.empty()) {
        issues.push_back({ValidationSeverity::Error, "Campaign must target at least one package"});
    }

    std::unordered_set<std::string> seen;
    for (const auto& package : options.packages) {
        if (!isValidPackageName(package)) {
            issues.push_back({ValidationSeverity::Error, "Invalid package name: '" + package + "'"});
            continue;
        }
        if (!seen.insert(package).second) {
            issues.push_back({ValidationSeverity::Warning, "Duplicate package: " + package});
        }
    }

    if (options.batteryThreshold < 0 || options.batteryThreshold > 99) {
        std::ostringstream os;
        os << "Battery threshold " << options.batteryThreshold << " outside 0..99";
        issues.push_back({ValidationSeverity::Error, os.str()});
    } else if (options.batteryThreshold >= 90) {
        issues.push_back({ValidationSeverity::Warning,
                          "Battery threshold above 90% may hold runs for a long time"});
    }

    if (options.outputDirectory.empty()) {
        issues.push_back({ValidationSeverity::Error, "Output directory cannot be empty"});
    }

    if (options.bootPollInterval.count() <= 0) {
        issues.push_back({ValidationSeverity::Error, "Boot poll interval must be positive"});
    }
    if (options.chargePollInterval.count() <= 0) {
        issues.push_back({ValidationSeverity::Error, "Charge poll interval must be positive"});
    }
    if (options.settleDelay.count() < 0) {
        issues.push_back({ValidationSeverity::Error, "Settle delay cannot be negative"});
    }

    if (options.reportTool.empty()) {
        issues.push_back({ValidationSeverity::Error, "Report tool path cannot be empty"});
    }

    return issues;
}

bool CampaignValidator::hasErrors(const std::vector<ValidationIssue>& issues) {
    for (const auto& issue : issues) {
        if (issue.severity == ValidationSeverity::Error) {
            return true;
        }
    }
    return false;
}

} // namespace omk
