/**
 * @file campaign_validator.hpp
 * @brief openMonkey source file.
 */

#pragma once

#include <string>
#include <vector>

#include "openmonkey/config/campaign_options.hpp"

namespace omk {

/**
 * @brief Severity level for campaign validation findings.
 */
enum class ValidationSeverity { Warning, Error };

/**
 * @brief One campaign validation finding.
 */
struct ValidationIssue {
    ValidationSeverity severity = ValidationSeverity::Error;
    std::string message;
};

/**
 * @brief Validates `CampaignOptions` before any device command is issued.
 *
 * Checks cover run/event counts, the package list and package-name syntax,
 * the battery threshold range, poll and settle pacing, and the output
 * directory.
 */
class CampaignValidator {
public:
    /**
     * @brief Perform validation and return all findings.
     */
    static std::vector<ValidationIssue> validate(const CampaignOptions& options);
    /**
     * @brief Convenience predicate to detect if any issue is fatal.
     */
    static bool hasErrors(const std::vector<ValidationIssue>& issues);

    static bool isValidPackageName(const std::string& name);
};

} // namespace omk
