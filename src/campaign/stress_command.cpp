/**
 * @file stress_command.cpp
 * @brief openMonkey source file.
 */

#include "openmonkey/campaign/stress_command.hpp"

namespace omk {

std::vector<std::string> StressCommand::buildArguments(const RunConfig& config) {
    std::vector<std::string> args{
        "monkey",
        "-c", "android.intent.category.LAUNCHER",
        "--ignore-security-exceptions",
        "--monitor-native-crashes",
        "-v", "-v", "-v",
    };

    for (const auto& package : config.packages) {
        args.emplace_back("-p");
        args.push_back(package);
    }

    switch (config.failureFilter) {
    case FailureFilter::Anr:
        args.emplace_back("--ignore-crashes");
        args.emplace_back("--ignore-native-crashes");
        break;
    case FailureFilter::Crash:
        args.emplace_back("--ignore-timeouts");
        break;
    case FailureFilter::None:
        break;
    }

    if (!config.descriptionFilter.empty()) {
        args.emplace_back("--match-description");
        args.push_back(config.descriptionFilter);
    }

    args.push_back(std::to_string(config.eventCount));
    return args;
}

} // namespace omk
