/**
 * @file command_error.hpp
 * @brief openMonkey source file.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace omk {

/**
 * @brief Raised when a device-control command exits non-zero or cannot be launched.
 */
class CommandError : public std::runtime_error {
public:
    CommandError(std::string command, int exitCode, const std::string& detail = {});

    const std::string& command() const noexcept { return command_; }
    int exitCode() const noexcept { return exitCode_; }

private:
    std::string command_;
    int exitCode_ = 0;
};

} // namespace omk
