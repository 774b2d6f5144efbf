/**
 * @file command_line.cpp
 * @brief openMonkey source file.
 */

#include "openmonkey/transport/i_process_runner.hpp"

#include <algorithm>

namespace omk {

std::string joinCommandLine(const std::vector<std::string>& argv) {
    std::string joined;
    for (std::size_t i = 0; i < argv.size(); ++i) {
        if (i != 0U) {
            joined += ' ';
        }
        const auto& arg = argv[i];
        const bool needsQuotes = arg.empty() ||
            std::any_of(arg.begin(), arg.end(), [](char c) { return c == ' ' || c == '\t' || c == '"'; });
        if (!needsQuotes) {
            joined += arg;
            continue;
        }
        joined += '"';
        for (const char c : arg) {
            if (c == '"') {
                joined += '\\';
            }
            joined += c;
        }
        joined += '"';
    }
    return joined;
}

} // namespace omk
