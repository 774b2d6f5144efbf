/**
 * @file string_utils.hpp
 * @brief openMonkey source file.
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace omk {

inline std::string trimCopy(std::string value) {
    value.erase(value.begin(),
                std::find_if(value.begin(), value.end(), [](unsigned char c) { return !std::isspace(c); }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [](unsigned char c) { return !std::isspace(c); }).base(),
                value.end());
    return value;
}

} // namespace omk
