/**
 * @file property_dump.cpp
 * @brief openMonkey source file.
 */

#include "openmonkey/device/property_dump.hpp"

#include <charconv>
#include <sstream>

#include "openmonkey/core/string_utils.hpp"

namespace omk {

PropertyValue coercePropertyValue(const std::string& raw) {
    const auto value = trimCopy(raw);
    if (value == "true") {
        return true;
    }
    if (value == "false") {
        return false;
    }

    std::int64_t number = 0;
    const char* first = value.data();
    const char* last = value.data() + value.size();
    if (!value.empty() && *first == '+') {
        ++first;
    }
    const auto [ptr, ec] = std::from_chars(first, last, number);
    if (ec == std::errc{} && ptr == last && first != last) {
        return number;
    }
    return value;
}

PropertyMap parsePropertyDump(const std::string& text) {
    PropertyMap properties;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        const auto key = trimCopy(line.substr(0, colon));
        if (key.empty()) {
            continue;
        }
        properties[key] = coercePropertyValue(line.substr(colon + 1U));
    }
    return properties;
}

std::optional<std::int64_t> integerProperty(const PropertyMap& properties, const std::string& key) {
    const auto it = properties.find(key);
    if (it == properties.end()) {
        return std::nullopt;
    }
    if (const auto* number = std::get_if<std::int64_t>(&it->second)) {
        return *number;
    }
    return std::nullopt;
}

std::optional<bool> booleanProperty(const PropertyMap& properties, const std::string& key) {
    const auto it = properties.find(key);
    if (it == properties.end()) {
        return std::nullopt;
    }
    if (const auto* flag = std::get_if<bool>(&it->second)) {
        return *flag;
    }
    return std::nullopt;
}

} // namespace omk
