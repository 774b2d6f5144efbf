/**
 * @file property_dump.hpp
 * @brief Parser for "key: value" service dumps such as `dumpsys battery`.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>

namespace omk {

using PropertyValue = std::variant<bool, std::int64_t, std::string>;
using PropertyMap = std::unordered_map<std::string, PropertyValue>;

/**
 * @brief Coerce one raw value: "true"/"false" to bool, a full integer token to
 * int64, anything else stays a string.
 */
PropertyValue coercePropertyValue(const std::string& raw);

/**
 * @brief Parse every line containing ':' into a trimmed key and coerced value.
 *
 * Lines without a separator (section headers) are skipped. Later duplicate
 * keys overwrite earlier ones.
 */
PropertyMap parsePropertyDump(const std::string& text);

std::optional<std::int64_t> integerProperty(const PropertyMap& properties, const std::string& key);
std::optional<bool> booleanProperty(const PropertyMap& properties, const std::string& key);

} // namespace omk
