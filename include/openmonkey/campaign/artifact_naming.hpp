/**
 * @file artifact_naming.hpp
 * @brief openMonkey source file.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "openmonkey/core/run_types.hpp"

namespace omk {

/**
 * @brief Per-run artifact paths that sort lexicographically in run order.
 *
 * Run indices are 1-based; file stems use the 0-based index zero-padded to
 * the digit count of `totalRuns - 1`, so a single-run campaign writes `0-*`.
 */
class ArtifactNaming {
public:
    static std::size_t padWidth(std::uint32_t totalRuns);
    static std::string paddedIndex(std::uint32_t totalRuns, std::uint32_t runIndex);
    static std::string stem(const std::string& directory, std::uint32_t totalRuns, std::uint32_t runIndex);
    static RunArtifacts artifacts(const std::string& directory, std::uint32_t totalRuns, std::uint32_t runIndex);
};

} // namespace omk
