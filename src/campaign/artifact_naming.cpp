/**
 * @file artifact_naming.cpp
 * @brief openMonkey source file.
 */

#include "openmonkey/campaign/artifact_naming.hpp"

#include <filesystem>
#include <stdexcept>

namespace omk {

std::size_t ArtifactNaming::padWidth(std::uint32_t totalRuns) {
    std::uint32_t largest = totalRuns > 0U ? totalRuns - 1U : 0U;
    std::size_t digits = 1U;
    while (largest >= 10U) {
        largest /= 10U;
        ++digits;
    }
    return digits;
}

std::string ArtifactNaming::paddedIndex(std::uint32_t totalRuns, std::uint32_t runIndex) {
    if (runIndex == 0U || runIndex > totalRuns) {
        throw std::out_of_range("run index " + std::to_string(runIndex) + " outside 1.." +
                                std::to_string(totalRuns));
    }
    auto digits = std::to_string(runIndex - 1U);
    const auto width = padWidth(totalRuns);
    if (digits.size() < width) {
        digits.insert(0, width - digits.size(), '0');
    }
    return digits;
}

std::string ArtifactNaming::stem(const std::string& directory, std::uint32_t totalRuns, std::uint32_t runIndex) {
    return (std::filesystem::path(directory) / paddedIndex(totalRuns, runIndex)).string();
}

RunArtifacts ArtifactNaming::artifacts(const std::string& directory, std::uint32_t totalRuns,
                                       std::uint32_t runIndex) {
    const auto base = stem(directory, totalRuns, runIndex);
    RunArtifacts paths;
    paths.monkeyLog = base + "-monkey.txt";
    paths.deviceLog = base + "-logcat.txt";
    paths.bugreport = base + "-bugreport.txt";
    paths.report = base + ".html";
    return paths;
}

} // namespace omk
