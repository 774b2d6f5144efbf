/**
 * @file report_renderer.cpp
 * @brief openMonkey source file.
 */

#include "openmonkey/campaign/report_renderer.hpp"

namespace omk {

ReportRenderer::ReportRenderer(IProcessRunner& runner, std::string toolPath)
    : runner_(runner), toolPath_(std::move(toolPath)) {}

std::vector<std::string> ReportRenderer::commandLine(const RunArtifacts& artifacts) const {
    return {
        toolPath_,
        "--monkey", artifacts.monkeyLog,
        "--logcat", artifacts.deviceLog,
        "--bugreport", artifacts.bugreport,
        "--output", artifacts.report,
    };
}

const std::string& ReportRenderer::toolPath() const noexcept { return toolPath_; }

bool ReportRenderer::render(const RunArtifacts& artifacts, std::string& outError) {
    outError.clear();

    ProcessRequest request;
    request.argv = commandLine(artifacts);
    request.captureOutput = true;

    const auto result = runner_.run(request);
    if (!result.launched) {
        outError = "report tool did not start: " + result.error;
        return false;
    }
    if (result.exitCode != 0) {
        outError = "report tool exited with " + std::to_string(result.exitCode);
        if (!result.output.empty()) {
            outError += ": " + result.output;
        }
        return false;
    }
    return true;
}

} // namespace omk
