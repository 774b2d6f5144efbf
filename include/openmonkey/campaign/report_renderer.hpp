/**
 * @file report_renderer.hpp
 * @brief openMonkey source file.
 */

#pragma once

#include <string>
#include <vector>

#include "openmonkey/core/run_types.hpp"
#include "openmonkey/transport/i_process_runner.hpp"

namespace omk {

/**
 * @brief Runs the external report tool over the artifacts of a failed run.
 *
 * Invocation: `<tool> --monkey <m> --logcat <l> --bugreport <b> --output <html>`.
 */
class ReportRenderer {
public:
    ReportRenderer(IProcessRunner& runner, std::string toolPath);

    bool render(const RunArtifacts& artifacts, std::string& outError);

    std::vector<std::string> commandLine(const RunArtifacts& artifacts) const;
    const std::string& toolPath() const noexcept;

private:
    IProcessRunner& runner_;
    std::string toolPath_;
};

} // namespace omk
