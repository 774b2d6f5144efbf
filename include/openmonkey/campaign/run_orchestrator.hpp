/**
 * @file run_orchestrator.hpp
 * @brief openMonkey source file.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

#include "openmonkey/campaign/polling.hpp"
#include "openmonkey/campaign/readiness_gate.hpp"
#include "openmonkey/campaign/report_renderer.hpp"
#include "openmonkey/campaign/resource_gate.hpp"
#include "openmonkey/capture/log_capture.hpp"
#include "openmonkey/core/run_types.hpp"
#include "openmonkey/device/device_client.hpp"

namespace omk {

struct OrchestratorOptions {
    PollingOptions bootPolling = ReadinessGate::defaultPolling();
    PollingOptions chargePolling = ResourceGate::defaultPolling();
    /**
     * @brief Quiet period after boot so boot noise stays out of the capture.
     */
    std::chrono::milliseconds settleDelay{30000};
    /**
     * @brief Shared sleep hook; also used by gates that have none of their own.
     */
    std::function<void(std::chrono::milliseconds)> sleep;
    /**
     * @brief Campaign-wide stop hook. Gates without their own `keepWaiting`
     * use it, no new run starts once it reads false, and a stress failure seen
     * while it reads false is recorded as an interrupted run.
     */
    std::function<bool()> keepRunning;
    std::vector<std::string> logFilterSpec;
    std::ostream* log = nullptr;
};

/**
 * @brief Drives reboot, gating, capture, stress and artifact collection.
 *
 * One run walks IDLE -> REBOOTING -> AWAITING-CHARGE -> CAPTURING ->
 * STRESS-RUNNING -> CLEAN|FAILED -> ARTIFACT-COLLECTION -> DONE. Only a
 * CommandError from the stress invocation is recovered (as a failed run, or
 * an interrupted one after a stop request); every other error propagates and
 * ends the campaign. The capture is stopped
 * and the stress log closed on every exit path.
 */
class RunOrchestrator {
public:
    using StateCallback = std::function<void(std::uint32_t runIndex, RunState state)>;
    using StopPredicate = std::function<bool()>;

    RunOrchestrator(DeviceClient& device, ReportRenderer& renderer, OrchestratorOptions options = {});

    void onStateChange(StateCallback callback);

    RunResult runOnce(const RunConfig& config);

    /**
     * @brief Run `base.totalRuns` runs, checking `stopRequested` between runs.
     * @throws CommandError, std::runtime_error or std::filesystem::filesystem_error
     * for campaign-fatal failures.
     */
    CampaignSummary runCampaign(const RunConfig& base, StopPredicate stopRequested = {});

    RunState state() const noexcept;

private:
    void transition(std::uint32_t runIndex, RunState next);
    bool cancelled() const;
    void settle();
    bool collectBugreport(const RunArtifacts& artifacts);
    void prepareOutputDirectory(const std::string& directory);

    DeviceClient& device_;
    ReportRenderer& renderer_;
    OrchestratorOptions options_;
    ReadinessGate readiness_;
    ResourceGate resources_;
    LogCapture capture_;
    StateCallback stateCallback_;
    RunState state_ = RunState::Idle;
};

} // namespace omk
