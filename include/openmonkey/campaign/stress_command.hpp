#pragma once

#include <string>
#include <vector>

#include "openmonkey/core/run_types.hpp"

namespace omk {

/**
 * @brief Builds the `monkey` argument list (without the `shell` prefix).
 *
 * Base flags restrict launches to LAUNCHER activities, tolerate security
 * exceptions, monitor native crashes and raise verbosity. Each package is a
 * separate `-p` target. The failure filter suppresses the failure class that
 * is not of interest; the event count is always last.
 */
class StressCommand {
public:
    static std::vector<std::string> buildArguments(const RunConfig& config);
};

} // namespace omk
