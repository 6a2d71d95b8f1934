#pragma once
#include "runner_utils.h"

#include "gauntlet/reporter.h"

namespace gauntlet {

// Exit codes: 0 all tests passed, 1 failures or configuration error.
int cmd_run(const CliArgs& args, Reporter& rep);

// Validate configuration and fixtures without running anything.
int cmd_check(const CliArgs& args, Reporter& rep);

} // namespace gauntlet
