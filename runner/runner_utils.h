#pragma once

#include "gauntlet/types.h"

#include <string>
#include <vector>

namespace gauntlet {

// Parsed command line with environment defaults already applied.
struct CliArgs {
    std::string command;                // regular|tournament|memcheck|perf|check
    std::string config_path;

    int timeout_ms{5000};               // --timeout <sec>, GAUNTLET_TIMEOUT_MS
    std::string failure_log;            // --failure-log
    std::string output_dir{"."};        // --output-dir
    std::string event_log;              // --event-log
    std::string package;                // --package
    std::string scratch_dir;            // --scratch-dir, GAUNTLET_SCRATCH_DIR
    bool keep_artifacts{false};         // --keep-artifacts
    std::vector<std::string> leak_wrapper;  // --leak-wrapper "<cmd>"; empty = config
    int verbosity{0};                   // -v (repeatable), --verbosity n
    bool no_color{false};               // --no-color, NO_COLOR
};

// false on a usage error, with *err describing it.
bool parse_cli_args(int argc, char** argv, CliArgs* out, std::string* err);

std::string usage_text();

std::string gen_run_id();

namespace runner_detail {
int getenv_int(const char* k, int defv);
} // namespace runner_detail

} // namespace gauntlet
