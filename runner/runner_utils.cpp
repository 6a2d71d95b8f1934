#include "runner_utils.h"
#include "gauntlet/proc.h"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <random>
#include <sstream>
#include <stdexcept>

namespace gauntlet {

namespace runner_detail {
int getenv_int(const char* k, int defv) {
    if (const char* e = std::getenv(k)) {
        try { return std::stoi(e); } catch (const std::exception&) { return defv; }
    }
    return defv;
}
} // namespace runner_detail

std::string gen_run_id() {
    const char* det = std::getenv("GAUNTLET_DETERMINISTIC_RUN_ID");

    uint64_t seed = 0;
    if (det && std::string(det) == "1") {
        seed = 1234567ULL;
    } else {
        uint64_t t = (uint64_t)std::chrono::high_resolution_clock::now().time_since_epoch().count();
        uint64_t r = 0;
        try {
            std::random_device rd;
            r = ((uint64_t)rd() << 32) ^ (uint64_t)rd();
        } catch (const std::exception&) {
            r = 0x9e3779b97f4a7c15ULL;
        }
        seed = t ^ r;
    }

    std::mt19937_64 rng{seed};
    uint64_t a = rng();
    uint64_t b = rng();
    std::ostringstream oss;
    oss << std::hex << a << b;
    return oss.str();
}

std::string usage_text() {
    return "usage: gauntlet_cli <regular|tournament|memcheck|perf|check> <config.json> [options]\n"
           "  --timeout <sec>         per-step timeout (default 5, env GAUNTLET_TIMEOUT_MS)\n"
           "  --failure-log <path>    baseline failures (tournament)\n"
           "  --output-dir <dir>      CSV and feedback files (default .)\n"
           "  --event-log <path>      JSONL event log\n"
           "  --package <name>        run a single package\n"
           "  --scratch-dir <dir>     artifact root (env GAUNTLET_SCRATCH_DIR)\n"
           "  --keep-artifacts        do not remove per-test scratch directories\n"
           "  --leak-wrapper \"<cmd>\"  leak checker command (memcheck)\n"
           "  -v, --verbose           more output (repeatable)\n"
           "  --verbosity <n>         set verbosity 0-3\n"
           "  --no-color              disable ANSI colors (env NO_COLOR)\n";
}

static bool known_command(const std::string& c) {
    RunMode m;
    return c == "check" || parse_run_mode(c, &m);
}

bool parse_cli_args(int argc, char** argv, CliArgs* out, std::string* err) {
    CliArgs a;
    a.timeout_ms = runner_detail::getenv_int("GAUNTLET_TIMEOUT_MS", 5000);
    if (const char* sd = std::getenv("GAUNTLET_SCRATCH_DIR")) a.scratch_dir = sd;
    if (const char* nc = std::getenv("NO_COLOR")) a.no_color = (*nc != '\0');

    std::vector<std::string> positional;
    for (int i = 1; i < argc; i++) {
        const std::string arg = argv[i];
        auto need_value = [&](std::string* dst) -> bool {
            if (i + 1 >= argc) {
                *err = "missing value for " + arg;
                return false;
            }
            *dst = argv[++i];
            return true;
        };

        std::string v;
        if (arg == "--timeout") {
            if (!need_value(&v)) return false;
            double sec = 0;
            try {
                size_t used = 0;
                sec = std::stod(v, &used);
                if (used != v.size()) throw std::invalid_argument(v);
            } catch (const std::exception&) {
                *err = "invalid --timeout: " + v;
                return false;
            }
            if (!(sec > 0) || sec > 86400) {
                *err = "--timeout must be in (0, 86400] seconds";
                return false;
            }
            a.timeout_ms = (int)std::lround(sec * 1000.0);
            if (a.timeout_ms < 1) a.timeout_ms = 1;
        } else if (arg == "--failure-log") {
            if (!need_value(&a.failure_log)) return false;
        } else if (arg == "--output-dir") {
            if (!need_value(&a.output_dir)) return false;
        } else if (arg == "--event-log") {
            if (!need_value(&a.event_log)) return false;
        } else if (arg == "--package") {
            if (!need_value(&a.package)) return false;
        } else if (arg == "--scratch-dir") {
            if (!need_value(&a.scratch_dir)) return false;
        } else if (arg == "--keep-artifacts") {
            a.keep_artifacts = true;
        } else if (arg == "--leak-wrapper") {
            if (!need_value(&v)) return false;
            a.leak_wrapper = split_argv_quoted(v);
            if (a.leak_wrapper.empty()) {
                *err = "--leak-wrapper needs a command";
                return false;
            }
        } else if (arg == "-v" || arg == "--verbose") {
            a.verbosity++;
        } else if (arg == "--verbosity") {
            if (!need_value(&v)) return false;
            try {
                a.verbosity = std::stoi(v);
            } catch (const std::exception&) {
                *err = "invalid --verbosity: " + v;
                return false;
            }
        } else if (arg == "--no-color") {
            a.no_color = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            *err = "unknown option: " + arg;
            return false;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 2) {
        *err = positional.size() < 2 ? "missing command or config path" : "unexpected argument: " + positional[2];
        return false;
    }
    if (!known_command(positional[0])) {
        *err = "unknown command: " + positional[0];
        return false;
    }
    if (a.timeout_ms <= 0) {
        *err = "GAUNTLET_TIMEOUT_MS must be positive";
        return false;
    }
    if (a.verbosity < 0) a.verbosity = 0;
    if (a.verbosity > 3) a.verbosity = 3;

    a.command = positional[0];
    a.config_path = positional[1];
    *out = std::move(a);
    return true;
}

} // namespace gauntlet
