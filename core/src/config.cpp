#include "gauntlet/config.h"
#include "gauntlet/json_mini.h"

#include <fstream>
#include <sstream>

namespace gauntlet {

namespace fs = std::filesystem;

static std::string resolve_path(const std::string& p, const fs::path& base_dir) {
    fs::path path(p);
    if (path.is_absolute() || base_dir.empty()) return path.lexically_normal().string();
    return (base_dir / path).lexically_normal().string();
}

// Binaries given as bare names ("gcc") are looked up on PATH by the executor;
// anything with a directory component is resolved against the config dir.
static std::string resolve_binary(const std::string& b, const fs::path& base_dir) {
    if (b.find('/') == std::string::npos) return b;
    return resolve_path(b, base_dir);
}

static Step parse_step(json_object* o, const std::string& where) {
    if (!o || !json_object_is_type(o, json_type_object)) {
        throw ConfigError("expected step object at " + where);
    }
    const std::string w = where + ".";
    StepSpec s;
    s.name = json_mini::as_string(json_mini::require_member(o, "stepName", w), w + "stepName");
    s.command = json_mini::as_string(json_mini::require_member(o, "command", w), w + "command");
    if (json_object* args = json_mini::member(o, "arguments")) {
        s.arguments = json_mini::as_string_array(args, w + "arguments");
    }
    s.output = json_mini::opt_string(o, "output", w).value_or("-");
    s.allow_error = json_mini::opt_bool(o, "allowError", w).value_or(false);
    s.uses_input_stream = json_mini::opt_bool(o, "usesInStr", w).value_or(false);
    s.uses_runtime = json_mini::opt_bool(o, "usesRuntime", w).value_or(false);
    try {
        return Step(std::move(s));
    } catch (const ConfigError& e) {
        throw ConfigError(where + ": " + e.what());
    }
}

static Executable parse_executable(json_object* o, const std::string& where, const fs::path& base_dir) {
    if (!o || !json_object_is_type(o, json_type_object)) {
        throw ConfigError("expected executable object at " + where);
    }
    const std::string w = where + ".";
    ExecutableSpec s;
    s.id = json_mini::as_string(json_mini::require_member(o, "id", w), w + "id");
    s.binary = resolve_binary(
        json_mini::as_string(json_mini::require_member(o, "binary", w), w + "binary"), base_dir);
    if (json_object* rts = json_mini::member(o, "runtimes")) {
        for (const auto& rt : json_mini::as_string_array(rts, w + "runtimes")) {
            s.runtimes.push_back(resolve_path(rt, base_dir));
        }
    }
    if (auto rt = json_mini::opt_string(o, "runtime", w)) {
        if (!rt->empty()) s.runtimes.push_back(resolve_path(*rt, base_dir));
    }
    s.is_baseline = json_mini::opt_bool(o, "isBaseline", w).value_or(false);
    try {
        return Executable(std::move(s));
    } catch (const ConfigError& e) {
        throw ConfigError(where + ": " + e.what());
    }
}

static LeakCheck parse_memcheck(json_object* o) {
    LeakCheck lc;
    lc.wrapper = default_leak_wrapper(lc.exit_code);
    if (!o) return lc;
    if (!json_object_is_type(o, json_type_object)) {
        throw ConfigError("expected object at memcheck");
    }
    const std::string w = "memcheck.";
    lc.step = json_mini::opt_string(o, "step", w).value_or("");
    if (auto code = json_mini::opt_int(o, "exitCode", w)) {
        lc.exit_code = (int)*code;
        lc.wrapper = default_leak_wrapper(lc.exit_code);
    }
    lc.stderr_pattern = json_mini::opt_string(o, "stderrPattern", w).value_or("");
    if (json_object* wr = json_mini::member(o, "wrapper")) {
        lc.wrapper = json_mini::as_string_array(wr, w + "wrapper");
    }
    return lc;
}

const Executable* Config::find_executable(const std::string& id) const {
    for (const auto& e : executables) {
        if (e.id() == id) return &e;
    }
    return nullptr;
}

const Executable* Config::baseline() const {
    for (const auto& e : executables) {
        if (e.is_baseline()) return &e;
    }
    return nullptr;
}

Config parse_config(const std::string& json_text, const fs::path& base_dir) {
    std::string perr;
    json_mini::Doc doc = json_mini::parse(json_text, &perr);
    if (!doc) throw ConfigError("invalid JSON: " + perr);
    if (!json_object_is_type(doc.root, json_type_object)) {
        throw ConfigError("configuration must be a JSON object");
    }

    Config cfg;
    cfg.test_dir = resolve_path(
        json_mini::as_string(json_mini::require_member(doc.root, "testDir", ""), "testDir"), base_dir);

    json_object* exes = json_mini::require_member(doc.root, "executables", "");
    if (!json_object_is_type(exes, json_type_array)) {
        throw ConfigError("expected array at executables");
    }
    const size_t n_exes = json_object_array_length(exes);
    for (size_t i = 0; i < n_exes; i++) {
        const std::string where = "executables[" + std::to_string(i) + "]";
        Executable exe = parse_executable(json_object_array_get_idx(exes, i), where, base_dir);
        if (cfg.find_executable(exe.id())) {
            throw ConfigError("duplicate executable id: " + exe.id());
        }
        cfg.executables.push_back(std::move(exe));
    }
    if (cfg.executables.empty()) throw ConfigError("executables must not be empty");

    json_object* tcs = json_mini::require_member(doc.root, "toolchains", "");
    if (!json_object_is_type(tcs, json_type_object)) {
        throw ConfigError("expected object at toolchains");
    }
    json_object_object_foreach(tcs, tc_name, tc_steps) {
        const std::string where = std::string("toolchains.") + tc_name;
        if (!tc_steps || !json_object_is_type(tc_steps, json_type_array)) {
            throw ConfigError("expected array of steps at " + where);
        }
        std::vector<Step> steps;
        const size_t n_steps = json_object_array_length(tc_steps);
        for (size_t i = 0; i < n_steps; i++) {
            steps.push_back(parse_step(json_object_array_get_idx(tc_steps, i),
                                       where + "[" + std::to_string(i) + "]"));
        }
        cfg.toolchains.emplace_back(tc_name, std::move(steps));
    }
    if (cfg.toolchains.empty()) throw ConfigError("toolchains must not be empty");

    cfg.solution_exe = json_mini::opt_string(doc.root, "solutionExe", "").value_or("");
    if (!cfg.solution_exe.empty()) {
        bool found = false;
        for (auto& e : cfg.executables) {
            if (e.id() == cfg.solution_exe) {
                e = e.with_baseline(true);
                found = true;
            }
        }
        if (!found) throw ConfigError("solutionExe names unknown executable: " + cfg.solution_exe);
    } else if (const Executable* b = cfg.baseline()) {
        cfg.solution_exe = b->id();
    }

    cfg.memcheck = parse_memcheck(json_mini::member(doc.root, "memcheck"));

    if (auto cs = json_mini::opt_string(doc.root, "commentSyntax", "")) {
        if (cs->empty()) throw ConfigError("commentSyntax must not be empty");
        cfg.fixtures.comment_syntax = *cs;
    }
    return cfg;
}

Config load_config(const fs::path& path) {
    std::ifstream f(path);
    if (!f) throw ConfigError("cannot open config: " + path.string());
    std::stringstream ss;
    ss << f.rdbuf();

    std::error_code ec;
    fs::path abs = fs::absolute(path, ec);
    fs::path base = (ec ? path : abs).parent_path();

    Config cfg = parse_config(ss.str(), base);
    cfg.config_path = ec ? path : abs;
    return cfg;
}

} // namespace gauntlet
