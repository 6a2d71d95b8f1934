#include "gauntlet/executable.h"

#include <cstdlib>
#include <filesystem>
#include <set>
#include <utility>

namespace gauntlet {

Executable::Executable(ExecutableSpec spec) : spec_(std::move(spec)) {
    if (spec_.id.empty()) {
        throw ConfigError("executable missing required field: id");
    }
    if (spec_.binary.empty()) {
        throw ConfigError("executable '" + spec_.id + "' missing required field: binary");
    }
}

std::string Executable::runtime_dir() const {
    if (spec_.runtimes.empty()) return "";
    return std::filesystem::path(spec_.runtimes.front()).parent_path().string();
}

std::string Executable::runtime_lib() const {
    if (spec_.runtimes.empty()) return "";
    std::string name = std::filesystem::path(spec_.runtimes.front()).filename().string();
    if (name.rfind("lib", 0) == 0) name = name.substr(3);
    // strip ".so", ".so.1.2", ".a", ".dylib"
    auto dot = name.find('.');
    if (dot != std::string::npos) name = name.substr(0, dot);
    return name;
}

EnvOverlay Executable::runtime_env() const {
    EnvOverlay env;
    if (spec_.runtimes.empty()) return env;

    std::string dirs;
    std::set<std::string> seen;
    for (const auto& rt : spec_.runtimes) {
        std::string d = std::filesystem::path(rt).parent_path().string();
        if (d.empty() || !seen.insert(d).second) continue;
        if (!dirs.empty()) dirs += ":";
        dirs += d;
    }
    if (dirs.empty()) return env;

    if (const char* cur = std::getenv("LD_LIBRARY_PATH")) {
        if (*cur) dirs += std::string(":") + cur;
    }
    env.emplace_back("LD_LIBRARY_PATH", dirs);
    return env;
}

Executable Executable::with_baseline(bool baseline) const {
    ExecutableSpec s = spec_;
    s.is_baseline = baseline;
    return Executable(std::move(s));
}

} // namespace gauntlet
