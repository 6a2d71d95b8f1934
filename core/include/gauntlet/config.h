#pragma once
#include "executable.h"
#include "runner.h"
#include "testfile.h"
#include "toolchain.h"

#include <filesystem>
#include <string>
#include <vector>

namespace gauntlet {

// Parsed run configuration. Relative paths are already resolved against the
// configuration file's directory.
struct Config {
    std::filesystem::path config_path;
    std::filesystem::path test_dir;
    std::vector<Executable> executables;
    std::vector<ToolChain> toolchains;   // JSON object order
    std::string solution_exe;            // id of the baseline executable, "" if none
    LeakCheck memcheck;                  // settings only; memcheck mode enables it
    TestFileOptions fixtures;

    const Executable* find_executable(const std::string& id) const;
    const Executable* baseline() const;
};

// Throws ConfigError naming the offending key on any missing/mistyped field.
Config parse_config(const std::string& json_text, const std::filesystem::path& base_dir);

// Reads and parses a configuration file. Throws ConfigError.
Config load_config(const std::filesystem::path& path);

} // namespace gauntlet
