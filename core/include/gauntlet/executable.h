#pragma once
#include "proc.h"
#include "types.h"

#include <string>
#include <vector>

namespace gauntlet {

struct ExecutableSpec {
    std::string id;                     // id
    std::string binary;                 // binary
    std::vector<std::string> runtimes;  // runtimes / runtime
    bool is_baseline{false};            // isBaseline
};

// A program under test. Immutable; never touches the runner's own environment.
class Executable {
public:
    // Throws ConfigError when id or binary is empty.
    explicit Executable(ExecutableSpec spec);

    const std::string& id() const { return spec_.id; }
    const std::string& binary() const { return spec_.binary; }
    const std::vector<std::string>& runtimes() const { return spec_.runtimes; }
    bool is_baseline() const { return spec_.is_baseline; }

    // $RT_PATH: directory holding the first runtime library ("" if none).
    std::string runtime_dir() const;
    // $RT_LIB: first runtime library name for -l ("libfoo.so" -> "foo").
    std::string runtime_lib() const;
    // Child environment for steps that use the runtime.
    EnvOverlay runtime_env() const;

    Executable with_baseline(bool baseline) const;

private:
    ExecutableSpec spec_;
};

} // namespace gauntlet
