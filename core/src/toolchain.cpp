#include "gauntlet/toolchain.h"

#include <utility>

namespace gauntlet {

Step::Step(StepSpec spec) : spec_(std::move(spec)) {
    if (spec_.name.empty()) {
        throw ConfigError("step missing required field: stepName");
    }
    if (spec_.command.empty()) {
        throw ConfigError("step '" + spec_.name + "' missing required field: command");
    }
    if (spec_.output.empty()) {
        throw ConfigError("step '" + spec_.name + "' has empty output (use \"-\" to pipe)");
    }
}

ToolChain::ToolChain(std::string name, std::vector<Step> steps)
    : name_(std::move(name)), steps_(std::move(steps)) {
    if (name_.empty()) {
        throw ConfigError("toolchain name must not be empty");
    }
    if (steps_.empty()) {
        throw ConfigError("toolchain '" + name_ + "' has no steps");
    }
}

const Step* ToolChain::find_step(const std::string& step_name) const {
    for (const auto& s : steps_) {
        if (s.name() == step_name) return &s;
    }
    return nullptr;
}

} // namespace gauntlet
