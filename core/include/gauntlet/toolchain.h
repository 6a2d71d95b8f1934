#pragma once
#include "types.h"

#include <string>
#include <vector>

namespace gauntlet {

// Named, typed step fields as they appear in configuration. Defaults mirror
// the optional JSON keys; name and command are required.
struct StepSpec {
    std::string name;                    // stepName
    std::string command;                 // command
    std::vector<std::string> arguments;  // arguments
    std::string output{"-"};             // output: "-" = pipe, else artifact path
    bool allow_error{false};             // allowError
    bool uses_input_stream{false};       // usesInStr
    bool uses_runtime{false};            // usesRuntime
};

// One pipeline stage. Immutable after construction.
class Step {
public:
    // Throws ConfigError when name or command is empty, or output is empty.
    explicit Step(StepSpec spec);

    const std::string& name() const { return spec_.name; }
    const std::string& command() const { return spec_.command; }
    const std::vector<std::string>& arguments() const { return spec_.arguments; }
    const std::string& output() const { return spec_.output; }
    bool allow_error() const { return spec_.allow_error; }
    bool uses_input_stream() const { return spec_.uses_input_stream; }
    bool uses_runtime() const { return spec_.uses_runtime; }

    bool pipes_output() const { return spec_.output == "-"; }

private:
    StepSpec spec_;
};

// Named ordered sequence of steps; step order is execution order.
class ToolChain {
public:
    // Throws ConfigError when the name is empty or there are no steps.
    ToolChain(std::string name, std::vector<Step> steps);

    const std::string& name() const { return name_; }
    const std::vector<Step>& steps() const { return steps_; }
    size_t size() const { return steps_.size(); }
    const Step& operator[](size_t i) const { return steps_[i]; }

    std::vector<Step>::const_iterator begin() const { return steps_.begin(); }
    std::vector<Step>::const_iterator end() const { return steps_.end(); }

    // nullptr if no step carries that name
    const Step* find_step(const std::string& step_name) const;

private:
    std::string name_;
    std::vector<Step> steps_;
};

} // namespace gauntlet
