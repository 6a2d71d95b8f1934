#include "cmd_run.h"
#include "runner_utils.h"

#include "gauntlet/reporter.h"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    using namespace gauntlet;

    CliArgs args;
    std::string err;
    if (!parse_cli_args(argc, argv, &args, &err)) {
        std::cerr << "gauntlet_cli: " << err << "\n" << usage_text();
        return 2;
    }

    Reporter rep(std::cout, std::cerr,
                 !args.no_color && Reporter::stdout_supports_color(),
                 args.verbosity);

    if (args.command == "check") return cmd_check(args, rep);
    return cmd_run(args, rep);
}
