#include <iostream>
#include <string>
#include <vector>
#include "cli/volt_cli.hpp"
#include "cli/theme.hpp"
#include "core/constants.hpp"

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);
        std::string config_path;
        std::string cmd;

        for (size_t i = 0; i < args.size(); i++) {
            const std::string& arg = args[i];
            if (arg == "--version") {
                std::cout << theme::yellow(theme::bold("volt"))
                          << theme::dim(std::string(" version ") + VOLT_VERSION) << "\n";
                return 0;
            } else if (arg == "--help" || arg == "-h") {
                VoltCLI().print_usage();
                return 0;
            } else if (arg == "--config" || arg == "-c") {
                if (i + 1 >= args.size()) {
                    std::cout << theme::fail("Missing path after " + arg);
                    return 1;
                }
                config_path = args[++i];
            } else if (cmd.empty()) {
                cmd = arg;
            } else {
                std::cout << theme::fail("Unexpected argument: " + arg);
                return 1;
            }
        }

        VoltCLI cli(config_path);
        return cli.execute_command(cmd.empty() ? "run" : cmd);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
