#include <iostream>
#include <vector>
#include <string>
#include "cli/jobrunner_cli.hpp"
#include "cli/theme.hpp"

void print_usage(const JobRunnerCLI& cli) {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::usage_line("run", "<file|standard>", "Submit a pipeline");
    std::cout << theme::usage_line("status", "<name>", "Refresh outcomes");
    std::cout << theme::usage_line("rerun", "<name>", "Resubmit failed branches");
    std::cout << theme::usage_line("show", "<name> [--json]", "Print a pipeline");
    cli.print_help();
    std::cout << theme::dim("    jobrunner --version        Show version\n"
                            "    jobrunner --help           Show this help") << "\n\n";
}

int main(int argc, char** argv) {
    try {
        JobRunnerCLI cli;

        if (argc == 1) {
            print_usage(cli);
            return 1;
        }

        std::string cmd = argv[1];
        if (cmd == "--version") {
            std::cout << theme::version_line();
            return 0;
        } else if (cmd == "--help" || cmd == "help") {
            print_usage(cli);
            return 0;
        }

        std::vector<std::string> args(argv + 2, argv + argc);
        return cli.run_command(cmd, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
