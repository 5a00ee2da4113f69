#include <iostream>
#include <vector>
#include <string>
#include "cli/coldxfer_cli.hpp"
#include "cli/theme.hpp"

void print_usage(const ColdxferCLI& cli) {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    coldxfer "
              << theme::color::RESET << theme::color::SLATE << "[--config <path>] <command> [args]"
              << theme::color::RESET << "\n";
    cli.print_help();
    std::cout << theme::color::DIM
              << "    coldxfer --version        Show version\n"
              << "    coldxfer --help           Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);

        std::string config_path;
        if (!take_option(args, "--config", config_path)) {
            std::cout << theme::fail("--config needs a path");
            return 1;
        }
        ColdxferCLI cli(config_path);

        if (args.empty()) {
            print_usage(cli);
            return 1;
        }

        std::string cmd = args.front();
        args.erase(args.begin());

        if (cmd == "--version") {
            std::cout << theme::color::SLATE << theme::color::BOLD << "coldxfer"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << COLDXFER_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help" || cmd == "help") {
            print_usage(cli);
            return 0;
        } else if (!cli.has_command(cmd)) {
            std::cout << theme::fail("Unknown command: " + cmd);
            print_usage(cli);
            return 1;
        }

        return cli.run_command(cmd, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
