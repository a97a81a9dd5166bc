#include <iostream>
#include <vector>
#include <string>
#include <optional>
#include "cli/chunkpoint_cli.hpp"
#include "cli/theme.hpp"

void print_usage(const ChunkpointCLI& cli) {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::TEAL << "    chunkpoint "
              << theme::color::RESET << theme::color::SAND << "[--config <path>] <command> [job_id]"
              << theme::color::RESET << "\n";
    cli.print_help();
    std::cout << theme::color::DIM
              << "    chunkpoint --version  Show version\n"
              << "    chunkpoint --help     Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        ChunkpointCLI cli;

        std::vector<std::string> args(argv + 1, argv + argc);
        std::optional<std::string> config_path;

        if (!args.empty() && args[0] == "--config") {
            if (args.size() < 2) {
                std::cout << theme::fail("--config needs a path.");
                return 1;
            }
            config_path = args[1];
            args.erase(args.begin(), args.begin() + 2);
        }

        if (args.empty() || args[0] == "--help" || args[0] == "help") {
            print_usage(cli);
            return args.empty() ? 1 : 0;
        }

        if (args[0] == "--version") {
            std::cout << theme::color::TEAL << theme::color::BOLD << "chunkpoint"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << CHUNKPOINT_VERSION << theme::color::RESET << "\n";
            return 0;
        }

        std::string cmd = args[0];
        args.erase(args.begin());
        return cli.run_command(cmd, args, config_path);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
