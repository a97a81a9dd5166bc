#include "chunkpoint_cli.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <iostream>

ChunkpointCLI::ChunkpointCLI() : BaseCLI() {
    register_all_commands();
}

void ChunkpointCLI::register_all_commands() {
    register_jobs_commands(*this);
    register_setup_commands(*this);
}

int ChunkpointCLI::run_command(const std::string& command, const std::vector<std::string>& args,
                               const std::optional<std::string>& config_path) {
    if (args.size() > 1) {
        std::cout << theme::fail("Too many arguments for '" + command + "'.");
        return 1;
    }

    // init writes the config, so it must not require one to load
    if (command != "init" && !load(config_path)) {
        return exit_code;
    }

    chunkpoint_log("[cli] " + command + (args.empty() ? "" : " " + args[0]));
    execute_command(command, args.empty() ? "" : args[0]);
    return exit_code;
}
