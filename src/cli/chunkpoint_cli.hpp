#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>

class ChunkpointCLI : public BaseCLI {
public:
    ChunkpointCLI();

    // One-shot dispatch: `chunkpoint [--config <path>] <command> [arg]`.
    // Returns the process exit status.
    int run_command(const std::string& command, const std::vector<std::string>& args,
                    const std::optional<std::string>& config_path);

private:
    void register_all_commands();
};
