#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <core/config.hpp>
#include <managers/checkpoint_store.hpp>

class BaseCLI {
public:
    BaseCLI() = default;
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<void(BaseCLI&, const std::string&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    // Load config (explicit path, else ~/.chunkpoint/config.yaml) and open
    // the checkpoint store on its state directory.
    bool load(const std::optional<std::string>& config_path = std::nullopt);

    bool require_store();

    // Returns false for an unknown command.
    bool execute_command(const std::string& command, const std::string& args = "");
    void print_help() const;

    // Public state
    std::optional<Config> config;
    std::unique_ptr<CheckpointStore> store;

    // Set to non-zero by a failing command; becomes the process exit status.
    int exit_code = 0;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
};

void register_jobs_commands(BaseCLI& cli);
void register_setup_commands(BaseCLI& cli);
