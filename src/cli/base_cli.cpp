#include "base_cli.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <iostream>
#include <vector>
#include <fmt/format.h>

void BaseCLI::add_command(const std::string& name,
                          CommandHandler handler,
                          const std::string& help) {
    commands_[name] = {std::move(handler), help};
}

bool BaseCLI::load(const std::optional<std::string>& config_path) {
    auto result = config_path ? Config::load_file(*config_path) : Config::load_global();
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        exit_code = 1;
        return false;
    }
    config = result.value;

    if (auto log_file = config->log_file()) {
        set_log_path(*log_file);
    }

    StoreOptions options;
    options.lock_timeout_ms = config->lock().timeout_ms;
    options.lock_poll_ms = config->lock().poll_ms;
    store = std::make_unique<CheckpointStore>(config->state_dir(), options);
    chunkpoint_log("[cli] state dir " + config->state_dir().string());
    return true;
}

bool BaseCLI::require_store() {
    if (!store) {
        std::cout << theme::fail("No configuration loaded.");
        exit_code = 1;
        return false;
    }
    return true;
}

bool BaseCLI::execute_command(const std::string& command, const std::string& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Run 'chunkpoint --help' for available commands.");
        exit_code = 1;
        return false;
    }

    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        exit_code = 1;
    }
    return true;
}

void BaseCLI::print_help() const {
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Jobs",  {"list", "status", "show", "clear"}},
        {"Setup", {"init"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        std::cout << "\n" << theme::color::SAND << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::TEAL
                          << fmt::format("    {:<14}", name)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.second
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n";
}
