#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>

static void do_init(BaseCLI& cli, const std::string& arg) {
    if (global_config_exists()) {
        std::cout << theme::info("Config already exists: " + get_global_config_path().string());
        return;
    }

    auto result = create_default_global_config();
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        cli.exit_code = 1;
        return;
    }
    std::cout << theme::ok("Wrote " + get_global_config_path().string());
    std::cout << theme::step("State directory: " + get_default_state_dir().string());
}

void register_setup_commands(BaseCLI& cli) {
    cli.add_command("init", do_init, "Write the default global configuration");
}
