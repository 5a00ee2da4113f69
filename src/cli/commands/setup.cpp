#include "../coldxfer_cli.hpp"
#include "../theme.hpp"
#include <iostream>

static int do_init(BaseCLI& cli, const std::vector<std::string>& args) {
    if (!args.empty()) {
        std::cout << theme::fail("Usage: coldxfer init");
        return 1;
    }

    if (fs::exists(cli.config_path)) {
        std::cout << theme::info("Config already exists: " + cli.config_path.string());
        return 0;
    }

    auto r = create_default_config(cli.config_path);
    if (r.is_err()) {
        std::cout << theme::fail(r.error);
        return 1;
    }
    std::cout << theme::ok("Wrote " + cli.config_path.string());
    std::cout << theme::step("Set store.root, then run 'coldxfer upload <src> <key>'.");
    return 0;
}

void register_setup_commands(BaseCLI& cli) {
    cli.add_command("init", do_init, "", "Write a default config file");
}
