#include "base_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <fmt/format.h>

BaseCLI::BaseCLI(fs::path path) : config_path(std::move(path)) {
    if (config_path.empty()) config_path = default_config_path();
    auto config_result = Config::load(config_path);
    if (config_result.is_ok()) {
        config = config_result.value;
    } else {
        config_error = config_result.error;
    }
}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& usage,
                         const std::string& help) {
    commands_[name] = Command{std::move(handler), usage, help};
}

bool BaseCLI::require_config() {
    if (!config.has_value()) {
        std::cout << theme::fail(config_error);
        return false;
    }
    return true;
}

bool BaseCLI::require_service() {
    if (service && service->is_open()) return true;
    if (!require_config()) return false;

    service = std::make_unique<ColdxferService>(config.value());
    auto r = service->open();
    if (r.is_err()) {
        std::cout << theme::fail(r.error);
        service.reset();
        return false;
    }
    return true;
}

int BaseCLI::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Run 'coldxfer --help' for available commands.");
        return 1;
    }

    try {
        return it->second.handler(*this, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}

void BaseCLI::print_help() const {
    // Group commands by category
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Transfers", {"upload", "download", "run"}},
        {"Jobs",      {"status", "cancel", "forget"}},
        {"Account",   {"quota", "init"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        std::cout << "\n" << theme::color::SLATE << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it == commands_.end()) continue;
            std::cout << theme::color::BLUE
                      << fmt::format("    {:<34}", name + " " + it->second.usage)
                      << theme::color::RESET
                      << theme::color::DIM
                      << it->second.help
                      << theme::color::RESET << "\n";
        }
    }
    std::cout << "\n";
}
