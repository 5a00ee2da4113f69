#include "coldxfer_cli.hpp"
#include "theme.hpp"
#include <algorithm>
#include <iostream>

ColdxferCLI::ColdxferCLI(fs::path config_path) : BaseCLI(std::move(config_path)) {
    register_all_commands();
}

void ColdxferCLI::register_all_commands() {
    register_transfer_commands(*this);
    register_status_commands(*this);
    register_setup_commands(*this);
}

int ColdxferCLI::run_command(const std::string& command, const std::vector<std::string>& args) {
    return execute_command(command, args);
}

bool take_option(std::vector<std::string>& args, const std::string& name, std::string& value) {
    auto it = std::find(args.begin(), args.end(), name);
    if (it == args.end()) return true;
    if (it + 1 == args.end()) return false;
    value = *(it + 1);
    args.erase(it, it + 2);
    return true;
}

bool take_flag(std::vector<std::string>& args, const std::string& name) {
    auto it = std::find(args.begin(), args.end(), name);
    if (it == args.end()) return false;
    args.erase(it);
    return true;
}
