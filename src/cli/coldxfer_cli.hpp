#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>

// Forward declarations for command registration
void register_transfer_commands(BaseCLI& cli);
void register_status_commands(BaseCLI& cli);
void register_setup_commands(BaseCLI& cli);

class ColdxferCLI : public BaseCLI {
public:
    explicit ColdxferCLI(fs::path config_path = {});

    int run_command(const std::string& command, const std::vector<std::string>& args);

private:
    void register_all_commands();
};

// Pull "--name value" out of args. Returns false if the flag is present
// without a value.
bool take_option(std::vector<std::string>& args, const std::string& name, std::string& value);

// Remove a bare "--name" flag from args; true if it was there.
bool take_flag(std::vector<std::string>& args, const std::string& name);
