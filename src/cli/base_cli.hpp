#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <core/config.hpp>
#include <managers/coldxfer_service.hpp>

class BaseCLI {
public:
    explicit BaseCLI(fs::path config_path = {});
    virtual ~BaseCLI() = default;

    // Returns the process exit code.
    using CommandHandler = std::function<int(BaseCLI&, const std::vector<std::string>&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& usage,
                    const std::string& help);

    bool require_config();
    bool require_service();

    int execute_command(const std::string& command, const std::vector<std::string>& args);
    void print_help() const;
    bool has_command(const std::string& name) const { return commands_.count(name) > 0; }

    // Public state
    fs::path config_path;
    std::optional<Config> config;
    std::string config_error;
    std::unique_ptr<ColdxferService> service;

protected:
    struct Command {
        CommandHandler handler;
        std::string usage;
        std::string help;
    };
    std::map<std::string, Command> commands_;
};
