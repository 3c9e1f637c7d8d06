#include "base_cli.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <iostream>
#include <fmt/format.h>

BaseCLI::BaseCLI() {
    if (!global_config_exists()) {
        auto created = create_default_global_config();
        if (created.is_err()) {
            jobrunner_log("default config: " + created.error);
        }
    }

    auto config_result = Config::load();
    if (config_result.is_err()) {
        config_error = config_result.error;
        return;
    }
    config = config_result.value;

    hosts = std::make_unique<HostRegistry>(config->state_dir() / "hosts.yaml");
    auto loaded = hosts->load();
    if (loaded.is_err()) {
        jobrunner_log("host registry: " + loaded.error);
    }
    store = std::make_unique<PipelineStore>(config->state_dir());
}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

bool BaseCLI::require_config() {
    if (!config.has_value()) {
        std::cout << theme::fail("Invalid configuration: " + config_error);
        std::cout << theme::step("Check ~/.jobrunner/config.yaml and ./jobrunner.yaml");
        return false;
    }
    return true;
}

bool BaseCLI::require_scheduler() {
    if (!require_config()) {
        return false;
    }
    if (scheduler) return true;

    auto made = make_scheduler(config.value(), *hosts);
    if (made.is_err()) {
        std::cout << theme::fail(made.error);
        return false;
    }
    scheduler = std::move(made.value);
    jobrunner_log(fmt::format("using {} via {}", scheduler->scheduler->name(),
                              scheduler->runner->describe()));
    return true;
}

bool BaseCLI::execute_command(const std::string& command, const std::string& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Run 'jobrunner --help' for available commands.");
        return false;
    }

    failed_ = false;
    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return false;
    }
    return !failed_;
}

void BaseCLI::print_help() const {
    // Group commands by category
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Pipelines", {"run", "status", "rerun", "show", "list"}},
        {"Hosts",     {"hosts"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        bool has_any = false;
        for (const auto& name : cmd_names) {
            if (commands_.count(name)) {
                has_any = true;
                break;
            }
        }
        if (!has_any) continue;

        std::cout << "\n" << theme::bold(theme::brown("  " + cat_name)) << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::command_row(name, it->second.second);
            }
        }
    }
    std::cout << "\n";
}
