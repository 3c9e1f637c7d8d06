#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <core/config.hpp>
#include <scheduler/host_registry.hpp>
#include <scheduler/scheduler_factory.hpp>
#include <pipeline/pipeline_store.hpp>

class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<void(BaseCLI&, const std::string&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    bool require_config();
    bool require_scheduler();

    // Returns false when the command is unknown, threw, or reported failure.
    bool execute_command(const std::string& command, const std::string& args = "");
    void print_help() const;

    // Handlers call this to make the process exit non-zero.
    void mark_failed() { failed_ = true; }

    // Public state
    std::optional<Config> config;
    std::string config_error;
    std::unique_ptr<HostRegistry> hosts;
    std::unique_ptr<PipelineStore> store;
    std::optional<SchedulerHandle> scheduler;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
    bool failed_ = false;
};
