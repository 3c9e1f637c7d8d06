#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>

// Forward declarations for command registration
void register_pipeline_commands(BaseCLI& cli);
void register_host_commands(BaseCLI& cli);

class JobRunnerCLI : public BaseCLI {
public:
    JobRunnerCLI();

    // Runs one command; returns the process exit code.
    int run_command(const std::string& command, const std::vector<std::string>& args);

private:
    void register_all_commands();
};
