#include "jobrunner_cli.hpp"
#include <util/string_utils.hpp>

JobRunnerCLI::JobRunnerCLI() {
    register_all_commands();
}

void JobRunnerCLI::register_all_commands() {
    register_pipeline_commands(*this);
    register_host_commands(*this);
}

int JobRunnerCLI::run_command(const std::string& command, const std::vector<std::string>& args) {
    return execute_command(command, StringUtils::join(args, " ")) ? 0 : 1;
}
