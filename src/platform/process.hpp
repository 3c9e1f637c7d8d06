#pragma once

#include <string>
#include <core/types.hpp>

namespace platform {

// Run a shell command to completion, capturing stdout and stderr separately.
// exit_code is -1 when the command could not be started.
CommandResult run_command(const std::string& command);

} // namespace platform
