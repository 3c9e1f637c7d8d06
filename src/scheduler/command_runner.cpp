#include "command_runner.hpp"
#include <core/log.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>

CommandResult LocalRunner::run(const std::string& command) {
    auto r = platform::run_command(command);
    jobrunner_log_command("local", command, r);
    return r;
}

SSHRunner::SSHRunner(const SessionTarget& target, int timeout_secs)
    : target_(target), timeout_secs_(timeout_secs) {
}

std::string SSHRunner::describe() const {
    return fmt::format("{}@{}", target_.user, target_.host);
}

CommandResult SSHRunner::ensure_connected() {
    if (session_ && session_->check_alive()) {
        return CommandResult{0, "", ""};
    }
    session_ = std::make_unique<SessionManager>(target_);
    auto r = session_->establish([](const std::string& msg) { jobrunner_log("ssh: " + msg); });
    if (r.failed()) {
        session_.reset();
    }
    return r;
}

CommandResult SSHRunner::run(const std::string& command) {
    auto connected = ensure_connected();
    if (connected.failed()) {
        jobrunner_log(fmt::format("ssh {} connect failed: {}", describe(), connected.stderr_data));
        return connected;
    }
    auto r = session_->exec(command, timeout_secs_);
    jobrunner_log_command(describe(), command, r);
    return r;
}
