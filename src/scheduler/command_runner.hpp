#pragma once

#include <memory>
#include <string>
#include <core/types.hpp>
#include <ssh/session.hpp>

// Runs shell commands on the host that talks to the scheduler.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    virtual CommandResult run(const std::string& command) = 0;
    virtual std::string describe() const = 0;
};

// Commands run on this machine.
class LocalRunner : public CommandRunner {
public:
    CommandResult run(const std::string& command) override;
    std::string describe() const override { return "local"; }
};

// Commands run over SSH; the session is opened on first use and reopened
// if it drops.
class SSHRunner : public CommandRunner {
public:
    explicit SSHRunner(const SessionTarget& target, int timeout_secs = 0);

    CommandResult run(const std::string& command) override;
    std::string describe() const override;

private:
    SessionTarget target_;
    int timeout_secs_;
    std::unique_ptr<SessionManager> session_;

    CommandResult ensure_connected();
};
