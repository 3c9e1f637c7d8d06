#pragma once

#include <string>
#include "scheduler.hpp"
#include "command_runner.hpp"

// Fire-and-forget execution on a bare-metal host: the job is started under
// nohup and its pid becomes the external id. A bare host cannot hold a job
// until a predecessor finishes, so directives with a dependency are refused.
class BaremetalScheduler : public Scheduler {
public:
    BaremetalScheduler(CommandRunner& runner, std::string host_name);

    Result<std::string> submit(const SubmissionDirective& directive) override;
    Result<SchedulerState> query_status(const std::string& external_id) override;

    std::string name() const override { return "baremetal:" + host_name_; }

private:
    CommandRunner& runner_;
    std::string host_name_;
};
