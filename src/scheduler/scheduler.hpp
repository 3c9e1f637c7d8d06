#pragma once

#include <string>
#include <core/types.hpp>
#include "directive.hpp"

// Outcome of a previously submitted job, as reported by the scheduler.
enum class SchedulerState {
    Pending,
    Running,
    Succeeded,
    Failed,
};

std::string to_string(SchedulerState state);

// External batch scheduler. submit() returns the scheduler-assigned id;
// query_status() errors are transient and never mean the job failed.
class Scheduler {
public:
    virtual ~Scheduler() = default;

    virtual Result<std::string> submit(const SubmissionDirective& directive) = 0;
    virtual Result<SchedulerState> query_status(const std::string& external_id) = 0;

    virtual std::string name() const = 0;
};
