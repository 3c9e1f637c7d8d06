#pragma once

#include <memory>
#include <core/config.hpp>
#include "scheduler.hpp"
#include "command_runner.hpp"
#include "host_registry.hpp"

// A scheduler together with the command runner it talks through.
struct SchedulerHandle {
    std::unique_ptr<CommandRunner> runner;
    std::unique_ptr<Scheduler> scheduler;
};

// Build the configured backend: SLURM over the login node (or locally when
// no login host is set), or a registered bare-metal host.
Result<SchedulerHandle> make_scheduler(const Config& config, const HostRegistry& hosts);
