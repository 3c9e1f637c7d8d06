#pragma once

#include <string>
#include "scheduler.hpp"
#include "command_runner.hpp"

// Map a SLURM job state (sacct/squeue spelling) to a scheduler state.
// Returns Err for an empty or unrecognized state.
Result<SchedulerState> map_slurm_state(const std::string& slurm_state);

// Parse `sbatch --parsable` output: "<id>" or "<id>;<cluster>".
Result<std::string> parse_sbatch_output(const std::string& output);

class SlurmScheduler : public Scheduler {
public:
    explicit SlurmScheduler(CommandRunner& runner);

    Result<std::string> submit(const SubmissionDirective& directive) override;
    Result<SchedulerState> query_status(const std::string& external_id) override;

    std::string name() const override { return "slurm"; }

    // The exact sbatch command line that submit() runs.
    static std::string sbatch_command(const SubmissionDirective& directive);

private:
    CommandRunner& runner_;
};
