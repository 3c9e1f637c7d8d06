#include "slurm_scheduler.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <util/string_utils.hpp>
#include <fmt/format.h>
#include <sstream>

Result<SchedulerState> map_slurm_state(const std::string& slurm_state) {
    // sacct reports "CANCELLED by 1234"; only the first word matters
    std::istringstream iss(slurm_state);
    std::string state;
    iss >> state;
    if (!state.empty() && state.back() == '+') state.pop_back();

    if (state == "PENDING" || state == "CONFIGURING" || state == "REQUEUED" ||
        state == "REQUEUE_HOLD" || state == "REQUEUE_FED" || state == "RESV_DEL_HOLD" ||
        state == "SUSPENDED" || state == "STOPPED") {
        return Result<SchedulerState>::Ok(SchedulerState::Pending);
    }
    if (state == "RUNNING" || state == "COMPLETING" || state == "STAGE_OUT" ||
        state == "SIGNALING" || state == "RESIZING") {
        return Result<SchedulerState>::Ok(SchedulerState::Running);
    }
    if (state == "COMPLETED") {
        return Result<SchedulerState>::Ok(SchedulerState::Succeeded);
    }
    if (state == "FAILED" || state == "CANCELLED" || state == "TIMEOUT" ||
        state == "OUT_OF_MEMORY" || state == "NODE_FAIL" || state == "PREEMPTED" ||
        state == "BOOT_FAIL" || state == "DEADLINE" || state == "REVOKED" ||
        state == "SPECIAL_EXIT") {
        return Result<SchedulerState>::Ok(SchedulerState::Failed);
    }
    return Result<SchedulerState>::Err(fmt::format("Unrecognized SLURM state '{}'", slurm_state));
}

Result<std::string> parse_sbatch_output(const std::string& output) {
    // --parsable prints "jobid[;cluster]" on the last non-empty line
    std::string last;
    std::istringstream iss(output);
    std::string line;
    while (std::getline(iss, line)) {
        auto t = StringUtils::trim(line);
        if (!t.empty()) last = t;
    }

    auto semi = last.find(';');
    std::string id = semi == std::string::npos ? last : last.substr(0, semi);
    if (!is_valid_external_id(id)) {
        return Result<std::string>::Err(fmt::format("sbatch returned an unusable job id: '{}'", output));
    }
    return Result<std::string>::Ok(id);
}

SlurmScheduler::SlurmScheduler(CommandRunner& runner) : runner_(runner) {
}

std::string SlurmScheduler::sbatch_command(const SubmissionDirective& directive) {
    std::string cmd = "sbatch";
    for (const auto& arg : directive.sbatch_args()) {
        cmd += " " + shell_quote(arg);
    }
    return cmd;
}

Result<std::string> SlurmScheduler::submit(const SubmissionDirective& directive) {
    std::string cmd = sbatch_command(directive);
    auto r = runner_.run(cmd);
    if (r.failed()) {
        std::string err = StringUtils::trim(r.get_output());
        return Result<std::string>::Err(
            fmt::format("sbatch rejected {} (exit {}): {}", directive.job_name, r.exit_code, err));
    }
    return parse_sbatch_output(r.stdout_data);
}

Result<SchedulerState> SlurmScheduler::query_status(const std::string& external_id) {
    // sacct knows finished jobs; squeue is the fallback when accounting is off
    std::string cmd = fmt::format("sacct -j {} -X -n -P -o State", shell_quote(external_id));
    auto r = runner_.run(cmd);
    std::string state = StringUtils::trim(r.stdout_data);
    if (r.success() && !state.empty()) {
        std::istringstream iss(state);
        std::string first;
        std::getline(iss, first);
        return map_slurm_state(first);
    }

    cmd = fmt::format("squeue -j {} -h -o %T", shell_quote(external_id));
    auto q = runner_.run(cmd);
    state = StringUtils::trim(q.stdout_data);
    if (q.success() && !state.empty()) {
        return map_slurm_state(state);
    }

    std::string err = StringUtils::trim(q.stderr_data.empty() ? r.stderr_data : q.stderr_data);
    return Result<SchedulerState>::Err(
        fmt::format("No state for job {}{}", external_id, err.empty() ? "" : ": " + err));
}
