#include "baremetal_scheduler.hpp"
#include <core/utils.hpp>
#include <util/string_utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>

// Exit codes land in $HOME/.jobrunner-exit/<pid> once the job finishes.
static const char* EXIT_DIR = "$HOME/.jobrunner-exit";

static bool all_digits(const std::string& s) {
    return !s.empty() &&
        std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

BaremetalScheduler::BaremetalScheduler(CommandRunner& runner, std::string host_name)
    : runner_(runner), host_name_(std::move(host_name)) {
}

Result<std::string> BaremetalScheduler::submit(const SubmissionDirective& directive) {
    if (directive.dependency) {
        return Result<std::string>::Err(fmt::format(
            "{} cannot wait on '{}': bare-metal hosts run jobs immediately",
            host_name_, *directive.dependency));
    }

    std::string output = directive.output.empty() ? "output.log" : directive.output;
    std::string inner = fmt::format("bash {} > {} 2>&1; echo $? > {}/$$",
                                    shell_quote(directive.script), shell_quote(output), EXIT_DIR);
    std::string cmd = fmt::format(
        "mkdir -p {exit} {wd} && cd {wd} && nohup bash -c {inner} > /dev/null 2>&1 & echo $!",
        fmt::arg("exit", EXIT_DIR),
        fmt::arg("wd", shell_quote(directive.workdir.empty() ? "." : directive.workdir)),
        fmt::arg("inner", shell_quote(inner)));

    auto r = runner_.run(cmd);
    std::string pid = StringUtils::trim(r.stdout_data);
    if (r.failed() || !all_digits(pid)) {
        return Result<std::string>::Err(fmt::format(
            "{} refused {}: {}", host_name_, directive.job_name, StringUtils::trim(r.get_output())));
    }
    return Result<std::string>::Ok(pid);
}

Result<SchedulerState> BaremetalScheduler::query_status(const std::string& external_id) {
    if (!all_digits(external_id)) {
        return Result<SchedulerState>::Err("Not a process id: " + external_id);
    }

    std::string cmd = fmt::format(
        "if kill -0 {pid} 2>/dev/null; then echo RUNNING; "
        "elif [ -f {exit}/{pid} ]; then cat {exit}/{pid}; else echo MISSING; fi",
        fmt::arg("pid", external_id), fmt::arg("exit", EXIT_DIR));
    auto r = runner_.run(cmd);
    if (r.failed()) {
        return Result<SchedulerState>::Err(fmt::format(
            "{} unreachable: {}", host_name_, StringUtils::trim(r.get_output())));
    }

    std::string out = StringUtils::trim(r.stdout_data);
    if (out == "RUNNING") return Result<SchedulerState>::Ok(SchedulerState::Running);
    if (out == "0") return Result<SchedulerState>::Ok(SchedulerState::Succeeded);
    if (all_digits(out)) return Result<SchedulerState>::Ok(SchedulerState::Failed);
    return Result<SchedulerState>::Err(fmt::format(
        "No trace of process {} on {}", external_id, host_name_));
}
