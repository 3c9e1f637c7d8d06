#include "dependency_compiler.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/resource_spec.hpp>
#include <util/string_utils.hpp>
#include <fmt/format.h>

CompilerSettings CompilerSettings::from_config(const Config& config) {
    CompilerSettings s;
    s.profiles = config.runner().profiles;
    // Scripts are read by sbatch on the submit host; locally that is the
    // project tree, remotely the path is taken as written.
    if (config.login().host.empty() && config.runner().scheduler == "slurm") {
        s.templates_dir = config.templates_dir();
    } else {
        s.templates_dir = config.runner().templates;
    }
    s.local_root = config.local_workdir();
    s.remote_root = config.runner().workdir.remote;
    return s;
}

// First Parallel in `node` (itself included) that lost a branch during the
// current pass.
static const Parallel* partially_failed(const JobNode& node) {
    if (const auto* par = node.as<Parallel>()) {
        if (!par->failed.empty()) return par;
    }
    if (const auto* kids = children(node)) {
        for (const auto& child : *kids) {
            if (const Parallel* p = partially_failed(child)) return p;
        }
    }
    return nullptr;
}

DependencyCompiler::DependencyCompiler(Scheduler& scheduler, CompilerSettings settings)
    : scheduler_(scheduler), settings_(std::move(settings)) {
}

std::string DependencyCompiler::generate(JobNode& node, const DependencyContext& context) {
    if (auto* job = node.as<Job>()) return generate_job(*job, context);
    if (auto* seq = node.as<Sequential>()) return generate_sequential(*seq, context);
    if (auto* par = node.as<Parallel>()) return generate_parallel(*par, context);
    return generate_passthrough(*node.as<PassThrough>());
}

SubmissionDirective DependencyCompiler::build_directive(const Job& job,
                                                        const DependencyContext& context) const {
    auto it = settings_.profiles.find(job.profile);
    if (it == settings_.profiles.end()) {
        throw SubmissionError(job.job_id, fmt::format("Unknown profile '{}'", job.profile));
    }
    if (job.script.empty() || StringUtils::contains_whitespace(job.script)) {
        throw SubmissionError(job.job_id, fmt::format("Malformed script reference '{}'", job.script));
    }

    fs::path remote_dir = settings_.remote_root / context.output / job.job_id;

    SubmissionDirective d;
    d.job_name = job.job_id;
    d.script = (settings_.templates_dir / (job.script + SCRIPT_EXTENSION)).string();
    d.workdir = remote_dir.string();
    d.output = (remote_dir / JOB_OUTPUT_PATTERN).string();
    d.resource_args = sbatch_resource_args(it->second);
    if (context.depends_on && !context.depends_on->empty()) {
        d.dependency = dependency_clause(context.depends_event, *context.depends_on);
    }
    return d;
}

std::string DependencyCompiler::generate_job(Job& job, const DependencyContext& context) {
    if (job.status == JobStatus::Skipped) {
        if (job.external_id.empty()) {
            throw DependencyResolutionError(fmt::format(
                "Skipped job '{}' has no recorded external id", job.job_id));
        }
        return job.external_id;
    }

    fs::path local_dir = settings_.local_root / context.output / job.job_id;

    auto fail = [&](const std::string& msg) {
        job.status = JobStatus::Failed;
        job.external_id.clear();
        job.error = msg;
        append_job_log(local_dir, "submission failed: " + msg);
        jobrunner_log(fmt::format("job {} failed to submit: {}", job.job_id, msg));
        return SubmissionError(job.job_id, fmt::format("{}: {}", job.job_id, msg));
    };

    std::error_code ec;
    fs::create_directories(local_dir, ec);
    if (ec) {
        throw fail(fmt::format("cannot create {}: {}", local_dir.string(), ec.message()));
    }

    SubmissionDirective directive;
    try {
        directive = build_directive(job, context);
    } catch (const SubmissionError& e) {
        throw fail(e.what());
    }

    append_job_log(local_dir, fmt::format("submitting to {}: {}", scheduler_.name(),
                                          StringUtils::join(directive.sbatch_args(), " ")));
    submissions_++;
    auto result = scheduler_.submit(directive);
    if (result.is_err()) {
        throw fail(result.error);
    }
    if (!is_valid_external_id(result.value)) {
        throw fail(fmt::format("scheduler returned unusable id '{}'", result.value));
    }

    job.external_id = result.value;
    job.status = JobStatus::Submitted;
    job.error.clear();
    append_job_log(local_dir, "submitted as " + job.external_id);
    return job.external_id;
}

std::string DependencyCompiler::generate_sequential(Sequential& seq, const DependencyContext& context) {
    DependencyContext ctx = context;
    ctx.output = context.output / seq.name;

    std::string last = context.depends_on.value_or("");
    bool first = true;
    for (auto& child : seq.jobs) {
        if (!first) {
            ctx.depends_on = last.empty() ? std::nullopt : std::optional<std::string>(last);
            ctx.depends_event = DependsEvent::AfterOk;
        }
        first = false;

        last = generate(child, ctx);

        // The next stage needs every branch of a fan-out to succeed.
        if (const Parallel* par = partially_failed(child)) {
            throw SubmissionError(par->jobs[par->failed.front()].label(), fmt::format(
                "{} of {} branches of '{}' failed to submit",
                par->failed.size(), par->jobs.size(), par->name));
        }
    }
    return last;
}

std::string DependencyCompiler::generate_parallel(Parallel& par, const DependencyContext& context) {
    DependencyContext ctx = context;
    ctx.output = context.output / par.name;

    par.failed.clear();
    if (par.jobs.empty()) return context.depends_on.value_or("");

    // Declared order, one at a time: the scheduler sees the same sequence
    // on every run.
    std::vector<std::string> ids;
    std::string first_error;
    for (size_t i = 0; i < par.jobs.size(); i++) {
        try {
            std::string id = generate(par.jobs[i], ctx);
            if (!id.empty()) ids.push_back(id);
            // A nested fan-out that lost a branch counts as a failed branch here.
            if (const Parallel* inner = partially_failed(par.jobs[i])) {
                par.failed.push_back(i);
                if (first_error.empty()) {
                    first_error = fmt::format("'{}' lost {} branch(es)", inner->name, inner->failed.size());
                }
            }
        } catch (const SubmissionError& e) {
            par.failed.push_back(i);
            if (first_error.empty()) first_error = e.what();
        }
    }

    if (ids.empty() && !par.failed.empty()) {
        throw SubmissionError(par.jobs.front().label(), fmt::format(
            "every branch of '{}' failed to submit ({})", par.name, first_error));
    }
    return join_ids(ids);
}

std::string DependencyCompiler::generate_passthrough(const PassThrough& pass) {
    if (pass.external_id.empty()) {
        throw DependencyResolutionError(fmt::format(
            "'{}' forwards a previous run but carries no external id", pass.name));
    }
    return pass.external_id;
}

std::string joined_external_id(const JobNode& node) {
    if (const auto* job = node.as<Job>()) {
        if (job->external_id.empty()) {
            throw DependencyResolutionError(fmt::format(
                "Job '{}' has no external id ({})", job->job_id, to_string(job->status)));
        }
        return job->external_id;
    }
    if (const auto* pass = node.as<PassThrough>()) {
        if (pass->external_id.empty()) {
            throw DependencyResolutionError(fmt::format("'{}' has no external id", pass->name));
        }
        return pass->external_id;
    }
    if (const auto* seq = node.as<Sequential>()) {
        if (seq->jobs.empty()) {
            throw DependencyResolutionError(fmt::format("'{}' has no jobs", seq->name));
        }
        return joined_external_id(seq->jobs.back());
    }

    const auto& par = *node.as<Parallel>();
    if (par.jobs.empty()) {
        throw DependencyResolutionError(fmt::format("'{}' has no jobs", par.name));
    }
    std::vector<std::string> ids;
    for (const auto& child : par.jobs) ids.push_back(joined_external_id(child));
    return join_ids(ids);
}
