#include "pipeline.hpp"
#include "dependency_compiler.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <util/string_utils.hpp>
#include <fmt/format.h>
#include <set>

static bool has_reserved(const std::string& s) {
    return s.find(DEP_AND_SEP) != std::string::npos ||
           s.find(DEP_OR_SEP) != std::string::npos ||
           s.find(',') != std::string::npos ||
           s.find('/') != std::string::npos ||
           StringUtils::contains_whitespace(s);
}

std::string derive_job_id(const Job& job) {
    if (job.profile.empty() || job.profile == job.script) return job.script;
    return job.script + "-" + job.profile;
}

Pipeline::Pipeline(std::string name, JobNode definition, std::optional<std::string> job_id)
    : name_(std::move(name)), definition_(std::move(definition)), job_id_(std::move(job_id)) {
    if (name_.empty() || has_reserved(name_)) {
        throw DefinitionError(fmt::format("Invalid pipeline name '{}'", name_));
    }
    assign_job_ids();
    validate();
}

void Pipeline::assign_job_ids() {
    std::set<std::string> taken;
    for_each_job(static_cast<const JobNode&>(definition_), [&](const Job& j) {
        if (!j.job_id.empty()) taken.insert(j.job_id);
    });

    for_each_job(definition_, [&](Job& j) {
        if (!j.job_id.empty()) return;
        std::string base = derive_job_id(j);
        std::string candidate = base;
        for (int n = 1; taken.count(candidate); n++) {
            candidate = fmt::format("{}.{}", base, n);
        }
        j.job_id = candidate;
        taken.insert(candidate);
    });
}

void Pipeline::validate() const {
    std::set<std::string> seen;
    for_each_job(definition_, [&](const Job& j) {
        if (j.script.empty()) {
            throw DefinitionError(fmt::format("Job '{}' has no script", j.job_id));
        }
        if (has_reserved(j.job_id)) {
            throw DefinitionError(fmt::format(
                "Job id '{}' contains a reserved character", j.job_id));
        }
        if (!seen.insert(j.job_id).second) {
            throw DefinitionError(fmt::format("Duplicate job id '{}'", j.job_id));
        }
    });
}

std::string Pipeline::schedule(DependencyCompiler& compiler) {
    if (!job_id_) {
        job_id_ = generate_run_id(name_);
    }
    jobrunner_log(fmt::format("scheduling pipeline {} ({})", name_, *job_id_));

    DependencyContext context;
    context.depends_event = DependsEvent::AfterOk;
    context.output = name_;

    return definition_.generate(context, compiler);
}

fs::path Pipeline::output_dir(const fs::path& root) const {
    return root / name_;
}

std::vector<const Job*> Pipeline::jobs() const {
    std::vector<const Job*> out;
    for_each_job(definition_, [&](const Job& j) { out.push_back(&j); });
    return out;
}

Job* Pipeline::find_job(const std::string& job_id) {
    Job* found = nullptr;
    for_each_job(definition_, [&](Job& j) {
        if (!found && j.job_id == job_id) found = &j;
    });
    return found;
}

const Job* Pipeline::find_job(const std::string& job_id) const {
    const Job* found = nullptr;
    for_each_job(definition_, [&](const Job& j) {
        if (!found && j.job_id == job_id) found = &j;
    });
    return found;
}

std::vector<std::pair<std::string, JobStatus>> Pipeline::job_statuses() const {
    std::vector<std::pair<std::string, JobStatus>> out;
    for_each_job(definition_, [&](const Job& j) { out.emplace_back(j.job_id, j.status); });
    return out;
}

bool Pipeline::apply_status(const std::string& job_id, SchedulerState state) {
    Job* job = find_job(job_id);
    if (!job) return false;

    switch (state) {
        case SchedulerState::Pending:
        case SchedulerState::Running:
            job->status = JobStatus::Submitted;
            break;
        case SchedulerState::Succeeded:
            job->status = JobStatus::Succeeded;
            break;
        case SchedulerState::Failed:
            job->status = JobStatus::Failed;
            break;
    }
    return true;
}

bool operator==(const Pipeline& a, const Pipeline& b) {
    return a.name() == b.name() && a.job_id() == b.job_id() && a.definition() == b.definition();
}
