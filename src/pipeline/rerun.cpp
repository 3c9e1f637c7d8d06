#include "rerun.hpp"
#include "dependency_compiler.hpp"

static bool is_done(const Job& job) {
    return job.status == JobStatus::Succeeded || job.status == JobStatus::Skipped;
}

static bool all_done(const JobNode& node) {
    bool done = true;
    for_each_job(node, [&](const Job& j) { done = done && is_done(j); });
    return done;
}

JobNode plan_rerun(const JobNode& node) {
    if (const auto* job = node.as<Job>()) {
        Job next = *job;
        if (is_done(*job)) {
            next.status = JobStatus::Skipped;
        } else {
            // Failed, never reached, or outcome never observed: run it again.
            next.status = JobStatus::Pending;
            next.external_id.clear();
        }
        next.error.clear();
        return JobNode(std::move(next));
    }
    if (node.is<PassThrough>()) {
        return node;
    }

    // A composite with no jobs has nothing to forward; keep it as is.
    const auto& kids = *children(node);
    if (!kids.empty() && all_done(node)) {
        PassThrough pass;
        pass.name = node.label();
        pass.external_id = joined_external_id(node);
        return JobNode(std::move(pass));
    }

    std::vector<JobNode> planned;
    planned.reserve(kids.size());
    for (const auto& child : kids) planned.push_back(plan_rerun(child));

    if (node.is<Sequential>()) return make_sequential(std::move(planned), node.label());
    return make_parallel(std::move(planned), node.label());
}

Pipeline rerun(const Pipeline& pipeline) {
    return Pipeline(pipeline.name(), plan_rerun(pipeline.definition()));
}

int resubmittable_jobs(const JobNode& node) {
    int count = 0;
    for_each_job(node, [&](const Job& j) {
        if (j.status != JobStatus::Skipped) count++;
    });
    return count;
}

std::vector<const Job*> in_flight_jobs(const Pipeline& pipeline) {
    std::vector<const Job*> out;
    for (const Job* job : pipeline.jobs()) {
        if (job->status == JobStatus::Submitted) out.push_back(job);
    }
    return out;
}
