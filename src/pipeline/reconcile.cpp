#include "reconcile.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

SchedulerState query_job(Scheduler& scheduler, const Job& job) {
    if (job.external_id.empty()) {
        throw StatusQueryError("", fmt::format("{} was never submitted", job.job_id));
    }
    auto r = scheduler.query_status(job.external_id);
    if (r.is_err()) {
        throw StatusQueryError(job.external_id, r.error);
    }
    return r.value;
}

static void query_one(Pipeline& pipeline, Scheduler& scheduler, const std::string& job_id,
                      ReconcileReport& report) {
    const Job* job = pipeline.find_job(job_id);
    std::string external_id = job->external_id;
    report.queried++;

    SchedulerState state = SchedulerState::Pending;
    try {
        state = query_job(scheduler, *job);
    } catch (const StatusQueryError& e) {
        jobrunner_log(fmt::format("status query for {} ({}) failed: {}", job_id, e.external_id, e.what()));
        report.failures.push_back({job_id, e.external_id, e.what()});
        return;
    }

    JobStatus before = job->status;
    pipeline.apply_status(job_id, state);
    if (pipeline.find_job(job_id)->status != before) {
        report.updated++;
        jobrunner_log(fmt::format("{} ({}) is now {}", job_id, external_id, to_string(state)));
    }
}

ReconcileReport reconcile(Pipeline& pipeline, Scheduler& scheduler) {
    std::vector<std::string> pending;
    for (const Job* job : pipeline.jobs()) {
        if (job->status == JobStatus::Submitted && !job->external_id.empty()) {
            pending.push_back(job->job_id);
        }
    }

    ReconcileReport report;
    for (const auto& job_id : pending) {
        query_one(pipeline, scheduler, job_id, report);
    }
    return report;
}

ReconcileReport reconcile_with_backoff(Pipeline& pipeline, Scheduler& scheduler,
                                       int retries, int base_delay_ms) {
    ReconcileReport report = reconcile(pipeline, scheduler);

    int delay = base_delay_ms;
    for (int attempt = 0; attempt < retries && !report.failures.empty(); attempt++) {
        if (delay > 0) platform::sleep_ms(delay);
        delay *= 2;

        auto failed = std::move(report.failures);
        report.failures.clear();
        for (const auto& f : failed) {
            query_one(pipeline, scheduler, f.job_id, report);
        }
    }
    return report;
}
