#pragma once

#include <string>
#include <vector>
#include <core/constants.hpp>
#include <scheduler/scheduler.hpp>
#include "pipeline.hpp"

// A status query that could not be answered. The job keeps its last known
// status; the caller retries later.
struct StatusQueryFailure {
    std::string job_id;
    std::string external_id;
    std::string error;
};

struct ReconcileReport {
    int queried = 0;
    int updated = 0;        // jobs whose status changed
    std::vector<StatusQueryFailure> failures;

    bool complete() const { return failures.empty(); }
};

// Ask the scheduler for one submitted job's state. Throws StatusQueryError
// when the scheduler cannot answer; the job itself is left untouched.
SchedulerState query_job(Scheduler& scheduler, const Job& job);

// Query every Submitted job once and record the observed outcomes.
ReconcileReport reconcile(Pipeline& pipeline, Scheduler& scheduler);

// reconcile(), then retry only the failed queries with a doubling delay.
ReconcileReport reconcile_with_backoff(Pipeline& pipeline, Scheduler& scheduler,
                                       int retries = STATUS_QUERY_MAX_RETRIES,
                                       int base_delay_ms = STATUS_RETRY_BASE_MS);
