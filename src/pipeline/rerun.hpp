#pragma once

#include <vector>
#include "pipeline.hpp"

// Build the next run of `pipeline`: succeeded jobs become skip markers that
// keep their external id, composites whose every job succeeded collapse to a
// PassThrough, and everything else is reset to Pending under the same job_id.
// The result keeps the pipeline name and has no run id yet.
Pipeline rerun(const Pipeline& pipeline);

// Rebuild a single subtree the same way.
JobNode plan_rerun(const JobNode& node);

// Number of Jobs a compile pass over `node` would actually submit.
int resubmittable_jobs(const JobNode& node);

// Jobs whose last submission has no observed outcome yet. They may still be
// queued or running, so a new run over the same job_ids must wait for them.
std::vector<const Job*> in_flight_jobs(const Pipeline& pipeline);
