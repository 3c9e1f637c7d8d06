#pragma once

#include <string>
#include <pipeline/pipeline.hpp>

// Status marker for a job: "+" succeeded, "x" failed, "~" submitted,
// "=" skipped, "." pending (colored when `color` is set).
std::string status_marker(JobStatus status, bool color = true);

// Indented tree of the whole pipeline with every job's status and external id.
std::string render_tree(const Pipeline& pipeline, bool color = true);

// One-line tally: "3 succeeded, 1 failed, 4 pending".
std::string status_summary(const Pipeline& pipeline);
