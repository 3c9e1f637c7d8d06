#pragma once

#include <map>
#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <scheduler/scheduler.hpp>
#include "job_node.hpp"

namespace fs = std::filesystem;

class DependencyCompiler;

// A run of a job tree. Owns its definition exclusively; schedule() and
// rerun() on the same instance must not overlap.
class Pipeline {
public:
    // Validates the tree and fills in missing job_ids. Throws DefinitionError
    // on duplicate job_ids, ids with reserved characters or empty scripts.
    Pipeline(std::string name, JobNode definition,
             std::optional<std::string> job_id = std::nullopt);

    const std::string& name() const { return name_; }
    const std::optional<std::string>& job_id() const { return job_id_; }
    const JobNode& definition() const { return definition_; }
    JobNode& definition() { return definition_; }

    // Submit the whole tree. Assigns a run id first when none is set.
    // Returns the joined id of the final stage; SubmissionError propagates.
    std::string schedule(DependencyCompiler& compiler);

    // <root>/<name>; every node's directory nests below it.
    fs::path output_dir(const fs::path& root) const;

    std::vector<const Job*> jobs() const;
    Job* find_job(const std::string& job_id);
    const Job* find_job(const std::string& job_id) const;

    // job_id -> status, in tree order.
    std::vector<std::pair<std::string, JobStatus>> job_statuses() const;

    // Record an observed outcome. Pending/Running leave the job Submitted.
    // Returns false when the job_id is unknown.
    bool apply_status(const std::string& job_id, SchedulerState state);

private:
    std::string name_;
    JobNode definition_;
    std::optional<std::string> job_id_;

    void assign_job_ids();
    void validate() const;
};

bool operator==(const Pipeline& a, const Pipeline& b);

// Base id for a job without one: "<script>" or "<script>-<profile>".
std::string derive_job_id(const Job& job);
