#pragma once

#include <string>
#include <vector>
#include <variant>
#include <optional>
#include <functional>
#include <filesystem>

namespace fs = std::filesystem;

class JobNode;
struct DependencyContext;
class DependencyCompiler;

enum class JobStatus {
    Pending,      // not submitted in this run (yet)
    Submitted,    // accepted by the scheduler, outcome not observed
    Succeeded,
    Failed,
    Skipped,      // succeeded in an earlier run; forwards its external id
};

std::string to_string(JobStatus status);
std::optional<JobStatus> parse_job_status(const std::string& s);

// Leaf: one submittable unit.
struct Job {
    std::string script;        // template name, resolved to <templates>/<script>.sh
    std::string profile;       // resource profile name
    std::string job_id;        // pipeline-local identity, stable across reruns
    std::string external_id;   // scheduler id; empty until submitted
    JobStatus status = JobStatus::Pending;
    std::string error;         // last submission failure
};

// Ordered chain: child i+1 runs after child i succeeds.
struct Sequential {
    std::string name = "S";
    std::vector<JobNode> jobs;
};

// Fan-out: every child shares the same upstream dependency.
struct Parallel {
    std::string name = "P";
    std::vector<JobNode> jobs;

    // Indices of children whose submission failed in the last compile pass.
    // Not persisted and not part of equality.
    std::vector<size_t> failed;
};

// A composite pruned by the rerun planner: everything under it succeeded in
// a previous run, so it only forwards that run's joined id.
struct PassThrough {
    std::string name;
    std::string external_id;
};

class JobNode {
public:
    using Variant = std::variant<Job, Sequential, Parallel, PassThrough>;

    JobNode(Job job) : value_(std::move(job)) {}
    JobNode(Sequential seq) : value_(std::move(seq)) {}
    JobNode(Parallel par) : value_(std::move(par)) {}
    JobNode(PassThrough pass) : value_(std::move(pass)) {}

    const Variant& value() const { return value_; }
    Variant& value() { return value_; }

    template <typename T> bool is() const { return std::holds_alternative<T>(value_); }
    template <typename T> T* as() { return std::get_if<T>(&value_); }
    template <typename T> const T* as() const { return std::get_if<T>(&value_); }

    // Discriminator used in snapshots: job, sequential, parallel, passthrough.
    std::string type_name() const;

    // job_id for a Job, name for everything else.
    std::string label() const;

    // Submit this subtree; returns its (joined) external id, or an empty
    // string when the subtree is empty and there was nothing upstream.
    std::string generate(const DependencyContext& context, DependencyCompiler& compiler);

    // Where this node's artifacts live below its parent's directory.
    fs::path output_dir(const fs::path& root) const;

private:
    Variant value_;
};

bool operator==(const Job& a, const Job& b);
bool operator==(const Sequential& a, const Sequential& b);
bool operator==(const Parallel& a, const Parallel& b);
bool operator==(const PassThrough& a, const PassThrough& b);
bool operator==(const JobNode& a, const JobNode& b);
bool operator!=(const JobNode& a, const JobNode& b);

JobNode make_job(const std::string& script, const std::string& profile,
                 const std::string& job_id = "");
JobNode make_sequential(std::vector<JobNode> jobs, const std::string& name = "S");
JobNode make_parallel(std::vector<JobNode> jobs, const std::string& name = "P");

// Depth-first, declared order.
void for_each_job(JobNode& node, const std::function<void(Job&)>& fn);
void for_each_job(const JobNode& node, const std::function<void(const Job&)>& fn);

// Children of a composite (nullptr for Job and PassThrough).
std::vector<JobNode>* children(JobNode& node);
const std::vector<JobNode>* children(const JobNode& node);
