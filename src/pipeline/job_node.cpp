#include "job_node.hpp"
#include "dependency_compiler.hpp"

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

std::string to_string(JobStatus status) {
    switch (status) {
        case JobStatus::Pending:   return "pending";
        case JobStatus::Submitted: return "submitted";
        case JobStatus::Succeeded: return "succeeded";
        case JobStatus::Failed:    return "failed";
        case JobStatus::Skipped:   return "skipped";
    }
    return "pending";
}

std::optional<JobStatus> parse_job_status(const std::string& s) {
    if (s == "pending")   return JobStatus::Pending;
    if (s == "submitted") return JobStatus::Submitted;
    if (s == "succeeded") return JobStatus::Succeeded;
    if (s == "failed")    return JobStatus::Failed;
    if (s == "skipped")   return JobStatus::Skipped;
    return std::nullopt;
}

std::string JobNode::type_name() const {
    return std::visit(overloaded{
        [](const Job&) { return std::string("job"); },
        [](const Sequential&) { return std::string("sequential"); },
        [](const Parallel&) { return std::string("parallel"); },
        [](const PassThrough&) { return std::string("passthrough"); },
    }, value_);
}

std::string JobNode::label() const {
    return std::visit(overloaded{
        [](const Job& j) { return j.job_id; },
        [](const Sequential& s) { return s.name; },
        [](const Parallel& p) { return p.name; },
        [](const PassThrough& p) { return p.name; },
    }, value_);
}

std::string JobNode::generate(const DependencyContext& context, DependencyCompiler& compiler) {
    return compiler.generate(*this, context);
}

fs::path JobNode::output_dir(const fs::path& root) const {
    return root / label();
}

// ── Equality ──────────────────────────────────────────────────

bool operator==(const Job& a, const Job& b) {
    return a.script == b.script && a.profile == b.profile && a.job_id == b.job_id &&
           a.external_id == b.external_id && a.status == b.status && a.error == b.error;
}

bool operator==(const Sequential& a, const Sequential& b) {
    return a.name == b.name && a.jobs == b.jobs;
}

bool operator==(const Parallel& a, const Parallel& b) {
    return a.name == b.name && a.jobs == b.jobs;
}

bool operator==(const PassThrough& a, const PassThrough& b) {
    return a.name == b.name && a.external_id == b.external_id;
}

bool operator==(const JobNode& a, const JobNode& b) {
    return a.value() == b.value();
}

bool operator!=(const JobNode& a, const JobNode& b) {
    return !(a == b);
}

// ── Builders ──────────────────────────────────────────────────

JobNode make_job(const std::string& script, const std::string& profile,
                 const std::string& job_id) {
    Job job;
    job.script = script;
    job.profile = profile;
    job.job_id = job_id;
    return JobNode(std::move(job));
}

JobNode make_sequential(std::vector<JobNode> jobs, const std::string& name) {
    Sequential seq;
    seq.name = name;
    seq.jobs = std::move(jobs);
    return JobNode(std::move(seq));
}

JobNode make_parallel(std::vector<JobNode> jobs, const std::string& name) {
    Parallel par;
    par.name = name;
    par.jobs = std::move(jobs);
    return JobNode(std::move(par));
}

// ── Traversal ─────────────────────────────────────────────────

std::vector<JobNode>* children(JobNode& node) {
    if (auto* s = node.as<Sequential>()) return &s->jobs;
    if (auto* p = node.as<Parallel>()) return &p->jobs;
    return nullptr;
}

const std::vector<JobNode>* children(const JobNode& node) {
    if (const auto* s = node.as<Sequential>()) return &s->jobs;
    if (const auto* p = node.as<Parallel>()) return &p->jobs;
    return nullptr;
}

void for_each_job(JobNode& node, const std::function<void(Job&)>& fn) {
    if (auto* job = node.as<Job>()) {
        fn(*job);
        return;
    }
    if (auto* kids = children(node)) {
        for (auto& child : *kids) for_each_job(child, fn);
    }
}

void for_each_job(const JobNode& node, const std::function<void(const Job&)>& fn) {
    if (const auto* job = node.as<Job>()) {
        fn(*job);
        return;
    }
    if (const auto* kids = children(node)) {
        for (const auto& child : *kids) for_each_job(child, fn);
    }
}
