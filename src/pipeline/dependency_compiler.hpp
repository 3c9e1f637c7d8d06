#pragma once

#include <map>
#include <string>
#include <optional>
#include <filesystem>
#include <core/types.hpp>
#include <scheduler/directive.hpp>
#include <scheduler/scheduler.hpp>
#include "job_node.hpp"

namespace fs = std::filesystem;

class Config;

// Threaded top-down through one compile pass; never persisted.
struct DependencyContext {
    std::optional<std::string> depends_on;       // joined id of the predecessor(s)
    DependsEvent depends_event = DependsEvent::AfterOk;
    fs::path output;                             // tree path below the output roots
};

struct CompilerSettings {
    std::map<std::string, SlurmProfile> profiles;
    fs::path templates_dir;    // as seen by the submit host
    fs::path local_root;       // job folders are created here before submission
    fs::path remote_root;      // --chdir/--output root on the cluster

    static CompilerSettings from_config(const Config& config);
};

// Walks a JobNode tree, submitting each Job with the dependency clause its
// position implies and recording the id the scheduler hands back.
class DependencyCompiler {
public:
    DependencyCompiler(Scheduler& scheduler, CompilerSettings settings);

    // Throws SubmissionError (rejected job, halted chain) and
    // DependencyResolutionError (skip marker without an id).
    std::string generate(JobNode& node, const DependencyContext& context);

    // The directive a Job would be submitted with; throws SubmissionError on
    // an unknown profile or an unusable script name.
    SubmissionDirective build_directive(const Job& job, const DependencyContext& context) const;

    const CompilerSettings& settings() const { return settings_; }
    int submissions() const { return submissions_; }

private:
    Scheduler& scheduler_;
    CompilerSettings settings_;
    int submissions_ = 0;

    std::string generate_job(Job& job, const DependencyContext& context);
    std::string generate_sequential(Sequential& seq, const DependencyContext& context);
    std::string generate_parallel(Parallel& par, const DependencyContext& context);
    std::string generate_passthrough(const PassThrough& pass);
};

// Joined id of a subtree from its recorded outcomes; throws
// DependencyResolutionError when a member id was never produced.
std::string joined_external_id(const JobNode& node);
