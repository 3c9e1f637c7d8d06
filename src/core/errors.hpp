#pragma once

#include <stdexcept>
#include <string>

// Base of every error raised while building, compiling or decoding a job tree.
struct PipelineError : public std::runtime_error {
    explicit PipelineError(const std::string& s) : std::runtime_error(s) {}
};

// The scheduler rejected a directive (bad profile, script, quota...).
struct SubmissionError : public PipelineError {
    SubmissionError(const std::string& job_id, const std::string& s)
        : PipelineError(s), job_id(job_id) {}

    std::string job_id;
};

// A node needed a predecessor id that was never produced.
struct DependencyResolutionError : public PipelineError {
    explicit DependencyResolutionError(const std::string& s) : PipelineError(s) {}
};

struct UnknownVariantError : public PipelineError {
    explicit UnknownVariantError(const std::string& tag)
        : PipelineError("Unknown type: " + tag), tag(tag) {}

    std::string tag;
};

struct MalformedRecordError : public PipelineError {
    explicit MalformedRecordError(const std::string& s) : PipelineError(s) {}
};

// Transient failure reaching the scheduler; never means the job failed.
struct StatusQueryError : public PipelineError {
    StatusQueryError(const std::string& external_id, const std::string& s)
        : PipelineError(s), external_id(external_id) {}

    std::string external_id;
};

// Invalid tree at construction time (duplicate job_id, reserved characters...).
struct DefinitionError : public PipelineError {
    explicit DefinitionError(const std::string& s) : PipelineError(s) {}
};
