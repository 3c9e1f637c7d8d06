#include "codec.hpp"
#include "pipeline.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

// ── Encoding ──────────────────────────────────────────────────

static YAML::Node nullable(const std::string& value) {
    if (value.empty()) return YAML::Node(YAML::NodeType::Null);
    return YAML::Node(value);
}

YAML::Node to_snapshot(const JobNode& node) {
    YAML::Node out;
    out["type"] = node.type_name();

    if (const auto* job = node.as<Job>()) {
        out["script"] = job->script;
        out["profile"] = job->profile;
        out["job_id"] = nullable(job->job_id);
        out["external_id"] = nullable(job->external_id);
        out["status"] = to_string(job->status);
        if (!job->error.empty()) out["error"] = job->error;
        return out;
    }
    if (const auto* pass = node.as<PassThrough>()) {
        out["name"] = pass->name;
        out["external_id"] = nullable(pass->external_id);
        return out;
    }

    out["name"] = node.label();
    YAML::Node jobs(YAML::NodeType::Sequence);
    for (const auto& child : *children(node)) {
        jobs.push_back(to_snapshot(child));
    }
    out["jobs"] = jobs;
    return out;
}

YAML::Node to_snapshot(const Pipeline& pipeline) {
    YAML::Node out;
    out["type"] = "pipeline";
    out["name"] = pipeline.name();
    out["job_id"] = nullable(pipeline.job_id().value_or(""));
    out["definition"] = to_snapshot(pipeline.definition());
    return out;
}

// ── Decoding ──────────────────────────────────────────────────

static std::string record_type(const YAML::Node& record) {
    if (!record || !record.IsMap()) {
        throw MalformedRecordError("Snapshot record must be an object");
    }
    const YAML::Node& type = record["type"];
    if (!type || !type.IsScalar()) {
        throw MalformedRecordError("Snapshot record has no \"type\" field");
    }
    return type.as<std::string>();
}

static std::string required_string(const YAML::Node& record, const std::string& type,
                                   const char* field) {
    const YAML::Node& v = record[field];
    if (!v || !v.IsScalar()) {
        throw MalformedRecordError(fmt::format("{} record is missing \"{}\"", type, field));
    }
    return v.as<std::string>();
}

static std::string optional_string(const YAML::Node& record, const std::string& type,
                                   const char* field, const std::string& fallback = "") {
    const YAML::Node& v = record[field];
    if (!v || v.IsNull()) return fallback;
    if (!v.IsScalar()) {
        throw MalformedRecordError(fmt::format("{} record has a non-string \"{}\"", type, field));
    }
    return v.as<std::string>();
}

static std::vector<JobNode> decode_children(const YAML::Node& record, const std::string& type) {
    const YAML::Node& jobs = record["jobs"];
    if (!jobs || !jobs.IsSequence()) {
        throw MalformedRecordError(fmt::format("{} record is missing \"jobs\"", type));
    }
    std::vector<JobNode> out;
    out.reserve(jobs.size());
    for (const auto& child : jobs) {
        out.push_back(node_from_snapshot(child));
    }
    return out;
}

JobNode node_from_snapshot(const YAML::Node& record) {
    std::string type = record_type(record);

    if (type == "job") {
        Job job;
        job.script = required_string(record, type, "script");
        job.profile = required_string(record, type, "profile");
        job.job_id = optional_string(record, type, "job_id");
        job.external_id = optional_string(record, type, "external_id");
        job.error = optional_string(record, type, "error");
        std::string status = optional_string(record, type, "status", "pending");
        auto parsed = parse_job_status(status);
        if (!parsed) {
            throw MalformedRecordError(fmt::format("job record has unknown status '{}'", status));
        }
        job.status = *parsed;
        return JobNode(std::move(job));
    }
    if (type == "sequential") {
        return make_sequential(decode_children(record, type),
                               optional_string(record, type, "name", DEFAULT_SEQUENTIAL_NAME));
    }
    if (type == "parallel") {
        return make_parallel(decode_children(record, type),
                             optional_string(record, type, "name", DEFAULT_PARALLEL_NAME));
    }
    if (type == "passthrough") {
        PassThrough pass;
        pass.name = required_string(record, type, "name");
        pass.external_id = optional_string(record, type, "external_id");
        return JobNode(std::move(pass));
    }
    if (type == "pipeline") {
        throw MalformedRecordError("A pipeline record cannot be nested inside a tree");
    }
    throw UnknownVariantError(type);
}

Pipeline pipeline_from_snapshot(const YAML::Node& record) {
    std::string type = record_type(record);
    if (type != "pipeline") {
        if (type == "job" || type == "sequential" || type == "parallel" || type == "passthrough") {
            throw MalformedRecordError(fmt::format("Expected a pipeline record, got '{}'", type));
        }
        throw UnknownVariantError(type);
    }

    std::string name = required_string(record, type, "name");
    const YAML::Node& def = record["definition"];
    if (!def) {
        throw MalformedRecordError("pipeline record is missing \"definition\"");
    }
    JobNode definition = node_from_snapshot(def);

    std::string job_id = optional_string(record, type, "job_id");
    std::optional<std::string> run_id;
    if (!job_id.empty()) run_id = job_id;

    try {
        return Pipeline(name, std::move(definition), run_id);
    } catch (const DefinitionError& e) {
        throw MalformedRecordError(fmt::format("pipeline '{}': {}", name, e.what()));
    }
}

// ── JSON text ─────────────────────────────────────────────────

std::string emit_json(const YAML::Node& record) {
    YAML::Emitter out;
    out.SetMapFormat(YAML::Flow);
    out.SetSeqFormat(YAML::Flow);
    out.SetStringFormat(YAML::DoubleQuoted);
    out.SetNullFormat(YAML::LowerNull);
    // Control bytes (scheduler stderr, ANSI colours) as \uXXXX, never \xXX.
    out.SetOutputCharset(YAML::EscapeAsJson);
    out << record;
    return out.c_str();
}

YAML::Node parse_record(const std::string& text) {
    try {
        return YAML::Load(text);
    } catch (const YAML::Exception& e) {
        throw MalformedRecordError(std::string("Unparseable snapshot: ") + e.what());
    }
}

std::string to_json(const JobNode& node) {
    return emit_json(to_snapshot(node));
}

std::string to_json(const Pipeline& pipeline) {
    return emit_json(to_snapshot(pipeline));
}

JobNode node_from_json(const std::string& text) {
    return node_from_snapshot(parse_record(text));
}

Pipeline pipeline_from_json(const std::string& text) {
    return pipeline_from_snapshot(parse_record(text));
}
