#include <gtest/gtest.h>
#include <pipeline/codec.hpp>
#include <pipeline/pipeline.hpp>
#include <core/errors.hpp>
#include <yaml-cpp/yaml.h>

static Job job(const std::string& id, const std::string& ext, JobStatus status) {
    Job j;
    j.script = "run";
    j.profile = "A100";
    j.job_id = id;
    j.external_id = ext;
    j.status = status;
    return j;
}

// Sequential(pin, Parallel(Sequential(a, b), c), PassThrough)
static JobNode deep_tree() {
    return make_sequential({
        JobNode(job("pin", "100", JobStatus::Succeeded)),
        make_parallel({
            make_sequential({
                JobNode(job("a", "101", JobStatus::Failed)),
                JobNode(job("b", "", JobStatus::Pending)),
            }, "chain"),
            JobNode(job("c", "102", JobStatus::Submitted)),
        }, "fan"),
        JobNode(PassThrough{"prior", "90:91"}),
    }, "root");
}

// ── Round trips ─────────────────────────────────────────────

TEST(Codec, LeafRoundTrip) {
    JobNode leaf = make_job("pin", "pin", "pin");
    EXPECT_EQ(node_from_json(to_json(leaf)), leaf);
}

TEST(Codec, DeepTreeRoundTrip) {
    JobNode tree = deep_tree();
    EXPECT_EQ(node_from_json(to_json(tree)), tree);
}

TEST(Codec, ParallelOfSequentialRoundTrip) {
    JobNode tree = make_parallel({
        make_sequential({make_job("x", "cpu", "x1"), make_job("y", "cpu", "y1")}),
        make_sequential({make_job("x", "cpu", "x2")}),
    });
    EXPECT_EQ(node_from_json(to_json(tree)), tree);
}

TEST(Codec, ErrorMessageSurvivesRoundTrip) {
    Job failed = job("install", "", JobStatus::Failed);
    failed.error = "sbatch rejected install (exit 1): invalid account";
    JobNode node(failed);

    JobNode back = node_from_json(to_json(node));
    EXPECT_EQ(back.as<Job>()->error, failed.error);
}

TEST(Codec, ControlBytesUseJsonEscapes) {
    Job failed = job("install", "", JobStatus::Failed);
    failed.error = "\x1b[31merror:\x1b[0m Invalid qos \x01 caf\xc3\xa9";
    JobNode node(failed);

    std::string text = to_json(node);
    EXPECT_EQ(text.find("\\x"), std::string::npos) << text;
    EXPECT_EQ(text.find('\x1b'), std::string::npos);
    EXPECT_NE(text.find("\\u00"), std::string::npos) << text;

    EXPECT_EQ(node_from_json(text).as<Job>()->error, failed.error);
}

TEST(Codec, PipelineRoundTrip) {
    Pipeline p("bench", deep_tree(), std::string("2026-03-01T10-00-00-000__bench"));
    Pipeline back = pipeline_from_json(to_json(p));

    EXPECT_EQ(back, p);
    EXPECT_EQ(back.job_id().value_or(""), "2026-03-01T10-00-00-000__bench");
}

TEST(Codec, PipelineWithoutRunId) {
    Pipeline p("bench", make_sequential({make_job("pin", "pin")}));
    Pipeline back = pipeline_from_json(to_json(p));

    EXPECT_FALSE(back.job_id().has_value());
    EXPECT_EQ(back, p);
}

// ── Record shape ────────────────────────────────────────────

TEST(Codec, JobRecordFields) {
    YAML::Node rec = to_snapshot(make_job("pin", "pin", "pin"));

    EXPECT_EQ(rec["type"].as<std::string>(), "job");
    EXPECT_EQ(rec["script"].as<std::string>(), "pin");
    EXPECT_EQ(rec["profile"].as<std::string>(), "pin");
    EXPECT_EQ(rec["job_id"].as<std::string>(), "pin");
    EXPECT_TRUE(rec["external_id"].IsNull());
    EXPECT_EQ(rec["status"].as<std::string>(), "pending");
}

TEST(Codec, CompositeRecordKeepsChildOrder) {
    YAML::Node rec = to_snapshot(deep_tree());

    EXPECT_EQ(rec["type"].as<std::string>(), "sequential");
    EXPECT_EQ(rec["name"].as<std::string>(), "root");
    ASSERT_EQ(rec["jobs"].size(), 3u);
    EXPECT_EQ(rec["jobs"][0]["job_id"].as<std::string>(), "pin");
    EXPECT_EQ(rec["jobs"][1]["type"].as<std::string>(), "parallel");
    EXPECT_EQ(rec["jobs"][2]["type"].as<std::string>(), "passthrough");
}

TEST(Codec, JsonTextIsFlowStyle) {
    std::string text = to_json(make_job("pin", "pin", "pin"));

    EXPECT_EQ(text.front(), '{');
    EXPECT_EQ(text.back(), '}');
    EXPECT_NE(text.find("\"script\""), std::string::npos);
    EXPECT_NE(text.find("null"), std::string::npos);
}

// ── Decoding defaults ───────────────────────────────────────

TEST(Codec, OptionalJobFieldsDefault) {
    JobNode node = node_from_json(R"({"type": "job", "script": "pin", "profile": "pin", "job_id": null})");
    const Job* j = node.as<Job>();

    ASSERT_NE(j, nullptr);
    EXPECT_EQ(j->job_id, "");
    EXPECT_EQ(j->external_id, "");
    EXPECT_EQ(j->status, JobStatus::Pending);
}

TEST(Codec, CompositeNamesDefault) {
    JobNode s = node_from_json(R"({"type": "sequential", "jobs": []})");
    JobNode p = node_from_json(R"({"type": "parallel", "jobs": []})");

    EXPECT_EQ(s.label(), "S");
    EXPECT_EQ(p.label(), "P");
}

TEST(Codec, AcceptsYamlDefinitions) {
    JobNode node = node_from_json(
        "type: sequential\n"
        "name: stage\n"
        "jobs:\n"
        "  - {type: job, script: pin, profile: pin}\n"
        "  - type: job\n"
        "    script: run\n"
        "    profile: A100\n");

    ASSERT_TRUE(node.is<Sequential>());
    EXPECT_EQ(children(node)->size(), 2u);
    EXPECT_EQ(children(node)->at(1).as<Job>()->profile, "A100");
}

// ── Decode failures ─────────────────────────────────────────

TEST(Codec, UnknownVariantIsRejected) {
    try {
        node_from_json(R"({"type": "branch", "jobs": []})");
        FAIL() << "expected UnknownVariantError";
    } catch (const UnknownVariantError& e) {
        EXPECT_EQ(e.tag, "branch");
        EXPECT_STREQ(e.what(), "Unknown type: branch");
    }
}

TEST(Codec, UnknownVariantDeepInTreeIsRejected) {
    std::string text = R"({"type": "sequential", "name": "S", "jobs": [
        {"type": "job", "script": "pin", "profile": "pin"},
        {"type": "parallel", "name": "P", "jobs": [{"type": "branch"}]}
    ]})";
    EXPECT_THROW(node_from_json(text), UnknownVariantError);
}

TEST(Codec, UnknownVariantAtPipelineLevel) {
    EXPECT_THROW(pipeline_from_json(R"({"type": "branch"})"), UnknownVariantError);
}

TEST(Codec, MissingRequiredFields) {
    EXPECT_THROW(node_from_json(R"({"type": "job", "profile": "pin"})"), MalformedRecordError);
    EXPECT_THROW(node_from_json(R"({"type": "job", "script": "pin"})"), MalformedRecordError);
    EXPECT_THROW(node_from_json(R"({"type": "sequential", "name": "S"})"), MalformedRecordError);
    EXPECT_THROW(node_from_json(R"({"type": "parallel", "jobs": 3})"), MalformedRecordError);
    EXPECT_THROW(node_from_json(R"({"type": "passthrough"})"), MalformedRecordError);
    EXPECT_THROW(node_from_json(R"({"script": "pin", "profile": "pin"})"), MalformedRecordError);
    EXPECT_THROW(pipeline_from_json(R"({"type": "pipeline", "name": "x"})"), MalformedRecordError);
}

TEST(Codec, NonObjectRecords) {
    EXPECT_THROW(node_from_json("[1, 2]"), MalformedRecordError);
    EXPECT_THROW(node_from_json("\"job\""), MalformedRecordError);
    EXPECT_THROW(node_from_json("{\"type\": "), MalformedRecordError);
}

TEST(Codec, UnknownStatusIsMalformed) {
    EXPECT_THROW(node_from_json(R"({"type": "job", "script": "a", "profile": "b", "status": "lost"})"),
                 MalformedRecordError);
}

TEST(Codec, NoPartialTreeOnNestedFailure) {
    std::string text = R"({"type": "pipeline", "name": "bench", "definition":
        {"type": "sequential", "jobs": [
            {"type": "job", "script": "pin", "profile": "pin"},
            {"type": "job", "profile": "install"}
        ]}})";
    EXPECT_THROW(pipeline_from_json(text), MalformedRecordError);
}

TEST(Codec, DuplicateJobIdsAreMalformed) {
    std::string text = R"({"type": "pipeline", "name": "bench", "definition":
        {"type": "parallel", "jobs": [
            {"type": "job", "script": "run", "profile": "A100", "job_id": "x"},
            {"type": "job", "script": "run", "profile": "H100", "job_id": "x"}
        ]}})";
    EXPECT_THROW(pipeline_from_json(text), MalformedRecordError);
}
