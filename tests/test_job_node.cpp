#include <gtest/gtest.h>
#include <pipeline/job_node.hpp>
#include <pipeline/dependency_compiler.hpp>
#include <scheduler/directive.hpp>
#include <core/errors.hpp>
#include "fakes.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>

class CompilerTest : public ::testing::Test {
protected:
    fs::path test_dir;
    FakeScheduler sched;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "jobrunner_compiler_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    DependencyCompiler compiler() {
        return DependencyCompiler(sched, fake_settings(test_dir));
    }

    static Job& job_at(JobNode& node, size_t i) {
        return *children(node)->at(i).as<Job>();
    }

    static std::string read(const fs::path& p) {
        std::ifstream in(p);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
};

// ── Sequential ──────────────────────────────────────────────

TEST_F(CompilerTest, SequentialChainsAfterOk) {
    JobNode tree = make_sequential({
        make_job("pin", "pin", "pin"),
        make_job("install", "install", "install"),
        make_job("prepare", "prepare", "prepare"),
    });
    auto c = compiler();
    DependencyContext ctx;
    ctx.output = "run";

    EXPECT_EQ(c.generate(tree, ctx), "102");

    std::vector<std::string> order = {"pin", "install", "prepare"};
    EXPECT_EQ(sched.names(), order);
    EXPECT_FALSE(sched.submitted[0].dependency.has_value());
    EXPECT_EQ(sched.submitted[1].dependency.value_or(""), "afterok:100");
    EXPECT_EQ(sched.submitted[2].dependency.value_or(""), "afterok:101");

    EXPECT_EQ(job_at(tree, 0).status, JobStatus::Submitted);
    EXPECT_EQ(job_at(tree, 0).external_id, "100");
    EXPECT_EQ(job_at(tree, 2).external_id, "102");
    EXPECT_EQ(c.submissions(), 3);
}

TEST_F(CompilerTest, FirstChildInheritsIncomingContext) {
    JobNode tree = make_sequential({
        make_job("pin", "pin", "pin"),
        make_job("install", "install", "install"),
    });
    auto c = compiler();
    DependencyContext ctx;
    ctx.depends_on = std::string("7");
    ctx.depends_event = DependsEvent::AfterAny;

    c.generate(tree, ctx);

    EXPECT_EQ(sched.submitted[0].dependency.value_or(""), "afterany:7");
    EXPECT_EQ(sched.submitted[1].dependency.value_or(""), "afterok:100");
}

TEST_F(CompilerTest, SequentialHaltsOnFailure) {
    JobNode tree = make_sequential({
        make_job("pin", "pin", "pin"),
        make_job("install", "install", "install"),
        make_job("prepare", "prepare", "prepare"),
        make_job("run", "A100", "run"),
    });
    sched.reject.insert("install");
    auto c = compiler();

    EXPECT_THROW(c.generate(tree, DependencyContext{}), SubmissionError);

    std::vector<std::string> order = {"pin"};
    EXPECT_EQ(sched.names(), order);

    EXPECT_EQ(job_at(tree, 0).status, JobStatus::Submitted);
    EXPECT_EQ(job_at(tree, 1).status, JobStatus::Failed);
    EXPECT_TRUE(job_at(tree, 1).external_id.empty());
    EXPECT_NE(job_at(tree, 1).error.find("quota exceeded"), std::string::npos);
    for (size_t i = 2; i < 4; i++) {
        EXPECT_EQ(job_at(tree, i).status, JobStatus::Pending);
        EXPECT_TRUE(job_at(tree, i).external_id.empty());
    }
}

TEST_F(CompilerTest, SubmissionErrorCarriesJobId) {
    JobNode tree = make_sequential({make_job("install", "install", "install")});
    sched.reject.insert("install");
    auto c = compiler();

    try {
        c.generate(tree, DependencyContext{});
        FAIL() << "expected SubmissionError";
    } catch (const SubmissionError& e) {
        EXPECT_EQ(e.job_id, "install");
    }
}

// ── Parallel ────────────────────────────────────────────────

TEST_F(CompilerTest, ParallelSharesUpstreamAndJoinsInOrder) {
    JobNode tree = make_parallel({
        make_job("run", "A100", "a"),
        make_job("run", "H100", "b"),
        make_job("run", "cpu", "c"),
    });
    auto c = compiler();
    DependencyContext ctx;
    ctx.depends_on = std::string("42");

    std::string joined = c.generate(tree, ctx);

    EXPECT_EQ(joined, "100:101:102");
    EXPECT_EQ(split_joined_id(joined).size(), 3u);
    for (const auto& d : sched.submitted) {
        EXPECT_EQ(d.dependency.value_or(""), "afterok:42");
    }
    std::vector<std::string> order = {"a", "b", "c"};
    EXPECT_EQ(sched.names(), order);
}

TEST_F(CompilerTest, ParallelKeepsGoingPastFailedSibling) {
    JobNode tree = make_parallel({
        make_job("run", "A100", "a"),
        make_job("run", "H100", "b"),
        make_job("run", "cpu", "c"),
    });
    sched.reject.insert("b");
    auto c = compiler();

    EXPECT_EQ(c.generate(tree, DependencyContext{}), "100:101");

    std::vector<size_t> failed = {1};
    EXPECT_EQ(tree.as<Parallel>()->failed, failed);
    EXPECT_EQ(job_at(tree, 0).status, JobStatus::Submitted);
    EXPECT_EQ(job_at(tree, 1).status, JobStatus::Failed);
    EXPECT_EQ(job_at(tree, 2).status, JobStatus::Submitted);
}

TEST_F(CompilerTest, ParallelWithEveryBranchFailedThrows) {
    JobNode tree = make_parallel({
        make_job("run", "A100", "a"),
        make_job("run", "H100", "b"),
    });
    sched.reject = {"a", "b"};
    auto c = compiler();

    EXPECT_THROW(c.generate(tree, DependencyContext{}), SubmissionError);
    EXPECT_EQ(tree.as<Parallel>()->failed.size(), 2u);
}

TEST_F(CompilerTest, SequentialStopsAfterPartialParallel) {
    JobNode tree = make_sequential({
        make_job("pin", "pin", "pin"),
        make_parallel({make_job("run", "A100", "a"), make_job("run", "H100", "b")}),
        make_job("report", "cpu", "report"),
    });
    sched.reject.insert("b");
    auto c = compiler();

    EXPECT_THROW(c.generate(tree, DependencyContext{}), SubmissionError);

    std::vector<std::string> order = {"pin", "a"};
    EXPECT_EQ(sched.names(), order);
    EXPECT_EQ(job_at(tree, 2).status, JobStatus::Pending);
}

TEST_F(CompilerTest, NestedParallelFailureHaltsNextStage) {
    JobNode tree = make_sequential({
        make_parallel({
            make_parallel({make_job("run", "A100", "a"), make_job("run", "H100", "b")}, "inner"),
            make_job("run", "cpu", "c"),
        }, "outer"),
        make_job("report", "cpu", "d"),
    });
    sched.reject.insert("a");
    auto c = compiler();

    EXPECT_THROW(c.generate(tree, DependencyContext{}), SubmissionError);

    std::vector<std::string> order = {"b", "c"};
    EXPECT_EQ(sched.names(), order);
    std::vector<size_t> failed = {0};
    EXPECT_EQ(children(tree)->at(0).as<Parallel>()->failed, failed);
    EXPECT_EQ(job_at(tree, 1).status, JobStatus::Pending);
}

TEST_F(CompilerTest, PartialFanOutAtEndOfInnerChainHaltsOuterChain) {
    JobNode tree = make_sequential({
        make_sequential({
            make_job("pin", "pin", "pin"),
            make_parallel({make_job("run", "A100", "a"), make_job("run", "H100", "b")}),
        }, "stage"),
        make_job("report", "cpu", "report"),
    });
    sched.reject.insert("b");
    auto c = compiler();

    EXPECT_THROW(c.generate(tree, DependencyContext{}), SubmissionError);
    EXPECT_EQ(sched.find("report"), nullptr);
}

TEST_F(CompilerTest, ParallelJoinFeedsNextStage) {
    JobNode tree = make_sequential({
        make_parallel({make_job("run", "A100", "a"), make_job("run", "H100", "b")}),
        make_job("report", "cpu", "report"),
    });
    auto c = compiler();

    EXPECT_EQ(c.generate(tree, DependencyContext{}), "102");
    EXPECT_EQ(sched.find("report")->dependency.value_or(""), "afterok:100:101");
}

TEST_F(CompilerTest, EmptyCompositesForwardUpstream) {
    JobNode empty = make_parallel({});
    auto c = compiler();
    DependencyContext ctx;
    ctx.depends_on = std::string("5");
    EXPECT_EQ(c.generate(empty, ctx), "5");

    JobNode tree = make_sequential({
        make_job("pin", "pin", "pin"),
        make_parallel({}),
        make_job("prepare", "prepare", "prepare"),
    });
    c.generate(tree, DependencyContext{});
    EXPECT_EQ(sched.find("prepare")->dependency.value_or(""), "afterok:100");
}

// ── Job ─────────────────────────────────────────────────────

TEST_F(CompilerTest, UnknownProfileFailsWithoutSubmitting) {
    JobNode tree = make_sequential({make_job("pin", "nope", "pin")});
    auto c = compiler();

    EXPECT_THROW(c.generate(tree, DependencyContext{}), SubmissionError);
    EXPECT_TRUE(sched.submitted.empty());
    EXPECT_EQ(job_at(tree, 0).status, JobStatus::Failed);
    EXPECT_NE(job_at(tree, 0).error.find("nope"), std::string::npos);
}

TEST_F(CompilerTest, MalformedScriptReferenceFails) {
    JobNode job = make_job("rm -rf", "pin", "bad");
    auto c = compiler();

    EXPECT_THROW(c.generate(job, DependencyContext{}), SubmissionError);
    EXPECT_TRUE(sched.submitted.empty());
}

TEST_F(CompilerTest, DirectiveLayoutMirrorsTree) {
    JobNode tree = make_sequential({make_job("pin", "pin", "pin")}, "S");
    auto c = compiler();
    DependencyContext ctx;
    ctx.output = "bench";

    c.generate(tree, ctx);

    const auto& d = sched.submitted.at(0);
    EXPECT_EQ(d.job_name, "pin");
    EXPECT_EQ(d.script, "scripts/slurm/pin.sh");
    EXPECT_EQ(d.workdir, "scratch/bench/S/pin");
    EXPECT_EQ(d.output, "scratch/bench/S/pin/slurm-%j.out");
    EXPECT_NE(std::find(d.resource_args.begin(), d.resource_args.end(), "--time=1:00:00"),
              d.resource_args.end());

    fs::path local = test_dir / "local" / "bench" / "S" / "pin";
    EXPECT_TRUE(fs::is_directory(local));
    EXPECT_NE(read(local / "jobrunner.log").find("submitted as 100"), std::string::npos);
}

TEST_F(CompilerTest, RejectionIsRecordedInJobLog) {
    JobNode job = make_job("install", "install", "install");
    sched.reject.insert("install");
    auto c = compiler();

    EXPECT_THROW(c.generate(job, DependencyContext{}), SubmissionError);
    std::string log = read(test_dir / "local" / "install" / "jobrunner.log");
    EXPECT_NE(log.find("quota exceeded"), std::string::npos);
}

TEST_F(CompilerTest, ResubmittingExistingDirectoryIsFine) {
    fs::create_directories(test_dir / "local" / "pin");
    JobNode job = make_job("pin", "pin", "pin");
    auto c = compiler();

    EXPECT_EQ(c.generate(job, DependencyContext{}), "100");
}

TEST_F(CompilerTest, UnwritableOutputDirectoryFailsJob) {
    fs::create_directories(test_dir / "local");
    std::ofstream(test_dir / "local" / "bench") << "not a directory";
    JobNode job = make_job("pin", "pin", "pin");
    auto c = compiler();
    DependencyContext ctx;
    ctx.output = "bench";

    EXPECT_THROW(c.generate(job, ctx), SubmissionError);
    EXPECT_TRUE(sched.submitted.empty());
    EXPECT_EQ(job.as<Job>()->status, JobStatus::Failed);
    EXPECT_NE(job.as<Job>()->error.find("cannot create"), std::string::npos);
}

TEST_F(CompilerTest, SkippedJobForwardsRecordedId) {
    Job pin;
    pin.script = "pin";
    pin.profile = "pin";
    pin.job_id = "pin";
    pin.external_id = "55";
    pin.status = JobStatus::Skipped;

    JobNode tree = make_sequential({JobNode(pin), make_job("install", "install", "install")});
    auto c = compiler();
    c.generate(tree, DependencyContext{});

    std::vector<std::string> order = {"install"};
    EXPECT_EQ(sched.names(), order);
    EXPECT_EQ(sched.submitted[0].dependency.value_or(""), "afterok:55");
    EXPECT_EQ(job_at(tree, 0).status, JobStatus::Skipped);
}

TEST_F(CompilerTest, SkippedJobWithoutIdCannotResolve) {
    Job pin;
    pin.script = "pin";
    pin.profile = "pin";
    pin.job_id = "pin";
    pin.status = JobStatus::Skipped;

    JobNode tree = make_sequential({JobNode(pin), make_job("install", "install", "install")});
    auto c = compiler();

    EXPECT_THROW(c.generate(tree, DependencyContext{}), DependencyResolutionError);
    EXPECT_TRUE(sched.submitted.empty());
}

TEST_F(CompilerTest, PassThroughForwardsJoinedId) {
    JobNode tree = make_sequential({
        JobNode(PassThrough{"prep", "55:56"}),
        make_job("run", "A100", "run"),
    });
    auto c = compiler();
    c.generate(tree, DependencyContext{});

    EXPECT_EQ(sched.submitted.at(0).dependency.value_or(""), "afterok:55:56");
}

// ── joined_external_id ──────────────────────────────────────

TEST_F(CompilerTest, JoinedExternalIdFromRecordedOutcomes) {
    JobNode tree = make_sequential({
        make_job("pin", "pin", "pin"),
        make_parallel({make_job("run", "A100", "a"), make_job("run", "H100", "b")}),
    });
    EXPECT_THROW(joined_external_id(tree), DependencyResolutionError);

    auto c = compiler();
    c.generate(tree, DependencyContext{});

    EXPECT_EQ(joined_external_id(tree), "101:102");
    EXPECT_EQ(joined_external_id(children(tree)->at(0)), "100");
}

// ── Node basics ─────────────────────────────────────────────

TEST(JobNode, OutputDirNestsUnderRoot) {
    EXPECT_EQ(make_job("pin", "pin", "pin").output_dir("root").string(), "root/pin");
    EXPECT_EQ(make_sequential({}, "stage").output_dir("root").string(), "root/stage");
    EXPECT_EQ(make_parallel({}).output_dir("root").string(), "root/P");
}

TEST(JobNode, StatusNames) {
    EXPECT_EQ(to_string(JobStatus::Succeeded), "succeeded");
    EXPECT_EQ(parse_job_status("skipped"), JobStatus::Skipped);
    EXPECT_FALSE(parse_job_status("branch").has_value());
}

TEST(JobNode, EqualityIgnoresTransientFailures) {
    JobNode a = make_parallel({make_job("run", "A100", "a")});
    JobNode b = a;
    b.as<Parallel>()->failed.push_back(0);
    EXPECT_EQ(a, b);

    std::get<Job>(children(b)->at(0).value()).status = JobStatus::Failed;
    EXPECT_NE(a, b);
}

TEST(JobNode, ForEachJobIsDepthFirst) {
    JobNode tree = make_sequential({
        make_job("pin", "pin", "1"),
        make_parallel({make_job("run", "A100", "2"), make_sequential({make_job("x", "cpu", "3")})}),
        make_job("report", "cpu", "4"),
    });
    std::string order;
    for_each_job(static_cast<const JobNode&>(tree), [&](const Job& j) { order += j.job_id; });
    EXPECT_EQ(order, "1234");
}
