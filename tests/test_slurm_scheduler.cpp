#include <gtest/gtest.h>
#include <scheduler/slurm_scheduler.hpp>
#include "fakes.hpp"

// ── State mapping ───────────────────────────────────────────

TEST(SlurmScheduler, MapsStates) {
    EXPECT_EQ(map_slurm_state("PENDING").value, SchedulerState::Pending);
    EXPECT_EQ(map_slurm_state("REQUEUED").value, SchedulerState::Pending);
    EXPECT_EQ(map_slurm_state("RUNNING").value, SchedulerState::Running);
    EXPECT_EQ(map_slurm_state("COMPLETING").value, SchedulerState::Running);
    EXPECT_EQ(map_slurm_state("COMPLETED").value, SchedulerState::Succeeded);
    EXPECT_EQ(map_slurm_state("TIMEOUT").value, SchedulerState::Failed);
    EXPECT_EQ(map_slurm_state("OUT_OF_MEMORY").value, SchedulerState::Failed);
}

TEST(SlurmScheduler, MapsDecoratedStates) {
    auto r = map_slurm_state("CANCELLED by 1234");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, SchedulerState::Failed);

    auto plus = map_slurm_state("CANCELLED+");
    ASSERT_TRUE(plus.is_ok());
    EXPECT_EQ(plus.value, SchedulerState::Failed);
}

TEST(SlurmScheduler, UnknownStateIsError) {
    EXPECT_TRUE(map_slurm_state("").is_err());
    EXPECT_TRUE(map_slurm_state("WHATEVER").is_err());
}

// ── sbatch output ───────────────────────────────────────────

TEST(SlurmScheduler, ParsesSbatchOutput) {
    EXPECT_EQ(parse_sbatch_output("4211\n").value, "4211");
    EXPECT_EQ(parse_sbatch_output("4211;cluster1\n").value, "4211");
    EXPECT_EQ(parse_sbatch_output("sbatch: warning: no time limit\n4212\n").value, "4212");
    EXPECT_TRUE(parse_sbatch_output("").is_err());
    EXPECT_TRUE(parse_sbatch_output("12:13\n").is_err());
}

// ── Submission ──────────────────────────────────────────────

TEST(SlurmScheduler, SubmitRunsQuotedSbatch) {
    FakeRunner runner;
    runner.replies.push_back({0, "4211\n", ""});
    SlurmScheduler slurm(runner);

    SubmissionDirective d;
    d.job_name = "pin";
    d.script = "scripts/slurm/pin.sh";
    d.dependency = std::string("afterok:12:13");

    auto r = slurm.submit(d);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, "4211");

    ASSERT_EQ(runner.commands.size(), 1u);
    EXPECT_EQ(runner.commands[0],
              "sbatch '--parsable' '--job-name=pin' '--dependency=afterok:12:13' "
              "'scripts/slurm/pin.sh'");
}

TEST(SlurmScheduler, RejectedSubmission) {
    FakeRunner runner;
    runner.replies.push_back({1, "", "sbatch: error: Invalid account\n"});
    SlurmScheduler slurm(runner);

    SubmissionDirective d;
    d.job_name = "install";
    d.script = "install.sh";

    auto r = slurm.submit(d);
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("Invalid account"), std::string::npos);
    EXPECT_NE(r.error.find("install"), std::string::npos);
}

// ── Status queries ──────────────────────────────────────────

TEST(SlurmScheduler, QueryUsesSacct) {
    FakeRunner runner;
    runner.replies.push_back({0, "COMPLETED\n", ""});
    SlurmScheduler slurm(runner);

    auto r = slurm.query_status("4211");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, SchedulerState::Succeeded);
    EXPECT_EQ(runner.commands.size(), 1u);
    EXPECT_NE(runner.commands[0].find("sacct -j '4211'"), std::string::npos);
}

TEST(SlurmScheduler, QueryFallsBackToSqueue) {
    FakeRunner runner;
    runner.replies.push_back({0, "", ""});
    runner.replies.push_back({0, "PENDING\n", ""});
    SlurmScheduler slurm(runner);

    auto r = slurm.query_status("4211");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, SchedulerState::Pending);
    ASSERT_EQ(runner.commands.size(), 2u);
    EXPECT_NE(runner.commands[1].find("squeue -j '4211'"), std::string::npos);
}

TEST(SlurmScheduler, QueryWithNoAnswerIsError) {
    FakeRunner runner;
    runner.replies.push_back({1, "", "slurm_load_jobs error: Socket timed out\n"});
    runner.replies.push_back({1, "", "slurm_load_jobs error: Socket timed out\n"});
    SlurmScheduler slurm(runner);

    auto r = slurm.query_status("4211");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("Socket timed out"), std::string::npos);
}
