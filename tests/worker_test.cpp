/*
 * rwork - Render Job Worker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "rwork/logger.hpp"
#include "rwork/registry.hpp"
#include "rwork/worker.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <thread>

using namespace rwork;
using namespace rwork::test;
using std::chrono::milliseconds;

class WorkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.workerName = "W";
        config.enginePath = "/unused";
        config.pollInterval = milliseconds(50);
    }

    WorkerConfig config;
    MemorySource source;
    ScriptedExecutor executor{source};
};

TEST_F(WorkerTest, SuccessfulRenderFinishesJob) {
    source.add("J1", "W");
    Worker worker(config, source, executor);

    EXPECT_EQ(worker.runOnce(), 1u);

    Job job = source.job("J1");
    EXPECT_EQ(job.status, Status::Finished);
    EXPECT_EQ(job.progress, 100);

    auto writes = source.updatesFor("J1");
    ASSERT_EQ(writes.size(), 3u);
    EXPECT_EQ(writes[0].status, Status::InProgress);
    EXPECT_EQ(writes[0].progress, 0);
    EXPECT_EQ(writes[0].timeEstimate, "Calculating...");
    EXPECT_EQ(writes[2].status, Status::Finished);
    EXPECT_EQ(writes[2].timeEstimate, "N/A");
}

TEST_F(WorkerTest, NonZeroExitErrorsJob) {
    source.add("J2", "W");
    executor.exitCodes["J2"] = 1;
    Worker worker(config, source, executor);

    worker.runOnce();

    Job job = source.job("J2");
    EXPECT_EQ(job.status, Status::Errored);
    EXPECT_EQ(job.progress, 0);
    EXPECT_EQ(job.timeEstimate, "0");
}

TEST_F(WorkerTest, ClaimIsWrittenBeforeRenderAndRenderRunsOnce) {
    source.add("J1", "W");
    Worker worker(config, source, executor);

    worker.runOnce();

    ASSERT_EQ(executor.calls.size(), 1u);
    EXPECT_EQ(executor.calls[0], "J1");
    EXPECT_EQ(executor.writesBeforeCall["J1"], 1u);
}

TEST_F(WorkerTest, ForeignJobsAreFetchedButNeverMutated) {
    source.add("MINE", "W");
    source.add("THEIRS", "OTHER_MACHINE");
    source.add("THEIRS_RUNNING", "OTHER_MACHINE", Status::InProgress);
    Worker worker(config, source, executor);

    EXPECT_EQ(worker.runOnce(), 1u);

    EXPECT_EQ(source.fetches(), 1);
    EXPECT_TRUE(source.updatesFor("THEIRS").empty());
    EXPECT_TRUE(source.updatesFor("THEIRS_RUNNING").empty());
    EXPECT_EQ(source.job("THEIRS").status, Status::ReadyToStart);
    EXPECT_EQ(executor.calls, std::vector<JobId>{"MINE"});
}

TEST_F(WorkerTest, OnlyReadyJobsAreClaimed) {
    source.add("READY", "W");
    source.add("RUNNING", "W", Status::InProgress);
    source.add("DONE", "W", Status::Finished);
    source.add("FAILED", "W", Status::Errored);
    Worker worker(config, source, executor);

    EXPECT_EQ(worker.runOnce(), 1u);
    EXPECT_EQ(executor.calls, std::vector<JobId>{"READY"});
    EXPECT_EQ(source.job("FAILED").status, Status::Errored);
    EXPECT_EQ(source.job("DONE").status, Status::Finished);
}

TEST_F(WorkerTest, JobsInOnePassRunSequentiallyWithoutInterleaving) {
    source.add("A", "W");
    source.add("B", "W");
    Worker worker(config, source, executor);

    EXPECT_EQ(worker.runOnce(), 2u);
    EXPECT_EQ(executor.calls, (std::vector<JobId>{"A", "B"}));

    auto writes = source.updates();
    ASSERT_EQ(writes.size(), 6u);
    for (std::size_t i = 0; i < 3; ++i) {
        EXPECT_EQ(writes[i].id, "A");
        EXPECT_EQ(writes[i + 3].id, "B");
    }
    EXPECT_EQ(writes[2].status, Status::Finished);
    EXPECT_EQ(writes[5].status, Status::Finished);
}

TEST_F(WorkerTest, FailureDoesNotAffectOtherJobsInPass) {
    source.add("BAD", "W");
    source.add("THROWS", "W");
    source.add("GOOD", "W");
    executor.exitCodes["BAD"] = 2;
    executor.throwFor["THROWS"] = "engine crashed";
    Worker worker(config, source, executor);

    EXPECT_EQ(worker.runOnce(), 3u);
    EXPECT_EQ(source.job("BAD").status, Status::Errored);
    EXPECT_EQ(source.job("THROWS").status, Status::Errored);
    EXPECT_EQ(source.job("THROWS").timeEstimate, "0");
    EXPECT_EQ(source.job("GOOD").status, Status::Finished);
}

TEST_F(WorkerTest, ExecutorExceptionBecomesInternalFailure) {
    source.add("J", "W");
    executor.throwFor["J"] = "boom";
    Worker worker(config, source, executor);

    RenderResult result = worker.processJob(source.job("J"));
    EXPECT_FALSE(result);
    EXPECT_EQ(result.failure, FailureKind::Internal);
    EXPECT_EQ(result.detail, "boom");
    EXPECT_EQ(source.job("J").status, Status::Errored);
    EXPECT_EQ(source.job("J").progress, 0);
}

TEST_F(WorkerTest, FailedClaimSkipsRender) {
    source.add("J", "W");
    source.failUpdate = [](const UpdateRecord& r) { return r.status == Status::InProgress; };
    Worker worker(config, source, executor);

    RenderResult result = worker.processJob(source.job("J"));
    EXPECT_EQ(result.failure, FailureKind::Update);
    EXPECT_TRUE(executor.calls.empty());
    EXPECT_EQ(source.job("J").status, Status::Errored);
}

TEST_F(WorkerTest, FailedFinishWriteErrorsJob) {
    source.add("J", "W");
    source.failUpdate = [](const UpdateRecord& r) { return r.status == Status::Finished; };
    Worker worker(config, source, executor);

    RenderResult result = worker.processJob(source.job("J"));
    EXPECT_EQ(result.failure, FailureKind::Update);
    EXPECT_EQ(source.job("J").status, Status::Errored);
}

TEST_F(WorkerTest, FetchFailureIsSurvivable) {
    source.add("J", "W");
    source.failFetch = true;
    Worker worker(config, source, executor);

    EXPECT_EQ(worker.runOnce(), 0u);
    EXPECT_TRUE(source.updates().empty());

    source.failFetch = false;
    EXPECT_EQ(worker.runOnce(), 1u);
}

TEST_F(WorkerTest, ErroredJobIsNotRetriedUntilRequeued) {
    source.add("J", "W");
    executor.exitCodes["J"] = 1;
    Worker worker(config, source, executor);

    worker.runOnce();
    EXPECT_EQ(worker.runOnce(), 0u);
    EXPECT_EQ(executor.calls.size(), 1u);

    source.update("J", 0, Status::ReadyToStart, "");
    executor.exitCodes["J"] = 0;
    EXPECT_EQ(worker.runOnce(), 1u);
    EXPECT_EQ(source.job("J").status, Status::Finished);
}

TEST_F(WorkerTest, RecoversOnlyOwnOrphans) {
    source.add("MINE", "W", Status::InProgress);
    source.add("THEIRS", "OTHER", Status::InProgress);
    source.add("READY", "W");
    Worker worker(config, source, executor);

    EXPECT_EQ(worker.recoverOrphanedJobs(), 1u);
    EXPECT_EQ(source.job("MINE").status, Status::Errored);
    EXPECT_EQ(source.job("THEIRS").status, Status::InProgress);
    EXPECT_EQ(source.job("READY").status, Status::ReadyToStart);
}

TEST_F(WorkerTest, EligibleJobsKeepSourceOrder) {
    std::vector<Job> jobs(4);
    jobs[0].id = "c"; jobs[0].worker = "W";
    jobs[1].id = "a"; jobs[1].worker = "X";
    jobs[2].id = "b"; jobs[2].worker = "W";
    jobs[3].id = "d"; jobs[3].worker = "W"; jobs[3].status = Status::Finished;

    auto eligible = Worker::eligibleJobs(jobs, "W");
    ASSERT_EQ(eligible.size(), 2u);
    EXPECT_EQ(eligible[0].id, "c");
    EXPECT_EQ(eligible[1].id, "b");
}

TEST_F(WorkerTest, BackgroundLoopPollsUntilShutdown) {
    source.add("J", "W");
    Worker worker(config, source, executor);

    ASSERT_TRUE(worker.start());
    EXPECT_TRUE(worker.isRunning());
    EXPECT_FALSE(worker.start());

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (source.fetches() < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(milliseconds(10));
    }
    worker.shutdown();

    EXPECT_FALSE(worker.isRunning());
    EXPECT_GE(source.fetches(), 3);
    EXPECT_EQ(source.job("J").status, Status::Finished);
    EXPECT_EQ(source.updatesFor("J").size(), 3u);
}

TEST_F(WorkerTest, ShutdownInterruptsIdleSleep) {
    config.pollInterval = std::chrono::seconds(30);
    Worker worker(config, source, executor);
    ASSERT_TRUE(worker.start());

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (source.fetches() < 1 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(milliseconds(10));
    }
    auto started = std::chrono::steady_clock::now();
    worker.shutdown();
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(2));
}

TEST_F(WorkerTest, ShutdownMidPassLeavesRemainingJobsUntouched) {
    source.add("A", "W");
    source.add("B", "W");
    Worker worker(config, source, executor);
    executor.onRender = [&worker](const Job&) { worker.shutdown(); };

    EXPECT_EQ(worker.runOnce(), 1u);

    EXPECT_EQ(executor.calls, std::vector<JobId>{"A"});
    EXPECT_EQ(source.job("A").status, Status::Finished);
    EXPECT_TRUE(source.updatesFor("B").empty());
    EXPECT_EQ(source.job("B").status, Status::ReadyToStart);
}

TEST_F(WorkerTest, RenderRunsInsideJobLogScope) {
    source.add("A", "W");
    Worker worker(config, source, executor);
    std::string scopeDuringRender;
    executor.onRender = [&scopeDuringRender](const Job&) { scopeDuringRender = LogScope::current(); };

    worker.runOnce();

    EXPECT_EQ(scopeDuringRender, "job A");
    EXPECT_TRUE(LogScope::current().empty());
}

TEST_F(WorkerTest, RunPollsOnCallingThreadUntilStopped) {
    source.add("J", "W");
    Worker worker(config, source, executor);
    std::atomic<bool> stop{false};

    std::thread runner([&worker, &stop] { worker.run(stop); });
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (source.job("J").status != Status::Finished && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(milliseconds(10));
    }
    EXPECT_TRUE(worker.isRunning());

    auto started = std::chrono::steady_clock::now();
    stop.store(true);
    runner.join();

    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(2));
    EXPECT_FALSE(worker.isRunning());
    EXPECT_EQ(source.job("J").status, Status::Finished);
    EXPECT_EQ(source.updatesFor("J").size(), 3u);
}

TEST_F(WorkerTest, RunReturnsAtOnceWhenAlreadyStopped) {
    source.add("J", "W");
    Worker worker(config, source, executor);
    std::atomic<bool> stop{true};

    worker.run(stop);

    EXPECT_EQ(source.fetches(), 0);
    EXPECT_EQ(source.job("J").status, Status::ReadyToStart);
    EXPECT_FALSE(worker.isRunning());
}

// Registry, driver and worker together against real engine stand-ins.
class WorkerEndToEndTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.workerName = "RENDER_MACHINE_01";
        config.projectPath = "/projects/Demo.uproject";
        config.moduleDir = dir.path();
        config.pollInterval = milliseconds(50);
        config.heartbeatInterval = milliseconds(50);
        config.assumedDuration = milliseconds(500);
    }

    TempDir dir;
    Registry registry{dir.path() / "registry"};
    WorkerConfig config;
};

TEST_F(WorkerEndToEndTest, ZeroExitFinishesAndNonZeroExitErrors) {
    config.enginePath = writeScript(dir.path(), "engine.sh",
        "case \"$3\" in\n"
        "  -JobId=*) ;;\n"
        "  *) exit 64 ;;\n"
        "esac\n"
        "[ \"$2\" = /Game/Maps/Broken ] && exit 1\n"
        "sleep 0.2\n"
        "exit 0");

    auto ok = registry.submit("RENDER_MACHINE_01", "/Game/Maps/Main", "/Game/Seq", "/Game/Cfg");
    auto bad = registry.submit("RENDER_MACHINE_01", "/Game/Maps/Broken", "/Game/Seq", "/Game/Cfg");
    auto other = registry.submit("RENDER_MACHINE_02", "/Game/Maps/Main", "/Game/Seq", "/Game/Cfg");
    ASSERT_TRUE(ok && bad && other);

    Driver driver(config, registry);
    Worker worker(config, registry, driver);
    EXPECT_EQ(worker.runOnce(), 2u);

    auto finished = registry.get(ok.id);
    ASSERT_TRUE(finished);
    EXPECT_EQ(finished->status, Status::Finished);
    EXPECT_EQ(finished->progress, 100);

    auto errored = registry.get(bad.id);
    ASSERT_TRUE(errored);
    EXPECT_EQ(errored->status, Status::Errored);
    EXPECT_EQ(errored->progress, 0);
    EXPECT_EQ(errored->timeEstimate, "0");

    auto untouched = registry.get(other.id);
    ASSERT_TRUE(untouched);
    EXPECT_EQ(untouched->status, Status::ReadyToStart);
}

TEST_F(WorkerEndToEndTest, MissingEngineErrorsJob) {
    config.enginePath = dir.path() / "no-engine-here";
    auto submitted = registry.submit("RENDER_MACHINE_01", "/Game/Maps/Main", "/Game/Seq", "/Game/Cfg");
    ASSERT_TRUE(submitted);

    Driver driver(config, registry);
    Worker worker(config, registry, driver);
    EXPECT_EQ(worker.runOnce(), 1u);

    auto job = registry.get(submitted.id);
    ASSERT_TRUE(job);
    EXPECT_EQ(job->status, Status::Errored);
    EXPECT_EQ(job->progress, 0);
    EXPECT_EQ(job->timeEstimate, "0");
}
