#include <gtest/gtest.h>
#include <clusterlink/managers/job_metadata.hpp>
#include <clusterlink/managers/reconciler.hpp>
#include "fake_slurm.hpp"

using namespace clusterlink;

static const char* PROJECT_BASE = "/projects/testuser/namdrunner_jobs";

class ReconcilerTest : public ::testing::Test {
protected:
    void SetUp() override {
        executor.set_retry_hooks(fake::instant_retry_hooks());
        slurm.install(*cluster);
        ASSERT_TRUE(conn.connect(fake::target(), fake::password()).is_ok());
    }

    JobRecord cached(const std::string& id, JobState state, const std::string& slurm_id) {
        JobRecord job;
        job.job_id = id;
        job.job_name = id;
        job.state = state;
        job.slurm_job_id = slurm_id;
        job.created_at = "2025-01-15T09:00:00Z";
        job.project_dir = std::string(PROJECT_BASE) + "/" + id;
        EXPECT_TRUE(cache.upsert(job).is_ok());
        return job;
    }

    fake::Slurm slurm;
    std::shared_ptr<fake::Cluster> cluster = std::make_shared<fake::Cluster>();
    std::shared_ptr<fake::Connector> connector = std::make_shared<fake::Connector>(cluster);
    ConnectionManager conn{connector};
    Executor executor{conn, 2};
    Scheduler scheduler{executor, SchedulerTimeouts{}, RetryPolicy::network()};
    TransferEngine transfer{executor, TransferSettings{}};
    MemoryJobCache cache;
    Reconciler reconciler{cache, scheduler, transfer};
};

TEST_F(ReconcilerTest, AppliesNewStateAndRewritesMetadata) {
    cached("j1", JobState::Pending, "100");
    slurm.active["100"] = fake::squeue_line("100", "j1", "R");
    int writes_before = cache.write_count();

    SyncReport report = reconciler.sync(PROJECT_BASE);
    EXPECT_TRUE(report.clean());
    EXPECT_EQ(report.jobs_checked, 1);
    EXPECT_EQ(report.jobs_updated, 1);
    EXPECT_EQ(report.cache_writes, 1);
    EXPECT_EQ(cache.write_count(), writes_before + 1);

    auto job = cache.find("j1");
    EXPECT_EQ(job->state, JobState::Running);
    EXPECT_FALSE(job->updated_at.empty());
    EXPECT_TRUE(job->completed_at.empty());

    auto meta = parse_job_info(cluster->file(std::string(PROJECT_BASE) + "/j1/job_info.json"));
    ASSERT_TRUE(meta.is_ok()) << meta.error.to_string();
    EXPECT_EQ(meta.value.state, JobState::Running);
}

TEST_F(ReconcilerTest, SecondRunWritesNothing) {
    cached("j1", JobState::Pending, "100");
    cached("j2", JobState::Running, "200");
    slurm.active["100"] = fake::squeue_line("100", "j1", "R");
    slurm.finish("200", "j2", "COMPLETED");

    SyncReport first = reconciler.sync(PROJECT_BASE);
    EXPECT_EQ(first.cache_writes, 2);
    int writes = cache.write_count();

    SyncReport second = reconciler.sync(PROJECT_BASE);
    EXPECT_EQ(second.cache_writes, 0);
    EXPECT_EQ(second.jobs_updated, 0);
    EXPECT_EQ(cache.write_count(), writes);
    EXPECT_TRUE(second.clean());
}

TEST_F(ReconcilerTest, TerminalJobsAreNeverQueried) {
    cached("done", JobState::Completed, "100");
    cached("fresh", JobState::Created, "");
    slurm.active["100"] = fake::squeue_line("100", "done", "R");

    SyncReport report = reconciler.sync(PROJECT_BASE);
    EXPECT_EQ(report.jobs_checked, 0);
    EXPECT_EQ(slurm.squeue_calls, 0);
    EXPECT_EQ(cache.find("done")->state, JobState::Completed);
}

TEST_F(ReconcilerTest, CompletionStampsCompletedAt) {
    cached("ok", JobState::Running, "100");
    cached("bad", JobState::Running, "200");
    slurm.finish("100", "ok", "COMPLETED");
    slurm.finish("200", "bad", "FAILED", "1:0");

    reconciler.sync(PROJECT_BASE);
    auto ok = cache.find("ok");
    EXPECT_EQ(ok->state, JobState::Completed);
    EXPECT_EQ(ok->completed_at, ok->updated_at);
    auto bad = cache.find("bad");
    EXPECT_EQ(bad->state, JobState::Failed);
    EXPECT_NE(bad->error_info.find("exit code"), std::string::npos);
}

TEST_F(ReconcilerTest, ResultsMatchedByScheduledId) {
    cached("first", JobState::Pending, "300");
    cached("second", JobState::Pending, "100");
    slurm.active["100"] = fake::squeue_line("100", "second", "R");
    slurm.finish("300", "first", "CANCELLED by 1000");

    reconciler.sync(PROJECT_BASE);
    EXPECT_EQ(cache.find("first")->state, JobState::Cancelled);
    EXPECT_EQ(cache.find("second")->state, JobState::Running);
}

TEST_F(ReconcilerTest, RequeueAppliedAsReported) {
    cached("j1", JobState::Running, "100");
    slurm.active["100"] = fake::squeue_line("100", "j1", "PD");
    reconciler.sync(PROJECT_BASE);
    EXPECT_EQ(cache.find("j1")->state, JobState::Pending);
}

TEST_F(ReconcilerTest, UnknownJobIsPerJobError) {
    cached("lost", JobState::Pending, "404");
    cached("fine", JobState::Pending, "100");
    slurm.active["100"] = fake::squeue_line("100", "fine", "R");

    SyncReport report = reconciler.sync(PROJECT_BASE);
    ASSERT_EQ(report.errors.size(), 1u);
    EXPECT_EQ(report.errors[0].job_id, "lost");
    EXPECT_EQ(report.errors[0].error.code, "SLURM_002");
    EXPECT_EQ(cache.find("fine")->state, JobState::Running);
    EXPECT_EQ(cache.find("lost")->state, JobState::Pending);
}

TEST_F(ReconcilerTest, UnknownStateFailsOnlyItsJob) {
    cached("good", JobState::Pending, "100");
    cached("odd", JobState::Pending, "200");
    slurm.active["100"] = fake::squeue_line("100", "good", "R");
    slurm.active["200"] = fake::squeue_line("200", "odd", "XX");

    SyncReport report = reconciler.sync(PROJECT_BASE);
    EXPECT_EQ(report.jobs_updated, 1);
    EXPECT_EQ(cache.find("good")->state, JobState::Running);
    EXPECT_EQ(cache.find("odd")->state, JobState::Pending);
    ASSERT_EQ(report.errors.size(), 1u);
    EXPECT_EQ(report.errors[0].job_id, "odd");
    EXPECT_EQ(report.errors[0].error.kind, ErrorKind::Protocol);
    EXPECT_NE(report.errors[0].error.details.find("|XX|"), std::string::npos);
}

TEST_F(ReconcilerTest, HeldJobStaysPending) {
    cached("held", JobState::Running, "200");
    slurm.active["200"] = fake::squeue_line("200", "held", "RH");
    SyncReport report = reconciler.sync(PROJECT_BASE);
    EXPECT_TRUE(report.clean());
    EXPECT_EQ(cache.find("held")->state, JobState::Pending);
}

TEST_F(ReconcilerTest, InvalidCachedSchedulerIdFailsOnlyItsJob) {
    cached("a", JobState::Pending, "100");
    cached("b", JobState::Pending, "12 34");
    slurm.active["100"] = fake::squeue_line("100", "a", "R");

    SyncReport report = reconciler.sync(PROJECT_BASE);
    EXPECT_EQ(cache.find("a")->state, JobState::Running);
    ASSERT_EQ(report.errors.size(), 1u);
    EXPECT_EQ(report.errors[0].job_id, "b");
    EXPECT_EQ(report.errors[0].error.kind, ErrorKind::Validation);
}

TEST_F(ReconcilerTest, QueryFailureReportedForEveryJob) {
    cached("a", JobState::Pending, "100");
    cached("b", JobState::Running, "200");
    cluster->reply("squeue", fake::output("", 1, "squeue: error: Access/permission denied"));
    int writes = cache.write_count();

    SyncReport report = reconciler.sync(PROJECT_BASE);
    ASSERT_EQ(report.errors.size(), 2u);
    EXPECT_EQ(report.errors[0].error.kind, ErrorKind::Permission);
    EXPECT_EQ(report.errors[1].error.kind, ErrorKind::Permission);
    EXPECT_EQ(cache.write_count(), writes);
}

TEST_F(ReconcilerTest, MetadataWriteFailureDoesNotBlockCache) {
    cached("j1", JobState::Pending, "100");
    slurm.active["100"] = fake::squeue_line("100", "j1", "R");
    cluster->write_error = ErrorKind::Permission;
    cluster->allow_writes = 0;

    SyncReport report = reconciler.sync(PROJECT_BASE);
    EXPECT_EQ(cache.find("j1")->state, JobState::Running);
    ASSERT_EQ(report.errors.size(), 1u);
    EXPECT_EQ(report.errors[0].job_id, "j1");
}

TEST_F(ReconcilerTest, DiscoversJobsWhenCacheEmpty) {
    JobRecord j1;
    j1.job_id = "j1";
    j1.job_name = "j1";
    j1.state = JobState::Pending;
    j1.slurm_job_id = "100";
    cluster->put_file(std::string(PROJECT_BASE) + "/j1/job_info.json", job_info_json(j1));
    cluster->put_file(std::string(PROJECT_BASE) + "/j2/job_info.json", "{ not json");
    cluster->add_dir(std::string(PROJECT_BASE) + "/j3");
    cluster->add_dir(std::string(PROJECT_BASE) + "/bad name");
    cluster->put_file(std::string(PROJECT_BASE) + "/README", "stray file");
    slurm.active["100"] = fake::squeue_line("100", "j1", "R");

    SyncReport report = reconciler.sync(PROJECT_BASE);
    EXPECT_EQ(report.discovered, 1);
    EXPECT_EQ(report.discovery_failures.size(), 3u);
    EXPECT_EQ(report.jobs_updated, 1);
    EXPECT_EQ(report.cache_writes, 2);

    auto job = cache.find("j1");
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->state, JobState::Running);
    EXPECT_EQ(job->project_dir, std::string(PROJECT_BASE) + "/j1");
}

TEST_F(ReconcilerTest, DiscoveryRejectsBadSchedulerId) {
    JobRecord a;
    a.job_id = "a";
    a.state = JobState::Pending;
    a.slurm_job_id = "100";
    JobRecord b = a;
    b.job_id = "b";
    b.slurm_job_id = "12 34";
    cluster->put_file(std::string(PROJECT_BASE) + "/a/job_info.json", job_info_json(a));
    cluster->put_file(std::string(PROJECT_BASE) + "/b/job_info.json", job_info_json(b));
    slurm.active["100"] = fake::squeue_line("100", "a", "R");

    SyncReport report = reconciler.sync(PROJECT_BASE);
    EXPECT_EQ(report.discovered, 1);
    ASSERT_EQ(report.discovery_failures.size(), 1u);
    EXPECT_EQ(report.discovery_failures[0].directory, std::string(PROJECT_BASE) + "/b");
    EXPECT_FALSE(cache.find("b").has_value());
    EXPECT_TRUE(report.errors.empty());
    EXPECT_EQ(cache.find("a")->state, JobState::Running);
}

TEST_F(ReconcilerTest, NoDiscoveryWhenBaseMissing) {
    SyncReport report = reconciler.sync(PROJECT_BASE);
    EXPECT_TRUE(report.clean());
    EXPECT_EQ(report.discovered, 0);
}

TEST_F(ReconcilerTest, NoDiscoveryWhenCacheHasJobs) {
    cached("local", JobState::Completed, "1");
    JobRecord remote;
    remote.job_id = "remote";
    cluster->put_file(std::string(PROJECT_BASE) + "/remote/job_info.json", job_info_json(remote));

    SyncReport report = reconciler.sync(PROJECT_BASE);
    EXPECT_EQ(report.discovered, 0);
    EXPECT_FALSE(cache.find("remote").has_value());
}
