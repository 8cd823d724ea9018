#include <gtest/gtest.h>
#include <clusterlink/managers/cluster_service.hpp>
#include <clusterlink/managers/job_metadata.hpp>
#include "fake_slurm.hpp"

using namespace clusterlink;

static const char* PROJECT = "/projects/testuser/namdrunner_jobs";
static const char* SCRATCH = "/scratch/alpine/testuser/namdrunner_jobs";

static Config cluster_config() {
    auto config = Config::parse(
        "cluster:\n"
        "  host: login.example.edu\n"
        "  username: testuser\n"
        "executor:\n"
        "  workers: 2\n");
    EXPECT_TRUE(config.is_ok());
    return config.value;
}

class ClusterServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        service.executor().set_retry_hooks(fake::instant_retry_hooks());
        slurm.install(*cluster);
        ASSERT_TRUE(service.connect(fake::password()).is_ok());
    }

    fake::Slurm slurm;
    std::shared_ptr<fake::Cluster> cluster = std::make_shared<fake::Cluster>();
    std::shared_ptr<fake::Connector> connector = std::make_shared<fake::Connector>(cluster);
    MemoryJobCache cache;
    ClusterService service{cluster_config(), connector, cache};
};

TEST(SafeDeletePath, AcceptsJobDirectoriesOnly) {
    std::vector<std::string> bases = {PROJECT, SCRATCH};
    EXPECT_TRUE(is_safe_delete_path(std::string(PROJECT) + "/job1", bases));
    EXPECT_TRUE(is_safe_delete_path(std::string(SCRATCH) + "/job1/outputs", bases));

    EXPECT_FALSE(is_safe_delete_path(PROJECT, bases));
    EXPECT_FALSE(is_safe_delete_path(std::string(PROJECT) + "/", bases));
    EXPECT_FALSE(is_safe_delete_path(std::string(PROJECT) + "/../other", bases));
    EXPECT_FALSE(is_safe_delete_path("/projects/testuser", bases));
    EXPECT_FALSE(is_safe_delete_path("/tmp/namdrunner_jobs/job1", bases));
    EXPECT_FALSE(is_safe_delete_path(std::string(PROJECT) + "_evil/job1", bases));
}

TEST(ClusterServiceConfig, ConnectWithoutClusterIsValidationError) {
    auto cluster = std::make_shared<fake::Cluster>();
    auto connector = std::make_shared<fake::Connector>(cluster);
    MemoryJobCache cache;
    ClusterService service{Config{}, connector, cache};

    auto r = service.connect(fake::password());
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::Validation);
    EXPECT_EQ(connector->attempts(), 0);
}

TEST(ClusterServiceConfig, JobOperationsNeedSession) {
    auto cluster = std::make_shared<fake::Cluster>();
    auto connector = std::make_shared<fake::Connector>(cluster);
    MemoryJobCache cache;
    ClusterService service{cluster_config(), connector, cache};

    auto created = service.create_job("job1");
    ASSERT_TRUE(created.is_err());
    EXPECT_EQ(created.error.code, "AUTH_002");
    EXPECT_TRUE(cache.empty());

    auto synced = service.sync();
    ASSERT_TRUE(synced.is_err());
    EXPECT_EQ(synced.error.code, "AUTH_002");
}

TEST_F(ClusterServiceTest, CreateJobBuildsDirectoriesAndMetadata) {
    auto r = service.create_job("job1", "test_job");
    ASSERT_TRUE(r.is_ok()) << r.error.to_string();
    EXPECT_EQ(r.value.state, JobState::Created);
    EXPECT_EQ(r.value.project_dir, std::string(PROJECT) + "/job1");
    EXPECT_EQ(r.value.scratch_dir, std::string(SCRATCH) + "/job1");

    for (const char* root : {PROJECT, SCRATCH}) {
        for (const char* sub : {"input_files", "scripts", "outputs"}) {
            EXPECT_TRUE(cluster->has_dir(std::string(root) + "/job1/" + sub)) << root << " " << sub;
        }
    }

    auto meta = parse_job_info(cluster->file(std::string(PROJECT) + "/job1/job_info.json"));
    ASSERT_TRUE(meta.is_ok());
    EXPECT_EQ(meta.value.job_name, "test_job");
    EXPECT_EQ(meta.value.state, JobState::Created);

    ASSERT_TRUE(cache.find("job1").has_value());
}

TEST_F(ClusterServiceTest, CreateJobRejectsBadOrDuplicateIds) {
    EXPECT_EQ(service.create_job("../etc").error.kind, ErrorKind::Validation);
    EXPECT_EQ(service.create_job("a b").error.kind, ErrorKind::Validation);
    ASSERT_TRUE(service.create_job("job1").is_ok());
    auto again = service.create_job("job1");
    ASSERT_TRUE(again.is_err());
    EXPECT_NE(again.error.message.find("already exists"), std::string::npos);
}

TEST_F(ClusterServiceTest, SubmitMirrorsThenQueues) {
    ASSERT_TRUE(service.create_job("job1").is_ok());

    auto r = service.submit("job1");
    ASSERT_TRUE(r.is_ok()) << r.error.to_string();
    EXPECT_EQ(r.value.state, JobState::Pending);
    EXPECT_EQ(r.value.slurm_job_id, "12345678");
    EXPECT_FALSE(r.value.submitted_at.empty());

    auto rsync = cluster->commands_containing("rsync -az");
    ASSERT_EQ(rsync.size(), 1u);
    EXPECT_NE(rsync[0].find(std::string(PROJECT) + "/job1/"), std::string::npos);
    EXPECT_NE(rsync[0].find(std::string(SCRATCH) + "/job1/"), std::string::npos);

    auto sbatch = cluster->commands_containing("sbatch");
    ASSERT_EQ(sbatch.size(), 1u);
    EXPECT_NE(sbatch[0].find(std::string(SCRATCH) + "/job1"), std::string::npos);

    EXPECT_EQ(cache.find("job1")->slurm_job_id, "12345678");
    auto meta = parse_job_info(cluster->file(std::string(PROJECT) + "/job1/job_info.json"));
    ASSERT_TRUE(meta.is_ok());
    EXPECT_EQ(meta.value.state, JobState::Pending);
}

TEST_F(ClusterServiceTest, SubmitOnlyFromCreatedOrFailed) {
    ASSERT_TRUE(service.create_job("job1").is_ok());
    ASSERT_TRUE(service.submit("job1").is_ok());

    auto again = service.submit("job1");
    ASSERT_TRUE(again.is_err());
    EXPECT_EQ(again.error.kind, ErrorKind::Validation);
    EXPECT_EQ(cluster->commands_containing("sbatch").size(), 1u);

    auto missing = service.submit("nope");
    ASSERT_TRUE(missing.is_err());
    EXPECT_NE(missing.error.message.find("not found"), std::string::npos);
}

TEST_F(ClusterServiceTest, SubmitFailureLeavesJobCreated) {
    ASSERT_TRUE(service.create_job("job1").is_ok());
    cluster->reply_once("sbatch", fake::output("", 1, "sbatch: error: Batch job submission failed: "
                                                     "Invalid account or account/partition combination specified\n"));

    auto r = service.submit("job1");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.code, "SLURM_001");
    EXPECT_EQ(cache.find("job1")->state, JobState::Created);
    EXPECT_TRUE(cache.find("job1")->slurm_job_id.empty());
}

TEST_F(ClusterServiceTest, CancelActiveJob) {
    ASSERT_TRUE(service.create_job("job1").is_ok());
    ASSERT_TRUE(service.submit("job1").is_ok());

    auto r = service.cancel("job1");
    ASSERT_TRUE(r.is_ok()) << r.error.to_string();
    EXPECT_EQ(r.value.state, JobState::Cancelled);
    EXPECT_FALSE(r.value.completed_at.empty());
    EXPECT_EQ(cluster->commands_containing("scancel 12345678").size(), 1u);

    // Terminal: nothing more is sent
    auto again = service.cancel("job1");
    ASSERT_TRUE(again.is_ok());
    EXPECT_EQ(cluster->commands_containing("scancel").size(), 1u);
}

TEST_F(ClusterServiceTest, CancelAfterCompletionKeepsRealOutcome) {
    ASSERT_TRUE(service.create_job("job1").is_ok());
    ASSERT_TRUE(service.submit("job1").is_ok());
    slurm.finish("12345678", "job1", "COMPLETED");

    auto r = service.cancel("job1");
    ASSERT_TRUE(r.is_ok()) << r.error.to_string();
    EXPECT_EQ(r.value.state, JobState::Pending);
    EXPECT_EQ(cache.find("job1")->state, JobState::Pending);

    ASSERT_TRUE(service.sync().is_ok());
    EXPECT_EQ(cache.find("job1")->state, JobState::Completed);
}

TEST_F(ClusterServiceTest, DeleteRemovesRemoteTrees) {
    ASSERT_TRUE(service.create_job("job1").is_ok());
    ASSERT_TRUE(service.submit("job1").is_ok());

    auto r = service.delete_job("job1", true);
    ASSERT_TRUE(r.is_ok()) << r.error.to_string();
    EXPECT_EQ(cluster->commands_containing("scancel").size(), 1u);
    EXPECT_EQ(cluster->commands_containing("rm -rf").size(), 2u);
    EXPECT_FALSE(cluster->has_dir(std::string(PROJECT) + "/job1"));
    EXPECT_FALSE(cluster->has_file(std::string(PROJECT) + "/job1/job_info.json"));
    EXPECT_FALSE(cache.find("job1").has_value());
}

TEST(ClusterServiceConfig, RemoteDeleteUsesCommandTimeout) {
    auto config = Config::parse(
        "cluster:\n"
        "  host: login.example.edu\n"
        "  username: testuser\n"
        "timeouts:\n"
        "  command: 1\n"
        "  slurm: 30\n");
    ASSERT_TRUE(config.is_ok());

    fake::Slurm slurm;
    auto cluster = std::make_shared<fake::Cluster>();
    auto connector = std::make_shared<fake::Connector>(cluster);
    MemoryJobCache cache;
    ClusterService service{config.value, connector, cache};
    service.executor().set_retry_hooks(fake::instant_retry_hooks());
    slurm.install(*cluster);
    ASSERT_TRUE(service.connect(fake::password()).is_ok());
    ASSERT_TRUE(service.create_job("job1").is_ok());

    cluster->exec_delay = std::chrono::milliseconds(1500);
    auto r = service.delete_job("job1", true);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::Timeout);
    EXPECT_TRUE(cache.find("job1").has_value());
}

TEST_F(ClusterServiceTest, DeleteKeepsRemoteByDefault) {
    ASSERT_TRUE(service.create_job("job1").is_ok());
    ASSERT_TRUE(service.delete_job("job1", false).is_ok());
    EXPECT_TRUE(cluster->commands_containing("rm -rf").empty());
    EXPECT_TRUE(cluster->has_file(std::string(PROJECT) + "/job1/job_info.json"));
    EXPECT_FALSE(cache.find("job1").has_value());
}

TEST_F(ClusterServiceTest, DeleteRefusesForeignDirectory) {
    JobRecord job;
    job.job_id = "odd";
    job.job_name = "odd";
    job.state = JobState::Completed;
    job.project_dir = "/home/testuser";
    ASSERT_TRUE(cache.upsert(job).is_ok());

    auto r = service.delete_job("odd", true);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::Validation);
    EXPECT_TRUE(cluster->commands_containing("rm -rf").empty());
    EXPECT_TRUE(cache.find("odd").has_value());
}

TEST_F(ClusterServiceTest, FetchLogsMissingFileIsEmpty) {
    ASSERT_TRUE(service.create_job("job1", "test_job").is_ok());
    EXPECT_TRUE(service.fetch_logs("job1").is_err());

    ASSERT_TRUE(service.submit("job1").is_ok());
    cluster->put_file(std::string(SCRATCH) + "/job1/test_job_12345678.out", "Info: step 100\n");

    auto logs = service.fetch_logs("job1");
    ASSERT_TRUE(logs.is_ok()) << logs.error.to_string();
    EXPECT_EQ(logs.value.stdout_text, "Info: step 100\n");
    EXPECT_EQ(logs.value.stderr_text, "");
}

TEST_F(ClusterServiceTest, SyncPullsSchedulerState) {
    ASSERT_TRUE(service.create_job("job1").is_ok());
    ASSERT_TRUE(service.submit("job1").is_ok());
    slurm.active["12345678"] = fake::squeue_line("12345678", "job1", "R");

    auto r = service.sync();
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.jobs_updated, 1);
    EXPECT_EQ(cache.find("job1")->state, JobState::Running);
}

TEST_F(ClusterServiceTest, ListJobsOldestFirst) {
    JobRecord newer;
    newer.job_id = "b_job";
    newer.created_at = "2025-02-01T00:00:00Z";
    JobRecord older;
    older.job_id = "z_job";
    older.created_at = "2025-01-01T00:00:00Z";
    ASSERT_TRUE(cache.upsert(newer).is_ok());
    ASSERT_TRUE(cache.upsert(older).is_ok());

    auto jobs = service.list_jobs();
    ASSERT_EQ(jobs.size(), 2u);
    EXPECT_EQ(jobs[0].job_id, "z_job");
    EXPECT_EQ(jobs[1].job_id, "b_job");
}

TEST_F(ClusterServiceTest, ListenersReceiveEventsUntilUnsubscribed) {
    std::vector<ServiceEvent> events;
    auto token = service.subscribe([&](const ServiceEvent& e) { events.push_back(e); });

    ASSERT_TRUE(service.create_job("job1").is_ok());
    bool changed = false;
    for (const auto& e : events) {
        if (e.kind == ServiceEvent::Kind::JobChanged && e.job_id == "job1") changed = true;
    }
    EXPECT_TRUE(changed);

    service.unsubscribe(token);
    std::size_t seen = events.size();
    ASSERT_TRUE(service.create_job("job2").is_ok());
    EXPECT_EQ(events.size(), seen);
}

TEST_F(ClusterServiceTest, UploadRejectsUnsafeRemotePath) {
    auto r = service.upload("/nonexistent", "/projects/testuser/../../etc/passwd");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::Validation);
}

TEST_F(ClusterServiceTest, DisconnectEmitsConnectionEvent) {
    std::vector<ServiceEvent> events;
    service.subscribe([&](const ServiceEvent& e) { events.push_back(e); });
    service.disconnect();
    EXPECT_EQ(service.get_status().state, ConnectionState::Disconnected);
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().kind, ServiceEvent::Kind::Connection);
}
