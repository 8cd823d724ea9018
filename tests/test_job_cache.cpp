#include <gtest/gtest.h>
#include <clusterlink/managers/job_cache.hpp>
#include <filesystem>
#include <fstream>

using namespace clusterlink;
namespace fs = std::filesystem;

static JobRecord make_job(const std::string& id, JobState state, const std::string& slurm_id = "") {
    JobRecord job;
    job.job_id = id;
    job.job_name = id;
    job.state = state;
    job.slurm_job_id = slurm_id;
    job.created_at = "2025-01-15T09:00:00Z";
    return job;
}

TEST(MemoryJobCache, UpsertFindRemove) {
    MemoryJobCache cache;
    EXPECT_TRUE(cache.empty());

    ASSERT_TRUE(cache.upsert(make_job("a", JobState::Created)).is_ok());
    ASSERT_TRUE(cache.upsert(make_job("b", JobState::Running, "100")).is_ok());
    EXPECT_EQ(cache.list().size(), 2u);
    EXPECT_EQ(cache.find("a")->state, JobState::Created);
    EXPECT_FALSE(cache.find("zzz").has_value());

    ASSERT_TRUE(cache.upsert(make_job("a", JobState::Pending, "101")).is_ok());
    EXPECT_EQ(cache.find("a")->state, JobState::Pending);
    EXPECT_EQ(cache.list().size(), 2u);

    EXPECT_EQ(cache.find_by_slurm_id("100")->job_id, "b");
    EXPECT_FALSE(cache.find_by_slurm_id("").has_value());

    ASSERT_TRUE(cache.remove("a").is_ok());
    ASSERT_TRUE(cache.remove("a").is_ok());
    EXPECT_FALSE(cache.find("a").has_value());
    EXPECT_EQ(cache.write_count(), 4);
}

TEST(MemoryJobCache, RejectsEmptyId) {
    MemoryJobCache cache;
    EXPECT_TRUE(cache.upsert(make_job("", JobState::Created)).is_err());
    EXPECT_EQ(cache.write_count(), 0);
}

class FileJobCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        path = fs::temp_directory_path() / "clusterlink_cache_test" /
               (std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) + ".yaml");
        fs::remove(path);
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(path.parent_path(), ec);
    }

    fs::path path;
};

TEST_F(FileJobCacheTest, MissingFileIsEmpty) {
    FileJobCache cache(path);
    ASSERT_TRUE(cache.load().is_ok());
    EXPECT_TRUE(cache.empty());
}

TEST_F(FileJobCacheTest, PersistsAcrossInstances) {
    JobRecord job = make_job("j1", JobState::Running, "12345678");
    job.project_dir = "/projects/u/namdrunner_jobs/j1";
    job.error_info = "quote: \"x\"";
    {
        FileJobCache cache(path);
        ASSERT_TRUE(cache.load().is_ok());
        ASSERT_TRUE(cache.upsert(job).is_ok());
        ASSERT_TRUE(cache.upsert(make_job("j2", JobState::Completed)).is_ok());
        ASSERT_TRUE(cache.remove("j2").is_ok());
    }
    EXPECT_TRUE(fs::exists(path));

    FileJobCache reopened(path);
    ASSERT_TRUE(reopened.load().is_ok());
    ASSERT_EQ(reopened.list().size(), 1u);
    EXPECT_EQ(*reopened.find("j1"), job);
}

TEST_F(FileJobCacheTest, CorruptFileIsError) {
    fs::create_directories(path.parent_path());
    {
        std::ofstream out(path);
        out << "jobs: [ {job_id: a\n";
    }
    FileJobCache cache(path);
    auto r = cache.load();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error.kind, ErrorKind::FileSystem);
}

TEST_F(FileJobCacheTest, BadEntrySkipped) {
    fs::create_directories(path.parent_path());
    {
        std::ofstream out(path);
        out << "jobs:\n  - job_id: good\n    state: PENDING\n  - job_name: no_id\n";
    }
    FileJobCache cache(path);
    ASSERT_TRUE(cache.load().is_ok());
    ASSERT_EQ(cache.list().size(), 1u);
    EXPECT_EQ(cache.find("good")->state, JobState::Pending);
}

TEST_F(FileJobCacheTest, FailedSaveLeavesCacheUnchanged) {
    FileJobCache cache(path);
    ASSERT_TRUE(cache.load().is_ok());
    ASSERT_TRUE(cache.upsert(make_job("j1", JobState::Pending, "100")).is_ok());
    int writes = cache.write_count();

    // A directory where the temp file goes makes every save fail
    fs::path tmp = path;
    tmp += ".tmp";
    fs::create_directories(tmp);

    auto updated = cache.upsert(make_job("j1", JobState::Running, "100"));
    ASSERT_TRUE(updated.is_err());
    EXPECT_EQ(updated.error.kind, ErrorKind::FileSystem);
    EXPECT_EQ(cache.find("j1")->state, JobState::Pending);

    EXPECT_TRUE(cache.upsert(make_job("j2", JobState::Created)).is_err());
    EXPECT_FALSE(cache.find("j2").has_value());

    EXPECT_TRUE(cache.remove("j1").is_err());
    EXPECT_TRUE(cache.find("j1").has_value());
    EXPECT_EQ(cache.write_count(), writes);

    FileJobCache reopened(path);
    ASSERT_TRUE(reopened.load().is_ok());
    EXPECT_EQ(reopened.find("j1")->state, JobState::Pending);
}
