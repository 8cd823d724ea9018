#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <clusterlink/core/job.hpp>
#include <clusterlink/core/types.hpp>

namespace clusterlink {

namespace fs = std::filesystem;

// Local job store keyed by job id.
class JobCache {
public:
    virtual ~JobCache() = default;

    virtual Result<void> upsert(const JobRecord& job) = 0;
    virtual std::optional<JobRecord> find(const std::string& job_id) const = 0;
    virtual std::vector<JobRecord> list() const = 0;
    // Removing an unknown id is not an error.
    virtual Result<void> remove(const std::string& job_id) = 0;

    std::optional<JobRecord> find_by_slurm_id(const std::string& slurm_job_id) const;
    bool empty() const { return list().empty(); }
};

class MemoryJobCache : public JobCache {
public:
    Result<void> upsert(const JobRecord& job) override;
    std::optional<JobRecord> find(const std::string& job_id) const override;
    std::vector<JobRecord> list() const override;
    Result<void> remove(const std::string& job_id) override;

    // upsert + remove calls so far
    int write_count() const;

protected:
    mutable std::mutex mutex_;
    std::map<std::string, JobRecord> jobs_;
    int writes_ = 0;
};

// MemoryJobCache persisted to a YAML file after every write.
class FileJobCache : public MemoryJobCache {
public:
    explicit FileJobCache(fs::path path);

    // ~/.clusterlink/state/jobs.yaml
    static fs::path default_path();

    // Read the file; a missing file is an empty cache.
    Result<void> load();

    Result<void> upsert(const JobRecord& job) override;
    Result<void> remove(const std::string& job_id) override;

    const fs::path& path() const { return path_; }

private:
    // Writes the given snapshot; jobs_ is committed only after it succeeds.
    // Caller holds mutex_
    Result<void> save_locked(const std::map<std::string, JobRecord>& jobs) const;

    fs::path path_;
};

} // namespace clusterlink
