#include "job_cache.hpp"
#include "job_metadata.hpp"
#include <clusterlink/core/log.hpp>
#include <clusterlink/platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>

namespace clusterlink {

std::optional<JobRecord> JobCache::find_by_slurm_id(const std::string& slurm_job_id) const {
    if (slurm_job_id.empty()) return std::nullopt;
    for (const auto& job : list()) {
        if (job.slurm_job_id == slurm_job_id) return job;
    }
    return std::nullopt;
}

// ── MemoryJobCache ──────────────────────────────────────────

Result<void> MemoryJobCache::upsert(const JobRecord& job) {
    if (job.job_id.empty()) {
        return Result<void>::Err(ErrorKind::Validation, "Invalid job id: must not be empty");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    jobs_[job.job_id] = job;
    writes_++;
    return Result<void>::Ok();
}

std::optional<JobRecord> MemoryJobCache::find(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) return std::nullopt;
    return it->second;
}

std::vector<JobRecord> MemoryJobCache::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<JobRecord> out;
    out.reserve(jobs_.size());
    for (const auto& [id, job] : jobs_) out.push_back(job);
    return out;
}

Result<void> MemoryJobCache::remove(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (jobs_.erase(job_id) > 0) writes_++;
    return Result<void>::Ok();
}

int MemoryJobCache::write_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return writes_;
}

// ── FileJobCache ────────────────────────────────────────────

FileJobCache::FileJobCache(fs::path path) : path_(std::move(path)) {}

fs::path FileJobCache::default_path() {
    return platform::app_dir() / "state" / "jobs.yaml";
}

Result<void> FileJobCache::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    jobs_.clear();

    std::error_code ec;
    if (!fs::exists(path_, ec)) return Result<void>::Ok();

    try {
        YAML::Node root = YAML::LoadFile(path_.string());
        if (root["jobs"] && root["jobs"].IsSequence()) {
            for (const auto& n : root["jobs"]) {
                auto job = job_record_from_node(n);
                if (job.is_err()) {
                    // Skip it, keep the rest
                    cl_log(fmt::format("job cache: skipping entry in {}: {}", path_.string(),
                                       job.error.to_string()));
                    continue;
                }
                jobs_[job.value.job_id] = job.value;
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<void>::Err(make_error(ErrorKind::FileSystem,
                                            fmt::format("Corrupt job cache {}: {}", path_.string(), e.what())));
    }
    return Result<void>::Ok();
}

Result<void> FileJobCache::save_locked(const std::map<std::string, JobRecord>& jobs) const {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "jobs" << YAML::Value << YAML::BeginSeq;
    for (const auto& [id, job] : jobs) {
        out << YAML::BeginMap;
        emit_job_record_fields(out, job);
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    std::error_code ec;
    fs::create_directories(path_.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::FileSystem,
                                 fmt::format("Cannot create {}: {}", path_.parent_path().string(), ec.message()));
    }

    // Write-then-rename: readers see the old file or the new one
    fs::path tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream fout(tmp.string(), std::ios::trunc);
        if (!fout) {
            return Result<void>::Err(ErrorKind::FileSystem, "Cannot write " + tmp.string());
        }
        fout << out.c_str() << "\n";
        if (!fout) {
            return Result<void>::Err(ErrorKind::FileSystem, "Write failed: " + tmp.string());
        }
    }
    fs::rename(tmp, path_, ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::FileSystem,
                                 fmt::format("Cannot replace {}: {}", path_.string(), ec.message()));
    }
    return Result<void>::Ok();
}

Result<void> FileJobCache::upsert(const JobRecord& job) {
    if (job.job_id.empty()) {
        return Result<void>::Err(ErrorKind::Validation, "Invalid job id: must not be empty");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto next = jobs_;
    next[job.job_id] = job;
    auto saved = save_locked(next);
    if (saved.is_err()) return saved;
    jobs_ = std::move(next);
    writes_++;
    return saved;
}

Result<void> FileJobCache::remove(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!jobs_.count(job_id)) return Result<void>::Ok();
    auto next = jobs_;
    next.erase(job_id);
    auto saved = save_locked(next);
    if (saved.is_err()) return saved;
    jobs_ = std::move(next);
    writes_++;
    return saved;
}

} // namespace clusterlink
