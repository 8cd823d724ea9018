#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <clusterlink/core/config.hpp>
#include <clusterlink/core/credentials.hpp>
#include <clusterlink/core/job.hpp>
#include <clusterlink/ssh/connection_manager.hpp>
#include "executor.hpp"
#include "job_cache.hpp"
#include "reconciler.hpp"
#include "scheduler.hpp"
#include "transfer.hpp"

namespace clusterlink {

namespace fs = std::filesystem;

// Events for UI consumption.
struct ServiceEvent {
    enum class Kind { Status, Progress, JobChanged, Connection };

    Kind kind = Kind::Status;
    std::string message;
    std::string job_id;                         // JobChanged
    std::optional<TransferProgress> progress;   // Progress
};

using EventListener = std::function<void(const ServiceEvent&)>;

struct JobLogs {
    std::string stdout_text;
    std::string stderr_text;
};

// True when `dir` may be removed with rm -rf: it names the job base
// directory, has no "..", and lies strictly below one of `bases`.
bool is_safe_delete_path(const std::string& dir, const std::vector<std::string>& bases);

// Headless service facade. Owns the session and every manager, and can be
// driven by any frontend.
class ClusterService {
public:
    ClusterService(Config config, std::shared_ptr<TransportConnector> connector, JobCache& cache);
    ~ClusterService();

    ClusterService(const ClusterService&) = delete;
    ClusterService& operator=(const ClusterService&) = delete;

    // ── Connection lifecycle ──────────────────────────────────

    Result<SessionInfo> connect(SecureCredential credential, StatusCallback cb = nullptr);
    void disconnect();
    ConnectionStatus get_status() const;
    bool check_alive();

    // ── Job operations ────────────────────────────────────────

    // Remote directory trees plus job_info.json, then a Created cache record.
    Result<JobRecord> create_job(const std::string& job_id, const std::string& job_name = "",
                                 StatusCallback cb = nullptr);

    // Mirror project -> scratch and sbatch. Allowed from Created or Failed.
    Result<JobRecord> submit(const std::string& job_id, StatusCallback cb = nullptr);

    Result<JobRecord> cancel(const std::string& job_id, StatusCallback cb = nullptr);

    // Cancels an active job first. delete_remote also removes both job directories.
    Result<void> delete_job(const std::string& job_id, bool delete_remote, StatusCallback cb = nullptr);

    Result<SyncReport> sync(StatusCallback cb = nullptr);

    // SLURM stdout/stderr files; a file that does not exist yet reads as empty.
    Result<JobLogs> fetch_logs(const std::string& job_id);

    // Cache snapshot, oldest first.
    std::vector<JobRecord> list_jobs() const;

    // ── Files ─────────────────────────────────────────────────

    Result<uint64_t> upload(const fs::path& local, const std::string& remote,
                            ProgressCallback progress = nullptr);
    Result<uint64_t> download(const std::string& remote, const fs::path& local,
                              ProgressCallback progress = nullptr);
    Result<std::vector<RemoteFileInfo>> list_files(const std::string& remote_dir);

    // ── Events ────────────────────────────────────────────────

    uint64_t subscribe(EventListener listener);
    void unsubscribe(uint64_t token);

    // ── Accessors ─────────────────────────────────────────────

    const Config& config() const { return config_; }
    Executor& executor() { return executor_; }
    JobCache& cache() { return cache_; }

private:
    // Base directories for the connected user.
    Result<std::pair<std::string, std::string>> remote_bases() const;

    StatusCallback status_sink(StatusCallback cb, const std::string& job_id = "");
    void emit(const ServiceEvent& event);
    void notify_job(const JobRecord& job);

    // Rewrite job_info.json; failures are logged and returned.
    Result<void> write_metadata(const JobRecord& job);

    Result<JobRecord> find_job(const std::string& job_id) const;

    Config config_;
    JobCache& cache_;

    // Declaration order matters: everything below uses connection_.
    ConnectionManager connection_;
    Executor executor_;
    Scheduler scheduler_;
    TransferEngine transfer_;
    Reconciler reconciler_;

    std::mutex listeners_mutex_;
    std::map<uint64_t, EventListener> listeners_;
    uint64_t next_token_ = 1;
};

} // namespace clusterlink
