#include "cluster_service.hpp"
#include "job_metadata.hpp"
#include <clusterlink/core/log.hpp>
#include <clusterlink/core/utils.hpp>
#include <clusterlink/core/validation.hpp>
#include <fmt/format.h>
#include <algorithm>

namespace clusterlink {

static Error not_connected_error() {
    return make_error(ErrorKind::Authentication, "Please connect to the cluster first", "AUTH_002");
}

bool is_safe_delete_path(const std::string& dir, const std::vector<std::string>& bases) {
    if (dir.find(JOB_BASE_DIRECTORY) == std::string::npos) return false;
    if (dir.find("..") != std::string::npos) return false;

    for (const auto& base : bases) {
        if (base.empty()) continue;
        std::string prefix = base.back() == '/' ? base : base + "/";
        if (dir.size() > prefix.size() && starts_with(dir, prefix)) return true;
    }
    return false;
}

ClusterService::ClusterService(Config config, std::shared_ptr<TransportConnector> connector,
                               JobCache& cache)
    : config_(std::move(config)),
      cache_(cache),
      connection_(std::move(connector)),
      executor_(connection_, config_.worker_threads()),
      scheduler_(executor_,
                 SchedulerTimeouts{config_.timeouts().slurm, config_.timeouts().submit},
                 config_.retry().network),
      transfer_(executor_,
                TransferSettings{config_.chunk_size(), config_.timeouts().chunk,
                                 config_.timeouts().quick, config_.retry().files,
                                 config_.retry().quick}),
      reconciler_(cache_, scheduler_, transfer_) {}

ClusterService::~ClusterService() {
    disconnect();
    executor_.shutdown();
}

// ── Connection lifecycle ──────────────────────────────────────

Result<SessionInfo> ClusterService::connect(SecureCredential credential, StatusCallback cb) {
    const auto& cluster = config_.cluster();
    if (cluster.host.empty() || cluster.username.empty()) {
        credential.clear();
        return Result<SessionInfo>::Err(ErrorKind::Validation,
            "No cluster configured. Set cluster.host and cluster.username in " +
            get_global_config_path().string());
    }

    SessionTarget target;
    target.host = cluster.host;
    target.port = cluster.port;
    target.username = cluster.username;
    target.connect_timeout = cluster.connect_timeout;
    target.keepalive_interval = cluster.keepalive_interval;

    auto result = connection_.connect(target, std::move(credential), status_sink(cb));
    if (result.is_ok()) {
        emit({ServiceEvent::Kind::Connection,
              fmt::format("Connected to {} as {}", result.value.host, result.value.username), "", {}});
    } else {
        emit({ServiceEvent::Kind::Connection, result.error.to_string(), "", {}});
    }
    return result;
}

void ClusterService::disconnect() {
    if (connection_.state() == ConnectionState::Disconnected) return;
    connection_.disconnect();
    emit({ServiceEvent::Kind::Connection, "Disconnected", "", {}});
}

ConnectionStatus ClusterService::get_status() const {
    return connection_.status();
}

bool ClusterService::check_alive() {
    return connection_.check_alive();
}

Result<std::pair<std::string, std::string>> ClusterService::remote_bases() const {
    std::string user = connection_.username();
    if (user.empty()) return Result<std::pair<std::string, std::string>>::Err(not_connected_error());
    return Result<std::pair<std::string, std::string>>::Ok(
        {config_.project_base(user), config_.scratch_base(user)});
}

// ── Events ────────────────────────────────────────────────────

uint64_t ClusterService::subscribe(EventListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    uint64_t token = next_token_++;
    listeners_[token] = std::move(listener);
    return token;
}

void ClusterService::unsubscribe(uint64_t token) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.erase(token);
}

void ClusterService::emit(const ServiceEvent& event) {
    std::vector<EventListener> targets;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        for (const auto& [token, listener] : listeners_) targets.push_back(listener);
    }
    for (const auto& listener : targets) listener(event);
}

StatusCallback ClusterService::status_sink(StatusCallback cb, const std::string& job_id) {
    return [this, cb, job_id](const std::string& msg) {
        cl_log(msg);
        if (!job_id.empty()) append_job_log(job_id, msg);
        if (cb) cb(msg);
        emit({ServiceEvent::Kind::Status, msg, job_id, {}});
    };
}

void ClusterService::notify_job(const JobRecord& job) {
    emit({ServiceEvent::Kind::JobChanged,
          fmt::format("{} is {}", job.job_id, job_state_name(job.state)), job.job_id, {}});
}

// ── Job operations ────────────────────────────────────────────

Result<JobRecord> ClusterService::find_job(const std::string& job_id) const {
    auto id = sanitize_identifier(job_id);
    if (id.is_err()) return Result<JobRecord>::Err(id.error);

    auto job = cache_.find(id.value);
    if (!job) {
        return Result<JobRecord>::Err(ErrorKind::Validation, "Job '" + id.value + "' not found");
    }
    return Result<JobRecord>::Ok(*job);
}

Result<void> ClusterService::write_metadata(const JobRecord& job) {
    auto result = transfer_.write_text(job_info_path(job.project_dir), job_info_json(job));
    if (result.is_err()) {
        cl_log_error("metadata " + job.job_id, result.error);
    }
    return result;
}

Result<JobRecord> ClusterService::create_job(const std::string& job_id, const std::string& job_name,
                                             StatusCallback cb) {
    auto id = sanitize_identifier(job_id);
    if (id.is_err()) return Result<JobRecord>::Err(id.error);
    auto name = sanitize_identifier(job_name.empty() ? job_id : job_name);
    if (name.is_err()) return Result<JobRecord>::Err(name.error);

    if (cache_.find(id.value)) {
        return Result<JobRecord>::Err(ErrorKind::Validation, "Job '" + id.value + "' already exists");
    }

    auto bases = remote_bases();
    if (bases.is_err()) return Result<JobRecord>::Err(bases.error);

    auto status = status_sink(cb, id.value);

    JobRecord job;
    job.job_id = id.value;
    job.job_name = name.value;
    job.state = JobState::Created;
    job.created_at = now_iso();
    job.updated_at = job.created_at;
    job.project_dir = bases.value.first + "/" + id.value;
    job.scratch_dir = bases.value.second + "/" + id.value;

    status("Creating job directories...");
    for (const auto& root : {job.project_dir, job.scratch_dir}) {
        for (const char* sub : {INPUT_FILES_DIR, SCRIPTS_DIR, OUTPUTS_DIR}) {
            auto made = transfer_.create_directory(root + "/" + sub);
            if (made.is_err()) return Result<JobRecord>::Err(made.error);
        }
    }

    auto written = write_metadata(job);
    if (written.is_err()) return Result<JobRecord>::Err(written.error);

    auto stored = cache_.upsert(job);
    if (stored.is_err()) return Result<JobRecord>::Err(stored.error);

    status(fmt::format("Created job {}", job.job_id));
    notify_job(job);
    return Result<JobRecord>::Ok(job);
}

Result<JobRecord> ClusterService::submit(const std::string& job_id, StatusCallback cb) {
    auto found = find_job(job_id);
    if (found.is_err()) return found;
    JobRecord job = found.value;

    if (job.state != JobState::Created && job.state != JobState::Failed) {
        return Result<JobRecord>::Err(ErrorKind::Validation,
            fmt::format("Job '{}' is {}; only CREATED or FAILED jobs can be submitted",
                        job.job_id, job_state_name(job.state)));
    }
    if (job.project_dir.empty() || job.scratch_dir.empty()) {
        return Result<JobRecord>::Err(ErrorKind::Validation,
                                      "Job '" + job.job_id + "' has no remote directories");
    }

    auto status = status_sink(cb, job.job_id);

    status("Syncing project files to scratch...");
    std::string rsync = fmt::format("rsync -az {} {}", escape_for_command(job.project_dir + "/"),
                                    escape_for_command(job.scratch_dir + "/"));
    auto mirrored = executor_.run_with_retry(rsync, config_.timeouts().rsync, config_.retry().network);
    if (mirrored.is_err()) return Result<JobRecord>::Err(mirrored.error);

    status("Submitting to SLURM...");
    auto slurm_id = scheduler_.submit(job.scratch_dir, JOB_SCRIPT_FILE);
    if (slurm_id.is_err()) {
        status("Submission failed: " + slurm_id.error.message);
        return Result<JobRecord>::Err(slurm_id.error);
    }

    job.state = JobState::Pending;
    job.slurm_job_id = slurm_id.value;
    job.submitted_at = now_iso();
    job.updated_at = job.submitted_at;
    job.completed_at.clear();
    job.error_info.clear();

    // The job is queued either way; a stale metadata file is fixed by the next sync
    (void)write_metadata(job);

    auto stored = cache_.upsert(job);
    if (stored.is_err()) return Result<JobRecord>::Err(stored.error);

    status(fmt::format("Submitted batch job {}", job.slurm_job_id));
    notify_job(job);
    return Result<JobRecord>::Ok(job);
}

Result<JobRecord> ClusterService::cancel(const std::string& job_id, StatusCallback cb) {
    auto found = find_job(job_id);
    if (found.is_err()) return found;
    JobRecord job = found.value;

    if (is_terminal(job.state)) return Result<JobRecord>::Ok(job);

    auto status = status_sink(cb, job.job_id);

    if (is_active(job.state) && !job.slurm_job_id.empty()) {
        status(fmt::format("Cancelling SLURM job {}...", job.slurm_job_id));
        auto cancelled = scheduler_.cancel(job.slurm_job_id, job.state);
        if (cancelled.is_err()) return Result<JobRecord>::Err(cancelled.error);
        if (!cancelled.value) {
            // It ended on its own; the next sync records how
            status("Job already finished; run sync to see its final state");
            return Result<JobRecord>::Ok(job);
        }
    }

    job.state = JobState::Cancelled;
    job.updated_at = now_iso();
    job.completed_at = job.updated_at;

    if (!job.project_dir.empty() && connection_.is_connected()) {
        (void)write_metadata(job);
    }

    auto stored = cache_.upsert(job);
    if (stored.is_err()) return Result<JobRecord>::Err(stored.error);

    status("Job cancelled");
    notify_job(job);
    return Result<JobRecord>::Ok(job);
}

Result<void> ClusterService::delete_job(const std::string& job_id, bool delete_remote, StatusCallback cb) {
    auto found = find_job(job_id);
    if (found.is_err()) return Result<void>::Err(found.error);
    JobRecord job = found.value;

    if (is_active(job.state)) {
        auto cancelled = cancel(job.job_id, cb);
        if (cancelled.is_err()) return Result<void>::Err(cancelled.error);
    }

    auto status = status_sink(cb, job.job_id);

    if (delete_remote) {
        auto bases = remote_bases();
        if (bases.is_err()) return Result<void>::Err(bases.error);
        std::vector<std::string> allowed = {bases.value.first, bases.value.second};

        for (const auto& dir : {job.project_dir, job.scratch_dir}) {
            if (dir.empty()) continue;
            if (!is_safe_delete_path(dir, allowed)) {
                return Result<void>::Err(ErrorKind::Validation,
                                         "Refusing to delete '" + dir + "': not a job directory");
            }
            status("Removing " + dir);
            auto removed = executor_.run_with_retry("rm -rf " + escape_for_command(dir),
                                                    config_.timeouts().command, config_.retry().quick);
            if (removed.is_err()) return Result<void>::Err(removed.error);
        }
    }

    auto erased = cache_.remove(job.job_id);
    if (erased.is_err()) return erased;

    cl_log(fmt::format("delete: job {} removed (remote={})", job.job_id, delete_remote));
    emit({ServiceEvent::Kind::JobChanged, job.job_id + " deleted", job.job_id, {}});
    return Result<void>::Ok();
}

Result<SyncReport> ClusterService::sync(StatusCallback cb) {
    auto bases = remote_bases();
    if (bases.is_err()) return Result<SyncReport>::Err(bases.error);

    SyncReport report = reconciler_.sync(bases.value.first, status_sink(cb));
    if (report.jobs_updated > 0 || report.discovered > 0) {
        emit({ServiceEvent::Kind::JobChanged,
              fmt::format("{} job(s) updated, {} discovered", report.jobs_updated, report.discovered),
              "", {}});
    }
    return Result<SyncReport>::Ok(report);
}

Result<JobLogs> ClusterService::fetch_logs(const std::string& job_id) {
    auto found = find_job(job_id);
    if (found.is_err()) return Result<JobLogs>::Err(found.error);
    const JobRecord& job = found.value;

    if (job.slurm_job_id.empty()) {
        return Result<JobLogs>::Err(ErrorKind::Validation, "Job '" + job.job_id + "' has not been submitted");
    }

    std::string stem = fmt::format("{}/{}_{}", job.scratch_dir, job.job_name, job.slurm_job_id);
    JobLogs logs;

    auto out = transfer_.read_text(stem + ".out");
    if (out.is_ok()) {
        logs.stdout_text = out.value;
    } else if (out.error.code != "FILE_001") {
        return Result<JobLogs>::Err(out.error);
    }

    auto err = transfer_.read_text(stem + ".err");
    if (err.is_ok()) {
        logs.stderr_text = err.value;
    } else if (err.error.code != "FILE_001") {
        return Result<JobLogs>::Err(err.error);
    }

    return Result<JobLogs>::Ok(logs);
}

std::vector<JobRecord> ClusterService::list_jobs() const {
    auto jobs = cache_.list();
    std::stable_sort(jobs.begin(), jobs.end(), [](const JobRecord& a, const JobRecord& b) {
        return a.created_at < b.created_at;
    });
    return jobs;
}

// ── Files ─────────────────────────────────────────────────────

Result<uint64_t> ClusterService::upload(const fs::path& local, const std::string& remote,
                                        ProgressCallback progress) {
    auto path = validate_remote_path(remote);
    if (path.is_err()) return Result<uint64_t>::Err(path.error);

    return transfer_.upload(local, path.value, [this, progress](const TransferProgress& p) {
        if (progress) progress(p);
        emit({ServiceEvent::Kind::Progress, p.file_name, "", p});
    });
}

Result<uint64_t> ClusterService::download(const std::string& remote, const fs::path& local,
                                          ProgressCallback progress) {
    auto path = validate_remote_path(remote);
    if (path.is_err()) return Result<uint64_t>::Err(path.error);

    return transfer_.download(path.value, local, [this, progress](const TransferProgress& p) {
        if (progress) progress(p);
        emit({ServiceEvent::Kind::Progress, p.file_name, "", p});
    });
}

Result<std::vector<RemoteFileInfo>> ClusterService::list_files(const std::string& remote_dir) {
    auto path = validate_remote_path(remote_dir);
    if (path.is_err()) return Result<std::vector<RemoteFileInfo>>::Err(path.error);
    return transfer_.list_directory(path.value);
}

} // namespace clusterlink
