#pragma once

#include <string>
#include <filesystem>
#include <cstddef>
#include "types.hpp"
#include "constants.hpp"
#include "retry_policy.hpp"

namespace clusterlink {

namespace fs = std::filesystem;

struct ClusterConfig {
    std::string host;
    int port = 22;
    std::string username;
    int connect_timeout = CONNECT_TIMEOUT_SECS;
    int keepalive_interval = KEEPALIVE_INTERVAL_SECS;
};

// Remote base directories; "{user}" is replaced with the cluster username.
struct PathsConfig {
    std::string project_base = "/projects/{user}/namdrunner_jobs";
    std::string scratch_base = "/scratch/alpine/{user}/namdrunner_jobs";
};

struct TimeoutConfig {
    int command = COMMAND_TIMEOUT_SECS;
    int slurm = SLURM_TIMEOUT_SECS;
    int submit = SUBMIT_TIMEOUT_SECS;
    int quick = QUICK_TIMEOUT_SECS;
    int chunk = CHUNK_TIMEOUT_SECS;
    int rsync = RSYNC_TIMEOUT_SECS;
};

struct RetryConfig {
    RetryPolicy quick = RetryPolicy::quick();
    RetryPolicy network = RetryPolicy::network();
    RetryPolicy files = RetryPolicy::files();
};

class Config {
public:
    // Load ~/.clusterlink/config.yaml. A missing file yields the defaults.
    static Result<Config> load_global();

    // Load from an explicit path (must exist).
    static Result<Config> load_file(const fs::path& path);

    // Parse YAML text.
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const ClusterConfig& cluster() const { return cluster_; }
    const PathsConfig& paths() const { return paths_; }
    const TimeoutConfig& timeouts() const { return timeouts_; }
    const RetryConfig& retry() const { return retry_; }
    std::size_t chunk_size() const { return chunk_size_; }
    int worker_threads() const { return worker_threads_; }
    const std::string& log_file() const { return log_file_; }

    // Resolved remote bases for a user
    std::string project_base(const std::string& username) const;
    std::string scratch_base(const std::string& username) const;

    Config() = default;

private:
    ClusterConfig cluster_;
    PathsConfig paths_;
    TimeoutConfig timeouts_;
    RetryConfig retry_;
    std::size_t chunk_size_ = TRANSFER_CHUNK_SIZE;
    int worker_threads_ = DEFAULT_WORKER_THREADS;
    std::string log_file_;
};

// Replace every "{user}" in a path template.
std::string expand_user_template(const std::string& tmpl, const std::string& username);

bool global_config_exists();
fs::path get_global_config_dir();
fs::path get_global_config_path();

// Write a commented default config (does not overwrite).
Result<void> create_default_global_config();

} // namespace clusterlink
