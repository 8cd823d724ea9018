#include "config.hpp"
#include <clusterlink/platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>

namespace clusterlink {

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

fs::path get_global_config_dir() {
    return platform::app_dir();
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

std::string expand_user_template(const std::string& tmpl, const std::string& username) {
    static const std::string token = "{user}";
    std::string out = tmpl;
    size_t pos = 0;
    while ((pos = out.find(token, pos)) != std::string::npos) {
        out.replace(pos, token.size(), username);
        pos += username.size();
    }
    return out;
}

std::string Config::project_base(const std::string& username) const {
    return expand_user_template(paths_.project_base, username);
}

std::string Config::scratch_base(const std::string& username) const {
    return expand_user_template(paths_.scratch_base, username);
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    const char* default_config = R"(# clusterlink configuration

cluster:
  host: "login.rc.colorado.edu"
  port: 22
  username: "@LOCAL_USER@"         # cluster account; the password is asked at connect time
  connect_timeout: 30
  keepalive_interval: 30

# Remote job directories. {user} is replaced with the cluster username.
paths:
  project_base: "/projects/{user}/namdrunner_jobs"
  scratch_base: "/scratch/alpine/{user}/namdrunner_jobs"

# Seconds
timeouts:
  command: 120                     # rm -rf of job directories
  slurm: 60
  submit: 30
  quick: 30
  chunk: 60                        # per transfer chunk, not per file
  rsync: 300

transfer:
  chunk_size: 262144

executor:
  workers: 4

# attempts / base_delay_ms / max_delay_ms / jitter_ms
retry:
  quick:   { attempts: 2, base_delay_ms: 200,  max_delay_ms: 2000,  jitter_ms: 100 }
  network: { attempts: 3, base_delay_ms: 1000, max_delay_ms: 30000, jitter_ms: 500 }
  files:   { attempts: 5, base_delay_ms: 2000, max_delay_ms: 60000, jitter_ms: 1000 }

logging:
  file: ""                         # empty = <tmp>/clusterlink_debug.log
)";

    try {
        fs::create_directories(config_path.parent_path());
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err(ErrorKind::FileSystem,
                                     "Failed to create config file at " + config_path.string());
        }
        std::string text = default_config;
        auto slot = text.find("@LOCAL_USER@");
        if (slot != std::string::npos) text.replace(slot, 12, platform::local_username());
        out << text;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err(ErrorKind::FileSystem,
                                 "Failed to write config file: " + std::string(e.what()));
    }
}

// ── Section parsers ─────────────────────────────────────────

static ClusterConfig parse_cluster_config(const YAML::Node& node) {
    ClusterConfig cluster;
    cluster.host = node["host"].as<std::string>("");
    cluster.port = node["port"].as<int>(22);
    cluster.username = node["username"].as<std::string>("");
    cluster.connect_timeout = node["connect_timeout"].as<int>(CONNECT_TIMEOUT_SECS);
    cluster.keepalive_interval = node["keepalive_interval"].as<int>(KEEPALIVE_INTERVAL_SECS);
    return cluster;
}

static PathsConfig parse_paths_config(const YAML::Node& node) {
    PathsConfig paths;
    paths.project_base = node["project_base"].as<std::string>(paths.project_base);
    paths.scratch_base = node["scratch_base"].as<std::string>(paths.scratch_base);
    return paths;
}

static TimeoutConfig parse_timeout_config(const YAML::Node& node) {
    TimeoutConfig t;
    t.command = node["command"].as<int>(t.command);
    t.slurm = node["slurm"].as<int>(t.slurm);
    t.submit = node["submit"].as<int>(t.submit);
    t.quick = node["quick"].as<int>(t.quick);
    t.chunk = node["chunk"].as<int>(t.chunk);
    t.rsync = node["rsync"].as<int>(t.rsync);
    return t;
}

static RetryPolicy parse_retry_policy(const YAML::Node& node, RetryPolicy policy) {
    if (!node || !node.IsMap()) return policy;
    policy.max_attempts = node["attempts"].as<int>(policy.max_attempts);
    policy.base_delay = std::chrono::milliseconds(
        node["base_delay_ms"].as<long long>(policy.base_delay.count()));
    policy.max_delay = std::chrono::milliseconds(
        node["max_delay_ms"].as<long long>(policy.max_delay.count()));
    policy.jitter_bound = std::chrono::milliseconds(
        node["jitter_ms"].as<long long>(policy.jitter_bound.count()));
    return policy;
}

static Result<void> check_ranges(const Config& config) {
    if (config.cluster().port <= 0 || config.cluster().port > 65535) {
        return Result<void>::Err(ErrorKind::Validation,
                                 fmt::format("cluster.port out of range: {}", config.cluster().port));
    }
    if (config.chunk_size() < 1024) {
        return Result<void>::Err(ErrorKind::Validation, "transfer.chunk_size must be at least 1024");
    }
    if (config.worker_threads() < 1) {
        return Result<void>::Err(ErrorKind::Validation, "executor.workers must be at least 1");
    }
    const auto& t = config.timeouts();
    for (int secs : {t.command, t.slurm, t.submit, t.quick, t.chunk, t.rsync}) {
        if (secs <= 0) {
            return Result<void>::Err(ErrorKind::Validation, "timeouts must be positive");
        }
    }
    return Result<void>::Ok();
}

Result<Config> Config::parse(const std::string& yaml_text) {
    Config config;
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (root.IsNull()) return Result<Config>::Ok(config);
        if (!root.IsMap()) {
            return Result<Config>::Err(ErrorKind::Validation, "Config root must be a mapping");
        }

        if (root["cluster"]) config.cluster_ = parse_cluster_config(root["cluster"]);
        if (root["paths"]) config.paths_ = parse_paths_config(root["paths"]);
        if (root["timeouts"]) config.timeouts_ = parse_timeout_config(root["timeouts"]);

        if (root["transfer"]) {
            config.chunk_size_ = root["transfer"]["chunk_size"].as<std::size_t>(TRANSFER_CHUNK_SIZE);
        }
        if (root["executor"]) {
            config.worker_threads_ = root["executor"]["workers"].as<int>(DEFAULT_WORKER_THREADS);
        }
        if (root["retry"]) {
            const auto& r = root["retry"];
            config.retry_.quick = parse_retry_policy(r["quick"], config.retry_.quick);
            config.retry_.network = parse_retry_policy(r["network"], config.retry_.network);
            config.retry_.files = parse_retry_policy(r["files"], config.retry_.files);
        }
        if (root["logging"]) {
            config.log_file_ = root["logging"]["file"].as<std::string>("");
        }
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(ErrorKind::Validation, "Invalid config: " + std::string(e.what()));
    }

    auto ranges = check_ranges(config);
    if (ranges.is_err()) return Result<Config>::Err(ranges.error);
    return Result<Config>::Ok(config);
}

Result<Config> Config::load_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err(ErrorKind::FileSystem, "Cannot read config file " + path.string());
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    auto result = parse(text);
    if (result.is_err()) {
        result.error.message = path.string() + ": " + result.error.message;
    }
    return result;
}

Result<Config> Config::load_global() {
    if (!global_config_exists()) {
        return Result<Config>::Ok(Config{});
    }
    return load_file(get_global_config_path());
}

} // namespace clusterlink
