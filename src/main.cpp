#include <algorithm>
#include <iostream>
#include <string>
#include <vector>
#include <clusterlink/core/config.hpp>
#include <clusterlink/core/credentials.hpp>
#include <clusterlink/core/log.hpp>
#include <clusterlink/managers/cluster_service.hpp>
#include <clusterlink/managers/job_cache.hpp>
#include <clusterlink/ssh/session.hpp>
#include <fmt/format.h>
#include "cli/theme.hpp"

using namespace clusterlink;

static const char* VERSION = "0.1.0";

static void print_usage() {
    std::cout << theme::section("Usage");
    std::cout << theme::kv("status", "Connect and show the session");
    std::cout << theme::kv("sync", "Refresh job states from SLURM");
    std::cout << theme::kv("jobs", "List cached jobs");
    std::cout << theme::kv("create", "create <job_id> [name]");
    std::cout << theme::kv("submit", "submit <job_id>");
    std::cout << theme::kv("cancel", "cancel <job_id>");
    std::cout << theme::kv("delete", "delete <job_id> [--remote]");
    std::cout << theme::kv("upload", "upload <local> <remote>");
    std::cout << theme::kv("download", "download <remote> <local>");
    std::cout << theme::kv("logs", "logs <job_id>");
    std::cout << theme::kv("ls", "ls <remote_dir>");
    std::cout << theme::kv("init-config", "Write ~/.clusterlink/config.yaml");
    std::cout << "\n" << theme::dim("    clusterlink --version    Show version") << "\n"
              << theme::dim("    clusterlink --help       Show this help") << "\n\n";
}

static void print_error(const Error& err) {
    std::cout << theme::fail(err.to_string());
    std::string hint = suggestion(err);
    if (!hint.empty()) std::cout << theme::step(hint);
}

static void print_progress(const TransferProgress& p) {
    std::cout << fmt::format("\r    {} {:>5.1f}%  ({}/{} bytes)", p.file_name, p.percentage,
                             p.bytes_transferred, p.total_bytes)
              << std::flush;
    if (p.bytes_transferred >= p.total_bytes) std::cout << "\n";
}

static StatusCallback print_status() {
    return [](const std::string& msg) { std::cout << theme::info(msg); };
}

static bool connect_interactive(ClusterService& service) {
    const auto& cluster = service.config().cluster();
    std::cout << theme::step(fmt::format("Connecting to {} as {}", cluster.host, cluster.username));

    SecureCredential password = read_password_from_terminal(
        fmt::format("    Password for {}@{}: ", cluster.username, cluster.host));
    auto session = service.connect(std::move(password), print_status());
    if (session.is_err()) {
        print_error(session.error);
        return false;
    }
    std::cout << theme::ok(fmt::format("Connected to {}", session.value.host));
    return true;
}

static void print_job(const JobRecord& job) {
    std::cout << fmt::format("    {:<24} {:<12} ", job.job_id, job.slurm_job_id.empty() ? "-" : job.slurm_job_id)
              << theme::state_label(job_state_name(job.state))
              << theme::dim(job.updated_at.empty() ? "" : "  " + job.updated_at) << "\n";
}

static int run_command(ClusterService& service, const std::vector<std::string>& args) {
    const std::string& cmd = args[0];
    auto arg = [&](size_t i) -> std::string { return i < args.size() ? args[i] : ""; };
    auto need = [&](size_t n, const char* usage) {
        if (args.size() >= n) return true;
        std::cout << theme::fail(std::string("Usage: clusterlink ") + usage);
        return false;
    };

    if (cmd == "jobs") {
        auto jobs = service.list_jobs();
        if (jobs.empty()) {
            std::cout << theme::info("No jobs");
            return 0;
        }
        std::cout << theme::section("Jobs");
        for (const auto& job : jobs) print_job(job);
        std::cout << "\n";
        return 0;
    }

    static const std::vector<std::string> remote_commands = {
        "status", "sync", "create", "submit", "cancel", "delete", "upload", "download", "logs", "ls",
    };
    if (std::find(remote_commands.begin(), remote_commands.end(), cmd) == remote_commands.end()) {
        std::cout << theme::fail("Unknown command: " + cmd);
        print_usage();
        return 1;
    }

    if (cmd == "create" && !need(2, "create <job_id> [name]")) return 1;
    if (cmd == "submit" && !need(2, "submit <job_id>")) return 1;
    if (cmd == "cancel" && !need(2, "cancel <job_id>")) return 1;
    if (cmd == "delete" && !need(2, "delete <job_id> [--remote]")) return 1;
    if (cmd == "upload" && !need(3, "upload <local> <remote>")) return 1;
    if (cmd == "download" && !need(3, "download <remote> <local>")) return 1;
    if (cmd == "logs" && !need(2, "logs <job_id>")) return 1;
    if (cmd == "ls" && !need(2, "ls <remote_dir>")) return 1;

    if (!connect_interactive(service)) return 1;

    if (cmd == "status") {
        auto status = service.get_status();
        std::cout << theme::section("Session");
        std::cout << theme::kv("state", connection_state_name(status.state));
        if (status.session) {
            std::cout << theme::kv("host", fmt::format("{}:{}", status.session->host, status.session->port));
            std::cout << theme::kv("user", status.session->username);
            std::cout << theme::kv("since", status.session->connected_at);
        }
        std::cout << theme::kv("alive", service.check_alive() ? "yes" : "no") << "\n";
        return 0;
    }

    if (cmd == "sync") {
        auto report = service.sync(print_status());
        if (report.is_err()) {
            print_error(report.error);
            return 1;
        }
        const auto& r = report.value;
        std::cout << theme::ok(fmt::format("Checked {} job(s), {} updated, {} discovered",
                                           r.jobs_checked, r.jobs_updated, r.discovered));
        for (const auto& f : r.discovery_failures) {
            std::cout << theme::fail(fmt::format("{}: {}", f.directory, f.reason));
        }
        for (const auto& e : r.errors) {
            std::cout << theme::fail(fmt::format("{}: {}", e.job_id, e.error.to_string()));
        }
        return r.clean() ? 0 : 1;
    }

    if (cmd == "create" || cmd == "submit" || cmd == "cancel") {
        Result<JobRecord> job = cmd == "create" ? service.create_job(arg(1), arg(2), print_status())
                              : cmd == "submit" ? service.submit(arg(1), print_status())
                                                : service.cancel(arg(1), print_status());
        if (job.is_err()) {
            print_error(job.error);
            return 1;
        }
        print_job(job.value);
        return 0;
    }

    if (cmd == "delete") {
        bool remote = arg(2) == "--remote";
        auto deleted = service.delete_job(arg(1), remote, print_status());
        if (deleted.is_err()) {
            print_error(deleted.error);
            return 1;
        }
        std::cout << theme::ok("Deleted " + arg(1));
        return 0;
    }

    if (cmd == "upload" || cmd == "download") {
        auto bytes = cmd == "upload" ? service.upload(arg(1), arg(2), print_progress)
                                     : service.download(arg(1), arg(2), print_progress);
        if (bytes.is_err()) {
            print_error(bytes.error);
            return 1;
        }
        std::cout << theme::ok(fmt::format("{} bytes transferred", bytes.value));
        return 0;
    }

    if (cmd == "logs") {
        auto logs = service.fetch_logs(arg(1));
        if (logs.is_err()) {
            print_error(logs.error);
            return 1;
        }
        std::cout << theme::section("stdout") << logs.value.stdout_text;
        std::cout << theme::section("stderr") << logs.value.stderr_text << "\n";
        return 0;
    }

    if (cmd == "ls") {
        auto entries = service.list_files(arg(1));
        if (entries.is_err()) {
            print_error(entries.error);
            return 1;
        }
        for (const auto& e : entries.value) {
            std::cout << fmt::format("    {:>10}  {}{}\n", e.size, e.name, e.is_directory ? "/" : "");
        }
        return 0;
    }

    return 1;
}

int main(int argc, char** argv) {
    try {
        if (argc < 2) {
            print_usage();
            return 1;
        }

        std::vector<std::string> args(argv + 1, argv + argc);
        const std::string& cmd = args[0];

        if (cmd == "--version") {
            std::cout << theme::bold("clusterlink") << theme::dim(std::string(" version ") + VERSION) << "\n";
            return 0;
        }
        if (cmd == "--help") {
            print_usage();
            return 0;
        }
        if (cmd == "init-config") {
            auto created = create_default_global_config();
            if (created.is_err()) {
                print_error(created.error);
                return 1;
            }
            std::cout << theme::ok("Config at " + get_global_config_path().string());
            return 0;
        }

        auto config = Config::load_global();
        if (config.is_err()) {
            print_error(config.error);
            return 1;
        }
        set_log_path(config.value.log_file());

        FileJobCache cache(FileJobCache::default_path());
        auto loaded = cache.load();
        if (loaded.is_err()) {
            print_error(loaded.error);
            return 1;
        }

        ClusterService service(config.value, std::make_shared<Libssh2Connector>(), cache);
        int rc = run_command(service, args);
        service.disconnect();
        return rc;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
