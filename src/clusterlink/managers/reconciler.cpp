#include "reconciler.hpp"
#include "job_metadata.hpp"
#include <clusterlink/core/log.hpp>
#include <clusterlink/core/utils.hpp>
#include <clusterlink/core/validation.hpp>
#include <fmt/format.h>

namespace clusterlink {

Reconciler::Reconciler(JobCache& cache, Scheduler& scheduler, TransferEngine& transfer)
    : cache_(cache), scheduler_(scheduler), transfer_(transfer) {}

SyncReport Reconciler::sync(const std::string& project_base, StatusCallback on_status) {
    SyncReport report;

    if (cache_.empty()) {
        discover(project_base, report, on_status);
    }

    std::vector<std::string> slurm_ids;
    std::vector<JobRecord> pending;
    for (const auto& job : cache_.list()) {
        if (is_terminal(job.state) || job.slurm_job_id.empty()) continue;
        slurm_ids.push_back(job.slurm_job_id);
        pending.push_back(job);
    }
    report.jobs_checked = static_cast<int>(pending.size());

    if (slurm_ids.empty()) {
        cl_log("sync: no active jobs to check");
        return report;
    }

    if (on_status) on_status(fmt::format("Checking {} job(s) on the scheduler...", slurm_ids.size()));

    auto status = scheduler_.query_status(slurm_ids);
    if (status.is_err()) {
        for (const auto& job : pending) {
            report.errors.push_back({job.job_id, status.error});
        }
        cl_log_error("sync", status.error);
        return report;
    }

    for (const auto& [slurm_id, record] : status.value.records) {
        apply(record, report);
    }

    for (const auto& job : pending) {
        if (status.value.records.count(job.slurm_job_id)) continue;
        auto failed = status.value.errors.find(job.slurm_job_id);
        if (failed != status.value.errors.end()) {
            report.errors.push_back({job.job_id, failed->second});
            continue;
        }
        report.errors.push_back({job.job_id, make_error(
            ErrorKind::Protocol,
            fmt::format("SLURM job {} not found in squeue or sacct", job.slurm_job_id),
            "SLURM_002")});
    }

    cl_log(fmt::format("sync: checked={} updated={} writes={} errors={}",
                       report.jobs_checked, report.jobs_updated, report.cache_writes,
                       report.errors.size()));
    return report;
}

void Reconciler::apply(const JobStatusRecord& record, SyncReport& report) {
    auto cached = cache_.find_by_slurm_id(record.job_id);
    if (!cached) return;

    JobRecord job = *cached;
    if (is_terminal(job.state) || job.state == record.state) return;

    cl_log(fmt::format("sync: job {} (slurm {}) {} -> {}", job.job_id, record.job_id,
                       job_state_name(job.state), job_state_name(record.state)));
    append_job_log(job.job_id, fmt::format("State {} -> {} ({})", job_state_name(job.state),
                                           job_state_name(record.state), record.raw_state));

    job.state = record.state;
    job.updated_at = now_iso();
    if (is_terminal(record.state)) {
        job.completed_at = job.updated_at;
        if (record.state == JobState::Failed && !record.exit_code.empty()) {
            job.error_info = fmt::format("{} (exit code {})", record.raw_state, record.exit_code);
        }
    }

    auto stored = cache_.upsert(job);
    if (stored.is_err()) {
        report.errors.push_back({job.job_id, stored.error});
        return;
    }
    report.cache_writes++;
    report.jobs_updated++;

    if (job.project_dir.empty()) return;
    auto written = transfer_.write_text(job_info_path(job.project_dir), job_info_json(job));
    if (written.is_err()) {
        report.errors.push_back({job.job_id, written.error});
    }
}

void Reconciler::discover(const std::string& project_base, SyncReport& report,
                          const StatusCallback& on_status) {
    if (on_status) on_status("Discovering jobs on the cluster...");

    auto entries = transfer_.list_directory(project_base);
    if (entries.is_err()) {
        // Nothing submitted yet
        if (entries.error.code == "FILE_001") return;
        report.discovery_failures.push_back({project_base, entries.error.to_string()});
        return;
    }

    for (const auto& entry : entries.value) {
        if (!entry.is_directory) continue;

        std::string dir = entry.path.empty() ? project_base + "/" + entry.name : entry.path;
        auto name_ok = sanitize_identifier(entry.name);
        if (name_ok.is_err()) {
            report.discovery_failures.push_back({dir, name_ok.error.message});
            continue;
        }

        auto text = transfer_.read_text(job_info_path(dir));
        if (text.is_err()) {
            report.discovery_failures.push_back({dir, text.error.to_string()});
            continue;
        }

        auto job = parse_job_info(text.value);
        if (job.is_err()) {
            report.discovery_failures.push_back({dir, job.error.to_string()});
            continue;
        }

        auto id_ok = sanitize_identifier(job.value.job_id);
        if (id_ok.is_err()) {
            report.discovery_failures.push_back({dir, id_ok.error.message});
            continue;
        }

        if (!job.value.slurm_job_id.empty()) {
            auto slurm_ok = validate_scheduler_id(job.value.slurm_job_id);
            if (slurm_ok.is_err()) {
                report.discovery_failures.push_back({dir, slurm_ok.error.message});
                continue;
            }
        }

        if (cache_.find(job.value.job_id)) continue;
        if (job.value.project_dir.empty()) job.value.project_dir = dir;

        auto stored = cache_.upsert(job.value);
        if (stored.is_err()) {
            report.discovery_failures.push_back({dir, stored.error.to_string()});
            continue;
        }
        report.cache_writes++;
        report.discovered++;
        cl_log(fmt::format("sync: discovered job {} in {}", job.value.job_id, dir));
    }

    if (on_status && report.discovered > 0) {
        on_status(fmt::format("Discovered {} job(s)", report.discovered));
    }
}

} // namespace clusterlink
