#include "scheduler.hpp"
#include "slurm_commands.hpp"
#include <clusterlink/core/log.hpp>
#include <clusterlink/core/utils.hpp>
#include <clusterlink/core/validation.hpp>
#include <fmt/format.h>
#include <set>

namespace clusterlink {

Scheduler::Scheduler(Executor& executor, SchedulerTimeouts timeouts, RetryPolicy policy)
    : executor_(executor), timeouts_(timeouts), policy_(policy) {}

// ── Submit ──────────────────────────────────────────────────

Result<std::string> Scheduler::submit(const std::string& working_dir, const std::string& script_name) {
    auto cmd = submit_command(working_dir, script_name);
    if (cmd.is_err()) return Result<std::string>::Err(cmd.error);

    auto result = executor_.run(cmd.value, timeouts_.submit);
    if (result.is_err()) return Result<std::string>::Err(result.error);

    const auto& r = result.value;
    auto slurm_id = r.success() ? parse_sbatch_output(r.stdout_data) : std::nullopt;
    if (!slurm_id) {
        std::string reason = trimmed(r.stderr_data.empty() ? r.stdout_data : r.stderr_data);
        if (reason.empty()) reason = fmt::format("sbatch exited with status {}", r.exit_code);
        Error err = make_error(ErrorKind::Protocol, "Job submission failed: " + reason, "SLURM_001",
                               fmt::format("stdout: {}\nstderr: {}", r.stdout_data, r.stderr_data));
        cl_log_error("sbatch", err);
        return Result<std::string>::Err(err);
    }

    cl_log(fmt::format("sbatch: submitted {} from {} as {}", script_name, working_dir, *slurm_id));
    return Result<std::string>::Ok(*slurm_id);
}

// ── Status ──────────────────────────────────────────────────

Result<ParsedStatusOutput> Scheduler::query_active(const std::vector<std::string>& ids) {
    using R = Result<ParsedStatusOutput>;
    auto cmd = squeue_batch_command(ids);
    if (cmd.is_err()) return R::Err(cmd.error);

    auto result = executor_.run_with_retry(cmd.value, timeouts_.query, policy_,
        [](const RemoteCommandResult& r) { return is_invalid_job_id_response(r.stderr_data); });
    if (result.is_err()) return R::Err(result.error);

    // Finished ids make squeue exit with "Invalid job id"; rows it printed
    // for the others still count
    return R::Ok(parse_squeue_output(result.value.stdout_data));
}

Result<ParsedStatusOutput> Scheduler::query_historical(const std::vector<std::string>& ids) {
    using R = Result<ParsedStatusOutput>;
    auto cmd = sacct_batch_command(ids);
    if (cmd.is_err()) return R::Err(cmd.error);

    auto result = executor_.run_with_retry(cmd.value, timeouts_.query, policy_);
    if (result.is_err()) return R::Err(result.error);
    return R::Ok(parse_sacct_output(result.value.stdout_data));
}

static void note_rejected(const std::vector<RejectedStatusLine>& rejected, const std::set<std::string>& wanted,
                          StatusQueryResult& out) {
    for (const auto& line : rejected) {
        cl_log(fmt::format("query_status: skipped line '{}': {}", line.error.details, line.error.message));
        if (!wanted.count(line.job_id) || out.records.count(line.job_id)) continue;
        out.errors.emplace(line.job_id, line.error);
    }
}

Result<StatusQueryResult> Scheduler::query_status(const std::vector<std::string>& slurm_ids) {
    using R = Result<StatusQueryResult>;
    StatusQueryResult out;

    // Dedupe, keep request order, set invalid ids aside
    std::vector<std::string> ids;
    std::set<std::string> wanted;
    for (const auto& id : slurm_ids) {
        auto valid = validate_scheduler_id(id);
        if (valid.is_err()) {
            out.errors.emplace(id, valid.error);
            continue;
        }
        if (wanted.insert(id).second) ids.push_back(id);
    }
    if (ids.empty()) return R::Ok(out);

    auto active = query_active(ids);
    if (active.is_err()) return R::Err(active.error);
    for (const auto& rec : active.value.records) {
        if (wanted.count(rec.job_id)) out.records[rec.job_id] = rec;
    }
    note_rejected(active.value.rejected, wanted, out);

    std::vector<std::string> missing;
    for (const auto& id : ids) {
        if (!out.records.count(id)) missing.push_back(id);
    }
    cl_log(fmt::format("query_status: {} ids, {} active, {} to sacct",
                       ids.size(), out.records.size(), missing.size()));
    if (missing.empty()) return R::Ok(out);

    auto historical = query_historical(missing);
    if (historical.is_err()) return R::Err(historical.error);
    // Requeued jobs can appear more than once; the last line is the latest
    for (const auto& rec : historical.value.records) {
        if (!wanted.count(rec.job_id)) continue;
        auto it = out.records.find(rec.job_id);
        if (it == out.records.end() || it->second.source == JobStatusRecord::Source::Historical) {
            out.records[rec.job_id] = rec;
            out.errors.erase(rec.job_id);
        }
    }
    note_rejected(historical.value.rejected, wanted, out);
    return R::Ok(out);
}

// ── Cancel ──────────────────────────────────────────────────

Result<bool> Scheduler::cancel(const std::string& slurm_id, JobState known_state) {
    if (!is_active(known_state)) {
        cl_log(fmt::format("scancel: {} is {}, nothing to cancel", slurm_id, job_state_name(known_state)));
        return Result<bool>::Ok(false);
    }

    auto cmd = cancel_command(slurm_id);
    if (cmd.is_err()) return Result<bool>::Err(cmd.error);

    auto result = executor_.run_with_retry(cmd.value, timeouts_.query, policy_,
        [](const RemoteCommandResult& r) { return is_cancel_noop_response(r.stderr_data + r.stdout_data); });
    if (result.is_err()) return Result<bool>::Err(result.error);
    if (result.value.failed()) {
        cl_log(fmt::format("scancel: {} already finished", slurm_id));
        return Result<bool>::Ok(false);
    }
    return Result<bool>::Ok(true);
}

} // namespace clusterlink
