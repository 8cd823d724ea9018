#include "slurm_commands.hpp"
#include <clusterlink/core/constants.hpp>
#include <clusterlink/core/utils.hpp>
#include <clusterlink/core/validation.hpp>
#include <fmt/format.h>
#include <cctype>

namespace clusterlink {

std::string build_command(const std::string& payload) {
    return fmt::format("{} && {} && {}", SLURM_ENV_INIT, SLURM_MODULE_LOAD, payload);
}

static Result<std::string> id_list(const std::vector<std::string>& slurm_ids) {
    if (slurm_ids.empty()) {
        return Result<std::string>::Err(ErrorKind::Validation, "Invalid scheduler job id: empty batch");
    }
    for (const auto& id : slurm_ids) {
        auto valid = validate_scheduler_id(id);
        if (valid.is_err()) return valid;
    }
    return Result<std::string>::Ok(join(slurm_ids, ","));
}

Result<std::string> squeue_batch_command(const std::vector<std::string>& slurm_ids) {
    auto ids = id_list(slurm_ids);
    if (ids.is_err()) return ids;
    return Result<std::string>::Ok(build_command(fmt::format(
        "squeue -j {} --noheader --format='%i|%j|%t|%M|%L|%D|%C|%m|%P|%Z'", ids.value)));
}

Result<std::string> sacct_batch_command(const std::vector<std::string>& slurm_ids) {
    auto ids = id_list(slurm_ids);
    if (ids.is_err()) return ids;
    return Result<std::string>::Ok(build_command(fmt::format(
        "sacct -j {} --allocations --noheader --parsable2 "
        "--format=JobID,JobName,State,ExitCode,Start,End,Elapsed,WorkDir", ids.value)));
}

Result<std::string> submit_command(const std::string& working_dir, const std::string& script_name) {
    auto dir = validate_remote_path(working_dir);
    if (dir.is_err()) return dir;
    auto script = validate_relative_path(script_name);
    if (script.is_err()) return script;
    return Result<std::string>::Ok(build_command(
        safe_cd_and_run(working_dir, "sbatch " + escape_for_command(script_name))));
}

Result<std::string> cancel_command(const std::string& slurm_id) {
    auto id = validate_scheduler_id(slurm_id);
    if (id.is_err()) return id;
    return Result<std::string>::Ok(build_command("scancel " + slurm_id));
}

// ── State mapping ───────────────────────────────────────────

Result<JobState> map_slurm_state(const std::string& raw_state) {
    std::string s = to_upper(trimmed(raw_state));
    // "CANCELLED by 1234", "CANCELLED+"
    auto space = s.find(' ');
    if (space != std::string::npos) s = s.substr(0, space);
    while (!s.empty() && s.back() == '+') s.pop_back();

    if (s == "PD" || s == "PENDING" || s == "CF" || s == "CONFIGURING" ||
        s == "RQ" || s == "REQUEUED" || s == "S" || s == "SUSPENDED" ||
        s == "RH" || s == "REQUEUE_HOLD" || s == "RF" || s == "REQUEUE_FED" ||
        s == "RD" || s == "RESV_DEL_HOLD") {
        return Result<JobState>::Ok(JobState::Pending);
    }
    if (s == "R" || s == "RUNNING" || s == "CG" || s == "COMPLETING" ||
        s == "RS" || s == "RESIZING" || s == "SI" || s == "SIGNALING" ||
        s == "SO" || s == "STAGE_OUT" || s == "ST" || s == "STOPPED") {
        return Result<JobState>::Ok(JobState::Running);
    }
    if (s == "CD" || s == "COMPLETED") {
        return Result<JobState>::Ok(JobState::Completed);
    }
    if (s == "F" || s == "FAILED" || s == "TO" || s == "TIMEOUT" ||
        s == "NF" || s == "NODE_FAIL" || s == "PR" || s == "PREEMPTED" ||
        s == "OOM" || s == "OUT_OF_MEMORY" || s == "BF" || s == "BOOT_FAIL" ||
        s == "DL" || s == "DEADLINE" || s == "SE" || s == "SPECIAL_EXIT") {
        return Result<JobState>::Ok(JobState::Failed);
    }
    if (s == "CA" || s == "CANCELLED" || s == "RV" || s == "REVOKED") {
        return Result<JobState>::Ok(JobState::Cancelled);
    }
    return Result<JobState>::Err(make_error(ErrorKind::Protocol,
                                            "Unknown SLURM state: '" + raw_state + "'",
                                            "PROTO_001", raw_state));
}

// ── Line parsing ────────────────────────────────────────────

static Result<std::vector<std::string>> split_fields(const std::string& line, std::size_t expected,
                                                     const char* source) {
    auto fields = split(line, '|');
    // Trailing '|' leaves one empty field
    if (fields.size() == expected + 1 && fields.back().empty()) fields.pop_back();
    if (fields.size() != expected) {
        return Result<std::vector<std::string>>::Err(make_error(
            ErrorKind::Protocol,
            fmt::format("Malformed {} line: expected {} fields, got {}", source, expected, fields.size()),
            "PROTO_001", line));
    }
    for (auto& f : fields) trim(f);
    return Result<std::vector<std::string>>::Ok(std::move(fields));
}

Result<JobStatusRecord> parse_squeue_line(const std::string& line) {
    auto fields = split_fields(line, SQUEUE_FIELD_COUNT, "squeue");
    if (fields.is_err()) return Result<JobStatusRecord>::Err(fields.error);
    const auto& f = fields.value;

    auto state = map_slurm_state(f[2]);
    if (state.is_err()) {
        state.error.details = line;
        return Result<JobStatusRecord>::Err(state.error);
    }

    JobStatusRecord rec;
    rec.source = JobStatusRecord::Source::Active;
    rec.job_id = f[0];
    rec.job_name = f[1];
    rec.raw_state = f[2];
    rec.state = state.value;
    rec.time_used = f[3];
    rec.time_left = f[4];
    rec.node_count = f[5];
    rec.cpu_count = f[6];
    rec.memory = f[7];
    rec.partition = f[8];
    rec.working_directory = f[9];
    return Result<JobStatusRecord>::Ok(rec);
}

Result<JobStatusRecord> parse_sacct_line(const std::string& line) {
    auto fields = split_fields(line, SACCT_FIELD_COUNT, "sacct");
    if (fields.is_err()) return Result<JobStatusRecord>::Err(fields.error);
    const auto& f = fields.value;

    auto state = map_slurm_state(f[2]);
    if (state.is_err()) {
        state.error.details = line;
        return Result<JobStatusRecord>::Err(state.error);
    }

    JobStatusRecord rec;
    rec.source = JobStatusRecord::Source::Historical;
    rec.job_id = f[0];
    rec.job_name = f[1];
    rec.raw_state = f[2];
    rec.state = state.value;
    rec.exit_code = f[3];
    rec.start_time = f[4];
    rec.end_time = f[5];
    rec.elapsed = f[6];
    rec.working_directory = f[7];
    return Result<JobStatusRecord>::Ok(rec);
}

static void add_line(ParsedStatusOutput& out, const std::string& line, Result<JobStatusRecord> rec) {
    if (rec.is_ok()) {
        out.records.push_back(std::move(rec.value));
        return;
    }
    rec.error.details = line;
    out.rejected.push_back({trimmed(line.substr(0, line.find('|'))), rec.error});
}

ParsedStatusOutput parse_squeue_output(const std::string& output) {
    ParsedStatusOutput out;
    for (const auto& line : split_lines(output)) {
        add_line(out, line, parse_squeue_line(line));
    }
    return out;
}

ParsedStatusOutput parse_sacct_output(const std::string& output) {
    ParsedStatusOutput out;
    for (const auto& line : split_lines(output)) {
        // Job steps: 123.batch, 123.extern, 123.0
        auto id_end = line.find('|');
        if (line.substr(0, id_end).find('.') != std::string::npos) continue;

        add_line(out, line, parse_sacct_line(line));
    }
    return out;
}

std::optional<std::string> parse_sbatch_output(const std::string& output) {
    static const std::string marker = "Submitted batch job ";
    auto pos = output.find(marker);
    if (pos == std::string::npos) return std::nullopt;

    std::size_t start = pos + marker.size();
    std::size_t end = start;
    while (end < output.size() && std::isdigit(static_cast<unsigned char>(output[end]))) end++;
    if (end == start) return std::nullopt;
    return output.substr(start, end - start);
}

bool is_invalid_job_id_response(const std::string& text) {
    return text.find("Invalid job id") != std::string::npos;
}

bool is_cancel_noop_response(const std::string& text) {
    return text.find("already completing or completed") != std::string::npos ||
           text.find("Invalid job id specified") != std::string::npos;
}

} // namespace clusterlink
