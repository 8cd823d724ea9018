#pragma once

#include <optional>
#include <string>
#include <vector>
#include <clusterlink/core/job.hpp>
#include <clusterlink/core/types.hpp>

namespace clusterlink {

// ── Command builders ────────────────────────────────────────
// Every builder validates its inputs before anything is embedded.

// "source /etc/profile && module load slurm/alpine && <payload>"
std::string build_command(const std::string& payload);

// squeue for a batch of ids, one pipe-delimited line per active job:
// id|name|state|time_used|time_left|nodes|cpus|memory|partition|workdir
Result<std::string> squeue_batch_command(const std::vector<std::string>& slurm_ids);

// sacct for a batch of ids (allocations only):
// id|name|state|exit_code|start|end|elapsed|workdir
Result<std::string> sacct_batch_command(const std::vector<std::string>& slurm_ids);

// cd '<dir>' && sbatch '<script>'
Result<std::string> submit_command(const std::string& working_dir, const std::string& script_name);

Result<std::string> cancel_command(const std::string& slurm_id);

// ── Output parsing ──────────────────────────────────────────

constexpr std::size_t SQUEUE_FIELD_COUNT = 10;
constexpr std::size_t SACCT_FIELD_COUNT = 8;

// Map a SLURM state (compact code or long name, any case) to a JobState.
// "CANCELLED by 1234" and "CANCELLED+" map to Cancelled. Unknown states are
// Protocol errors.
Result<JobState> map_slurm_state(const std::string& raw_state);

Result<JobStatusRecord> parse_squeue_line(const std::string& line);
Result<JobStatusRecord> parse_sacct_line(const std::string& line);

// A line that did not parse. job_id is the line's first field, empty when
// the line has none; error.details holds the raw line.
struct RejectedStatusLine {
    std::string job_id;
    Error error;
};

struct ParsedStatusOutput {
    std::vector<JobStatusRecord> records;
    std::vector<RejectedStatusLine> rejected;
};

// Whole-output parsers, line by line. Blank lines are ignored; sacct step
// lines (123.batch, 123.extern) are skipped. A malformed line only rejects
// itself.
ParsedStatusOutput parse_squeue_output(const std::string& output);
ParsedStatusOutput parse_sacct_output(const std::string& output);

// "Submitted batch job 12345678" -> "12345678"
std::optional<std::string> parse_sbatch_output(const std::string& output);

// squeue/scancel report finished or unknown ids this way.
bool is_invalid_job_id_response(const std::string& text);

// scancel output meaning there is nothing left to cancel.
bool is_cancel_noop_response(const std::string& text);

} // namespace clusterlink
