#pragma once

#include <cstddef>

namespace clusterlink {

// ── Remote command prefix ───────────────────────────────────
// Every scheduler command is "<init> && <modules> && <payload>". Never built from input.
constexpr const char* SLURM_ENV_INIT      = "source /etc/profile";
constexpr const char* SLURM_MODULE_LOAD   = "module load slurm/alpine";

// ── Timeouts ────────────────────────────────────────────────
constexpr int CONNECT_TIMEOUT_SECS        = 30;    // TCP connect + handshake
constexpr int COMMAND_TIMEOUT_SECS        = 120;   // Remote housekeeping commands (rm -rf)
constexpr int SLURM_TIMEOUT_SECS          = 60;    // squeue / sacct / scancel
constexpr int SUBMIT_TIMEOUT_SECS         = 30;    // sbatch
constexpr int QUICK_TIMEOUT_SECS          = 30;    // mkdir, test, cat
constexpr int CHUNK_TIMEOUT_SECS          = 60;    // One transfer chunk (write + flush)
constexpr int RSYNC_TIMEOUT_SECS          = 300;   // project -> scratch mirror
constexpr int KEEPALIVE_INTERVAL_SECS     = 30;
constexpr int CHANNEL_OPEN_TIMEOUT_SECS   = 30;
constexpr int EAGAIN_SLEEP_MS             = 10;

// ── Buffer sizes ────────────────────────────────────────────
constexpr std::size_t TRANSFER_CHUNK_SIZE = 256 * 1024;
constexpr std::size_t SSH_READ_BUF_SIZE   = 32 * 1024;
constexpr std::size_t MAX_TEXT_FILE_SIZE  = 1024 * 1024;   // read_text cap
constexpr std::size_t LOG_OUTPUT_TRUNCATE = 500;

// ── Validation ──────────────────────────────────────────────
constexpr std::size_t MAX_IDENTIFIER_LENGTH = 64;

// ── Executor ────────────────────────────────────────────────
constexpr int DEFAULT_WORKER_THREADS      = 4;

// ── Remote layout ───────────────────────────────────────────
constexpr const char* JOB_BASE_DIRECTORY  = "namdrunner_jobs";
constexpr const char* JOB_INFO_FILE       = "job_info.json";
constexpr const char* JOB_SCRIPT_FILE     = "job.sbatch";
constexpr const char* INPUT_FILES_DIR     = "input_files";
constexpr const char* SCRIPTS_DIR         = "scripts";
constexpr const char* OUTPUTS_DIR         = "outputs";

} // namespace clusterlink
