#pragma once

#include <map>
#include <string>
#include <vector>
#include <clusterlink/core/job.hpp>
#include <clusterlink/core/types.hpp>
#include "executor.hpp"
#include "retry.hpp"
#include "slurm_commands.hpp"

namespace clusterlink {

struct SchedulerTimeouts {
    int query = SLURM_TIMEOUT_SECS;
    int submit = SUBMIT_TIMEOUT_SECS;
};

// Outcome of a batched status query. An id can be in records, in errors, or
// in neither when SLURM knows nothing about it.
struct StatusQueryResult {
    std::map<std::string, JobStatusRecord> records;
    std::map<std::string, Error> errors;    // invalid id, or a status line that did not parse
};

// SLURM over the session: sbatch, the two-stage squeue/sacct status query,
// and scancel.
class Scheduler {
public:
    Scheduler(Executor& executor, SchedulerTimeouts timeouts, RetryPolicy policy);

    // Submit <script_name> from <working_dir>. Returns the scheduler job id.
    // Never retried: a resubmission could start the job twice.
    Result<std::string> submit(const std::string& working_dir, const std::string& script_name);

    // Active jobs from squeue, then sacct for the ids squeue did not report.
    // Invalid ids and unparseable lines fail only their own id. The call
    // itself fails only when a command does.
    Result<StatusQueryResult> query_status(const std::vector<std::string>& slurm_ids);

    // Only issues scancel when known_state is Pending or Running. True when
    // scancel took effect, false when there was nothing left to cancel; a job
    // that already finished is not an error.
    Result<bool> cancel(const std::string& slurm_id, JobState known_state);

private:
    Result<ParsedStatusOutput> query_active(const std::vector<std::string>& ids);
    Result<ParsedStatusOutput> query_historical(const std::vector<std::string>& ids);

    Executor& executor_;
    SchedulerTimeouts timeouts_;
    RetryPolicy policy_;
};

} // namespace clusterlink
