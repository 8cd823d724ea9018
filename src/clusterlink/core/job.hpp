#pragma once

#include <string>
#include "types.hpp"

namespace clusterlink {

enum class JobState {
    Created,
    Pending,
    Running,
    Completed,
    Failed,
    Cancelled,
};

// Completed, Failed and Cancelled never transition again.
bool is_terminal(JobState state);
bool is_active(JobState state);     // Pending or Running

// "PENDING", "RUNNING", ... (the form stored in job_info.json and the cache)
const char* job_state_name(JobState state);
Result<JobState> parse_job_state_name(const std::string& name);

// Snapshot of one scheduler record (squeue or sacct line).
struct JobStatusRecord {
    enum class Source { Active, Historical };

    std::string job_id;             // scheduler job id
    std::string job_name;
    JobState state = JobState::Pending;
    std::string raw_state;          // state field exactly as printed by SLURM
    Source source = Source::Active;

    // squeue fields
    std::string time_used;
    std::string time_left;
    std::string node_count;
    std::string cpu_count;
    std::string memory;
    std::string partition;

    // sacct fields
    std::string exit_code;
    std::string start_time;
    std::string end_time;
    std::string elapsed;

    std::string working_directory;
};

// A job as held in the local cache and in the remote job_info.json.
struct JobRecord {
    std::string job_id;
    std::string job_name;
    JobState state = JobState::Created;
    std::string slurm_job_id;
    std::string created_at;
    std::string updated_at;
    std::string submitted_at;
    std::string completed_at;
    std::string project_dir;
    std::string scratch_dir;
    std::string error_info;
};

bool operator==(const JobRecord& a, const JobRecord& b);
inline bool operator!=(const JobRecord& a, const JobRecord& b) { return !(a == b); }

} // namespace clusterlink
