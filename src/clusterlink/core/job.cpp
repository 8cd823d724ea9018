#include "job.hpp"
#include <tuple>

namespace clusterlink {

bool is_terminal(JobState state) {
    return state == JobState::Completed ||
           state == JobState::Failed ||
           state == JobState::Cancelled;
}

bool is_active(JobState state) {
    return state == JobState::Pending || state == JobState::Running;
}

const char* job_state_name(JobState state) {
    switch (state) {
        case JobState::Created:   return "CREATED";
        case JobState::Pending:   return "PENDING";
        case JobState::Running:   return "RUNNING";
        case JobState::Completed: return "COMPLETED";
        case JobState::Failed:    return "FAILED";
        case JobState::Cancelled: return "CANCELLED";
    }
    return "CREATED";
}

Result<JobState> parse_job_state_name(const std::string& name) {
    static const JobState all[] = {
        JobState::Created, JobState::Pending, JobState::Running,
        JobState::Completed, JobState::Failed, JobState::Cancelled,
    };
    for (JobState s : all) {
        if (name == job_state_name(s)) return Result<JobState>::Ok(s);
    }
    return Result<JobState>::Err(ErrorKind::Validation, "Unknown job state: " + name);
}

bool operator==(const JobRecord& a, const JobRecord& b) {
    return std::tie(a.job_id, a.job_name, a.state, a.slurm_job_id, a.created_at,
                    a.updated_at, a.submitted_at, a.completed_at, a.project_dir,
                    a.scratch_dir, a.error_info) ==
           std::tie(b.job_id, b.job_name, b.state, b.slurm_job_id, b.created_at,
                    b.updated_at, b.submitted_at, b.completed_at, b.project_dir,
                    b.scratch_dir, b.error_info);
}

} // namespace clusterlink
