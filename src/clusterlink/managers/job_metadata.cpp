#include "job_metadata.hpp"
#include <clusterlink/core/constants.hpp>
#include <clusterlink/core/utils.hpp>
#include <yaml-cpp/yaml.h>

namespace clusterlink {

std::string job_info_path(const std::string& project_dir) {
    std::string dir = project_dir;
    while (dir.size() > 1 && dir.back() == '/') dir.pop_back();
    return dir + "/" + JOB_INFO_FILE;
}

void emit_job_record_fields(YAML::Emitter& out, const JobRecord& job) {
    out << YAML::Key << "job_id" << YAML::Value << job.job_id;
    out << YAML::Key << "job_name" << YAML::Value << job.job_name;
    out << YAML::Key << "state" << YAML::Value << job_state_name(job.state);
    out << YAML::Key << "slurm_job_id" << YAML::Value << job.slurm_job_id;
    out << YAML::Key << "created_at" << YAML::Value << job.created_at;
    out << YAML::Key << "updated_at" << YAML::Value << job.updated_at;
    out << YAML::Key << "submitted_at" << YAML::Value << job.submitted_at;
    out << YAML::Key << "completed_at" << YAML::Value << job.completed_at;
    out << YAML::Key << "project_dir" << YAML::Value << job.project_dir;
    out << YAML::Key << "scratch_dir" << YAML::Value << job.scratch_dir;
    out << YAML::Key << "error_info" << YAML::Value << job.error_info;
}

// snake_case first, then the camelCase spelling older files used
static std::string field(const YAML::Node& node, const char* key, const char* alt) {
    if (node[key]) return node[key].as<std::string>("");
    if (alt && node[alt]) return node[alt].as<std::string>("");
    return "";
}

Result<JobRecord> job_record_from_node(const YAML::Node& node) {
    if (!node.IsMap()) {
        return Result<JobRecord>::Err(make_error(ErrorKind::Protocol, "Job metadata is not an object"));
    }

    JobRecord job;
    try {
        job.job_id = field(node, "job_id", "jobId");
        job.job_name = field(node, "job_name", "jobName");
        job.slurm_job_id = field(node, "slurm_job_id", "slurmJobId");
        job.created_at = field(node, "created_at", "createdAt");
        job.updated_at = field(node, "updated_at", "updatedAt");
        job.submitted_at = field(node, "submitted_at", "submittedAt");
        job.completed_at = field(node, "completed_at", "completedAt");
        job.project_dir = field(node, "project_dir", "projectDir");
        job.scratch_dir = field(node, "scratch_dir", "scratchDir");
        job.error_info = field(node, "error_info", "errorInfo");

        std::string state = field(node, "state", "status");
        auto parsed = parse_job_state_name(state.empty() ? "CREATED" : to_upper(state));
        if (parsed.is_err()) {
            return Result<JobRecord>::Err(make_error(ErrorKind::Protocol,
                                                     "Unknown job state '" + state + "'", "PROTO_001", state));
        }
        job.state = parsed.value;
    } catch (const YAML::Exception& e) {
        return Result<JobRecord>::Err(make_error(ErrorKind::Protocol,
                                                 "Malformed job metadata: " + std::string(e.what())));
    }

    if (job.job_id.empty()) {
        return Result<JobRecord>::Err(make_error(ErrorKind::Protocol, "Job metadata has no job_id"));
    }
    return Result<JobRecord>::Ok(job);
}

std::string job_info_json(const JobRecord& job) {
    YAML::Emitter out;
    out.SetMapFormat(YAML::Flow);
    out.SetStringFormat(YAML::DoubleQuoted);
    out << YAML::BeginMap;
    emit_job_record_fields(out, job);
    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

Result<JobRecord> parse_job_info(const std::string& text) {
    try {
        YAML::Node root = YAML::Load(text);
        auto job = job_record_from_node(root);
        if (job.is_err()) job.error.details = text.substr(0, LOG_OUTPUT_TRUNCATE);
        return job;
    } catch (const YAML::Exception& e) {
        return Result<JobRecord>::Err(make_error(ErrorKind::Protocol,
                                                 "Malformed job_info.json: " + std::string(e.what()),
                                                 "PROTO_001", text.substr(0, LOG_OUTPUT_TRUNCATE)));
    }
}

} // namespace clusterlink
