#pragma once

#include <string>
#include <clusterlink/core/job.hpp>
#include <clusterlink/core/types.hpp>

namespace YAML {
class Emitter;
class Node;
}

namespace clusterlink {

// job_info.json lives at the root of each job's project directory.
std::string job_info_path(const std::string& project_dir);

// Mapping body for a JobRecord (caller opens and closes the map).
void emit_job_record_fields(YAML::Emitter& out, const JobRecord& job);

// Reads snake_case keys; camelCase keys and "status" are accepted as well.
// A missing job_id or an unknown state is a Protocol error.
Result<JobRecord> job_record_from_node(const YAML::Node& node);

// Single-line JSON object with double-quoted strings.
std::string job_info_json(const JobRecord& job);

Result<JobRecord> parse_job_info(const std::string& text);

} // namespace clusterlink
