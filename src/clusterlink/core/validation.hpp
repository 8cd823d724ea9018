#pragma once

#include <string>
#include <vector>
#include "types.hpp"

namespace clusterlink {

// Identifiers that end up in remote paths or commands (job ids, job names).
// Accepts [A-Za-z0-9_-]{1,64}; everything else is a Validation error.
Result<std::string> sanitize_identifier(const std::string& input);

// Cluster usernames: identifier rules plus '.'.
Result<std::string> sanitize_username(const std::string& input);

// Hostnames and addresses: [A-Za-z0-9.-:] only.
Result<std::string> validate_hostname(const std::string& input);

// SLURM job ids: digits, optionally "_<n>" (array task) or ".<step>".
Result<std::string> validate_scheduler_id(const std::string& input);

// Relative file path inside a job directory (no NUL, not absolute, no "..").
Result<std::string> validate_relative_path(const std::string& input);

// Absolute remote path with no ".." component. When allowed_prefixes is
// non-empty the path must start with one of them.
Result<std::string> validate_remote_path(const std::string& input,
                                         const std::vector<std::string>& allowed_prefixes = {});

// Quote a value as a single shell token: abc -> 'abc', it's -> 'it'"'"'s'
std::string escape_for_command(const std::string& value);

// cd '<dir>' && <command>
std::string safe_cd_and_run(const std::string& dir, const std::string& command);

} // namespace clusterlink
