#pragma once

#include <string>
#include <clusterlink/core/errors.hpp>

namespace clusterlink {

// Map a libssh2 session-level return code to an Error.
Error ssh_error(int rc, const std::string& context);

// Map an SFTP status (libssh2_sftp_last_error) to an Error.
Error sftp_status_error(unsigned long status, const std::string& path);

} // namespace clusterlink
