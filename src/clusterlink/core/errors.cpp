#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <fmt/format.h>

namespace clusterlink {

static std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

static const char* default_code(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Network:        return "NET_001";
        case ErrorKind::Authentication: return "AUTH_001";
        case ErrorKind::Permission:     return "PERM_001";
        case ErrorKind::FileSystem:     return "FILE_001";
        case ErrorKind::Protocol:       return "PROTO_001";
        case ErrorKind::Timeout:        return "NET_002";
        case ErrorKind::Validation:     return "VAL_001";
        case ErrorKind::Internal:       return "INT_001";
    }
    return "INT_001";
}

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Network:        return "Network";
        case ErrorKind::Authentication: return "Authentication";
        case ErrorKind::Permission:     return "Permission";
        case ErrorKind::FileSystem:     return "FileSystem";
        case ErrorKind::Protocol:       return "Protocol";
        case ErrorKind::Timeout:        return "Timeout";
        case ErrorKind::Validation:     return "Validation";
        case ErrorKind::Internal:       return "Internal";
    }
    return "Internal";
}

bool is_retryable(ErrorKind kind) {
    return kind == ErrorKind::Network || kind == ErrorKind::Timeout;
}

bool Error::retryable() const {
    return is_retryable(kind);
}

std::string Error::to_string() const {
    return fmt::format("{} error: {}", error_kind_name(kind), message);
}

Error make_error(ErrorKind kind, const std::string& message,
                 const std::string& code, const std::string& details) {
    Error err;
    err.kind = kind;
    err.message = message;
    err.code = code.empty() ? default_code(kind) : code;
    err.details = details;
    return err;
}

Error classify_message(const std::string& text) {
    std::string lower = lowercase(text);

    if (contains(lower, "timed out") || contains(lower, "timeout")) {
        return make_error(ErrorKind::Timeout, text);
    }
    if (contains(lower, "authentication") || contains(lower, "auth fail") ||
        contains(lower, "password")) {
        return make_error(ErrorKind::Authentication, text);
    }
    if (contains(lower, "permission denied") || contains(lower, "not permitted") ||
        contains(lower, "access denied")) {
        return make_error(ErrorKind::Permission, text);
    }
    if (contains(lower, "no such file") || contains(lower, "not a directory") ||
        contains(lower, "disk quota") || contains(lower, "no space left")) {
        return make_error(ErrorKind::FileSystem, text);
    }
    if (contains(lower, "connection refused") || contains(lower, "connection reset") ||
        contains(lower, "broken pipe") || contains(lower, "network is unreachable") ||
        contains(lower, "could not resolve") || contains(lower, "host unreachable")) {
        return make_error(ErrorKind::Network, text);
    }
    if (contains(lower, "handshake") || contains(lower, "key exchange")) {
        return make_error(ErrorKind::Network, text, "NET_003");
    }
    return make_error(ErrorKind::Internal, text, "CMD_001");
}

std::string suggestion(const Error& err) {
    const std::string& c = err.code;
    if (c == "NET_001") return "Check your network connection and the cluster hostname, then reconnect.";
    if (c == "NET_002") return "The cluster is slow to respond. Try again in a moment.";
    if (c == "NET_003") return "The SSH handshake failed. The cluster may be under maintenance.";
    if (c == "NET_004") return "A session is already open or opening. Disconnect first to switch accounts.";
    if (c == "NET_005") return "The connection attempt was cancelled.";
    if (c == "AUTH_001") return "Verify your username and password. Accounts lock after repeated failures.";
    if (c == "AUTH_002") return "Your session has ended. Reconnect to continue.";
    if (c == "PERM_001") return "You do not have access to this resource. Check directory permissions.";
    if (c == "FILE_001") return "The remote file or directory does not exist.";
    if (c == "FILE_002") return "The transfer was interrupted. A partial file may remain on the cluster.";
    if (c == "FILE_003") return "The remote filesystem is full or over quota. Free space and retry.";
    if (c == "PROTO_001") return "The cluster returned unexpected output. See the details for the raw text.";
    if (c == "VAL_001") return "Use only letters, digits, '_' and '-' in names.";
    if (c == "SLURM_001") return "SLURM rejected the submission. Check the batch script and resource request.";
    if (c == "SLURM_002") return "SLURM has no record of this job. It may have been purged from accounting.";
    if (c == "CMD_001") return "A remote command failed. Check the job log for the command output.";
    if (c == "CMD_002") return "A remote command hit a network problem on the cluster side. Retry shortly.";
    return "Unexpected error. See the debug log for details.";
}

} // namespace clusterlink
