#pragma once

#include <string>

namespace clusterlink {

enum class ErrorKind {
    Network,
    Authentication,
    Permission,
    FileSystem,
    Protocol,
    Timeout,
    Validation,
    Internal,
};

struct Error {
    ErrorKind kind = ErrorKind::Internal;
    std::string message;
    std::string code;       // stable identifier, e.g. "NET_001"
    std::string details;    // raw offending text (protocol errors), stderr, etc.

    bool retryable() const;

    // "Network error: connection refused"
    std::string to_string() const;
};

const char* error_kind_name(ErrorKind kind);

// Network and Timeout are the only transient kinds.
bool is_retryable(ErrorKind kind);

// Build an error; an empty code picks the default code for the kind.
Error make_error(ErrorKind kind, const std::string& message,
                 const std::string& code = "", const std::string& details = "");

// Classify free-form failure text (remote stderr, library messages).
Error classify_message(const std::string& text);

// One-line hint for the user, keyed by error code.
std::string suggestion(const Error& err);

} // namespace clusterlink
