#include "validation.hpp"
#include <cctype>
#include "constants.hpp"
#include <fmt/format.h>

namespace clusterlink {

static bool is_ident_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '_' || c == '-';
}

static bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

static Result<std::string> invalid(const std::string& what, const std::string& why) {
    return Result<std::string>::Err(ErrorKind::Validation, fmt::format("Invalid {}: {}", what, why));
}

// Shared checks for anything that becomes a path component.
static Result<std::string> check_component(const std::string& input, const std::string& what,
                                           bool allow_dot) {
    if (input.empty()) return invalid(what, "must not be empty");
    if (input.size() > MAX_IDENTIFIER_LENGTH) {
        return invalid(what, fmt::format("longer than {} characters", MAX_IDENTIFIER_LENGTH));
    }
    if (input.find('\0') != std::string::npos) return invalid(what, "contains a null byte");
    if (input.find("..") != std::string::npos) return invalid(what, "contains '..'");
    if (input.find('/') != std::string::npos || input.find('\\') != std::string::npos) {
        return invalid(what, "contains a path separator");
    }
    for (char c : input) {
        if (is_ident_char(c)) continue;
        if (allow_dot && c == '.') continue;
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || uc >= 0x7f) return invalid(what, "contains a non-printable character");
        return invalid(what, fmt::format("character '{}' is not allowed", c));
    }
    return Result<std::string>::Ok(input);
}

Result<std::string> sanitize_identifier(const std::string& input) {
    return check_component(input, "identifier", false);
}

Result<std::string> sanitize_username(const std::string& input) {
    return check_component(input, "username", true);
}

Result<std::string> validate_hostname(const std::string& input) {
    if (input.empty()) return invalid("hostname", "must not be empty");
    if (input.size() > 253) return invalid("hostname", "too long");
    for (char c : input) {
        bool ok = is_ident_char(c) || c == '.' || c == ':';
        if (!ok || c == '_') return invalid("hostname", "contains characters outside [A-Za-z0-9.-:]");
    }
    return Result<std::string>::Ok(input);
}

Result<std::string> validate_scheduler_id(const std::string& input) {
    if (input.empty()) return invalid("scheduler job id", "must not be empty");
    if (input.size() > MAX_IDENTIFIER_LENGTH) return invalid("scheduler job id", "too long");

    size_t i = 0;
    while (i < input.size() && is_digit(input[i])) i++;
    if (i == 0) return invalid("scheduler job id", "must start with digits");
    if (i < input.size()) {
        // Array task (123_4) or step (123.batch) suffix
        if ((input[i] != '_' && input[i] != '.') || i + 1 == input.size()) {
            return invalid("scheduler job id", "'" + input + "'");
        }
        for (size_t j = i + 1; j < input.size(); j++) {
            if (!std::isalnum(static_cast<unsigned char>(input[j]))) {
                return invalid("scheduler job id", "'" + input + "'");
            }
        }
    }
    return Result<std::string>::Ok(input);
}

static bool has_dotdot_component(const std::string& path) {
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos) end = path.size();
        if (path.compare(start, end - start, "..") == 0) return true;
        start = end + 1;
    }
    return false;
}

Result<std::string> validate_relative_path(const std::string& input) {
    if (input.empty()) return invalid("file path", "must not be empty");
    if (input.find('\0') != std::string::npos) return invalid("file path", "contains a null byte");
    if (input[0] == '/' || input[0] == '\\') return invalid("file path", "must be relative");
    if (input.find('\\') != std::string::npos) return invalid("file path", "contains a backslash");
    if (has_dotdot_component(input)) return invalid("file path", "contains '..'");
    return Result<std::string>::Ok(input);
}

Result<std::string> validate_remote_path(const std::string& input,
                                         const std::vector<std::string>& allowed_prefixes) {
    if (input.empty()) return invalid("remote path", "must not be empty");
    if (input.find('\0') != std::string::npos) return invalid("remote path", "contains a null byte");
    if (input[0] != '/') return invalid("remote path", "must be absolute");
    if (has_dotdot_component(input)) return invalid("remote path", "contains '..'");

    if (!allowed_prefixes.empty()) {
        bool allowed = false;
        for (const auto& prefix : allowed_prefixes) {
            if (prefix.empty()) continue;
            if (input.compare(0, prefix.size(), prefix) == 0 &&
                (input.size() == prefix.size() || input[prefix.size()] == '/' ||
                 prefix.back() == '/')) {
                allowed = true;
                break;
            }
        }
        if (!allowed) return invalid("remote path", "'" + input + "' is outside the allowed directories");
    }
    return Result<std::string>::Ok(input);
}

std::string escape_for_command(const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\'') {
            out += "'\"'\"'";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

std::string safe_cd_and_run(const std::string& dir, const std::string& command) {
    return fmt::format("cd {} && {}", escape_for_command(dir), command);
}

} // namespace clusterlink
