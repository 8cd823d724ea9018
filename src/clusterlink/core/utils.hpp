#pragma once

#include <string>
#include <vector>

namespace clusterlink {

// ISO 8601 UTC timestamp for the current time: 2025-01-15T10:00:00Z
std::string now_iso();

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

inline std::string trimmed(std::string s) {
    trim(s);
    return s;
}

// Split on a delimiter, keeping empty fields ("a||b" -> {"a", "", "b"}).
std::vector<std::string> split(const std::string& str, char delimiter);

// Non-empty lines of a block of text, each trimmed.
std::vector<std::string> split_lines(const std::string& text);

std::string join(const std::vector<std::string>& parts, const std::string& separator);

std::string to_upper(std::string s);

bool starts_with(const std::string& s, const std::string& prefix);

} // namespace clusterlink
