#pragma once

#include <string>
#include <vector>
#include <functional>
#include <cstdint>
#include "errors.hpp"

namespace clusterlink {

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    Error error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), Error{}};
    }

    static Result<T> Err(const Error& err) {
        return {false, T{}, err};
    }

    static Result<T> Err(ErrorKind kind, const std::string& message) {
        return {false, T{}, make_error(kind, message)};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    Error error;

    static Result<void> Ok() {
        return {true, Error{}};
    }

    static Result<void> Err(const Error& err) {
        return {false, err};
    }

    static Result<void> Err(ErrorKind kind, const std::string& message) {
        return {false, make_error(kind, message)};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Output of one remote command. A non-zero exit code is data, not an error.
struct RemoteCommandResult {
    int exit_code = 0;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

struct TransferProgress {
    std::string file_name;
    uint64_t bytes_transferred = 0;
    uint64_t total_bytes = 0;
    double percentage = 0.0;
};

struct RemoteFileInfo {
    std::string name;
    std::string path;
    uint64_t size = 0;
    bool is_directory = false;
    unsigned long permissions = 0;
    uint64_t modified_time = 0;     // seconds since epoch
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
using ProgressCallback = std::function<void(const TransferProgress&)>;

} // namespace clusterlink
