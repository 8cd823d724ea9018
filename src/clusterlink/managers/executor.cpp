#include "executor.hpp"
#include <clusterlink/core/utils.hpp>

namespace clusterlink {

Executor::Executor(ConnectionManager& connection, int worker_threads)
    : connection_(connection), pool_(worker_threads) {}

void Executor::report_transport_error(const Error& err) {
    switch (err.kind) {
        case ErrorKind::Network:
        case ErrorKind::Protocol:
        case ErrorKind::Permission:
            connection_.report_failure(err);
            break;
        default:
            // Not-connected errors come back as Authentication; the
            // manager ignores reports unless it is Connected
            if (err.kind == ErrorKind::Authentication && err.code != "AUTH_002") {
                connection_.report_failure(err);
            }
            break;
    }
}

Result<RemoteCommandResult> Executor::run(const std::string& command, int timeout_secs) {
    auto result = with_transport<RemoteCommandResult>(
        "ssh", timeout_secs,
        [command, timeout_secs](RemoteTransport& t) { return t.exec(command, timeout_secs); });

    if (result.is_ok()) {
        cl_log_ssh("ssh", command, result.value);
    } else {
        cl_log(fmt::format("ssh CMD: {}", command));
        cl_log_error("ssh", result.error);
    }
    return result;
}

Result<RemoteCommandResult> Executor::run_checked(const std::string& command, int timeout_secs,
                                                  const ExitFilter& tolerated) {
    auto result = run(command, timeout_secs);
    if (result.is_err() || result.value.success()) return result;
    if (tolerated && tolerated(result.value)) return result;

    const auto& r = result.value;
    std::string text = trimmed(r.stderr_data.empty() ? r.stdout_data : r.stderr_data);
    if (text.empty()) text = fmt::format("Command exited with status {}", r.exit_code);

    Error err = classify_message(text);
    err.details = r.stderr_data;
    // Remote command reported it; the session itself is fine
    if (err.kind == ErrorKind::Timeout || err.kind == ErrorKind::Network) err.code = "CMD_002";
    return Result<RemoteCommandResult>::Err(err);
}

Result<RemoteCommandResult> Executor::run_with_retry(const std::string& command, int timeout_secs,
                                                     const RetryPolicy& policy,
                                                     const ExitFilter& tolerated) {
    auto result = with_retry<RemoteCommandResult>(
        policy, [&]() { return run_checked(command, timeout_secs, tolerated); }, nullptr, hooks_);

    if (result.is_err() && result.error.kind == ErrorKind::Timeout && result.error.code == "NET_002") {
        connection_.report_failure(result.error, true);
    }
    return result;
}

} // namespace clusterlink
