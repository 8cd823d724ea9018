#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <clusterlink/core/log.hpp>
#include <clusterlink/core/types.hpp>
#include <clusterlink/ssh/connection_manager.hpp>
#include "retry.hpp"
#include "worker_pool.hpp"

namespace clusterlink {

// Runs remote work on the worker pool under the session lease, with a
// per-call timeout. The timeout window opens once the lease is held, so
// time spent queued behind other callers does not count against it.
//
// A call that times out is abandoned: its worker keeps the lease until the
// transport gives up, and the caller gets a Timeout error.
class Executor {
public:
    // Returns true for a non-zero exit that should still count as success.
    using ExitFilter = std::function<bool(const RemoteCommandResult&)>;

    Executor(ConnectionManager& connection, int worker_threads);

    // Output of the command; a non-zero exit code is not an error here.
    Result<RemoteCommandResult> run(const std::string& command, int timeout_secs);

    // Like run(), but a non-zero exit becomes an error classified from stderr
    // unless `tolerated` accepts it.
    Result<RemoteCommandResult> run_checked(const std::string& command, int timeout_secs,
                                            const ExitFilter& tolerated = nullptr);

    // run_checked() under a retry policy. Exhausted timeouts expire the session.
    Result<RemoteCommandResult> run_with_retry(const std::string& command, int timeout_secs,
                                               const RetryPolicy& policy,
                                               const ExitFilter& tolerated = nullptr);

    // Arbitrary transport work (SFTP calls) with the same lease and timeout rules.
    // fn may outlive the call on timeout, so it must own what it captures.
    template <typename T>
    Result<T> with_transport(const std::string& label, int timeout_secs,
                             std::function<Result<T>(RemoteTransport&)> fn);

    ConnectionManager& connection() { return connection_; }

    void set_retry_hooks(RetryHooks hooks) { hooks_ = std::move(hooks); }
    const RetryHooks& retry_hooks() const { return hooks_; }

    // Stop the pool; pending work fails.
    void shutdown() { pool_.stop(); }

private:
    void report_transport_error(const Error& err);

    ConnectionManager& connection_;
    RetryHooks hooks_ = default_retry_hooks();
    WorkerPool pool_;
};

template <typename T>
Result<T> Executor::with_transport(const std::string& label, int timeout_secs,
                                   std::function<Result<T>(RemoteTransport&)> fn) {
    auto started = std::make_shared<std::promise<void>>();
    std::future<void> started_future = started->get_future();
    ConnectionManager* conn = &connection_;

    // Only the task holds the promise: a task dropped by shutdown breaks it
    std::future<Result<T>> fut = pool_.submit([conn, started = std::move(started), fn]() -> Result<T> {
        auto lease = conn->acquire();
        started->set_value();
        if (lease.is_err()) return Result<T>::Err(lease.error);
        return fn(lease.value.transport());
    });

    started_future.wait();
    if (fut.wait_for(std::chrono::seconds(timeout_secs)) != std::future_status::ready) {
        Error err = make_error(ErrorKind::Timeout,
                               fmt::format("{} timed out after {}s", label, timeout_secs));
        cl_log_error(label, err);
        return Result<T>::Err(err);
    }

    Result<T> result = Result<T>::Err(ErrorKind::Internal, label + ": worker stopped");
    try {
        result = fut.get();
    } catch (const std::future_error& e) {
        result = Result<T>::Err(ErrorKind::Internal, label + ": " + e.what());
    }

    if (result.is_err()) report_transport_error(result.error);
    return result;
}

} // namespace clusterlink
