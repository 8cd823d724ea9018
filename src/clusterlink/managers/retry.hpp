#pragma once

#include <chrono>
#include <functional>
#include <random>
#include <string>
#include <clusterlink/core/types.hpp>
#include <clusterlink/core/log.hpp>
#include <clusterlink/core/retry_policy.hpp>

namespace clusterlink {

// Exponential part of the wait before attempt `attempt + 1` (attempt is 1-based).
std::chrono::milliseconds backoff_delay(const RetryPolicy& policy, int attempt);

// Hooks so tests can run retries without real sleeps or randomness.
struct RetryHooks {
    std::function<void(std::chrono::milliseconds)> sleep;
    std::function<std::chrono::milliseconds(std::chrono::milliseconds bound)> jitter;
};

RetryHooks default_retry_hooks();

// Called before each wait: (attempt that failed, its error, upcoming delay)
using RetryCallback = std::function<void(int, const Error&, std::chrono::milliseconds)>;

// Run op until it succeeds, fails with a non-retryable error, or the policy's
// attempts are used up. The last error is returned unchanged.
template <typename T>
Result<T> with_retry(const RetryPolicy& policy,
                     const std::function<Result<T>()>& op,
                     const RetryCallback& on_retry = nullptr,
                     const RetryHooks& hooks = default_retry_hooks()) {
    int attempts = policy.max_attempts < 1 ? 1 : policy.max_attempts;

    for (int attempt = 1; ; attempt++) {
        Result<T> result = op();
        if (result.is_ok()) return result;

        if (!result.error.retryable()) {
            return result;
        }
        if (attempt >= attempts) {
            cl_log(fmt::format("retry: giving up after {} attempts: {}",
                               attempt, result.error.to_string()));
            return result;
        }

        auto delay = backoff_delay(policy, attempt);
        if (hooks.jitter && policy.jitter_bound.count() > 0) {
            delay += hooks.jitter(policy.jitter_bound);
        }

        cl_log(fmt::format("retry: attempt {}/{} failed ({}), retrying in {}ms",
                           attempt, attempts, result.error.to_string(), delay.count()));
        if (on_retry) on_retry(attempt, result.error, delay);
        if (hooks.sleep) hooks.sleep(delay);
    }
}

} // namespace clusterlink
