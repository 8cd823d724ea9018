#include "retry.hpp"
#include <mutex>
#include <thread>

namespace clusterlink {

using std::chrono::milliseconds;

milliseconds backoff_delay(const RetryPolicy& policy, int attempt) {
    if (attempt < 1) attempt = 1;
    long long delay = policy.base_delay.count();
    for (int i = 1; i < attempt; i++) {
        delay *= 2;
        if (delay >= policy.max_delay.count()) break;
    }
    if (policy.max_delay.count() > 0 && delay > policy.max_delay.count()) {
        delay = policy.max_delay.count();
    }
    return milliseconds(delay);
}

RetryHooks default_retry_hooks() {
    RetryHooks hooks;
    hooks.sleep = [](milliseconds d) { std::this_thread::sleep_for(d); };
    hooks.jitter = [](milliseconds bound) {
        static std::mutex rng_mutex;
        static std::mt19937 rng(std::random_device{}());
        std::lock_guard<std::mutex> lock(rng_mutex);
        std::uniform_int_distribution<long long> dist(0, bound.count());
        return milliseconds(dist(rng));
    };
    return hooks;
}

} // namespace clusterlink
