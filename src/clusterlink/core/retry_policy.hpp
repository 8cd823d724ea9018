#pragma once

#include <chrono>

namespace clusterlink {

struct RetryPolicy {
    int max_attempts = 3;                               // total attempts, including the first
    std::chrono::milliseconds base_delay{1000};         // delay before the 2nd attempt
    std::chrono::milliseconds max_delay{30000};         // cap on the exponential part
    std::chrono::milliseconds jitter_bound{500};        // uniform [0, jitter_bound] added per wait

    static RetryPolicy quick();     // 2 attempts, 200ms base
    static RetryPolicy network();   // 3 attempts, 1s base
    static RetryPolicy files();     // 5 attempts, 2s base
    static RetryPolicy none();      // single attempt
};

} // namespace clusterlink
