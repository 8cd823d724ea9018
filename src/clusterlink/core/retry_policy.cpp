#include "retry_policy.hpp"

namespace clusterlink {

using std::chrono::milliseconds;

RetryPolicy RetryPolicy::quick() {
    return RetryPolicy{2, milliseconds(200), milliseconds(2000), milliseconds(100)};
}

RetryPolicy RetryPolicy::network() {
    return RetryPolicy{3, milliseconds(1000), milliseconds(30000), milliseconds(500)};
}

RetryPolicy RetryPolicy::files() {
    return RetryPolicy{5, milliseconds(2000), milliseconds(60000), milliseconds(1000)};
}

RetryPolicy RetryPolicy::none() {
    return RetryPolicy{1, milliseconds(0), milliseconds(0), milliseconds(0)};
}

} // namespace clusterlink
