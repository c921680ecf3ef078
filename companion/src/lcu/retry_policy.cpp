#include "lcu/retry_policy.hpp"
#include <algorithm>

namespace lolc::lcu {

RetryPolicy::RetryPolicy(int maxAttempts, std::chrono::milliseconds delay)
    : m_maxAttempts(std::max(1, maxAttempts))
    , m_delay(delay)
{
}

RetryPolicy::Decision RetryPolicy::recordFailure() {
    if (m_attempts < m_maxAttempts) {
        m_attempts++;
    }
    return exhausted() ? Decision::Exhausted : Decision::Retry;
}

} // namespace lolc::lcu
