#pragma once

#include <chrono>

namespace lolc::lcu {

/**
 * Bounded connect retries with a fixed delay.
 * Counts attempts in total: with a bound of 30 the 30th failure is final.
 */
class RetryPolicy {
public:
    enum class Decision {
        Retry,
        Exhausted,
    };
    
    RetryPolicy(int maxAttempts, std::chrono::milliseconds delay);
    
    Decision recordFailure();
    void reset() { m_attempts = 0; }
    
    int attempts() const { return m_attempts; }
    int maxAttempts() const { return m_maxAttempts; }
    bool exhausted() const { return m_attempts >= m_maxAttempts; }
    std::chrono::milliseconds delay() const { return m_delay; }
    
private:
    int m_maxAttempts;
    std::chrono::milliseconds m_delay;
    int m_attempts = 0;
};

} // namespace lolc::lcu
