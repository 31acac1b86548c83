#ifndef RECONNECTBACKOFF_H
#define RECONNECTBACKOFF_H

#include <QtGlobal>

namespace CER {

/**
 * @brief Bounded exponential backoff between reconnect attempts
 *
 * delay = base * 2^(failures - 1), capped at maxDelay.
 */
class ReconnectBackoff {
public:
    /**
     * @param maxAttempts Consecutive failures allowed, 0 for unlimited
     */
    ReconnectBackoff(int baseDelayMs, int maxDelayMs, int maxAttempts = 0);

    /**
     * @brief Register one failure and return the delay before the next attempt
     */
    int nextDelayMs();

    /**
     * @brief Forget all failures after a successful connection
     */
    void reset() { m_failures = 0; }

    int failures() const { return m_failures; }
    bool exhausted() const { return m_maxAttempts > 0 && m_failures >= m_maxAttempts; }

private:
    int m_baseDelayMs;
    int m_maxDelayMs;
    int m_maxAttempts;
    int m_failures = 0;
};

} // namespace CER

#endif // RECONNECTBACKOFF_H
