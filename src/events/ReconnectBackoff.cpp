#include "ReconnectBackoff.h"

namespace CER {

ReconnectBackoff::ReconnectBackoff(int baseDelayMs, int maxDelayMs, int maxAttempts)
    : m_baseDelayMs(qMax(1, baseDelayMs))
    , m_maxDelayMs(qMax(m_baseDelayMs, maxDelayMs))
    , m_maxAttempts(qMax(0, maxAttempts))
{
}

int ReconnectBackoff::nextDelayMs() {
    m_failures++;

    qint64 delay = m_baseDelayMs;
    for (int i = 1; i < m_failures; i++) {
        delay *= 2;
        if (delay >= m_maxDelayMs) {
            return m_maxDelayMs;
        }
    }
    return static_cast<int>(delay);
}

} // namespace CER
