#ifndef CLOCK_H
#define CLOCK_H

#include <QDateTime>
#include <QElapsedTimer>
#include <QtGlobal>

namespace CER {

/**
 * @brief Time source used by the detection and subscription logic
 *
 * Deadlines are computed on the monotonic reading; the wall clock is
 * only used for artifact names and log output. Tests substitute a
 * manually advanced implementation.
 */
class Clock {
public:
    virtual ~Clock() = default;

    /**
     * @brief Milliseconds on a monotonic time base (never goes backwards)
     */
    virtual qint64 monotonicMs() const = 0;

    /**
     * @brief Current local wall-clock time
     */
    virtual QDateTime now() const = 0;
};

/**
 * @brief Clock backed by QElapsedTimer and the system time
 */
class SystemClock : public Clock {
public:
    SystemClock();

    qint64 monotonicMs() const override;
    QDateTime now() const override;

private:
    QElapsedTimer m_timer;
};

} // namespace CER

#endif // CLOCK_H
