#include "Clock.h"

namespace CER {

SystemClock::SystemClock() {
    m_timer.start();
}

qint64 SystemClock::monotonicMs() const {
    return m_timer.elapsed();
}

QDateTime SystemClock::now() const {
    return QDateTime::currentDateTime();
}

} // namespace CER
