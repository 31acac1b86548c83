#include "DetectionStateMachine.h"
#include "core/Clock.h"
#include "utils/Logging.h"

#include <algorithm>

namespace CER {

const char* detectionStateName(DetectionState state) {
    switch (state) {
        case DetectionState::Idle: return "IDLE";
        case DetectionState::Active: return "ACTIVE";
    }
    return "UNKNOWN";
}

const char* sessionCommandName(SessionCommandType type) {
    switch (type) {
        case SessionCommandType::Start: return "start_session";
        case SessionCommandType::Extend: return "extend_session";
        case SessionCommandType::Stop: return "stop_session";
    }
    return "unknown";
}

DetectionStateMachine::DetectionStateMachine(const QString& deviceName, qint64 postDetectionMs,
                                             const Clock* clock, bool holdWhilePresent)
    : m_deviceName(deviceName)
    , m_postDetectionMs(postDetectionMs)
    , m_clock(clock)
    , m_holdWhilePresent(holdWhilePresent)
{
}

SessionCommand DetectionStateMachine::makeCommand(SessionCommandType type, qint64 atMs) const {
    SessionCommand command;
    command.type = type;
    command.deviceName = m_deviceName;
    command.atMs = atMs;
    // Local wall time, the device clock may be skewed or reset
    command.at = m_clock->now();
    command.deadlineMs = m_deadlineMs;
    return command;
}

std::optional<SessionCommand> DetectionStateMachine::onEvent(const DetectionEvent& event) {
    if (!event.isPresent) {
        const bool held = m_holdWhilePresent && m_present && m_state == DetectionState::Active;
        m_present = false;
        if (!held) {
            // Absence alone never shortens the window
            return std::nullopt;
        }

        // Tail starts when the person leaves
        m_deadlineMs = std::max(m_deadlineMs, event.observedAtMs + m_postDetectionMs);
        qCDebug(lcPipeline).noquote() << deviceTag(m_deviceName) << "presence ended, deadline in"
                                      << (m_deadlineMs - event.observedAtMs) << "ms";
        return makeCommand(SessionCommandType::Extend, event.observedAtMs);
    }

    m_present = true;
    const qint64 candidate = event.observedAtMs + m_postDetectionMs;

    if (m_state == DetectionState::Idle) {
        m_state = DetectionState::Active;
        m_deadlineMs = candidate;
        m_lastPositiveMs = event.observedAtMs;
        ++m_activationCount;

        qCDebug(lcPipeline).noquote() << deviceTag(m_deviceName) << "IDLE -> ACTIVE, deadline in"
                                      << m_postDetectionMs << "ms";
        return makeCommand(SessionCommandType::Start, event.observedAtMs);
    }

    m_deadlineMs = std::max(m_deadlineMs, candidate);
    m_lastPositiveMs = std::max(m_lastPositiveMs, event.observedAtMs);
    return makeCommand(SessionCommandType::Extend, event.observedAtMs);
}

std::optional<SessionCommand> DetectionStateMachine::checkDeadline() {
    if (m_state != DetectionState::Active) {
        return std::nullopt;
    }

    const qint64 now = m_clock->monotonicMs();

    if (m_holdWhilePresent && m_present) {
        // Still present as far as the camera told us
        const qint64 held = now + m_postDetectionMs;
        if (held <= m_deadlineMs) {
            return std::nullopt;
        }
        m_deadlineMs = held;
        return makeCommand(SessionCommandType::Extend, now);
    }

    if (now < m_deadlineMs) {
        return std::nullopt;
    }

    m_state = DetectionState::Idle;

    qCDebug(lcPipeline).noquote() << deviceTag(m_deviceName) << "ACTIVE -> IDLE,"
                                  << (now - m_deadlineMs) << "ms after deadline";
    return makeCommand(SessionCommandType::Stop, now);
}

void DetectionStateMachine::reset() {
    m_state = DetectionState::Idle;
    m_deadlineMs = 0;
    m_present = false;
}

qint64 DetectionStateMachine::msUntilDeadline() const {
    if (m_state != DetectionState::Active) {
        return -1;
    }
    return std::max<qint64>(0, m_deadlineMs - m_clock->monotonicMs());
}

} // namespace CER
