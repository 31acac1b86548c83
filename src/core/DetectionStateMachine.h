#ifndef DETECTIONSTATEMACHINE_H
#define DETECTIONSTATEMACHINE_H

#include <QDateTime>
#include <QString>
#include <optional>

#include "core/DetectionEvent.h"

namespace CER {

class Clock;

enum class DetectionState {
    Idle,    // No recording
    Active   // Recording, including the post-detection tail
};

enum class SessionCommandType {
    Start,
    Extend,
    Stop
};

/**
 * @brief Command handed from the state machine to the session manager
 */
struct SessionCommand {
    SessionCommandType type = SessionCommandType::Start;
    QString deviceName;
    qint64 atMs = 0;        // Monotonic time the command was decided
    QDateTime at;           // Wall time for artifact naming
    qint64 deadlineMs = 0;  // Authoritative deadline after this command
};

const char* detectionStateName(DetectionState state);
const char* sessionCommandName(SessionCommandType type);

/**
 * @brief Per-device debouncing of presence notifications
 *
 * Idle --present--> Active (Start), Active --present--> Active (Extend),
 * Active --deadline--> Idle (Stop). Absence notifications never shorten
 * the window and the deadline only moves forward.
 *
 * With holdWhilePresent the last reported presence is latched: while it
 * is true the deadline keeps following the clock, and the tail is
 * measured from the absence notification. This suits cameras that only
 * report presence changes.
 *
 * Not thread-safe; owned by exactly one device pipeline.
 */
class DetectionStateMachine {
public:
    DetectionStateMachine(const QString& deviceName, qint64 postDetectionMs, const Clock* clock,
                          bool holdWhilePresent = false);

    /**
     * @brief Feed one notification
     * @return Start or Extend for a positive event, Extend for an absence
     *         that ends a held presence, nothing otherwise
     */
    std::optional<SessionCommand> onEvent(const DetectionEvent& event);

    /**
     * @brief Evaluate the deadline against the clock
     * @return Stop when the post-detection window has elapsed, Extend
     *         while a held presence moves the deadline
     *
     * Must be called periodically even without events.
     */
    std::optional<SessionCommand> checkDeadline();

    /**
     * @brief Return to Idle without emitting a command
     *
     * Used when the session could not be started or its capture
     * process died, so the next positive detection starts afresh.
     */
    void reset();

    DetectionState state() const { return m_state; }
    bool isActive() const { return m_state == DetectionState::Active; }

    /**
     * @brief Current deadline (only meaningful while Active)
     */
    qint64 deadlineMs() const { return m_deadlineMs; }

    /**
     * @brief Milliseconds until the deadline, 0 if already due, -1 when Idle
     */
    qint64 msUntilDeadline() const;

    qint64 lastPositiveMs() const { return m_lastPositiveMs; }
    bool isPresent() const { return m_present; }
    int activationCount() const { return m_activationCount; }
    QString deviceName() const { return m_deviceName; }
    qint64 postDetectionMs() const { return m_postDetectionMs; }

private:
    SessionCommand makeCommand(SessionCommandType type, qint64 atMs) const;

    QString m_deviceName;
    qint64 m_postDetectionMs;
    const Clock* m_clock;
    bool m_holdWhilePresent;

    DetectionState m_state{DetectionState::Idle};
    qint64 m_deadlineMs{0};
    qint64 m_lastPositiveMs{0};
    int m_activationCount{0};
    bool m_present{false};
};

} // namespace CER

#endif // DETECTIONSTATEMACHINE_H
