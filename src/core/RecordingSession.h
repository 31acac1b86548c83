#ifndef RECORDINGSESSION_H
#define RECORDINGSESSION_H

#include <QDateTime>
#include <QString>

namespace CER {

enum class SessionStatus {
    Starting,
    Running,
    Stopping,
    Stopped
};

const char* sessionStatusName(SessionStatus status);

/**
 * @brief One detection episode: a snapshot plus a clip
 *
 * The capture process handle belongs to the RecordingSessionManager
 * that owns the session.
 */
struct RecordingSession {
    QString sessionId;
    QString deviceName;
    QDateTime startedAt;
    qint64 startedAtMs = 0;
    QString snapshotPath;
    QString clipPath;
    qint64 deadlineMs = 0;
    SessionStatus status = SessionStatus::Stopped;
    bool snapshotSaved = false;

    bool isActive() const { return status != SessionStatus::Stopped; }
};

} // namespace CER

#endif // RECORDINGSESSION_H
