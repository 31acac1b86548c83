#ifndef RECORDINGSESSIONMANAGER_H
#define RECORDINGSESSIONMANAGER_H

#include <QObject>
#include <QString>
#include <QDateTime>
#include <memory>

#include "capture/CaptureProcess.h"
#include "capture/SnapshotFetcher.h"
#include "core/Config.h"
#include "core/DetectionStateMachine.h"
#include "core/Errors.h"
#include "core/RecordingSession.h"

namespace CER {

/**
 * @brief Owns the recording of one device
 *
 * Each session writes a snapshot and a stream-copied clip:
 *   {outputDir}/{device}/snapshots/person_{yyyyMMdd_HHmmss_zzz}.jpg
 *   {outputDir}/{device}/clips/person_{yyyyMMdd_HHmmss_zzz}.mp4
 *
 * At most one session is active at a time. Between start and stop the
 * manager exclusively owns the capture process and both paths; the
 * destructor stops a session that is still running.
 *
 * Lives on the pipeline thread that created it.
 */
class RecordingSessionManager : public QObject {
    Q_OBJECT

public:
    RecordingSessionManager(const DeviceConfig& device, const RecordingSettings& settings,
                            CaptureProcessFactory processFactory,
                            SnapshotFetcherFactory snapshotFactory,
                            QObject* parent = nullptr);
    ~RecordingSessionManager() override;

    /**
     * @brief Start a new session for a Start command
     * @param command Start command from the state machine
     * @param error Receives a SessionStartError on failure
     * @return true if the capture process is running
     *
     * A failed snapshot is logged and does not fail the session.
     */
    bool startSession(const SessionCommand& command, Error* error = nullptr);

    /**
     * @brief Record a new deadline for the running session
     */
    void extendSession(qint64 deadlineMs);

    /**
     * @brief Stop and finalize the active session
     *
     * Sends the graceful stop, waits the configured grace period and
     * then escalates to terminate/kill. No-op without an active session.
     */
    void stopSession();

    /**
     * @brief Check that the capture process is still alive
     * @param error Receives a ProcessFault if it exited on its own
     * @return false if the session was lost
     */
    bool pollProcess(Error* error = nullptr);

    bool hasActiveSession() const { return m_session.isActive(); }
    const RecordingSession& currentSession() const { return m_session; }

    int sessionCount() const { return m_sessionCount; }
    int snapshotCount() const { return m_snapshotCount; }

    QString deviceDirectory() const;
    QString snapshotDirectory() const;
    QString clipDirectory() const;

signals:
    void sessionStarted(const QString& deviceName, const QString& sessionId,
                        const QString& clipPath);
    void sessionStopped(const QString& deviceName, const QString& sessionId,
                        const QString& clipPath);
    void snapshotCaptured(const QString& deviceName, const QString& snapshotPath);
    void errorOccurred(const QString& deviceName, const CER::Error& error);

private:
    /**
     * @brief Artifact base name, unique within the device directory
     */
    QString generateArtifactName(const QDateTime& at);

    /**
     * @brief Ensure output directory exists
     */
    bool ensureDirectoryExists(const QString& path);

    void captureSnapshot();
    void finalizeClip();
    void reportError(const Error& error, Error* out);

    DeviceConfig m_device;
    RecordingSettings m_settings;
    CaptureProcessFactory m_processFactory;
    SnapshotFetcherFactory m_snapshotFactory;

    RecordingSession m_session;
    std::unique_ptr<CaptureProcess> m_process;
    std::unique_ptr<SnapshotFetcher> m_snapshotFetcher;

    QString m_lastStamp;
    int m_lastSuffix = 0;
    int m_sessionCount = 0;
    int m_snapshotCount = 0;
};

} // namespace CER

#endif // RECORDINGSESSIONMANAGER_H
