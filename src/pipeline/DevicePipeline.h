#ifndef DEVICEPIPELINE_H
#define DEVICEPIPELINE_H

#include <QMutex>
#include <QThread>
#include <QWaitCondition>
#include <QString>
#include <atomic>

#include "core/Config.h"
#include "core/Errors.h"
#include "pipeline/PipelineDependencies.h"

namespace CER {

class DetectionStateMachine;
class RecordingSessionManager;
struct SessionCommand;

/**
 * @brief Event-to-recording loop of one camera
 *
 * Each iteration checks the detection deadline, polls the capture
 * process and waits for the next event for at most one tick (or until
 * the deadline, whichever comes first).
 *
 * On stop the loop ends at the next wake-up; the thread then closes the
 * subscription, stops the running session and emits shutdownComplete().
 * A pipeline whose subscription gives up emits pipelineFailed() and
 * finishes; it can be started again.
 */
class DevicePipeline : public QThread {
    Q_OBJECT

public:
    DevicePipeline(const DeviceConfig& device, const RecordingSettings& recording,
                   const EventSettings& events, const PipelineDependencies& deps,
                   QObject* parent = nullptr);
    ~DevicePipeline() override;

    /**
     * @brief Ask the loop to finish; returns immediately
     */
    void requestStop();

    bool isStopRequested() const { return m_stopRequested; }
    bool hasFailed() const { return m_failed; }

    QString deviceName() const { return m_device.name; }

    /**
     * @brief Number of sessions started since the thread was started
     */
    int sessionCount() const { return m_sessionCount; }

signals:
    void subscriptionEstablished(const QString& deviceName);
    void sessionStarted(const QString& deviceName, const QString& sessionId,
                        const QString& clipPath);
    void sessionStopped(const QString& deviceName, const QString& sessionId,
                        const QString& clipPath);
    void snapshotCaptured(const QString& deviceName, const QString& snapshotPath);
    void errorOccurred(const QString& deviceName, const CER::Error& error);

    /**
     * @brief The pipeline cannot continue; emitted before shutdownComplete()
     */
    void pipelineFailed(const QString& deviceName, const CER::Error& error);

    /**
     * @brief Subscription closed and session finalized
     */
    void shutdownComplete(const QString& deviceName);

protected:
    void run() override;

private:
    /**
     * @brief Sleep unless a stop is requested
     * @return false if the stop request interrupted the wait
     */
    bool waitForStop(int ms);

    void applyCommand(const SessionCommand& command, DetectionStateMachine& detector,
                      RecordingSessionManager& sessions);

    DeviceConfig m_device;
    RecordingSettings m_recording;
    EventSettings m_events;
    PipelineDependencies m_deps;

    std::atomic<bool> m_stopRequested{false};
    std::atomic<bool> m_failed{false};
    std::atomic<int> m_sessionCount{0};

    QMutex m_stopMutex;
    QWaitCondition m_stopCondition;
};

} // namespace CER

#endif // DEVICEPIPELINE_H
