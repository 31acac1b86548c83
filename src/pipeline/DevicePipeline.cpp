#include "DevicePipeline.h"
#include "core/DetectionStateMachine.h"
#include "core/RecordingSessionManager.h"
#include "events/SubscriptionClient.h"
#include "utils/Logging.h"

#include <QMutexLocker>

namespace CER {

DevicePipeline::DevicePipeline(const DeviceConfig& device, const RecordingSettings& recording,
                               const EventSettings& events, const PipelineDependencies& deps,
                               QObject* parent)
    : QThread(parent)
    , m_device(device)
    , m_recording(recording)
    , m_events(events)
    , m_deps(deps)
{
    setObjectName(QString("pipeline-%1").arg(device.name));
}

DevicePipeline::~DevicePipeline() {
    requestStop();
    wait();
}

void DevicePipeline::requestStop() {
    QMutexLocker locker(&m_stopMutex);
    m_stopRequested = true;
    m_stopCondition.wakeAll();
}

bool DevicePipeline::waitForStop(int ms) {
    QMutexLocker locker(&m_stopMutex);
    if (m_stopRequested) {
        return false;
    }
    m_stopCondition.wait(&m_stopMutex, static_cast<unsigned long>(qMax(0, ms)));
    return !m_stopRequested;
}

void DevicePipeline::run() {
    const QString tag = deviceTag(m_device.name);
    m_failed = false;
    m_sessionCount = 0;

    std::unique_ptr<EventTransport> transport =
        m_deps.transportFactory ? m_deps.transportFactory(m_device) : nullptr;
    if (!transport || !m_deps.clock) {
        const Error error = Error::connect("pipeline has no event transport or clock");
        qCCritical(lcPipeline).noquote() << tag << error.toString();
        m_failed = true;
        emit pipelineFailed(m_device.name, error);
        emit shutdownComplete(m_device.name);
        return;
    }

    const Clock* clock = m_deps.clock.get();
    DetectionStateMachine detector(m_device.name, m_recording.postDetectionMs, clock,
                                   m_recording.holdWhilePresent);

    RecordingSessionManager sessions(m_device, m_recording, m_deps.captureFactory,
                                     m_deps.snapshotFactory);
    // Direct: re-emitted from this thread, receivers pick their own connection type
    connect(&sessions, &RecordingSessionManager::sessionStarted,
            this, &DevicePipeline::sessionStarted, Qt::DirectConnection);
    connect(&sessions, &RecordingSessionManager::sessionStopped,
            this, &DevicePipeline::sessionStopped, Qt::DirectConnection);
    connect(&sessions, &RecordingSessionManager::snapshotCaptured,
            this, &DevicePipeline::snapshotCaptured, Qt::DirectConnection);
    connect(&sessions, &RecordingSessionManager::errorOccurred,
            this, &DevicePipeline::errorOccurred, Qt::DirectConnection);

    SubscriptionClient client(m_device, m_events, std::move(transport), clock);
    client.setSleeper([this](int ms) { return waitForStop(ms); });

    qCInfo(lcPipeline).noquote() << tag << "pipeline started";

    Error error;
    if (client.connect(&error)) {
        emit subscriptionEstablished(m_device.name);
    } else {
        emit errorOccurred(m_device.name, error);
    }

    Error failure;
    bool wasConnected = client.isConnected();

    while (!m_stopRequested) {
        if (auto command = detector.checkDeadline()) {
            applyCommand(*command, detector, sessions);
        }

        Error fault;
        if (!sessions.pollProcess(&fault)) {
            detector.reset();
        }

        int waitMs = m_events.tickIntervalMs;
        const qint64 untilDeadline = detector.msUntilDeadline();
        if (untilDeadline >= 0 && untilDeadline < waitMs) {
            waitMs = static_cast<int>(untilDeadline);
        }

        DetectionEvent event;
        error.clear();
        const PollResult result = client.nextEvent(waitMs, &event, &error);

        if (client.isConnected() != wasConnected) {
            wasConnected = client.isConnected();
            if (wasConnected) {
                emit subscriptionEstablished(m_device.name);
            }
        }

        if (result == PollResult::Event) {
            // A detection arriving after the deadline belongs to a new session
            if (auto command = detector.checkDeadline()) {
                applyCommand(*command, detector, sessions);
            }
            qCDebug(lcPipeline).noquote() << tag << "person"
                                          << (event.isPresent ? "present" : "absent")
                                          << "(device time"
                                          << event.deviceTime.toString(Qt::ISODateWithMs) << ")";
            if (auto command = detector.onEvent(event)) {
                applyCommand(*command, detector, sessions);
            }
        } else if (result == PollResult::Failed) {
            failure = error;
            m_failed = true;
            break;
        } else if (result == PollResult::Closed) {
            break;
        }
    }

    client.close();
    sessions.stopSession();
    detector.reset();

    if (m_failed) {
        qCCritical(lcPipeline).noquote() << tag << "pipeline failed:" << failure.toString();
        emit pipelineFailed(m_device.name, failure);
    }

    qCInfo(lcPipeline).noquote() << tag << "pipeline stopped," << m_sessionCount.load() << "session(s)";
    emit shutdownComplete(m_device.name);
}

void DevicePipeline::applyCommand(const SessionCommand& command, DetectionStateMachine& detector,
                                  RecordingSessionManager& sessions) {
    const QString tag = deviceTag(m_device.name);

    switch (command.type) {
        case SessionCommandType::Start: {
            qCInfo(lcPipeline).noquote() << tag << "person detected, recording for at least"
                                         << m_recording.postDetectionMs / 1000.0 << "s";
            Error error;
            if (sessions.startSession(command, &error)) {
                m_sessionCount++;
            } else {
                // Next positive detection tries again
                detector.reset();
            }
            break;
        }
        case SessionCommandType::Extend:
            sessions.extendSession(command.deadlineMs);
            break;
        case SessionCommandType::Stop:
            qCInfo(lcPipeline).noquote() << tag << "no detection for"
                                         << m_recording.postDetectionMs / 1000.0
                                         << "s, stopping recording";
            sessions.stopSession();
            break;
    }
}

} // namespace CER
