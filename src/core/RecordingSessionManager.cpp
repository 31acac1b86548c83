#include "RecordingSessionManager.h"
#include "capture/ClipInspector.h"
#include "utils/Logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

namespace CER {

RecordingSessionManager::RecordingSessionManager(const DeviceConfig& device,
                                                 const RecordingSettings& settings,
                                                 CaptureProcessFactory processFactory,
                                                 SnapshotFetcherFactory snapshotFactory,
                                                 QObject* parent)
    : QObject(parent)
    , m_device(device)
    , m_settings(settings)
    , m_processFactory(std::move(processFactory))
    , m_snapshotFactory(std::move(snapshotFactory))
{
    m_session.deviceName = device.name;
}

RecordingSessionManager::~RecordingSessionManager() {
    stopSession();
}

QString RecordingSessionManager::deviceDirectory() const {
    return QDir(m_settings.outputDirectory).filePath(m_device.name);
}

QString RecordingSessionManager::snapshotDirectory() const {
    return QDir(deviceDirectory()).filePath("snapshots");
}

QString RecordingSessionManager::clipDirectory() const {
    return QDir(deviceDirectory()).filePath("clips");
}

bool RecordingSessionManager::startSession(const SessionCommand& command, Error* error) {
    const QString tag = deviceTag(m_device.name);

    if (m_session.isActive()) {
        reportError(Error::sessionStart(QString("session %1 is still %2")
                                            .arg(m_session.sessionId,
                                                 sessionStatusName(m_session.status))),
                    error);
        return false;
    }

    if (!ensureDirectoryExists(snapshotDirectory()) || !ensureDirectoryExists(clipDirectory())) {
        reportError(Error::sessionStart(QString("failed to create output directory: %1")
                                            .arg(deviceDirectory())),
                    error);
        return false;
    }

    const QDateTime startedAt = command.at.isValid() ? command.at : QDateTime::currentDateTime();
    const QString artifact = generateArtifactName(startedAt);

    RecordingSession session;
    session.sessionId = QString("%1/%2").arg(m_device.name, artifact);
    session.deviceName = m_device.name;
    session.startedAt = startedAt;
    session.startedAtMs = command.atMs;
    session.deadlineMs = command.deadlineMs;
    session.snapshotPath = QDir(snapshotDirectory()).filePath(artifact + ".jpg");
    session.clipPath = QDir(clipDirectory()).filePath(artifact + ".mp4");
    session.status = SessionStatus::Starting;
    m_session = session;

    std::unique_ptr<CaptureProcess> process = m_processFactory ? m_processFactory() : nullptr;
    if (!process) {
        m_session.status = SessionStatus::Stopped;
        reportError(Error::sessionStart("no capture process available"), error);
        return false;
    }

    QString startError;
    if (!process->start(m_device.rtspStreamUrl(), m_session.clipPath, &startError)) {
        m_session.status = SessionStatus::Stopped;
        reportError(Error::sessionStart(QString("failed to launch capture: %1").arg(startError)),
                    error);
        return false;
    }

    m_process = std::move(process);
    m_session.status = SessionStatus::Running;
    m_sessionCount++;

    qCInfo(lcSession).noquote() << tag << "recording started:" << m_session.clipPath;
    emit sessionStarted(m_device.name, m_session.sessionId, m_session.clipPath);

    // The clip is already running, so the snapshot cannot delay it
    if (m_settings.snapshotsEnabled) {
        captureSnapshot();
    }
    return true;
}

void RecordingSessionManager::extendSession(qint64 deadlineMs) {
    if (m_session.status != SessionStatus::Running) {
        return;
    }
    if (deadlineMs > m_session.deadlineMs) {
        qCDebug(lcSession).noquote() << deviceTag(m_device.name) << "extended by"
                                     << (deadlineMs - m_session.deadlineMs) << "ms";
        m_session.deadlineMs = deadlineMs;
    }
}

void RecordingSessionManager::stopSession() {
    if (!m_session.isActive()) {
        return;
    }

    const QString tag = deviceTag(m_device.name);
    m_session.status = SessionStatus::Stopping;

    Error fault;
    if (m_process) {
        if (m_process->requestGracefulStop(m_settings.stopGraceMs)) {
            const int code = m_process->exitCode();
            if (code != 0) {
                // Died on its own before the stop request reached it
                const QString diagnostics = m_process->diagnostics();
                if (!diagnostics.isEmpty()) {
                    qCWarning(lcSession).noquote() << tag << "capture output:\n" << diagnostics;
                }
                fault = Error::processFault(QString("capture exited with code %1 before stop")
                                                .arg(code));
            } else {
                qCDebug(lcSession).noquote() << tag << "capture exited cleanly";
            }
        } else {
            qCWarning(lcSession).noquote() << tag << "capture did not stop gracefully, killing it";
            m_process->kill();
        }
        m_process.reset();
    }

    finalizeClip();
    m_session.status = SessionStatus::Stopped;

    if (fault.isSet()) {
        reportError(fault, nullptr);
    }
    qCInfo(lcSession).noquote() << tag << "recording stopped:" << m_session.sessionId;
    emit sessionStopped(m_device.name, m_session.sessionId, m_session.clipPath);
}

bool RecordingSessionManager::pollProcess(Error* error) {
    if (m_session.status != SessionStatus::Running || !m_process) {
        return true;
    }
    if (m_process->isRunning()) {
        return true;
    }

    const QString tag = deviceTag(m_device.name);
    const int code = m_process->exitCode();
    const QString diagnostics = m_process->diagnostics();
    m_process.reset();

    qCWarning(lcSession).noquote() << tag << "capture exited unexpectedly with code" << code
                                   << "- clip is incomplete:" << m_session.clipPath;
    if (!diagnostics.isEmpty()) {
        qCWarning(lcSession).noquote() << tag << "capture output:\n" << diagnostics;
    }

    finalizeClip();
    m_session.status = SessionStatus::Stopped;

    reportError(Error::processFault(QString("capture exited with code %1").arg(code)), error);
    emit sessionStopped(m_device.name, m_session.sessionId, m_session.clipPath);
    return false;
}

QString RecordingSessionManager::generateArtifactName(const QDateTime& at) {
    const QString stamp = QString("person_%1").arg(at.toString("yyyyMMdd_HHmmss_zzz"));

    int suffix = (stamp == m_lastStamp) ? m_lastSuffix + 1 : 0;
    auto nameFor = [&stamp](int n) {
        return n == 0 ? stamp : QString("%1_%2").arg(stamp).arg(n);
    };

    const QDir snapshots(snapshotDirectory());
    const QDir clips(clipDirectory());
    while (clips.exists(nameFor(suffix) + ".mp4") || snapshots.exists(nameFor(suffix) + ".jpg")) {
        suffix++;
    }

    m_lastStamp = stamp;
    m_lastSuffix = suffix;
    return nameFor(suffix);
}

bool RecordingSessionManager::ensureDirectoryExists(const QString& path) {
    QDir dir(path);
    if (!dir.exists()) {
        return dir.mkpath(".");
    }
    return true;
}

void RecordingSessionManager::captureSnapshot() {
    const QString tag = deviceTag(m_device.name);

    if (!m_snapshotFetcher && m_snapshotFactory) {
        m_snapshotFetcher = m_snapshotFactory();
    }
    if (!m_snapshotFetcher) {
        qCWarning(lcSession).noquote() << tag << "snapshot skipped: no fetcher available";
        return;
    }

    QByteArray image;
    QString fetchError;
    if (!m_snapshotFetcher->fetch(m_device, &image, &fetchError)) {
        qCWarning(lcSession).noquote() << tag << "snapshot failed:" << fetchError;
        return;
    }

    QSaveFile file(m_session.snapshotPath);
    if (!file.open(QIODevice::WriteOnly)) {
        qCWarning(lcSession).noquote() << tag << "cannot write snapshot" << m_session.snapshotPath
                                       << ":" << file.errorString();
        return;
    }
    if (file.write(image) != image.size() || !file.commit()) {
        qCWarning(lcSession).noquote() << tag << "cannot write snapshot" << m_session.snapshotPath
                                       << ":" << file.errorString();
        return;
    }

    m_session.snapshotSaved = true;
    m_snapshotCount++;
    qCInfo(lcSession).noquote() << tag << "snapshot saved:" << m_session.snapshotPath;
    emit snapshotCaptured(m_device.name, m_session.snapshotPath);
}

void RecordingSessionManager::finalizeClip() {
    const QString tag = deviceTag(m_device.name);
    const QString& path = m_session.clipPath;

    const QFileInfo file(path);
    if (!file.exists()) {
        qCWarning(lcSession).noquote() << tag << "no clip was written:" << path;
        return;
    }
    if (file.size() == 0) {
        qCWarning(lcSession).noquote() << tag << "clip is empty, removing" << path;
        if (!QFile::remove(path)) {
            qCWarning(lcSession).noquote() << tag << "failed to remove" << path;
        }
        return;
    }

    const ClipInfo info = ClipInspector::inspect(path);
    if (!info.readable) {
        qCWarning(lcSession).noquote() << tag << "clip saved but not readable:" << path
                                       << QString("(%1 MB, %2)")
                                              .arg(info.sizeMegabytes(), 0, 'f', 2)
                                              .arg(info.errorMessage);
        return;
    }

    qCInfo(lcSession).noquote() << tag << "clip saved:" << path
                                << QString("(%1 MB, %2 s, %3 %4x%5)")
                                       .arg(info.sizeMegabytes(), 0, 'f', 2)
                                       .arg(info.durationSeconds, 0, 'f', 1)
                                       .arg(info.videoCodec)
                                       .arg(info.width)
                                       .arg(info.height);
}

void RecordingSessionManager::reportError(const Error& error, Error* out) {
    qCWarning(lcSession).noquote() << deviceTag(m_device.name) << error.toString();
    setError(out, error);
    emit errorOccurred(m_device.name, error);
}

} // namespace CER
