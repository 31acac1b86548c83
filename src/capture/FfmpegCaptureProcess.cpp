#include "FfmpegCaptureProcess.h"
#include "core/Config.h"
#include "utils/Logging.h"

#ifdef Q_OS_UNIX
#include <unistd.h>
#endif

namespace CER {

FfmpegCaptureProcess::FfmpegCaptureProcess(const RecordingSettings& settings)
    : m_ffmpegPath(settings.ffmpegPath)
    , m_audioCodec(settings.audioCodec)
{
    m_process.setProcessChannelMode(QProcess::SeparateChannels);
    m_process.setStandardOutputFile(QProcess::nullDevice());

#ifdef Q_OS_UNIX
    // Own session: a Ctrl+C on the terminal must not reach ffmpeg directly,
    // the session manager decides when and how the clip is finalized.
    m_process.setChildProcessModifier([] { ::setsid(); });
#endif
}

FfmpegCaptureProcess::~FfmpegCaptureProcess() {
    if (m_process.state() != QProcess::NotRunning) {
        kill();
    }
}

QStringList FfmpegCaptureProcess::buildArguments(const QString& sourceUrl, const QString& outputPath,
                                                 const QString& audioCodec) {
    QStringList args{
        "-hide_banner",
        "-loglevel", "error",
        "-nostats",
        "-rtsp_transport", "tcp",   // TCP is more reliable than UDP for long captures
        "-i", sourceUrl,
        "-c:v", "copy"
    };

    if (audioCodec == "none") {
        args << "-an";
    } else if (audioCodec == "aac") {
        args << "-c:a" << "aac" << "-b:a" << "128k";
    } else {
        args << "-c:a" << "copy";
    }

    args << "-movflags" << "+faststart"
         << "-f" << "mp4"
         << "-y"
         << outputPath;
    return args;
}

bool FfmpegCaptureProcess::start(const QString& sourceUrl, const QString& outputPath,
                                 QString* errorMessage) {
    if (m_process.state() != QProcess::NotRunning) {
        if (errorMessage) {
            *errorMessage = "capture process already running";
        }
        return false;
    }

    m_stderrTail.clear();
    m_process.setProgram(m_ffmpegPath);
    m_process.setArguments(buildArguments(sourceUrl, outputPath, m_audioCodec));

    // stdin stays open for the 'q' command
    m_process.start(QIODevice::ReadWrite);
    if (!m_process.waitForStarted(START_TIMEOUT_MS)) {
        if (errorMessage) {
            *errorMessage = QString("%1: %2").arg(m_ffmpegPath, m_process.errorString());
        }
        if (m_process.state() != QProcess::NotRunning) {
            kill();
        }
        return false;
    }

    qCDebug(lcSession) << "ffmpeg started, pid" << m_process.processId() << "->" << outputPath;
    return true;
}

bool FfmpegCaptureProcess::isRunning() {
    if (m_process.state() == QProcess::NotRunning) {
        return false;
    }

    // Zero timeout: only collects pending stderr and exit notifications
    m_process.waitForFinished(0);
    drainStandardError();
    return m_process.state() != QProcess::NotRunning;
}

bool FfmpegCaptureProcess::requestGracefulStop(int graceMs) {
    if (!isRunning()) {
        return true;
    }

    if (m_process.write("q") < 0) {
        qCDebug(lcSession) << "ffmpeg stdin already closed:" << m_process.errorString();
    } else {
        m_process.waitForBytesWritten(500);
    }

    const bool finished = m_process.waitForFinished(graceMs);
    drainStandardError();

    if (m_process.state() == QProcess::NotRunning) {
        return true;
    }

    if (!finished) {
        qCWarning(lcSession) << "ffmpeg did not exit within" << graceMs << "ms";
    }
    m_process.closeWriteChannel();
    return false;
}

void FfmpegCaptureProcess::kill() {
    if (m_process.state() == QProcess::NotRunning) {
        return;
    }

    m_process.terminate();
    if (m_process.waitForFinished(TERMINATE_WAIT_MS)) {
        drainStandardError();
        return;
    }

    qCWarning(lcSession) << "ffmpeg ignored SIGTERM, killing pid" << m_process.processId();
    m_process.kill();
    m_process.waitForFinished(KILL_WAIT_MS);
    drainStandardError();
}

int FfmpegCaptureProcess::exitCode() const {
    if (m_process.exitStatus() == QProcess::CrashExit) {
        return -1;
    }
    return m_process.exitCode();
}

QString FfmpegCaptureProcess::diagnostics() const {
    return m_stderrTail.join('\n');
}

void FfmpegCaptureProcess::drainStandardError() {
    const QByteArray data = m_process.readAllStandardError();
    if (data.isEmpty()) {
        return;
    }

    const QStringList lines = QString::fromUtf8(data).split('\n', Qt::SkipEmptyParts);
    for (const QString& line : lines) {
        m_stderrTail.append(line.trimmed());
    }
    while (m_stderrTail.size() > MAX_STDERR_LINES) {
        m_stderrTail.removeFirst();
    }
}

} // namespace CER
