#ifndef FFMPEGCAPTUREPROCESS_H
#define FFMPEGCAPTUREPROCESS_H

#include <QProcess>
#include <QString>
#include <QStringList>

#include "capture/CaptureProcess.h"

namespace CER {

/**
 * @brief Stream-copy recorder running ffmpeg through QProcess
 *
 * Video is always copied (no re-encoding); audio is copied, encoded to
 * AAC or dropped depending on RecordingSettings::audioCodec. A graceful
 * stop sends 'q' on stdin so ffmpeg writes the MP4 trailer.
 *
 * Must be created and used on a single thread. The synchronous
 * waitFor*() calls make it usable from threads without an event loop.
 */
class FfmpegCaptureProcess : public CaptureProcess {
public:
    explicit FfmpegCaptureProcess(const RecordingSettings& settings);
    ~FfmpegCaptureProcess() override;

    bool start(const QString& sourceUrl, const QString& outputPath, QString* errorMessage) override;
    bool isRunning() override;
    bool requestGracefulStop(int graceMs) override;
    void kill() override;
    int exitCode() const override;
    QString diagnostics() const override;

    /**
     * @brief Command line for one recording
     */
    static QStringList buildArguments(const QString& sourceUrl, const QString& outputPath,
                                      const QString& audioCodec);

private:
    /**
     * @brief Keep the tail of stderr so the pipe never fills up
     */
    void drainStandardError();

    QString m_ffmpegPath;
    QString m_audioCodec;
    QProcess m_process;
    QStringList m_stderrTail;

    static constexpr int START_TIMEOUT_MS = 5000;
    static constexpr int TERMINATE_WAIT_MS = 2000;
    static constexpr int KILL_WAIT_MS = 1000;
    static constexpr int MAX_STDERR_LINES = 15;
};

} // namespace CER

#endif // FFMPEGCAPTUREPROCESS_H
