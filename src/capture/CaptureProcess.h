#ifndef CAPTUREPROCESS_H
#define CAPTUREPROCESS_H

#include <QString>
#include <functional>
#include <memory>

namespace CER {

struct RecordingSettings;

/**
 * @brief External stream-copy recorder process
 *
 * One instance records one clip. The owner must call requestGracefulStop() or kill()
 * before dropping it; implementations also terminate the process in
 * their destructor.
 */
class CaptureProcess {
public:
    virtual ~CaptureProcess() = default;

    /**
     * @brief Launch the recorder
     * @param sourceUrl Stream to copy from
     * @param outputPath Clip file to write
     * @param errorMessage Receives the reason on failure
     * @return true once the process is running
     */
    virtual bool start(const QString& sourceUrl, const QString& outputPath,
                       QString* errorMessage) = 0;

    /**
     * @brief Check whether the process is still alive (non-blocking)
     */
    virtual bool isRunning() = 0;

    /**
     * @brief Ask the process to finalize its output and exit
     * @param graceMs How long to wait before giving up
     * @return true if the process exited within the grace period
     */
    virtual bool requestGracefulStop(int graceMs) = 0;

    /**
     * @brief Terminate, then force-kill if still running
     */
    virtual void kill() = 0;

    /**
     * @brief Exit code of a finished process
     */
    virtual int exitCode() const = 0;

    /**
     * @brief Last lines written by the process to stderr
     */
    virtual QString diagnostics() const = 0;
};

using CaptureProcessFactory = std::function<std::unique_ptr<CaptureProcess>()>;

} // namespace CER

#endif // CAPTUREPROCESS_H
