#ifndef CAMERASUPERVISOR_H
#define CAMERASUPERVISOR_H

#include <QObject>
#include <QList>
#include <QSet>
#include <QString>
#include <QStringList>

#include "core/Config.h"
#include "core/Errors.h"
#include "pipeline/PipelineDependencies.h"

namespace CER {

class DevicePipeline;

/**
 * @brief Runs one DevicePipeline per enabled camera
 *
 * Pipelines share nothing but the output root. A failed pipeline is
 * restarted after the configured delay, or left stopped; if all of
 * them end up failed with no restart pending, allPipelinesFailed() is
 * emitted.
 *
 * Lives on the main thread.
 */
class CameraSupervisor : public QObject {
    Q_OBJECT

public:
    explicit CameraSupervisor(const Config& config, QObject* parent = nullptr);
    CameraSupervisor(const Config& config, const PipelineDependencies& deps,
                     QObject* parent = nullptr);
    ~CameraSupervisor() override;

    /**
     * @brief Validate the configuration and start all pipelines
     * @param error Receives a ConfigError if validation fails
     */
    bool start(Error* error = nullptr);

    /**
     * @brief Stop every pipeline and wait until each has shut down
     *
     * Running sessions are stopped gracefully before this returns.
     */
    void stop();

    bool isRunning() const { return m_running; }

    int pipelineCount() const { return m_pipelines.size(); }
    int activePipelineCount() const;
    QStringList failedDevices() const;
    DevicePipeline* pipeline(const QString& deviceName) const;

    const Config& config() const { return m_config; }

signals:
    void sessionStarted(const QString& deviceName, const QString& sessionId,
                        const QString& clipPath);
    void sessionStopped(const QString& deviceName, const QString& sessionId,
                        const QString& clipPath);
    void snapshotCaptured(const QString& deviceName, const QString& snapshotPath);

    void pipelineFailed(const QString& deviceName, const CER::Error& error);
    void pipelineRestarted(const QString& deviceName);

    /**
     * @brief Every pipeline failed and none will be restarted
     */
    void allPipelinesFailed();

    void allPipelinesStopped();

private slots:
    void onPipelineFailed(const QString& deviceName, const CER::Error& error);

private:
    void restartPipeline(const QString& deviceName);

    Config m_config;
    PipelineDependencies m_deps;
    QList<DevicePipeline*> m_pipelines;
    QSet<QString> m_failed;
    bool m_running = false;
};

} // namespace CER

#endif // CAMERASUPERVISOR_H
