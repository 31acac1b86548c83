#include "CameraSupervisor.h"
#include "pipeline/DevicePipeline.h"
#include "utils/Logging.h"

#include <QTimer>

namespace CER {

CameraSupervisor::CameraSupervisor(const Config& config, QObject* parent)
    : CameraSupervisor(config, PipelineDependencies::defaults(config), parent)
{
}

CameraSupervisor::CameraSupervisor(const Config& config, const PipelineDependencies& deps,
                                   QObject* parent)
    : QObject(parent)
    , m_config(config)
    , m_deps(deps)
{
    qRegisterMetaType<CER::Error>("CER::Error");
}

CameraSupervisor::~CameraSupervisor() {
    stop();
}

bool CameraSupervisor::start(Error* error) {
    if (m_running) {
        return true;
    }

    Error configError;
    if (!m_config.validate(&configError)) {
        qCCritical(lcSupervisor).noquote() << configError.toString();
        setError(error, configError);
        return false;
    }
    if (!m_deps.isComplete()) {
        const Error depsError = Error::config("pipeline collaborators are incomplete");
        qCCritical(lcSupervisor).noquote() << depsError.toString();
        setError(error, depsError);
        return false;
    }

    qDeleteAll(m_pipelines);
    m_pipelines.clear();
    m_failed.clear();

    for (const DeviceConfig& device : m_config.enabledDevices()) {
        auto* pipeline = new DevicePipeline(device, m_config.recording(), m_config.events(),
                                            m_deps, this);

        connect(pipeline, &DevicePipeline::sessionStarted, this, &CameraSupervisor::sessionStarted);
        connect(pipeline, &DevicePipeline::sessionStopped, this, &CameraSupervisor::sessionStopped);
        connect(pipeline, &DevicePipeline::snapshotCaptured, this, &CameraSupervisor::snapshotCaptured);
        connect(pipeline, &DevicePipeline::pipelineFailed, this, &CameraSupervisor::onPipelineFailed);

        m_pipelines.append(pipeline);
    }

    m_running = true;
    for (DevicePipeline* pipeline : m_pipelines) {
        pipeline->start();
    }

    qCInfo(lcSupervisor) << "watching" << m_pipelines.size() << "camera(s), recordings in"
                         << m_config.recording().outputDirectory;
    return true;
}

void CameraSupervisor::stop() {
    if (!m_running) {
        return;
    }
    m_running = false;

    qCInfo(lcSupervisor) << "stopping" << m_pipelines.size() << "pipeline(s)";

    // Ask all first so they wind down in parallel
    for (DevicePipeline* pipeline : m_pipelines) {
        pipeline->requestStop();
    }
    for (DevicePipeline* pipeline : m_pipelines) {
        pipeline->wait();
    }

    qCInfo(lcSupervisor) << "all pipelines stopped";
    emit allPipelinesStopped();
}

int CameraSupervisor::activePipelineCount() const {
    int count = 0;
    for (const DevicePipeline* pipeline : m_pipelines) {
        if (pipeline->isRunning()) {
            count++;
        }
    }
    return count;
}

QStringList CameraSupervisor::failedDevices() const {
    QStringList names = m_failed.values();
    names.sort();
    return names;
}

DevicePipeline* CameraSupervisor::pipeline(const QString& deviceName) const {
    for (DevicePipeline* pipeline : m_pipelines) {
        if (pipeline->deviceName() == deviceName) {
            return pipeline;
        }
    }
    return nullptr;
}

void CameraSupervisor::onPipelineFailed(const QString& deviceName, const CER::Error& error) {
    if (!m_running) {
        return;
    }

    m_failed.insert(deviceName);
    emit pipelineFailed(deviceName, error);

    const SupervisorSettings& policy = m_config.supervisor();
    if (policy.restartFailedPipelines) {
        qCWarning(lcSupervisor).noquote() << deviceTag(deviceName) << "restarting in"
                                          << policy.restartDelayMs / 1000.0 << "s";
        QTimer::singleShot(policy.restartDelayMs, this, [this, deviceName]() {
            restartPipeline(deviceName);
        });
        return;
    }

    qCWarning(lcSupervisor).noquote() << deviceTag(deviceName) << "left stopped,"
                                      << (m_pipelines.size() - m_failed.size())
                                      << "pipeline(s) still running";
    if (m_failed.size() == m_pipelines.size()) {
        qCCritical(lcSupervisor) << "every camera pipeline has failed";
        emit allPipelinesFailed();
    }
}

void CameraSupervisor::restartPipeline(const QString& deviceName) {
    if (!m_running) {
        return;
    }

    DevicePipeline* target = pipeline(deviceName);
    if (!target) {
        return;
    }

    // The failure signal is emitted just before run() returns
    target->wait();
    m_failed.remove(deviceName);
    target->start();

    qCInfo(lcSupervisor).noquote() << deviceTag(deviceName) << "pipeline restarted";
    emit pipelineRestarted(deviceName);
}

} // namespace CER
