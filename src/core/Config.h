#ifndef CONFIG_H
#define CONFIG_H

#include <QString>
#include <QStringList>
#include <QJsonObject>
#include <QJsonArray>
#include <QJsonDocument>
#include <QList>
#include <QMetaType>

#include "core/Errors.h"

namespace CER {

/**
 * @brief One camera to watch
 *
 * The name is used as the storage namespace below the output root,
 * so it must be unique and must not contain path separators.
 */
struct DeviceConfig {
    QString name;
    QString host;
    int port = 80;           // HTTP / ONVIF port
    int rtspPort = 554;
    int channel = 0;         // 0-based; Reolink stream paths are 1-based
    QString username;
    QString password;
    bool enabled = true;
    QString streamFormat = "h264";   // "h264" or "h265"
    QString rtspUrl;                 // Overrides the derived stream URL
    QString snapshotUrl;             // Overrides the derived snapshot URL
    QString eventServicePath = "/onvif/event_service";
    QString eventSource;             // Source token to accept, empty accepts every source

    /**
     * @brief Main-stream RTSP URL handed to the capture process
     */
    QString rtspStreamUrl() const;

    /**
     * @brief HTTP URL returning one JPEG for this channel
     */
    QString snapshotRequestUrl() const;

    /**
     * @brief ONVIF event service endpoint
     */
    QString eventServiceUrl() const;

    QJsonObject toJson() const;
    static DeviceConfig fromJson(const QJsonObject& obj);
};

/**
 * @brief Recording configuration (artifacts and capture process)
 */
struct RecordingSettings {
    QString outputDirectory = "recordings";
    qint64 postDetectionMs = 15000;
    bool snapshotsEnabled = true;
    int snapshotTimeoutMs = 10000;
    QString ffmpegPath = "ffmpeg";
    QString audioCodec = "copy";   // "copy", "aac" or "none"
    int stopGraceMs = 10000;
    bool holdWhilePresent = false;  // Camera only reports presence changes

    QJsonObject toJson() const;
    static RecordingSettings fromJson(const QJsonObject& obj);
};

/**
 * @brief Event subscription configuration
 */
struct EventSettings {
    int tickIntervalMs = 1000;
    int subscriptionTerminationSeconds = 60;
    int renewMarginSeconds = 10;
    int requestTimeoutMs = 10000;
    int reconnectBaseDelayMs = 1000;
    int reconnectMaxDelayMs = 60000;
    int maxReconnectAttempts = 0;   // 0 = retry forever
    QString topicFilter = "PeopleDetect";
    QString stateItemName = "State";
    int messageLimit = 10;

    QJsonObject toJson() const;
    static EventSettings fromJson(const QJsonObject& obj);
};

/**
 * @brief Policy applied by the supervisor to failed pipelines
 */
struct SupervisorSettings {
    bool restartFailedPipelines = true;
    int restartDelayMs = 30000;

    QJsonObject toJson() const;
    static SupervisorSettings fromJson(const QJsonObject& obj);
};

/**
 * @brief Complete application configuration
 *
 * Immutable once loaded and validated; the supervisor keeps its own copy.
 */
class Config {
public:
    Config() = default;

    /**
     * @brief Load configuration from a JSON file
     * @param path File to read
     * @param config Receives the parsed configuration
     * @param error Receives a ConfigError on failure
     * @return true if the file could be read and parsed
     *
     * Validation is a separate step, see validate().
     */
    static bool load(const QString& path, Config* config, Error* error = nullptr);

    static Config fromJson(const QJsonObject& root);
    QJsonObject toJson() const;

    /**
     * @brief Write the configuration as indented JSON
     */
    bool save(const QString& path, Error* error = nullptr) const;

    /**
     * @brief Apply environment overrides
     *
     * OUTPUT_DIR and POST_DETECTION_DURATION override the recording section.
     * When no device is configured, one is built from CAMERA_NAME,
     * CAMERA_HOST, CAMERA_USERNAME, CAMERA_PASSWORD, CAMERA_PORT and
     * CAMERA_CHANNEL.
     */
    void applyEnvironment();

    /**
     * @brief Check the startup requirements
     * @return false with a ConfigError listing every problem found
     */
    bool validate(Error* error = nullptr) const;

    const RecordingSettings& recording() const { return m_recording; }
    const EventSettings& events() const { return m_events; }
    const SupervisorSettings& supervisor() const { return m_supervisor; }
    const QList<DeviceConfig>& devices() const { return m_devices; }
    QList<DeviceConfig> enabledDevices() const;

    void setRecording(const RecordingSettings& settings) { m_recording = settings; }
    void setEvents(const EventSettings& settings) { m_events = settings; }
    void setSupervisor(const SupervisorSettings& settings) { m_supervisor = settings; }
    void setDevices(const QList<DeviceConfig>& devices) { m_devices = devices; }

private:
    RecordingSettings m_recording;
    EventSettings m_events;
    SupervisorSettings m_supervisor;
    QList<DeviceConfig> m_devices;
};

} // namespace CER

Q_DECLARE_METATYPE(CER::DeviceConfig)

#endif // CONFIG_H
