#include "Config.h"
#include "utils/Logging.h"

#include <QFile>
#include <QSet>
#include <QUrl>
#include <QUrlQuery>

namespace CER {

namespace {

qint64 secondsToMs(const QJsonValue& value, qint64 defaultMs) {
    if (!value.isDouble()) {
        return defaultMs;
    }
    return qRound64(value.toDouble() * 1000.0);
}

double msToSeconds(qint64 ms) {
    return static_cast<double>(ms) / 1000.0;
}

} // namespace

// DeviceConfig implementation
QString DeviceConfig::rtspStreamUrl() const {
    if (!rtspUrl.isEmpty()) {
        return rtspUrl;
    }

    // Reolink channels start at 01: channel 0 -> Preview_01_main
    const QString channelStr = QString("%1").arg(channel + 1, 2, 10, QChar('0'));
    const QString prefix = (streamFormat == "h265") ? "h265Preview" : "Preview";

    QUrl url;
    url.setScheme("rtsp");
    url.setHost(host);
    url.setPort(rtspPort);
    url.setPath(QString("/%1_%2_main").arg(prefix, channelStr));
    url.setUserName(username);
    url.setPassword(password);
    return url.toString(QUrl::FullyEncoded);
}

QString DeviceConfig::snapshotRequestUrl() const {
    if (!snapshotUrl.isEmpty()) {
        return snapshotUrl;
    }

    QUrl url;
    url.setScheme("http");
    url.setHost(host);
    url.setPort(port);
    url.setPath("/cgi-bin/api.cgi");

    QUrlQuery query;
    query.addQueryItem("cmd", "Snap");
    query.addQueryItem("channel", QString::number(channel));
    query.addQueryItem("user", username);
    query.addQueryItem("password", password);
    url.setQuery(query);
    return url.toString(QUrl::FullyEncoded);
}

QString DeviceConfig::eventServiceUrl() const {
    QUrl url;
    url.setScheme("http");
    url.setHost(host);
    url.setPort(port);
    url.setPath(eventServicePath.startsWith('/') ? eventServicePath : "/" + eventServicePath);
    return url.toString(QUrl::FullyEncoded);
}

QJsonObject DeviceConfig::toJson() const {
    QJsonObject obj{
        {"name", name},
        {"host", host},
        {"port", port},
        {"rtspPort", rtspPort},
        {"channel", channel},
        {"username", username},
        {"password", password},
        {"enabled", enabled},
        {"streamFormat", streamFormat},
        {"eventServicePath", eventServicePath}
    };
    if (!rtspUrl.isEmpty()) {
        obj["rtspUrl"] = rtspUrl;
    }
    if (!snapshotUrl.isEmpty()) {
        obj["snapshotUrl"] = snapshotUrl;
    }
    if (!eventSource.isEmpty()) {
        obj["eventSource"] = eventSource;
    }
    return obj;
}

DeviceConfig DeviceConfig::fromJson(const QJsonObject& obj) {
    DeviceConfig config;
    config.name = obj.value("name").toString().trimmed();
    config.host = obj.value("host").toString().trimmed();
    config.port = obj.value("port").toInt(80);
    config.rtspPort = obj.value("rtspPort").toInt(554);
    config.channel = obj.value("channel").toInt(0);
    config.username = obj.value("username").toString();
    config.password = obj.value("password").toString();
    config.enabled = obj.value("enabled").toBool(true);
    config.streamFormat = obj.value("streamFormat").toString("h264").toLower();
    config.rtspUrl = obj.value("rtspUrl").toString();
    config.snapshotUrl = obj.value("snapshotUrl").toString();
    config.eventServicePath = obj.value("eventServicePath").toString("/onvif/event_service");
    config.eventSource = obj.value("eventSource").toString().trimmed();
    return config;
}

// RecordingSettings implementation
QJsonObject RecordingSettings::toJson() const {
    return QJsonObject{
        {"outputDirectory", outputDirectory},
        {"postDetectionSeconds", msToSeconds(postDetectionMs)},
        {"snapshotsEnabled", snapshotsEnabled},
        {"snapshotTimeoutSeconds", msToSeconds(snapshotTimeoutMs)},
        {"ffmpegPath", ffmpegPath},
        {"audioCodec", audioCodec},
        {"stopGraceSeconds", msToSeconds(stopGraceMs)},
        {"holdWhilePresent", holdWhilePresent}
    };
}

RecordingSettings RecordingSettings::fromJson(const QJsonObject& obj) {
    RecordingSettings settings;
    settings.outputDirectory = obj.value("outputDirectory").toString("recordings");
    settings.postDetectionMs = secondsToMs(obj.value("postDetectionSeconds"), 15000);
    settings.snapshotsEnabled = obj.value("snapshotsEnabled").toBool(true);
    settings.snapshotTimeoutMs = static_cast<int>(
        secondsToMs(obj.value("snapshotTimeoutSeconds"), 10000));
    settings.ffmpegPath = obj.value("ffmpegPath").toString("ffmpeg");
    settings.audioCodec = obj.value("audioCodec").toString("copy").toLower();
    settings.stopGraceMs = static_cast<int>(secondsToMs(obj.value("stopGraceSeconds"), 10000));
    settings.holdWhilePresent = obj.value("holdWhilePresent").toBool(false);
    return settings;
}

// EventSettings implementation
QJsonObject EventSettings::toJson() const {
    return QJsonObject{
        {"tickIntervalMs", tickIntervalMs},
        {"subscriptionTerminationSeconds", subscriptionTerminationSeconds},
        {"renewMarginSeconds", renewMarginSeconds},
        {"requestTimeoutSeconds", msToSeconds(requestTimeoutMs)},
        {"reconnectBaseDelayMs", reconnectBaseDelayMs},
        {"reconnectMaxDelayMs", reconnectMaxDelayMs},
        {"maxReconnectAttempts", maxReconnectAttempts},
        {"topicFilter", topicFilter},
        {"stateItemName", stateItemName},
        {"messageLimit", messageLimit}
    };
}

EventSettings EventSettings::fromJson(const QJsonObject& obj) {
    EventSettings settings;
    settings.tickIntervalMs = obj.value("tickIntervalMs").toInt(1000);
    settings.subscriptionTerminationSeconds = obj.value("subscriptionTerminationSeconds").toInt(60);
    settings.renewMarginSeconds = obj.value("renewMarginSeconds").toInt(10);
    settings.requestTimeoutMs = static_cast<int>(
        secondsToMs(obj.value("requestTimeoutSeconds"), 10000));
    settings.reconnectBaseDelayMs = obj.value("reconnectBaseDelayMs").toInt(1000);
    settings.reconnectMaxDelayMs = obj.value("reconnectMaxDelayMs").toInt(60000);
    settings.maxReconnectAttempts = obj.value("maxReconnectAttempts").toInt(0);
    settings.topicFilter = obj.value("topicFilter").toString("PeopleDetect");
    settings.stateItemName = obj.value("stateItemName").toString("State");
    settings.messageLimit = obj.value("messageLimit").toInt(10);
    return settings;
}

// SupervisorSettings implementation
QJsonObject SupervisorSettings::toJson() const {
    return QJsonObject{
        {"restartFailedPipelines", restartFailedPipelines},
        {"restartDelaySeconds", msToSeconds(restartDelayMs)}
    };
}

SupervisorSettings SupervisorSettings::fromJson(const QJsonObject& obj) {
    SupervisorSettings settings;
    settings.restartFailedPipelines = obj.value("restartFailedPipelines").toBool(true);
    settings.restartDelayMs = static_cast<int>(
        secondsToMs(obj.value("restartDelaySeconds"), 30000));
    return settings;
}

// Config implementation
bool Config::load(const QString& path, Config* config, Error* error) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        setError(error, Error::config(
            QString("Could not open config file %1: %2").arg(path, file.errorString())));
        return false;
    }

    const QByteArray data = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        setError(error, Error::config(QString("JSON parse error in %1 at offset %2: %3")
                                          .arg(path)
                                          .arg(parseError.offset)
                                          .arg(parseError.errorString())));
        return false;
    }
    if (!doc.isObject()) {
        setError(error, Error::config(QString("%1: top-level value must be an object").arg(path)));
        return false;
    }

    if (config) {
        *config = fromJson(doc.object());
    }
    qCInfo(lcConfig) << "Config loaded from:" << path;
    return true;
}

Config Config::fromJson(const QJsonObject& root) {
    Config config;

    if (root.contains("recording")) {
        config.m_recording = RecordingSettings::fromJson(root.value("recording").toObject());
    }

    if (root.contains("events")) {
        config.m_events = EventSettings::fromJson(root.value("events").toObject());
    }

    if (root.contains("supervisor")) {
        config.m_supervisor = SupervisorSettings::fromJson(root.value("supervisor").toObject());
    }

    const QJsonArray devicesArray = root.value("devices").toArray();
    for (const QJsonValue& val : devicesArray) {
        config.m_devices.append(DeviceConfig::fromJson(val.toObject()));
    }

    return config;
}

QJsonObject Config::toJson() const {
    QJsonObject root;
    root["recording"] = m_recording.toJson();
    root["events"] = m_events.toJson();
    root["supervisor"] = m_supervisor.toJson();

    QJsonArray devicesArray;
    for (const auto& device : m_devices) {
        devicesArray.append(device.toJson());
    }
    root["devices"] = devicesArray;
    return root;
}

bool Config::save(const QString& path, Error* error) const {
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        setError(error, Error::config(
            QString("Could not open config file for writing %1: %2").arg(path, file.errorString())));
        return false;
    }

    file.write(QJsonDocument(toJson()).toJson(QJsonDocument::Indented));
    file.close();

    qCInfo(lcConfig) << "Config saved to:" << path;
    return true;
}

void Config::applyEnvironment() {
    if (qEnvironmentVariableIsSet("OUTPUT_DIR")) {
        m_recording.outputDirectory = qEnvironmentVariable("OUTPUT_DIR");
    }

    if (qEnvironmentVariableIsSet("POST_DETECTION_DURATION")) {
        bool ok = false;
        const double seconds = qEnvironmentVariable("POST_DETECTION_DURATION").toDouble(&ok);
        if (ok) {
            m_recording.postDetectionMs = qRound64(seconds * 1000.0);
        } else {
            qCWarning(lcConfig) << "Ignoring non-numeric POST_DETECTION_DURATION";
        }
    }

    if (!m_devices.isEmpty() || !qEnvironmentVariableIsSet("CAMERA_HOST")) {
        return;
    }

    DeviceConfig device;
    device.name = qEnvironmentVariable("CAMERA_NAME", "camera");
    device.host = qEnvironmentVariable("CAMERA_HOST");
    device.username = qEnvironmentVariable("CAMERA_USERNAME");
    device.password = qEnvironmentVariable("CAMERA_PASSWORD");
    device.port = qEnvironmentVariable("CAMERA_PORT", "80").toInt();
    device.channel = qEnvironmentVariable("CAMERA_CHANNEL", "0").toInt();
    m_devices.append(device);

    qCInfo(lcConfig) << "Using device" << device.name << "from environment (host"
                     << device.host << ")";
}

bool Config::validate(Error* error) const {
    QStringList problems;

    if (m_recording.outputDirectory.isEmpty()) {
        problems << "recording.outputDirectory must not be empty";
    }
    if (m_recording.postDetectionMs <= 0) {
        problems << "recording.postDetectionSeconds must be positive";
    }
    if (m_recording.snapshotTimeoutMs <= 0) {
        problems << "recording.snapshotTimeoutSeconds must be positive";
    }
    if (m_recording.stopGraceMs <= 0) {
        problems << "recording.stopGraceSeconds must be positive";
    }
    if (m_recording.ffmpegPath.isEmpty()) {
        problems << "recording.ffmpegPath must not be empty";
    }
    static const QStringList audioCodecs{"copy", "aac", "none"};
    if (!audioCodecs.contains(m_recording.audioCodec)) {
        problems << QString("recording.audioCodec '%1' is not one of copy, aac, none")
                        .arg(m_recording.audioCodec);
    }

    if (m_events.tickIntervalMs <= 0) {
        problems << "events.tickIntervalMs must be positive";
    }
    if (m_events.subscriptionTerminationSeconds <= 0) {
        problems << "events.subscriptionTerminationSeconds must be positive";
    }
    if (m_events.renewMarginSeconds <= 0
        || m_events.renewMarginSeconds >= m_events.subscriptionTerminationSeconds) {
        problems << "events.renewMarginSeconds must be positive and smaller than "
                    "events.subscriptionTerminationSeconds";
    }
    if (m_events.requestTimeoutMs <= 0) {
        problems << "events.requestTimeoutSeconds must be positive";
    }
    if (m_events.reconnectBaseDelayMs <= 0 || m_events.reconnectMaxDelayMs < m_events.reconnectBaseDelayMs) {
        problems << "events.reconnectBaseDelayMs must be positive and not above reconnectMaxDelayMs";
    }
    if (m_events.maxReconnectAttempts < 0) {
        problems << "events.maxReconnectAttempts must not be negative";
    }
    if (m_events.messageLimit <= 0) {
        problems << "events.messageLimit must be positive";
    }
    if (m_events.topicFilter.isEmpty() || m_events.stateItemName.isEmpty()) {
        problems << "events.topicFilter and events.stateItemName must not be empty";
    }

    if (m_supervisor.restartDelayMs <= 0) {
        problems << "supervisor.restartDelaySeconds must be positive";
    }

    if (m_devices.isEmpty()) {
        problems << "no devices configured";
    }

    QSet<QString> names;
    int enabledCount = 0;
    for (const auto& device : m_devices) {
        const QString label = device.name.isEmpty() ? QString("<unnamed>") : device.name;

        if (device.name.isEmpty()) {
            problems << "device name must not be empty";
        } else if (device.name.contains('/') || device.name.contains('\\')
                   || device.name == "." || device.name == "..") {
            problems << QString("device name '%1' is not usable as a directory name").arg(device.name);
        } else if (names.contains(device.name)) {
            problems << QString("device name '%1' is not unique").arg(device.name);
        }
        names.insert(device.name);

        if (!device.enabled) {
            continue;
        }
        ++enabledCount;

        if (device.host.isEmpty()) {
            problems << QString("device '%1' has no host").arg(label);
        }
        if (device.port < 1 || device.port > 65535 || device.rtspPort < 1 || device.rtspPort > 65535) {
            problems << QString("device '%1' has a port outside 1..65535").arg(label);
        }
        if (device.channel < 0) {
            problems << QString("device '%1' has a negative channel").arg(label);
        }
        if (device.streamFormat != "h264" && device.streamFormat != "h265") {
            problems << QString("device '%1' streamFormat '%2' is not h264 or h265")
                            .arg(label, device.streamFormat);
        }
    }

    if (!m_devices.isEmpty() && enabledCount == 0) {
        problems << "no enabled devices";
    }

    if (!problems.isEmpty()) {
        setError(error, Error::config(problems.join("; ")));
        return false;
    }
    return true;
}

QList<DeviceConfig> Config::enabledDevices() const {
    QList<DeviceConfig> result;
    for (const auto& device : m_devices) {
        if (device.enabled) {
            result.append(device);
        }
    }
    return result;
}

} // namespace CER
