/**
 * Camera Event Recorder
 *
 * Headless service that watches network cameras for person-detection
 * events and records one snapshot plus one stream-copied clip per
 * detection episode.
 *
 * Features:
 * - ONVIF pull-point event subscriptions with renewal and reconnect
 * - Post-detection window extended by every new detection
 * - ffmpeg stream copy, no re-encoding
 * - One independent pipeline thread per camera
 * - Graceful shutdown on SIGINT / SIGTERM
 */

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>

#include "core/Config.h"
#include "pipeline/CameraSupervisor.h"
#include "utils/Logging.h"
#include "utils/SignalHandler.h"

namespace {

constexpr int EXIT_CONFIG_ERROR = 2;
constexpr int EXIT_ALL_FAILED = 1;

CER::Config templateConfig() {
    CER::Config config;
    CER::DeviceConfig device;
    device.name = "front";
    device.host = "192.168.1.10";
    device.username = "admin";
    device.password = "change-me";
    config.setDevices({device});
    return config;
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication::setApplicationName("camera-event-recorder");
    QCoreApplication::setApplicationVersion("1.0.0");
    QCoreApplication::setOrganizationName("CER");

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription("Records snapshots and clips when cameras detect a person.");
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption configOption({"c", "config"}, "Configuration file.", "path");
    const QCommandLineOption verboseOption({"v", "verbose"}, "Enable debug logging.");
    const QCommandLineOption checkOption("check-config", "Validate the configuration and exit.");
    const QCommandLineOption writeOption("write-config",
                                         "Write a configuration template and exit.", "path");
    parser.addOptions({configOption, verboseOption, checkOption, writeOption});
    parser.process(app);

    CER::setupLogging(parser.isSet(verboseOption));

    if (parser.isSet(writeOption)) {
        CER::Error error;
        if (!templateConfig().save(parser.value(writeOption), &error)) {
            qCCritical(CER::lcConfig).noquote() << error.toString();
            return EXIT_CONFIG_ERROR;
        }
        qCInfo(CER::lcConfig) << "Configuration template written to" << parser.value(writeOption);
        return 0;
    }

    // Load configuration
    QString configPath = parser.value(configOption);
    if (configPath.isEmpty()) {
        configPath = "config.json";
        if (!QFile::exists(configPath)) {
            // Try in application directory
            configPath = QCoreApplication::applicationDirPath() + "/config.json";
        }
    }

    CER::Config config;
    CER::Error error;
    if (QFile::exists(configPath)) {
        if (!CER::Config::load(configPath, &config, &error)) {
            qCCritical(CER::lcConfig).noquote() << error.toString();
            return EXIT_CONFIG_ERROR;
        }
    } else if (parser.isSet(configOption)) {
        qCCritical(CER::lcConfig) << "Configuration file not found:" << configPath;
        return EXIT_CONFIG_ERROR;
    } else {
        qCWarning(CER::lcConfig) << "No config.json found, using defaults and environment";
    }

    config.applyEnvironment();
    if (!config.validate(&error)) {
        qCCritical(CER::lcConfig).noquote() << error.toString();
        return EXIT_CONFIG_ERROR;
    }

    if (parser.isSet(checkOption)) {
        qCInfo(CER::lcConfig) << "Configuration OK:" << config.enabledDevices().size()
                              << "enabled device(s)";
        return 0;
    }

    CER::CameraSupervisor supervisor(config);

    CER::SignalHandler signalHandler;
    if (!signalHandler.install()) {
        qCWarning(CER::lcSupervisor) << "Signal handling unavailable, stop with SIGKILL only";
    }

    QObject::connect(&signalHandler, &CER::SignalHandler::terminationRequested, &app, [&]() {
        supervisor.stop();
        app.quit();
    });
    QObject::connect(&supervisor, &CER::CameraSupervisor::allPipelinesFailed, &app, [&]() {
        supervisor.stop();
        app.exit(EXIT_ALL_FAILED);
    });

    if (!supervisor.start(&error)) {
        return EXIT_CONFIG_ERROR;
    }

    return app.exec();
}
