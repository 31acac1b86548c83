#include <gtest/gtest.h>

#include <QTemporaryDir>

#include "pipeline/CameraSupervisor.h"
#include "pipeline/DevicePipeline.h"
#include "TestSupport.h"

using namespace CER;
using namespace CER::Test;

class CameraSupervisorTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(outputDir.isValid());
        config = testConfig(outputDir.path(), {"front", "back"});
        for (const QString& name : {QString("front"), QString("back")}) {
            auto camera = std::make_shared<FakeCamera>();
            camera->emptyPullSleepMs = 10;
            cameras.insert(name, camera);
        }
        recorder = std::make_shared<FakeRecorder>();
        snapshots = std::make_shared<FakeSnapshots>();
    }

    void TearDown() override {
        if (supervisor) {
            supervisor->stop();
        }
    }

    void setEvents(int maxReconnectAttempts) {
        EventSettings events = config.events();
        events.maxReconnectAttempts = maxReconnectAttempts;
        config.setEvents(events);
    }

    void setRestart(bool enabled) {
        SupervisorSettings supervisorSettings = config.supervisor();
        supervisorSettings.restartFailedPipelines = enabled;
        config.setSupervisor(supervisorSettings);
    }

    void createSupervisor() {
        supervisor = std::make_unique<CameraSupervisor>(
            config,
            fakeDependencies(cameras, recorder, snapshots, std::make_shared<SystemClock>()));

        QObject::connect(supervisor.get(), &CameraSupervisor::sessionStarted,
                         [this](const QString& device, const QString&, const QString&) {
                             started.append(device);
                         });
        QObject::connect(supervisor.get(), &CameraSupervisor::sessionStopped,
                         [this](const QString& device, const QString&, const QString&) {
                             stopped.append(device);
                         });
        QObject::connect(supervisor.get(), &CameraSupervisor::pipelineFailed,
                         [this](const QString& device, const CER::Error&) {
                             failed.append(device);
                         });
        QObject::connect(supervisor.get(), &CameraSupervisor::pipelineRestarted,
                         [this](const QString& device) { restarted.append(device); });
        QObject::connect(supervisor.get(), &CameraSupervisor::allPipelinesFailed,
                         [this]() { allFailed++; });
        QObject::connect(supervisor.get(), &CameraSupervisor::allPipelinesStopped,
                         [this]() { allStopped++; });
    }

    QTemporaryDir outputDir;
    Config config;
    QMap<QString, std::shared_ptr<FakeCamera>> cameras;
    std::shared_ptr<FakeRecorder> recorder;
    std::shared_ptr<FakeSnapshots> snapshots;

    QStringList started;
    QStringList stopped;
    QStringList failed;
    QStringList restarted;
    int allFailed = 0;
    int allStopped = 0;

    std::unique_ptr<CameraSupervisor> supervisor;
};

TEST_F(CameraSupervisorTest, StartsOnePipelinePerEnabledDevice) {
    DeviceConfig disabled = testDevice("garage");
    disabled.enabled = false;
    QList<DeviceConfig> devices = config.devices();
    devices.append(disabled);
    config.setDevices(devices);

    createSupervisor();
    Error error;
    ASSERT_TRUE(supervisor->start(&error)) << error.toString().toStdString();

    EXPECT_TRUE(supervisor->isRunning());
    EXPECT_EQ(supervisor->pipelineCount(), 2);
    EXPECT_NE(supervisor->pipeline("front"), nullptr);
    EXPECT_NE(supervisor->pipeline("back"), nullptr);
    EXPECT_EQ(supervisor->pipeline("garage"), nullptr);
    EXPECT_TRUE(waitUntil([this] { return supervisor->activePipelineCount() == 2; }));
}

TEST_F(CameraSupervisorTest, InvalidConfigurationIsRejected) {
    config = testConfig(outputDir.path(), {"front", "front"});
    createSupervisor();

    Error error;
    EXPECT_FALSE(supervisor->start(&error));
    EXPECT_EQ(error.kind, ErrorKind::Config);
    EXPECT_FALSE(supervisor->isRunning());
    EXPECT_EQ(supervisor->pipelineCount(), 0);
}

TEST_F(CameraSupervisorTest, IncompleteDependenciesAreRejected) {
    PipelineDependencies deps =
        fakeDependencies(cameras, recorder, snapshots, std::make_shared<SystemClock>());
    deps.captureFactory = nullptr;
    supervisor = std::make_unique<CameraSupervisor>(config, deps);

    Error error;
    EXPECT_FALSE(supervisor->start(&error));
    EXPECT_EQ(error.kind, ErrorKind::Config);
}

// One camera offline must not keep the other from recording
TEST_F(CameraSupervisorTest, UnreachableCameraDoesNotBlockOthers) {
    cameras.value("front")->setReachable(false);
    createSupervisor();
    ASSERT_TRUE(supervisor->start());

    ASSERT_TRUE(waitUntil([this] { return cameras.value("back")->creates() == 1; }));
    cameras.value("back")->push(peopleNotification(true));
    ASSERT_TRUE(waitUntil([this] { return stopped.contains("back"); }));

    cameras.value("back")->push(peopleNotification(true));
    ASSERT_TRUE(waitUntil([this] { return stopped.count("back") == 2; }));

    EXPECT_EQ(started, (QStringList{"back", "back"}));
    EXPECT_FALSE(started.contains("front"));
    EXPECT_GE(cameras.value("front")->creates(), 2);
    EXPECT_TRUE(failed.isEmpty());
    EXPECT_EQ(supervisor->activePipelineCount(), 2);
}

TEST_F(CameraSupervisorTest, AllFailedIsReportedWithoutRestart) {
    setEvents(2);
    cameras.value("front")->setReachable(false);
    cameras.value("back")->setReachable(false);
    createSupervisor();
    ASSERT_TRUE(supervisor->start());

    ASSERT_TRUE(waitUntil([this] { return allFailed == 1; }));
    EXPECT_EQ(supervisor->failedDevices(), (QStringList{"back", "front"}));
    EXPECT_TRUE(restarted.isEmpty());
    EXPECT_TRUE(waitUntil([this] { return supervisor->activePipelineCount() == 0; }));
}

TEST_F(CameraSupervisorTest, SingleFailureKeepsOthersRunning) {
    setEvents(2);
    cameras.value("front")->setReachable(false);
    createSupervisor();
    ASSERT_TRUE(supervisor->start());

    ASSERT_TRUE(waitUntil([this] { return failed.contains("front"); }));
    EXPECT_EQ(allFailed, 0);
    EXPECT_EQ(supervisor->failedDevices(), QStringList{"front"});

    cameras.value("back")->push(peopleNotification(true));
    ASSERT_TRUE(waitUntil([this] { return started.contains("back"); }));
}

TEST_F(CameraSupervisorTest, FailedPipelineIsRestarted) {
    setEvents(2);
    setRestart(true);
    cameras.value("front")->setReachable(false);
    createSupervisor();
    ASSERT_TRUE(supervisor->start());

    ASSERT_TRUE(waitUntil([this] { return restarted.contains("front"); }));
    EXPECT_EQ(allFailed, 0);

    cameras.value("front")->setReachable(true);
    ASSERT_TRUE(waitUntil([this] {
        return cameras.value("front")->pulls() > 0 && supervisor->failedDevices().isEmpty();
    }));

    cameras.value("front")->push(peopleNotification(true));
    ASSERT_TRUE(waitUntil([this] { return started.contains("front"); }));
}

TEST_F(CameraSupervisorTest, StopFinalizesEverySession) {
    RecordingSettings recording = config.recording();
    recording.postDetectionMs = 60000;
    config.setRecording(recording);
    createSupervisor();
    ASSERT_TRUE(supervisor->start());

    ASSERT_TRUE(waitUntil([this] {
        return cameras.value("front")->creates() == 1 && cameras.value("back")->creates() == 1;
    }));
    cameras.value("front")->push(peopleNotification(true));
    cameras.value("back")->push(peopleNotification(true));
    ASSERT_TRUE(waitUntil([this] { return recorder->runningCount() == 2; }));

    supervisor->stop();

    EXPECT_FALSE(supervisor->isRunning());
    EXPECT_EQ(allStopped, 1);
    EXPECT_EQ(recorder->runningCount(), 0);
    EXPECT_EQ(recorder->gracefulStopCount(), 2);
    EXPECT_EQ(supervisor->activePipelineCount(), 0);
    EXPECT_EQ(cameras.value("front")->unsubscribes(), 1);
    EXPECT_EQ(cameras.value("back")->unsubscribes(), 1);

    supervisor->stop();
    EXPECT_EQ(allStopped, 1);
}
