#ifndef TESTSUPPORT_H
#define TESTSUPPORT_H

#include <QByteArray>
#include <QDateTime>
#include <QList>
#include <QMap>
#include <QMutex>
#include <QString>
#include <QStringList>
#include <atomic>
#include <functional>
#include <memory>

#include "capture/CaptureProcess.h"
#include "capture/SnapshotFetcher.h"
#include "core/Clock.h"
#include "core/Config.h"
#include "events/EventTransport.h"
#include "pipeline/PipelineDependencies.h"

namespace CER {
namespace Test {

/**
 * @brief Clock advanced by hand
 */
class ManualClock : public Clock {
public:
    explicit ManualClock(qint64 startMs = 1000);

    qint64 monotonicMs() const override { return m_ms; }
    QDateTime now() const override;

    void advance(qint64 ms) { m_ms += ms; }
    void set(qint64 ms) { m_ms = ms; }

private:
    std::atomic<qint64> m_ms;
    QDateTime m_base;
};

RawNotification peopleNotification(bool present, const QString& utcTime = QString(),
                                   const QString& source = QString("000"));

/**
 * @brief Scripted camera shared between a test and its fake transports
 */
struct FakeCamera {
    mutable QMutex mutex;

    bool reachable = true;
    bool failRenew = false;
    int renewDelayMs = 0;            // Renewals slower than their timeout fail
    int failPulls = 0;               // Number of upcoming pulls that fail
    int grantedSeconds = 60;
    int emptyPullSleepMs = 0;        // Simulated long poll when nothing is queued
    QList<RawNotification> queued;

    int createCalls = 0;
    int renewCalls = 0;
    int pullCalls = 0;
    int unsubscribeCalls = 0;
    QList<int> pullTimeouts;
    QList<int> createTimeouts;
    QList<int> renewTimeouts;
    QStringList released;            // Endpoints unsubscribed, in order

    void push(const RawNotification& notification);
    void setReachable(bool value);
    int creates() const;
    int pulls() const;
    int unsubscribes() const;
};

class FakeEventTransport : public EventTransport {
public:
    explicit FakeEventTransport(std::shared_ptr<FakeCamera> camera);

    bool createSubscription(int terminationSeconds, int timeoutMs, SubscriptionInfo* info,
                            Error* error) override;
    bool renewSubscription(const QString& endpointReference, int terminationSeconds,
                           int timeoutMs, SubscriptionInfo* info, Error* error) override;
    bool pullMessages(const QString& endpointReference, int timeoutMs, int messageLimit,
                      QList<RawNotification>* messages, Error* error) override;
    void unsubscribe(const QString& endpointReference, int timeoutMs) override;

private:
    std::shared_ptr<FakeCamera> m_camera;
};

/**
 * @brief Bookkeeping shared by all fake capture processes of a test
 */
struct FakeRecorder {
    mutable QMutex mutex;

    bool failStart = false;
    bool ignoreGracefulStop = false;
    QByteArray clipPayload = QByteArray("fake-mp4-payload");

    int starts = 0;
    int crashEpoch = 0;
    int gracefulStops = 0;
    int kills = 0;
    int running = 0;
    int maxRunning = 0;
    QStringList outputs;

    int runningCount() const;
    int startCount() const;
    int gracefulStopCount() const;

    /**
     * @brief Make every running process exit on its own
     */
    void crashRunning();
};

class FakeCaptureProcess : public CaptureProcess {
public:
    explicit FakeCaptureProcess(std::shared_ptr<FakeRecorder> recorder);
    ~FakeCaptureProcess() override;

    bool start(const QString& sourceUrl, const QString& outputPath, QString* errorMessage) override;
    bool isRunning() override;
    bool requestGracefulStop(int graceMs) override;
    void kill() override;
    int exitCode() const override { return m_crashed ? 1 : 0; }
    QString diagnostics() const override;

private:
    void markStopped();

    std::shared_ptr<FakeRecorder> m_recorder;
    bool m_running = false;
    bool m_crashed = false;
    int m_epoch = 0;
};

struct FakeSnapshots {
    mutable QMutex mutex;
    bool fail = false;
    int fetches = 0;
    QByteArray image = QByteArray("fake-jpeg-bytes");

    int fetchCount() const;
};

class FakeSnapshotFetcher : public SnapshotFetcher {
public:
    explicit FakeSnapshotFetcher(std::shared_ptr<FakeSnapshots> snapshots);

    bool fetch(const DeviceConfig& device, QByteArray* image, QString* errorMessage) override;

private:
    std::shared_ptr<FakeSnapshots> m_snapshots;
};

DeviceConfig testDevice(const QString& name);

/**
 * @brief Valid configuration with short timings for threaded tests
 */
Config testConfig(const QString& outputDirectory, const QStringList& deviceNames);

/**
 * @brief Dependencies routing each device name to its own fake camera
 */
PipelineDependencies fakeDependencies(const QMap<QString, std::shared_ptr<FakeCamera>>& cameras,
                                      std::shared_ptr<FakeRecorder> recorder,
                                      std::shared_ptr<FakeSnapshots> snapshots,
                                      std::shared_ptr<const Clock> clock);

/**
 * @brief Spin the event loop until @p condition holds or @p timeoutMs passes
 */
bool waitUntil(const std::function<bool()>& condition, int timeoutMs = 5000);

} // namespace Test
} // namespace CER

#endif // TESTSUPPORT_H
