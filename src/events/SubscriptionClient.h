#ifndef SUBSCRIPTIONCLIENT_H
#define SUBSCRIPTIONCLIENT_H

#include <QDateTime>
#include <QList>
#include <QString>
#include <functional>
#include <memory>

#include "core/Config.h"
#include "core/DetectionEvent.h"
#include "core/Errors.h"
#include "events/EventTransport.h"
#include "events/ReconnectBackoff.h"

namespace CER {

class Clock;

/**
 * @brief Live pull-point subscription of one device
 */
struct Subscription {
    QString deviceName;
    QString endpointReference;
    qint64 renewBeforeMs = 0;    // Monotonic time at which to renew
    QDateTime terminationTime;   // Device clock
};

/**
 * @brief Result of SubscriptionClient::nextEvent()
 */
enum class PollResult {
    Event,     // A detection event was returned
    Timeout,   // Nothing arrived within the timeout (also while disconnected)
    Failed,    // Reconnect budget exhausted, the client is unusable
    Closed     // close() was called
};

/**
 * @brief Classification of one raw notification
 */
enum class NotificationMatch {
    Detection,   // Converted to a DetectionEvent
    Unrelated,   // Topic or source does not match the filter
    Malformed    // Matching topic, unusable payload
};

const char* pollResultName(PollResult result);

/**
 * @brief Maintains the event channel of one device
 *
 * Handles renewal before the subscription lapses and reconnects with
 * bounded exponential backoff. Malformed and unrelated notifications
 * are dropped here and never reach the state machine.
 *
 * nextEvent() keeps to its timeout, even while the device is
 * unreachable, so the caller keeps its own deadlines. Renewals and
 * resubscriptions it makes are bounded by the same timeout, or by one
 * tick when less remains.
 *
 * A subscription that failed is unsubscribed before it is replaced,
 * since devices only allow a few pull points at once.
 *
 * Not thread-safe; owned by one device pipeline.
 */
class SubscriptionClient {
public:
    /**
     * @brief Interruptible wait used between reconnect attempts
     * @return false if the wait was interrupted
     */
    using Sleeper = std::function<bool(int ms)>;

    SubscriptionClient(const DeviceConfig& device, const EventSettings& settings,
                       std::unique_ptr<EventTransport> transport, const Clock* clock);
    ~SubscriptionClient();

    SubscriptionClient(const SubscriptionClient&) = delete;
    SubscriptionClient& operator=(const SubscriptionClient&) = delete;

    /**
     * @brief Create the subscription
     * @param error Receives a ConnectError (or ProtocolError) on failure
     *
     * On failure the next attempt is scheduled with backoff and is made
     * by nextEvent().
     */
    bool connect(Error* error = nullptr);

    /**
     * @brief Wait for the next detection event
     * @param timeoutMs Upper bound for the wait
     * @param event Receives the event when the result is Event
     * @param error Receives the reason when the result is Failed
     *
     * Buffered notifications are returned one per call in arrival order.
     * At most one pull is issued per call.
     */
    PollResult nextEvent(int timeoutMs, DetectionEvent* event, Error* error = nullptr);

    /**
     * @brief Unsubscribe and end the event sequence; idempotent
     */
    void close();

    void setSleeper(Sleeper sleeper);

    bool isConnected() const { return m_connected; }
    bool isClosed() const { return m_closed; }
    bool hasFailed() const { return m_failed; }
    const Subscription& subscription() const { return m_subscription; }

    int discardedCount() const { return m_discarded; }
    int reconnectFailures() const { return m_backoff.failures(); }

    /**
     * @brief Convert one notification
     * @param device Supplies the name and the accepted event source
     * @param receivedMs Monotonic receipt time
     * @param receivedAt Local wall time of receipt
     *
     * When the device has an eventSource, notifications naming another
     * source (another channel of an NVR) are Unrelated. Notifications
     * without source items are accepted.
     */
    static NotificationMatch normalize(const RawNotification& notification,
                                       const EventSettings& settings, const DeviceConfig& device,
                                       qint64 receivedMs, const QDateTime& receivedAt,
                                       DetectionEvent* event, QString* reason);

private:
    bool createSubscription(int timeoutMs, Error* error);
    bool renew(int timeoutMs);
    void releaseSubscription(int timeoutMs);

    /**
     * @brief Timeout for one maintenance request made before @p deadline
     */
    int requestBudget(qint64 deadline) const;
    void scheduleReconnect(const Error& cause);
    void acceptSubscription(const SubscriptionInfo& info);
    void enqueue(const QList<RawNotification>& messages);

    DeviceConfig m_device;
    EventSettings m_settings;
    std::unique_ptr<EventTransport> m_transport;
    const Clock* m_clock;
    Sleeper m_sleeper;

    Subscription m_subscription;
    ReconnectBackoff m_backoff;
    QList<DetectionEvent> m_pending;

    bool m_connected = false;
    bool m_closed = false;
    bool m_failed = false;
    qint64 m_nextAttemptMs = 0;
    Error m_lastError;
    int m_discarded = 0;
};

} // namespace CER

#endif // SUBSCRIPTIONCLIENT_H
