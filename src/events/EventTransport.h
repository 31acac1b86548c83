#ifndef EVENTTRANSPORT_H
#define EVENTTRANSPORT_H

#include <QDateTime>
#include <QList>
#include <QMap>
#include <QString>
#include <functional>
#include <memory>

#include "core/Errors.h"

namespace CER {

struct DeviceConfig;

/**
 * @brief One notification message as delivered by the device
 */
struct RawNotification {
    QString topic;
    QString utcTime;                  // As sent, may be empty
    QString propertyOperation;        // Initialized / Changed / Deleted
    QMap<QString, QString> source;    // SimpleItem name -> value
    QMap<QString, QString> data;      // SimpleItem name -> value
};

/**
 * @brief Subscription handle returned by create and renew
 */
struct SubscriptionInfo {
    QString endpointReference;   // Address for pull, renew and unsubscribe
    QDateTime currentTime;       // Device clock at response time
    QDateTime terminationTime;   // Device clock at which the subscription lapses

    /**
     * @brief Lifetime granted by the device, independent of clock skew
     * @return Milliseconds, or -1 if either timestamp is missing
     */
    qint64 grantedLifetimeMs() const;
};

/**
 * @brief Wire-level access to a device's pull-point event service
 *
 * All calls are blocking. Create, renew and unsubscribe are bounded by
 * the timeout the caller passes; a pull by its own server-side wait plus
 * the transport's request timeout.
 */
class EventTransport {
public:
    virtual ~EventTransport() = default;

    virtual bool createSubscription(int terminationSeconds, int timeoutMs, SubscriptionInfo* info,
                                    Error* error) = 0;

    virtual bool renewSubscription(const QString& endpointReference, int terminationSeconds,
                                   int timeoutMs, SubscriptionInfo* info, Error* error) = 0;

    /**
     * @brief Long-poll for notifications
     * @param timeoutMs Server-side wait (PullMessages Timeout)
     * @param messageLimit Maximum number of messages in the answer
     * @param messages Receives the notifications, possibly none
     */
    virtual bool pullMessages(const QString& endpointReference, int timeoutMs, int messageLimit,
                              QList<RawNotification>* messages, Error* error) = 0;

    /**
     * @brief Best-effort release of the subscription on the device
     */
    virtual void unsubscribe(const QString& endpointReference, int timeoutMs) = 0;
};

using EventTransportFactory = std::function<std::unique_ptr<EventTransport>(const DeviceConfig&)>;

} // namespace CER

#endif // EVENTTRANSPORT_H
