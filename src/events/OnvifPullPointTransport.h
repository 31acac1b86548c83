#ifndef ONVIFPULLPOINTTRANSPORT_H
#define ONVIFPULLPOINTTRANSPORT_H

#include <QNetworkAccessManager>
#include <QString>

#include "core/Config.h"
#include "events/EventTransport.h"
#include "events/OnvifMessages.h"

namespace CER {

/**
 * @brief ONVIF pull-point events over SOAP 1.2 / HTTP
 *
 * Network and authentication failures are reported as ConnectError,
 * unparsable answers and SOAP faults as ProtocolError.
 *
 * Must be created and used on one thread.
 */
class OnvifPullPointTransport : public EventTransport {
public:
    OnvifPullPointTransport(const DeviceConfig& device, int requestTimeoutMs);

    bool createSubscription(int terminationSeconds, int timeoutMs, SubscriptionInfo* info,
                            Error* error) override;
    bool renewSubscription(const QString& endpointReference, int terminationSeconds,
                           int timeoutMs, SubscriptionInfo* info, Error* error) override;
    bool pullMessages(const QString& endpointReference, int timeoutMs, int messageLimit,
                      QList<RawNotification>* messages, Error* error) override;
    void unsubscribe(const QString& endpointReference, int timeoutMs) override;

private:
    /**
     * @brief POST one envelope and classify transport-level failures
     */
    bool post(const QString& url, const char* action, const QByteArray& envelope,
              int timeoutMs, QByteArray* response, Error* error);

    /**
     * @brief Token stamped with the device's clock
     */
    UsernameToken makeToken() const;

    void trackDeviceClock(const SubscriptionInfo& info);

    DeviceConfig m_device;
    int m_requestTimeoutMs;
    qint64 m_deviceClockOffsetMs = 0;
    QNetworkAccessManager m_network;
};

} // namespace CER

#endif // ONVIFPULLPOINTTRANSPORT_H
