#include "OnvifPullPointTransport.h"
#include "utils/BlockingHttp.h"
#include "utils/Logging.h"

#include <QNetworkRequest>
#include <QUrl>

namespace CER {

OnvifPullPointTransport::OnvifPullPointTransport(const DeviceConfig& device, int requestTimeoutMs)
    : m_device(device)
    , m_requestTimeoutMs(requestTimeoutMs)
{
}

UsernameToken OnvifPullPointTransport::makeToken() const {
    if (m_device.username.isEmpty()) {
        return UsernameToken();
    }
    // Devices reject tokens whose Created stamp is far off their own clock
    const QDateTime created = QDateTime::currentDateTimeUtc().addMSecs(m_deviceClockOffsetMs);
    return UsernameToken::generate(m_device.username, m_device.password, created);
}

void OnvifPullPointTransport::trackDeviceClock(const SubscriptionInfo& info) {
    if (info.currentTime.isValid()) {
        m_deviceClockOffsetMs = QDateTime::currentDateTimeUtc().msecsTo(info.currentTime);
    }
}

bool OnvifPullPointTransport::post(const QString& url, const char* action,
                                   const QByteArray& envelope, int timeoutMs,
                                   QByteArray* response, Error* error) {
    QNetworkRequest request{QUrl(url)};
    request.setHeader(QNetworkRequest::ContentTypeHeader,
                      QString("application/soap+xml; charset=utf-8; action=\"%1\"").arg(action));

    const HttpResult result = blockingRequest(m_network, request, &envelope, timeoutMs);

    if (result.authenticationFailed()) {
        setError(error, Error::connect(QString("authentication rejected (HTTP %1)").arg(result.status)));
        return false;
    }

    if (result.ok()) {
        if (response) {
            *response = result.body;
        }
        return true;
    }

    // SOAP faults travel with HTTP 400/500
    QString reason;
    if (result.status > 0 && OnvifMessages::parseFault(result.body, &reason)) {
        if (reason.contains("NotAuthorized", Qt::CaseInsensitive)) {
            setError(error, Error::connect(QString("not authorized: %1").arg(reason)));
        } else {
            setError(error, Error::protocol(QString("SOAP fault: %1").arg(reason)));
        }
        return false;
    }

    if (result.status > 0) {
        setError(error, Error::connect(QString("HTTP %1 from %2").arg(result.status).arg(url)));
    } else {
        setError(error, Error::connect(result.errorString));
    }
    return false;
}

bool OnvifPullPointTransport::createSubscription(int terminationSeconds, int timeoutMs,
                                                 SubscriptionInfo* info, Error* error) {
    const QString url = m_device.eventServiceUrl();
    const QByteArray envelope =
        OnvifMessages::createPullPointSubscription(makeToken(), url, terminationSeconds);

    QByteArray response;
    if (!post(url, OnvifMessages::ACTION_CREATE_PULL_POINT, envelope, timeoutMs, &response,
              error)) {
        return false;
    }

    SubscriptionInfo created;
    QString parseError;
    if (!OnvifMessages::parseCreateResponse(response, &created, &parseError)) {
        setError(error, Error::protocol(parseError));
        return false;
    }

    trackDeviceClock(created);
    qCDebug(lcEvents).noquote() << deviceTag(m_device.name) << "pull point at"
                                << created.endpointReference;
    if (info) {
        *info = created;
    }
    return true;
}

bool OnvifPullPointTransport::renewSubscription(const QString& endpointReference,
                                                int terminationSeconds, int timeoutMs,
                                                SubscriptionInfo* info, Error* error) {
    const QByteArray envelope =
        OnvifMessages::renew(makeToken(), endpointReference, terminationSeconds);

    QByteArray response;
    if (!post(endpointReference, OnvifMessages::ACTION_RENEW, envelope, timeoutMs, &response,
              error)) {
        return false;
    }

    SubscriptionInfo renewed;
    renewed.endpointReference = endpointReference;
    QString parseError;
    if (!OnvifMessages::parseRenewResponse(response, &renewed, &parseError)) {
        setError(error, Error::protocol(parseError));
        return false;
    }

    trackDeviceClock(renewed);
    if (info) {
        *info = renewed;
    }
    return true;
}

bool OnvifPullPointTransport::pullMessages(const QString& endpointReference, int timeoutMs,
                                           int messageLimit, QList<RawNotification>* messages,
                                           Error* error) {
    const QByteArray envelope =
        OnvifMessages::pullMessages(makeToken(), endpointReference, timeoutMs, messageLimit);

    // The device holds the request for up to timeoutMs before answering
    QByteArray response;
    if (!post(endpointReference, OnvifMessages::ACTION_PULL_MESSAGES, envelope,
              timeoutMs + m_requestTimeoutMs, &response, error)) {
        return false;
    }

    QString parseError;
    if (!OnvifMessages::parsePullResponse(response, messages, nullptr, &parseError)) {
        setError(error, Error::protocol(parseError));
        return false;
    }
    return true;
}

void OnvifPullPointTransport::unsubscribe(const QString& endpointReference, int timeoutMs) {
    if (endpointReference.isEmpty()) {
        return;
    }

    const QByteArray envelope = OnvifMessages::unsubscribe(makeToken(), endpointReference);
    Error error;
    if (!post(endpointReference, OnvifMessages::ACTION_UNSUBSCRIBE, envelope, timeoutMs, nullptr,
              &error)) {
        // The subscription lapses on its own at its termination time
        qCDebug(lcEvents).noquote() << deviceTag(m_device.name) << "unsubscribe failed:"
                                    << error.toString();
    }
}

} // namespace CER
