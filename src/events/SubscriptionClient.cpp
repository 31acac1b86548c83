#include "SubscriptionClient.h"
#include "core/Clock.h"
#include "utils/Logging.h"

#include <QThread>

namespace CER {

const char* pollResultName(PollResult result) {
    switch (result) {
        case PollResult::Event:   return "Event";
        case PollResult::Timeout: return "Timeout";
        case PollResult::Failed:  return "Failed";
        case PollResult::Closed:  return "Closed";
    }
    return "Unknown";
}

SubscriptionClient::SubscriptionClient(const DeviceConfig& device, const EventSettings& settings,
                                       std::unique_ptr<EventTransport> transport,
                                       const Clock* clock)
    : m_device(device)
    , m_settings(settings)
    , m_transport(std::move(transport))
    , m_clock(clock)
    , m_sleeper([](int ms) {
        QThread::msleep(static_cast<unsigned long>(ms));
        return true;
    })
    , m_backoff(settings.reconnectBaseDelayMs, settings.reconnectMaxDelayMs,
                settings.maxReconnectAttempts)
{
    m_subscription.deviceName = device.name;
}

SubscriptionClient::~SubscriptionClient() {
    close();
}

void SubscriptionClient::setSleeper(Sleeper sleeper) {
    m_sleeper = std::move(sleeper);
}

bool SubscriptionClient::connect(Error* error) {
    if (m_closed) {
        setError(error, Error::connect("subscription client is closed"));
        return false;
    }
    if (m_connected) {
        return true;
    }

    Error connectError;
    if (!createSubscription(m_settings.requestTimeoutMs, &connectError)) {
        setError(error, connectError);
        scheduleReconnect(connectError);
        return false;
    }
    return true;
}

PollResult SubscriptionClient::nextEvent(int timeoutMs, DetectionEvent* event, Error* error) {
    if (m_closed) {
        return PollResult::Closed;
    }
    if (m_failed) {
        setError(error, m_lastError);
        return PollResult::Failed;
    }

    if (!m_pending.isEmpty()) {
        if (event) {
            *event = m_pending.takeFirst();
        } else {
            m_pending.removeFirst();
        }
        return PollResult::Event;
    }

    const qint64 deadline = m_clock->monotonicMs() + qMax(0, timeoutMs);

    if (!m_connected) {
        const qint64 now = m_clock->monotonicMs();
        if (now < m_nextAttemptMs) {
            const qint64 wait = qMin(m_nextAttemptMs, deadline) - now;
            if (wait > 0 && !m_sleeper(static_cast<int>(wait))) {
                return PollResult::Timeout;
            }
            if (m_clock->monotonicMs() < m_nextAttemptMs) {
                return PollResult::Timeout;
            }
        }

        Error connectError;
        if (!createSubscription(requestBudget(deadline), &connectError)) {
            scheduleReconnect(connectError);
            if (m_failed) {
                setError(error, m_lastError);
                return PollResult::Failed;
            }
            return PollResult::Timeout;
        }
    }

    if (m_clock->monotonicMs() >= m_subscription.renewBeforeMs
        && !renew(requestBudget(deadline))) {
        return PollResult::Timeout;
    }

    const qint64 now = m_clock->monotonicMs();
    const qint64 pullTimeout = qMax<qint64>(0, qMin(deadline, m_subscription.renewBeforeMs) - now);

    QList<RawNotification> messages;
    Error pullError;
    if (!m_transport->pullMessages(m_subscription.endpointReference, static_cast<int>(pullTimeout),
                                   m_settings.messageLimit, &messages, &pullError)) {
        releaseSubscription(requestBudget(deadline));
        scheduleReconnect(pullError);
        if (m_failed) {
            setError(error, m_lastError);
            return PollResult::Failed;
        }
        return PollResult::Timeout;
    }

    enqueue(messages);
    if (m_pending.isEmpty()) {
        return PollResult::Timeout;
    }
    if (event) {
        *event = m_pending.takeFirst();
    } else {
        m_pending.removeFirst();
    }
    return PollResult::Event;
}

void SubscriptionClient::close() {
    if (m_closed) {
        return;
    }
    m_closed = true;
    m_pending.clear();

    if (m_connected) {
        m_transport->unsubscribe(m_subscription.endpointReference, m_settings.requestTimeoutMs);
        m_connected = false;
        qCInfo(lcEvents).noquote() << deviceTag(m_device.name) << "unsubscribed";
    }
}

bool SubscriptionClient::createSubscription(int timeoutMs, Error* error) {
    SubscriptionInfo info;
    if (!m_transport->createSubscription(m_settings.subscriptionTerminationSeconds, timeoutMs,
                                         &info, error)) {
        return false;
    }

    acceptSubscription(info);
    m_backoff.reset();
    m_connected = true;

    qCInfo(lcEvents).noquote() << deviceTag(m_device.name) << "subscribed to events, renewal in"
                               << (m_subscription.renewBeforeMs - m_clock->monotonicMs()) / 1000
                               << "s";
    return true;
}

bool SubscriptionClient::renew(int timeoutMs) {
    SubscriptionInfo info;
    info.endpointReference = m_subscription.endpointReference;

    Error renewError;
    if (!m_transport->renewSubscription(m_subscription.endpointReference,
                                        m_settings.subscriptionTerminationSeconds, timeoutMs,
                                        &info, &renewError)) {
        qCWarning(lcEvents).noquote() << deviceTag(m_device.name) << "renewal failed,"
                                      << "resubscribing:" << renewError.toString();
        m_lastError = renewError;
        releaseSubscription(timeoutMs);
        m_nextAttemptMs = m_clock->monotonicMs();
        return false;
    }

    acceptSubscription(info);
    qCDebug(lcEvents).noquote() << deviceTag(m_device.name) << "subscription renewed until"
                                << m_subscription.terminationTime.toString(Qt::ISODate);
    return true;
}

void SubscriptionClient::releaseSubscription(int timeoutMs) {
    m_connected = false;
    if (m_subscription.endpointReference.isEmpty()) {
        return;
    }

    // Best effort, an unreachable device drops it at its termination time
    m_transport->unsubscribe(m_subscription.endpointReference, timeoutMs);
    qCDebug(lcEvents).noquote() << deviceTag(m_device.name) << "released"
                                << m_subscription.endpointReference;
    m_subscription.endpointReference.clear();
}

int SubscriptionClient::requestBudget(qint64 deadline) const {
    const qint64 remaining = deadline - m_clock->monotonicMs();
    return static_cast<int>(qMin<qint64>(m_settings.requestTimeoutMs,
                                         qMax<qint64>(remaining, m_settings.tickIntervalMs)));
}

void SubscriptionClient::scheduleReconnect(const Error& cause) {
    const QString tag = deviceTag(m_device.name);
    m_connected = false;
    m_lastError = cause;

    const int delay = m_backoff.nextDelayMs();
    if (m_backoff.exhausted()) {
        m_failed = true;
        m_lastError = Error::connect(QString("giving up after %1 failed attempts: %2")
                                         .arg(m_backoff.failures())
                                         .arg(cause.message));
        qCCritical(lcEvents).noquote() << tag << m_lastError.toString();
        return;
    }

    m_nextAttemptMs = m_clock->monotonicMs() + delay;
    qCWarning(lcEvents).noquote() << tag << cause.toString()
                                  << QString("(attempt %1), retrying in %2 ms")
                                         .arg(m_backoff.failures())
                                         .arg(delay);
}

void SubscriptionClient::acceptSubscription(const SubscriptionInfo& info) {
    qint64 lifetimeMs = info.grantedLifetimeMs();
    if (lifetimeMs <= 0) {
        lifetimeMs = qint64(m_settings.subscriptionTerminationSeconds) * 1000;
    }

    qint64 renewInMs = lifetimeMs - qint64(m_settings.renewMarginSeconds) * 1000;
    if (renewInMs <= 0) {
        renewInMs = lifetimeMs / 2;
    }

    if (!info.endpointReference.isEmpty()) {
        m_subscription.endpointReference = info.endpointReference;
    }
    m_subscription.terminationTime = info.terminationTime;
    m_subscription.renewBeforeMs = m_clock->monotonicMs() + renewInMs;
}

void SubscriptionClient::enqueue(const QList<RawNotification>& messages) {
    const qint64 receivedMs = m_clock->monotonicMs();
    const QDateTime receivedAt = m_clock->now();

    for (const RawNotification& notification : messages) {
        DetectionEvent event;
        QString reason;
        switch (normalize(notification, m_settings, m_device, receivedMs, receivedAt, &event,
                          &reason)) {
            case NotificationMatch::Detection:
                m_pending.append(event);
                break;
            case NotificationMatch::Unrelated:
                m_discarded++;
                qCDebug(lcEvents).noquote() << deviceTag(m_device.name) << "ignored" << reason;
                break;
            case NotificationMatch::Malformed:
                m_discarded++;
                qCWarning(lcEvents).noquote() << deviceTag(m_device.name)
                                              << Error::protocol(reason).toString();
                break;
        }
    }
}

NotificationMatch SubscriptionClient::normalize(const RawNotification& notification,
                                                const EventSettings& settings,
                                                const DeviceConfig& device, qint64 receivedMs,
                                                const QDateTime& receivedAt,
                                                DetectionEvent* event, QString* reason) {
    if (!notification.topic.contains(settings.topicFilter, Qt::CaseInsensitive)) {
        if (reason) {
            *reason = QString("topic %1").arg(notification.topic);
        }
        return NotificationMatch::Unrelated;
    }

    if (!device.eventSource.isEmpty() && !notification.source.isEmpty()) {
        bool ours = false;
        for (const QString& value : notification.source) {
            if (value.trimmed() == device.eventSource) {
                ours = true;
                break;
            }
        }
        if (!ours) {
            if (reason) {
                *reason = QString("%1 from source %2")
                              .arg(notification.topic, notification.source.values().join(','));
            }
            return NotificationMatch::Unrelated;
        }
    }

    const auto item = notification.data.constFind(settings.stateItemName);
    if (item == notification.data.constEnd()) {
        if (reason) {
            *reason = QString("%1 without %2 item").arg(notification.topic, settings.stateItemName);
        }
        return NotificationMatch::Malformed;
    }

    const QString value = item.value().trimmed().toLower();
    bool present = false;
    if (value == QLatin1String("true") || value == QLatin1String("1")) {
        present = true;
    } else if (value == QLatin1String("false") || value == QLatin1String("0")) {
        present = false;
    } else {
        if (reason) {
            *reason = QString("%1 has unexpected %2 value '%3'")
                          .arg(notification.topic, settings.stateItemName, item.value());
        }
        return NotificationMatch::Malformed;
    }

    if (event) {
        event->deviceName = device.name;
        event->observedAtMs = receivedMs;
        event->observedAt = receivedAt;
        event->isPresent = present;

        const QDateTime utc =
            QDateTime::fromString(notification.utcTime.trimmed(), Qt::ISODateWithMs);
        event->deviceTime = utc.isValid() ? utc.toLocalTime() : QDateTime();
    }
    return NotificationMatch::Detection;
}

} // namespace CER
