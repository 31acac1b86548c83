#ifndef ONVIFMESSAGES_H
#define ONVIFMESSAGES_H

#include <QByteArray>
#include <QDateTime>
#include <QList>
#include <QString>

#include "events/EventTransport.h"

namespace CER {

/**
 * @brief WS-Security UsernameToken with a password digest
 *
 * digest = Base64(SHA1(nonce + created + password))
 */
struct UsernameToken {
    QString username;
    QByteArray nonce;        // Raw bytes, sent Base64 encoded
    QString created;         // xs:dateTime in UTC
    QString passwordDigest;  // Base64

    bool isEmpty() const { return username.isEmpty(); }

    static UsernameToken create(const QString& username, const QString& password,
                                const QByteArray& nonce, const QDateTime& created);

    /**
     * @brief Token with a random 16-byte nonce
     */
    static UsernameToken generate(const QString& username, const QString& password,
                                  const QDateTime& created);
};

/**
 * @brief SOAP 1.2 envelopes and response parsers for ONVIF pull-point events
 *
 * Parsers match elements by local name, so devices may use any prefix.
 */
namespace OnvifMessages {

extern const char* const ACTION_CREATE_PULL_POINT;
extern const char* const ACTION_PULL_MESSAGES;
extern const char* const ACTION_RENEW;
extern const char* const ACTION_UNSUBSCRIBE;

/**
 * @brief xs:duration for a millisecond count, e.g. "PT5S" or "PT0.500S"
 */
QString formatDuration(qint64 ms);

QByteArray createPullPointSubscription(const UsernameToken& token, const QString& to,
                                       int terminationSeconds);

QByteArray pullMessages(const UsernameToken& token, const QString& to, int timeoutMs,
                        int messageLimit);

QByteArray renew(const UsernameToken& token, const QString& to, int terminationSeconds);

QByteArray unsubscribe(const UsernameToken& token, const QString& to);

/**
 * @brief Extract a SOAP fault
 * @return true if @p body is a fault; @p reason receives its text
 */
bool parseFault(const QByteArray& body, QString* reason);

bool parseCreateResponse(const QByteArray& body, SubscriptionInfo* info, QString* errorMessage);

/**
 * @brief Parse a RenewResponse
 *
 * The endpoint reference is not part of the answer and is left untouched.
 */
bool parseRenewResponse(const QByteArray& body, SubscriptionInfo* info, QString* errorMessage);

/**
 * @brief Parse a PullMessagesResponse
 * @param messages Receives the notifications in document order
 * @param info Optional, receives CurrentTime and TerminationTime
 */
bool parsePullResponse(const QByteArray& body, QList<RawNotification>* messages,
                       SubscriptionInfo* info, QString* errorMessage);

} // namespace OnvifMessages

} // namespace CER

#endif // ONVIFMESSAGES_H
