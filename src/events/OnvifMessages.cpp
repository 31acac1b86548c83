#include "OnvifMessages.h"

#include <QCryptographicHash>
#include <QRandomGenerator>
#include <QUuid>
#include <QXmlStreamReader>
#include <QXmlStreamWriter>

namespace CER {

namespace {

const char* const NS_SOAP = "http://www.w3.org/2003/05/soap-envelope";
const char* const NS_WSA = "http://www.w3.org/2005/08/addressing";
const char* const NS_WSSE =
    "http://docs.oasis-open.org/wss/2004/01/oasis-200401-wss-wssecurity-secext-1.0.xsd";
const char* const NS_WSU =
    "http://docs.oasis-open.org/wss/2004/01/oasis-200401-wss-wssecurity-utility-1.0.xsd";
const char* const NS_TEV = "http://www.onvif.org/ver10/events/wsdl";
const char* const NS_WSNT = "http://docs.oasis-open.org/wsn/b-2";

const char* const PASSWORD_DIGEST_TYPE =
    "http://docs.oasis-open.org/wss/2004/01/oasis-200401-wss-username-token-profile-1.0#PasswordDigest";
const char* const BASE64_ENCODING_TYPE =
    "http://docs.oasis-open.org/wss/2004/01/oasis-200401-wss-soap-message-security-1.0#Base64Binary";

constexpr int NONCE_BYTES = 16;

/**
 * @brief Writes the envelope, addressing and security headers
 */
class EnvelopeWriter {
public:
    EnvelopeWriter(const char* action, const QString& to, const UsernameToken& token)
        : m_xml(&m_buffer)
    {
        m_xml.writeStartDocument();
        m_xml.writeNamespace(NS_SOAP, "s");
        m_xml.writeNamespace(NS_WSA, "wsa");
        m_xml.writeNamespace(NS_WSSE, "wsse");
        m_xml.writeNamespace(NS_WSU, "wsu");
        m_xml.writeNamespace(NS_TEV, "tev");
        m_xml.writeNamespace(NS_WSNT, "wsnt");
        m_xml.writeStartElement(NS_SOAP, "Envelope");

        m_xml.writeStartElement(NS_SOAP, "Header");
        m_xml.writeTextElement(NS_WSA, "Action", action);
        m_xml.writeTextElement(NS_WSA, "MessageID",
                               "urn:uuid:" + QUuid::createUuid().toString(QUuid::WithoutBraces));
        if (!to.isEmpty()) {
            m_xml.writeTextElement(NS_WSA, "To", to);
        }
        if (!token.isEmpty()) {
            writeSecurity(token);
        }
        m_xml.writeEndElement(); // Header

        m_xml.writeStartElement(NS_SOAP, "Body");
    }

    QXmlStreamWriter& xml() { return m_xml; }

    QByteArray finish() {
        m_xml.writeEndElement(); // Body
        m_xml.writeEndElement(); // Envelope
        m_xml.writeEndDocument();
        return m_buffer;
    }

private:
    void writeSecurity(const UsernameToken& token) {
        m_xml.writeStartElement(NS_WSSE, "Security");
        m_xml.writeAttribute(NS_SOAP, "mustUnderstand", "1");
        m_xml.writeStartElement(NS_WSSE, "UsernameToken");
        m_xml.writeTextElement(NS_WSSE, "Username", token.username);

        m_xml.writeStartElement(NS_WSSE, "Password");
        m_xml.writeAttribute("Type", PASSWORD_DIGEST_TYPE);
        m_xml.writeCharacters(token.passwordDigest);
        m_xml.writeEndElement();

        m_xml.writeStartElement(NS_WSSE, "Nonce");
        m_xml.writeAttribute("EncodingType", BASE64_ENCODING_TYPE);
        m_xml.writeCharacters(QString::fromLatin1(token.nonce.toBase64()));
        m_xml.writeEndElement();

        m_xml.writeTextElement(NS_WSU, "Created", token.created);
        m_xml.writeEndElement(); // UsernameToken
        m_xml.writeEndElement(); // Security
    }

    QByteArray m_buffer;
    QXmlStreamWriter m_xml;
};

QDateTime parseDateTime(const QString& text) {
    const QString trimmed = text.trimmed();
    QDateTime value = QDateTime::fromString(trimmed, Qt::ISODateWithMs);
    if (!value.isValid()) {
        value = QDateTime::fromString(trimmed, Qt::ISODate);
    }
    return value;
}

void readSimpleItems(QXmlStreamReader& xml, QMap<QString, QString>* items) {
    while (xml.readNextStartElement()) {
        if (xml.name() == QLatin1String("SimpleItem")) {
            const QXmlStreamAttributes attrs = xml.attributes();
            items->insert(attrs.value("Name").toString(), attrs.value("Value").toString());
        }
        xml.skipCurrentElement();
    }
}

void readMessageBody(QXmlStreamReader& xml, RawNotification* notification) {
    const QXmlStreamAttributes attrs = xml.attributes();
    notification->utcTime = attrs.value("UtcTime").toString();
    notification->propertyOperation = attrs.value("PropertyOperation").toString();

    while (xml.readNextStartElement()) {
        if (xml.name() == QLatin1String("Source")) {
            readSimpleItems(xml, &notification->source);
        } else if (xml.name() == QLatin1String("Data")) {
            readSimpleItems(xml, &notification->data);
        } else {
            xml.skipCurrentElement();
        }
    }
}

RawNotification readNotification(QXmlStreamReader& xml) {
    RawNotification notification;
    while (xml.readNextStartElement()) {
        if (xml.name() == QLatin1String("Topic")) {
            notification.topic = xml.readElementText(QXmlStreamReader::IncludeChildElements).trimmed();
        } else if (xml.name() == QLatin1String("Message")) {
            // wsnt:Message wraps tt:Message
            while (xml.readNextStartElement()) {
                if (xml.name() == QLatin1String("Message")) {
                    readMessageBody(xml, &notification);
                } else {
                    xml.skipCurrentElement();
                }
            }
        } else {
            xml.skipCurrentElement();
        }
    }
    return notification;
}

bool failWithFault(const QByteArray& body, QString* errorMessage) {
    QString reason;
    if (OnvifMessages::parseFault(body, &reason)) {
        if (errorMessage) {
            *errorMessage = QString("SOAP fault: %1").arg(reason);
        }
        return true;
    }
    return false;
}

bool checkReader(const QXmlStreamReader& xml, QString* errorMessage) {
    if (xml.hasError()) {
        if (errorMessage) {
            *errorMessage = QString("malformed XML at line %1: %2")
                                .arg(xml.lineNumber())
                                .arg(xml.errorString());
        }
        return false;
    }
    return true;
}

/**
 * @brief Shared parsing of CurrentTime / TerminationTime elements
 */
bool readSubscriptionTimes(QXmlStreamReader& xml, SubscriptionInfo* info) {
    if (xml.name() == QLatin1String("CurrentTime")) {
        info->currentTime = parseDateTime(xml.readElementText());
        return true;
    }
    if (xml.name() == QLatin1String("TerminationTime")) {
        info->terminationTime = parseDateTime(xml.readElementText());
        return true;
    }
    return false;
}

} // namespace

qint64 SubscriptionInfo::grantedLifetimeMs() const {
    if (!currentTime.isValid() || !terminationTime.isValid()) {
        return -1;
    }
    return currentTime.msecsTo(terminationTime);
}

UsernameToken UsernameToken::create(const QString& username, const QString& password,
                                    const QByteArray& nonce, const QDateTime& created) {
    UsernameToken token;
    token.username = username;
    token.nonce = nonce;
    token.created = created.toUTC().toString("yyyy-MM-dd'T'HH:mm:ss.zzz'Z'");

    QByteArray material = nonce;
    material += token.created.toUtf8();
    material += password.toUtf8();
    token.passwordDigest = QString::fromLatin1(
        QCryptographicHash::hash(material, QCryptographicHash::Sha1).toBase64());
    return token;
}

UsernameToken UsernameToken::generate(const QString& username, const QString& password,
                                      const QDateTime& created) {
    QByteArray nonce(NONCE_BYTES, Qt::Uninitialized);
    for (int i = 0; i < NONCE_BYTES; i++) {
        nonce[i] = static_cast<char>(QRandomGenerator::global()->bounded(256));
    }
    return create(username, password, nonce, created);
}

namespace OnvifMessages {

const char* const ACTION_CREATE_PULL_POINT =
    "http://www.onvif.org/ver10/events/wsdl/EventPortType/CreatePullPointSubscriptionRequest";
const char* const ACTION_PULL_MESSAGES =
    "http://www.onvif.org/ver10/events/wsdl/PullPointSubscription/PullMessagesRequest";
const char* const ACTION_RENEW =
    "http://docs.oasis-open.org/wsn/bw-2/SubscriptionManager/RenewRequest";
const char* const ACTION_UNSUBSCRIBE =
    "http://docs.oasis-open.org/wsn/bw-2/SubscriptionManager/UnsubscribeRequest";

QString formatDuration(qint64 ms) {
    if (ms < 0) {
        ms = 0;
    }
    if (ms % 1000 == 0) {
        return QString("PT%1S").arg(ms / 1000);
    }
    return QString("PT%1S").arg(ms / 1000.0, 0, 'f', 3);
}

QByteArray createPullPointSubscription(const UsernameToken& token, const QString& to,
                                       int terminationSeconds) {
    EnvelopeWriter envelope(ACTION_CREATE_PULL_POINT, to, token);
    QXmlStreamWriter& xml = envelope.xml();
    xml.writeStartElement(NS_TEV, "CreatePullPointSubscription");
    xml.writeTextElement(NS_TEV, "InitialTerminationTime",
                         formatDuration(qint64(terminationSeconds) * 1000));
    xml.writeEndElement();
    return envelope.finish();
}

QByteArray pullMessages(const UsernameToken& token, const QString& to, int timeoutMs,
                        int messageLimit) {
    EnvelopeWriter envelope(ACTION_PULL_MESSAGES, to, token);
    QXmlStreamWriter& xml = envelope.xml();
    xml.writeStartElement(NS_TEV, "PullMessages");
    xml.writeTextElement(NS_TEV, "Timeout", formatDuration(timeoutMs));
    xml.writeTextElement(NS_TEV, "MessageLimit", QString::number(messageLimit));
    xml.writeEndElement();
    return envelope.finish();
}

QByteArray renew(const UsernameToken& token, const QString& to, int terminationSeconds) {
    EnvelopeWriter envelope(ACTION_RENEW, to, token);
    QXmlStreamWriter& xml = envelope.xml();
    xml.writeStartElement(NS_WSNT, "Renew");
    xml.writeTextElement(NS_WSNT, "TerminationTime",
                         formatDuration(qint64(terminationSeconds) * 1000));
    xml.writeEndElement();
    return envelope.finish();
}

QByteArray unsubscribe(const UsernameToken& token, const QString& to) {
    EnvelopeWriter envelope(ACTION_UNSUBSCRIBE, to, token);
    envelope.xml().writeEmptyElement(NS_WSNT, "Unsubscribe");
    return envelope.finish();
}

bool parseFault(const QByteArray& body, QString* reason) {
    QXmlStreamReader xml(body);
    bool inFault = false;
    QString text;
    QString code;

    while (!xml.atEnd()) {
        xml.readNext();
        if (!xml.isStartElement()) {
            continue;
        }
        if (xml.name() == QLatin1String("Fault")) {
            inFault = true;
        } else if (inFault && (xml.name() == QLatin1String("Text")
                               || xml.name() == QLatin1String("faultstring"))) {
            text = xml.readElementText().trimmed();
        } else if (inFault && xml.name() == QLatin1String("Value")) {
            // Subcode values come after the generic code and are more specific
            code = xml.readElementText().trimmed();
        }
    }

    if (!inFault) {
        return false;
    }
    if (reason) {
        if (!text.isEmpty() && !code.isEmpty()) {
            *reason = QString("%1 (%2)").arg(text, code);
        } else {
            *reason = text.isEmpty() ? code : text;
        }
    }
    return true;
}

bool parseCreateResponse(const QByteArray& body, SubscriptionInfo* info, QString* errorMessage) {
    if (failWithFault(body, errorMessage)) {
        return false;
    }

    SubscriptionInfo result;
    bool sawResponse = false;
    QXmlStreamReader xml(body);
    while (!xml.atEnd()) {
        xml.readNext();
        if (!xml.isStartElement()) {
            continue;
        }
        if (xml.name() == QLatin1String("CreatePullPointSubscriptionResponse")) {
            sawResponse = true;
        } else if (xml.name() == QLatin1String("SubscriptionReference")) {
            while (xml.readNextStartElement()) {
                if (xml.name() == QLatin1String("Address")) {
                    result.endpointReference = xml.readElementText().trimmed();
                } else {
                    xml.skipCurrentElement();
                }
            }
        } else {
            readSubscriptionTimes(xml, &result);
        }
    }

    if (!checkReader(xml, errorMessage)) {
        return false;
    }
    if (!sawResponse || result.endpointReference.isEmpty()) {
        if (errorMessage) {
            *errorMessage = "response carries no subscription reference";
        }
        return false;
    }

    if (info) {
        *info = result;
    }
    return true;
}

bool parseRenewResponse(const QByteArray& body, SubscriptionInfo* info, QString* errorMessage) {
    if (failWithFault(body, errorMessage)) {
        return false;
    }

    SubscriptionInfo times;
    bool sawResponse = false;
    QXmlStreamReader xml(body);
    while (!xml.atEnd()) {
        xml.readNext();
        if (!xml.isStartElement()) {
            continue;
        }
        if (xml.name() == QLatin1String("RenewResponse")) {
            sawResponse = true;
        } else {
            readSubscriptionTimes(xml, &times);
        }
    }

    if (!checkReader(xml, errorMessage)) {
        return false;
    }
    if (!sawResponse || !times.terminationTime.isValid()) {
        if (errorMessage) {
            *errorMessage = "renew response carries no termination time";
        }
        return false;
    }

    if (info) {
        info->currentTime = times.currentTime;
        info->terminationTime = times.terminationTime;
    }
    return true;
}

bool parsePullResponse(const QByteArray& body, QList<RawNotification>* messages,
                       SubscriptionInfo* info, QString* errorMessage) {
    if (failWithFault(body, errorMessage)) {
        return false;
    }

    QList<RawNotification> result;
    SubscriptionInfo times;
    bool sawResponse = false;
    QXmlStreamReader xml(body);
    while (!xml.atEnd()) {
        xml.readNext();
        if (!xml.isStartElement()) {
            continue;
        }
        if (xml.name() == QLatin1String("PullMessagesResponse")) {
            sawResponse = true;
        } else if (xml.name() == QLatin1String("NotificationMessage")) {
            result.append(readNotification(xml));
        } else {
            readSubscriptionTimes(xml, &times);
        }
    }

    if (!checkReader(xml, errorMessage)) {
        return false;
    }
    if (!sawResponse) {
        if (errorMessage) {
            *errorMessage = "not a PullMessages response";
        }
        return false;
    }

    if (messages) {
        *messages = result;
    }
    if (info) {
        info->currentTime = times.currentTime;
        info->terminationTime = times.terminationTime;
    }
    return true;
}

} // namespace OnvifMessages

} // namespace CER
