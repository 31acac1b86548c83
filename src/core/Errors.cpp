#include "Errors.h"

namespace CER {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::Connect: return "ConnectError";
        case ErrorKind::Protocol: return "ProtocolError";
        case ErrorKind::SessionStart: return "SessionStartError";
        case ErrorKind::ProcessFault: return "ProcessFault";
        case ErrorKind::Config: return "ConfigError";
    }
    return "Unknown";
}

void Error::clear() {
    kind = ErrorKind::None;
    message.clear();
}

QString Error::toString() const {
    if (!isSet()) {
        return QStringLiteral("no error");
    }
    return QStringLiteral("%1: %2").arg(QString::fromLatin1(errorKindName(kind)), message);
}

Error Error::connect(const QString& message) {
    return Error{ErrorKind::Connect, message};
}

Error Error::protocol(const QString& message) {
    return Error{ErrorKind::Protocol, message};
}

Error Error::sessionStart(const QString& message) {
    return Error{ErrorKind::SessionStart, message};
}

Error Error::processFault(const QString& message) {
    return Error{ErrorKind::ProcessFault, message};
}

Error Error::config(const QString& message) {
    return Error{ErrorKind::Config, message};
}

} // namespace CER
