#ifndef ERRORS_H
#define ERRORS_H

#include <QMetaType>
#include <QString>

namespace CER {

/**
 * @brief Error taxonomy shared by all pipeline components
 */
enum class ErrorKind {
    None,
    Connect,       // Network or authentication failure towards a device
    Protocol,      // Malformed or unexpected notification / response
    SessionStart,  // Capture could not be launched or paths not allocated
    ProcessFault,  // Capture process exited while recording
    Config         // Invalid startup configuration
};

/**
 * @brief Error value filled in by operations that can fail
 *
 * Functions return bool (or a result enum) and describe the failure
 * through an Error out-parameter.
 */
struct Error {
    ErrorKind kind = ErrorKind::None;
    QString message;

    bool isSet() const { return kind != ErrorKind::None; }
    void clear();
    QString toString() const;

    static Error connect(const QString& message);
    static Error protocol(const QString& message);
    static Error sessionStart(const QString& message);
    static Error processFault(const QString& message);
    static Error config(const QString& message);
};

const char* errorKindName(ErrorKind kind);

/**
 * @brief Assign @p value to @p target when the caller asked for it
 */
inline void setError(Error* target, const Error& value) {
    if (target) {
        *target = value;
    }
}

} // namespace CER

Q_DECLARE_METATYPE(CER::Error)

#endif // ERRORS_H
