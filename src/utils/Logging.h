#ifndef LOGGING_H
#define LOGGING_H

#include <QLoggingCategory>
#include <QString>

namespace CER {

Q_DECLARE_LOGGING_CATEGORY(lcConfig)
Q_DECLARE_LOGGING_CATEGORY(lcEvents)
Q_DECLARE_LOGGING_CATEGORY(lcSession)
Q_DECLARE_LOGGING_CATEGORY(lcPipeline)
Q_DECLARE_LOGGING_CATEGORY(lcSupervisor)

/**
 * @brief Install the process-wide message pattern and category filter
 * @param verbose Enable debug output for all cer.* categories
 */
void setupLogging(bool verbose);

/**
 * @brief Prefix used on every device-scoped log line, e.g. "[front]"
 */
inline QString deviceTag(const QString& deviceName) {
    return QStringLiteral("[%1]").arg(deviceName);
}

} // namespace CER

#endif // LOGGING_H
