#ifndef DETECTIONEVENT_H
#define DETECTIONEVENT_H

#include <QDateTime>
#include <QMetaType>
#include <QString>

namespace CER {

/**
 * @brief One normalized presence notification for a device
 *
 * observedAtMs is the local monotonic receipt time and drives all
 * deadline arithmetic; observedAt is the local wall time of receipt.
 * deviceTime is what the camera stamped, kept for diagnostics only.
 */
struct DetectionEvent {
    QString deviceName;
    qint64 observedAtMs = 0;
    QDateTime observedAt;
    QDateTime deviceTime;
    bool isPresent = false;
};

} // namespace CER

Q_DECLARE_METATYPE(CER::DetectionEvent)

#endif // DETECTIONEVENT_H
