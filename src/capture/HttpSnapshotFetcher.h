#ifndef HTTPSNAPSHOTFETCHER_H
#define HTTPSNAPSHOTFETCHER_H

#include <QNetworkAccessManager>
#include <QSize>

#include "capture/SnapshotFetcher.h"

namespace CER {

/**
 * @brief Snapshot over a single HTTP GET
 *
 * Uses DeviceConfig::snapshotRequestUrl(); for the derived Reolink URL
 * a random "rs" token is appended so no proxy serves a cached image.
 * Cameras answer authentication failures with a JSON body and HTTP 200,
 * so the payload is decoded before it is accepted.
 */
class HttpSnapshotFetcher : public SnapshotFetcher {
public:
    explicit HttpSnapshotFetcher(int timeoutMs);

    bool fetch(const DeviceConfig& device, QByteArray* image, QString* errorMessage) override;

    /**
     * @brief Decode an image payload with OpenCV
     * @param data Encoded image
     * @param size Receives the resolution
     * @param errorMessage Receives the reason when the payload is not an image
     */
    static bool inspectImage(const QByteArray& data, QSize* size, QString* errorMessage);

private:
    int m_timeoutMs;
    QNetworkAccessManager m_network;
};

} // namespace CER

#endif // HTTPSNAPSHOTFETCHER_H
