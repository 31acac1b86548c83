#ifndef SNAPSHOTFETCHER_H
#define SNAPSHOTFETCHER_H

#include <QByteArray>
#include <QString>
#include <functional>
#include <memory>

namespace CER {

struct DeviceConfig;

/**
 * @brief One-shot still image retrieval from a camera
 */
class SnapshotFetcher {
public:
    virtual ~SnapshotFetcher() = default;

    /**
     * @brief Fetch the current image of a device
     * @param device Camera to query
     * @param image Receives the encoded image (JPEG)
     * @param errorMessage Receives the reason on failure
     * @return true if a decodable image was received
     */
    virtual bool fetch(const DeviceConfig& device, QByteArray* image, QString* errorMessage) = 0;
};

using SnapshotFetcherFactory = std::function<std::unique_ptr<SnapshotFetcher>()>;

} // namespace CER

#endif // SNAPSHOTFETCHER_H
