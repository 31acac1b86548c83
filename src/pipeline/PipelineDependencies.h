#ifndef PIPELINEDEPENDENCIES_H
#define PIPELINEDEPENDENCIES_H

#include <memory>

#include "capture/CaptureProcess.h"
#include "capture/SnapshotFetcher.h"
#include "core/Clock.h"
#include "events/EventTransport.h"

namespace CER {

class Config;

/**
 * @brief Collaborators handed to every device pipeline
 *
 * Factories are invoked on the pipeline thread, so the objects they
 * create live there.
 */
struct PipelineDependencies {
    EventTransportFactory transportFactory;
    CaptureProcessFactory captureFactory;
    SnapshotFetcherFactory snapshotFactory;
    std::shared_ptr<const Clock> clock;

    bool isComplete() const;

    /**
     * @brief ONVIF transport, ffmpeg, HTTP snapshots and the system clock
     */
    static PipelineDependencies defaults(const Config& config);
};

} // namespace CER

#endif // PIPELINEDEPENDENCIES_H
