#include "PipelineDependencies.h"
#include "capture/FfmpegCaptureProcess.h"
#include "capture/HttpSnapshotFetcher.h"
#include "core/Config.h"
#include "events/OnvifPullPointTransport.h"

namespace CER {

bool PipelineDependencies::isComplete() const {
    return transportFactory && captureFactory && snapshotFactory && clock;
}

PipelineDependencies PipelineDependencies::defaults(const Config& config) {
    const RecordingSettings recording = config.recording();
    const int requestTimeoutMs = config.events().requestTimeoutMs;

    PipelineDependencies deps;
    deps.transportFactory = [requestTimeoutMs](const DeviceConfig& device) {
        return std::unique_ptr<EventTransport>(
            std::make_unique<OnvifPullPointTransport>(device, requestTimeoutMs));
    };
    deps.captureFactory = [recording]() {
        return std::unique_ptr<CaptureProcess>(std::make_unique<FfmpegCaptureProcess>(recording));
    };
    deps.snapshotFactory = [recording]() {
        return std::unique_ptr<SnapshotFetcher>(
            std::make_unique<HttpSnapshotFetcher>(recording.snapshotTimeoutMs));
    };
    deps.clock = std::make_shared<SystemClock>();
    return deps;
}

} // namespace CER
