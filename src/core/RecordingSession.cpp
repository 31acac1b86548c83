#include "RecordingSession.h"

namespace CER {

const char* sessionStatusName(SessionStatus status) {
    switch (status) {
        case SessionStatus::Starting: return "Starting";
        case SessionStatus::Running:  return "Running";
        case SessionStatus::Stopping: return "Stopping";
        case SessionStatus::Stopped:  return "Stopped";
    }
    return "Unknown";
}

} // namespace CER
