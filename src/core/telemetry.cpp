#include "core/telemetry.hpp"

namespace camio {

void Telemetry::recordFrame(bool map_located, bool pointer_located, bool touching, bool cue) {
    ++frames_;
    if (map_located) ++map_located_;
    if (pointer_located) ++pointer_located_;
    if (touching) ++touching_;
    if (cue) ++cues_;
}

TelemetrySnapshot Telemetry::snapshot() const {
    return TelemetrySnapshot{
        fps_,
        frames_,
        map_located_,
        pointer_located_,
        touching_,
        cues_};
}

}  // namespace camio
