#pragma once

#include <cstdint>

namespace camio {

struct TelemetrySnapshot {
    int fps{0};
    uint64_t frames{0};
    uint64_t map_located{0};
    uint64_t pointer_located{0};
    uint64_t touching{0};
    uint64_t cues{0};
};

class Telemetry {
public:
    void setFps(int value) { fps_ = value; }
    void recordFrame(bool map_located, bool pointer_located, bool touching, bool cue);

    TelemetrySnapshot snapshot() const;

private:
    int fps_{0};
    uint64_t frames_{0};
    uint64_t map_located_{0};
    uint64_t pointer_located_{0};
    uint64_t touching_{0};
    uint64_t cues_{0};
};

}  // namespace camio
