#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "interaction/audio_backend.hpp"

namespace camio {

struct DispatchState {
    std::string last_zone_name;
    int64_t last_dispatch_ns{0};
};

// One cue per zone entry. Plays when the zone name differs from the last
// dispatched one and the cooldown has elapsed since the last dispatch of any
// zone. A failed playback still updates the state and is not retried.
class InteractionDispatcher {
public:
    static constexpr double kDefaultCooldownS = 0.5;

    InteractionDispatcher(
        std::vector<Hotspot> hotspots,
        AudioBackend& audio,
        double cooldown_s,
        int64_t start_ns);

    // Returns true when playback of a cue was requested.
    bool dispatch(int zone_id, int64_t now_ns);

    const DispatchState& state() const { return state_; }
    std::size_t loadedAssetCount() const;

private:
    std::vector<Hotspot> hotspots_;
    std::vector<int> audio_handles_;  // -1 when the asset failed to load
    AudioBackend& audio_;
    int64_t cooldown_ns_;
    DispatchState state_;
};

}  // namespace camio
