#include "interaction/interaction_dispatcher.hpp"

#include <iostream>
#include <utility>

#include "core/time_utils.hpp"

namespace camio {

InteractionDispatcher::InteractionDispatcher(
    std::vector<Hotspot> hotspots,
    AudioBackend& audio,
    double cooldown_s,
    int64_t start_ns)
    : hotspots_(std::move(hotspots)),
      audio_(audio),
      cooldown_ns_(secondsToNs(cooldown_s)) {
    state_.last_dispatch_ns = start_ns;

    audio_handles_.reserve(hotspots_.size());
    for (const auto& hotspot : hotspots_) {
        int handle = -1;
        std::string error;
        if (!audio_.load(hotspot.audio_path, handle, error)) {
            std::cerr << "[Audio] warning: '" << hotspot.text_description << "' has no cue: " << error << '\n';
            handle = -1;
        }
        audio_handles_.push_back(handle);
    }
}

std::size_t InteractionDispatcher::loadedAssetCount() const {
    std::size_t n = 0;
    for (const int h : audio_handles_) {
        if (h >= 0) {
            ++n;
        }
    }
    return n;
}

bool InteractionDispatcher::dispatch(int zone_id, int64_t now_ns) {
    if (zone_id < 0 || zone_id >= static_cast<int>(hotspots_.size())) {
        return false;
    }
    const std::size_t idx = static_cast<std::size_t>(zone_id);
    const std::string& zone_name = hotspots_[idx].text_description;
    if (zone_name == state_.last_zone_name) {
        return false;
    }
    if (now_ns - state_.last_dispatch_ns < cooldown_ns_) {
        return false;
    }

    bool requested = false;
    std::string error;
    if (audio_handles_[idx] < 0) {
        std::cerr << "[Audio] cannot play cue for '" << zone_name << "': asset unavailable\n";
    } else if (!audio_.play(audio_handles_[idx], error)) {
        std::cerr << "[Audio] cannot play cue for '" << zone_name << "': " << error << '\n';
    } else {
        requested = true;
    }

    state_.last_dispatch_ns = now_ns;
    state_.last_zone_name = zone_name;
    return requested;
}

}  // namespace camio
