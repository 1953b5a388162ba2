#include "markers/correspondence_matcher.hpp"

#include <unordered_map>

namespace camio {

CorrespondenceMatch matchCorrespondences(
    const std::vector<MarkerObservation>& observations,
    const MarkerLayout& layout) {
    CorrespondenceMatch match;
    const std::size_t n = layout.markers.size() * 4;
    match.set.model_points.reserve(n);
    match.set.scene_points.assign(n, cv::Point2f(0.0F, 0.0F));
    match.set.valid.assign(n, false);

    std::unordered_map<int, std::size_t> slot_by_id;
    for (std::size_t m = 0; m < layout.markers.size(); ++m) {
        const MarkerGeometry& marker = layout.markers[m];
        slot_by_id[marker.id] = m;
        for (const auto& corner : marker.corners) {
            match.set.model_points.push_back(corner);
        }
    }

    for (const auto& obs : observations) {
        const auto it = slot_by_id.find(obs.id);
        if (it == slot_by_id.end()) {
            continue;
        }
        const std::size_t base = it->second * 4;
        for (std::size_t j = 0; j < 4; ++j) {
            match.set.scene_points[base + j] = obs.corners[j];
            match.set.valid[base + j] = true;
        }
        match.any_valid = true;
    }
    return match;
}

}  // namespace camio
