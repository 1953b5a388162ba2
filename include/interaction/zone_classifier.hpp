#pragma once

#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "core/types.hpp"
#include "interaction/majority_vote_filter.hpp"

namespace camio {

constexpr int kNoZone = -1;

// Color-coded zone reference image (BGR, as loaded by OpenCV) plus the
// hotspot registry whose RGB colors identify each zone.
class ZoneMap {
public:
    ZoneMap() = default;
    ZoneMap(cv::Mat image_bgr, double pixels_per_cm, std::vector<Hotspot> hotspots);

    bool loadImage(const std::string& path, std::string& error);

    // Raw per-sample lookup; kNoZone outside the image or on a color miss.
    int rawZoneAt(double x_cm, double y_cm) const;
    int zoneForColor(const cv::Vec3b& bgr) const;

private:
    cv::Mat image_bgr_;
    double pixels_per_cm_{1.0};
    std::vector<Hotspot> hotspots_;
};

class ZoneClassifier {
public:
    static constexpr int kDefaultFilterSize = 10;
    static constexpr double kDefaultTouchThresholdCm = 2.0;

    explicit ZoneClassifier(
        ZoneMap zone_map,
        int filter_size = kDefaultFilterSize,
        double touch_threshold_cm = kDefaultTouchThresholdCm);

    // Records one sample and returns the debounced zone, or kNoZone when the
    // tip is not within touch distance of the map plane.
    int classify(const cv::Point3d& position_cm);

    int lastRawZone() const { return last_raw_zone_; }

private:
    ZoneMap zone_map_;
    MajorityVoteFilter<int> filter_;
    double touch_threshold_cm_;
    int last_raw_zone_{kNoZone};
};

}  // namespace camio
