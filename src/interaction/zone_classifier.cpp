#include "interaction/zone_classifier.hpp"

#include <cmath>
#include <utility>

#include <opencv2/imgcodecs.hpp>

namespace camio {

ZoneMap::ZoneMap(cv::Mat image_bgr, double pixels_per_cm, std::vector<Hotspot> hotspots)
    : image_bgr_(std::move(image_bgr)), pixels_per_cm_(pixels_per_cm), hotspots_(std::move(hotspots)) {}

bool ZoneMap::loadImage(const std::string& path, std::string& error) {
    cv::Mat img;
    try {
        img = cv::imread(path, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        error = "failed to read zone image " + path + ": " + e.what();
        return false;
    }
    if (img.empty() || img.type() != CV_8UC3) {
        error = "zone image not found or unreadable: " + path;
        return false;
    }
    image_bgr_ = img;
    error.clear();
    return true;
}

int ZoneMap::zoneForColor(const cv::Vec3b& bgr) const {
    for (std::size_t i = 0; i < hotspots_.size(); ++i) {
        const cv::Vec3b& rgb = hotspots_[i].color_rgb;
        if (rgb[0] == bgr[2] && rgb[1] == bgr[1] && rgb[2] == bgr[0]) {
            return static_cast<int>(i);
        }
    }
    return kNoZone;
}

int ZoneMap::rawZoneAt(double x_cm, double y_cm) const {
    if (image_bgr_.empty() || !std::isfinite(x_cm) || !std::isfinite(y_cm)) {
        return kNoZone;
    }
    // Truncation toward zero, so (-1, 0) px rounds onto column 0.
    const double px = x_cm * pixels_per_cm_;
    const double py = y_cm * pixels_per_cm_;
    if (px <= -1.0 || py <= -1.0 || px >= image_bgr_.cols || py >= image_bgr_.rows) {
        return kNoZone;
    }
    const int x = static_cast<int>(px);
    const int y = static_cast<int>(py);
    return zoneForColor(image_bgr_.at<cv::Vec3b>(y, x));
}

ZoneClassifier::ZoneClassifier(ZoneMap zone_map, int filter_size, double touch_threshold_cm)
    : zone_map_(std::move(zone_map)),
      filter_(static_cast<std::size_t>(filter_size > 0 ? filter_size : kDefaultFilterSize), kNoZone),
      touch_threshold_cm_(touch_threshold_cm) {}

int ZoneClassifier::classify(const cv::Point3d& position_cm) {
    last_raw_zone_ = zone_map_.rawZoneAt(position_cm.x, position_cm.y);
    const int zone = filter_.push(last_raw_zone_);
    if (std::abs(position_cm.z) < touch_threshold_cm_) {
        return zone;
    }
    return kNoZone;
}

}  // namespace camio
