#pragma once

#include <vector>

#include <opencv2/core.hpp>

#include "core/types.hpp"

namespace camio {

struct OverlayStatus {
    int fps{0};
    bool map_located{false};
    bool pointer_located{false};
    int zone{-1};
    const char* zone_name{nullptr};
    cv::Point3d tip_cm{0.0, 0.0, 0.0};
    double map_reprojection_px{-1.0};  // negative when the map was not located
};

class OverlayRenderer {
public:
    // Model points as white circles plus 6 cm axes (X blue, Y green, Z red
    // pointing off the map).
    static void drawLayoutProjection(
        cv::Mat& bgr_frame,
        const MarkerLayout& layout,
        const Pose& pose,
        const cv::Matx33d& K);
    // Detected marker outlines with the id next to the first corner.
    static void drawObservations(
        cv::Mat& bgr_frame,
        const std::vector<MarkerObservation>& observations,
        const cv::Scalar& color);
    static void drawStatus(cv::Mat& bgr_frame, const OverlayStatus& status);
};

}  // namespace camio
