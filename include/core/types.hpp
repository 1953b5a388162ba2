#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace camio {

struct MarkerGeometry {
    int id{-1};
    std::array<cv::Point3f, 4> corners{};  // model space, detector corner order
};

struct MarkerLayout {
    std::string dictionary{"DICT_4X4_50"};
    std::vector<MarkerGeometry> markers;
};

struct MarkerObservation {
    int id{-1};
    std::array<cv::Point2f, 4> corners{};  // pixels
};

// Parallel arrays, 4 rows per layout marker. scene_points[i] is only
// meaningful when valid[i] is set.
struct CorrespondenceSet {
    std::vector<cv::Point3f> model_points;
    std::vector<cv::Point2f> scene_points;
    std::vector<bool> valid;

    std::size_t size() const { return model_points.size(); }
    std::size_t validCount() const;
};

// Model space -> camera space.
struct Pose {
    cv::Vec3d rvec{0.0, 0.0, 0.0};
    cv::Vec3d tvec{0.0, 0.0, 0.0};

    cv::Matx33d rotation() const;
};

struct Hotspot {
    cv::Vec3b color_rgb{0, 0, 0};
    std::string text_description;
    std::string audio_path;
};

struct FramePacket {
    int64_t timestamp_ns{0};
    cv::Mat raw_bgr;
    cv::Mat gray;
};

}  // namespace camio
