#pragma once

#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "core/types.hpp"

namespace camio {

struct MapModel {
    std::string zone_image_path;
    double pixels_per_cm{0.0};
    MarkerLayout layout;
    std::vector<Hotspot> hotspots;  // index doubles as zone id
};

// Map file: {"model": {filename, pixels_per_cm, positioningData, hotspots}}
bool loadMapModel(const std::string& path, MapModel& out, std::string& error);
// Stylus file: {"stylus": {positioningData}}
bool loadStylusLayout(const std::string& path, MarkerLayout& out, std::string& error);

bool parsePositioningData(const cv::FileNode& node, MarkerLayout& out, std::string& error);
bool validateLayout(const MarkerLayout& layout, std::string& error);

// Relative paths are tried against the working directory first, then
// against the directory of reference_file.
std::string resolveAssetPath(const std::string& path, const std::string& reference_file);

}  // namespace camio
