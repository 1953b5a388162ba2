#include "model/model_config.hpp"

#include <filesystem>
#include <set>

#include <opencv2/core/persistence.hpp>

#include "markers/marker_detector.hpp"

namespace camio {

namespace {

bool readCorner(const cv::FileNode& node, cv::Point3f& out) {
    if (node.type() != cv::FileNode::SEQ || node.size() != 3) {
        return false;
    }
    float xyz[3] = {0.0F, 0.0F, 0.0F};
    for (int i = 0; i < 3; ++i) {
        const cv::FileNode v = node[i];
        if (!v.isInt() && !v.isReal()) {
            return false;
        }
        v >> xyz[i];
    }
    out = cv::Point3f(xyz[0], xyz[1], xyz[2]);
    return true;
}

bool readColor(const cv::FileNode& node, cv::Vec3b& out) {
    if (node.type() != cv::FileNode::SEQ || node.size() != 3) {
        return false;
    }
    for (int i = 0; i < 3; ++i) {
        const cv::FileNode v = node[i];
        if (!v.isInt()) {
            return false;
        }
        const int c = static_cast<int>(v);
        if (c < 0 || c > 255) {
            return false;
        }
        out[i] = static_cast<uchar>(c);
    }
    return true;
}

bool parseHotspots(const cv::FileNode& node, const std::string& map_path, std::vector<Hotspot>& out, std::string& error) {
    out.clear();
    if (node.type() != cv::FileNode::SEQ) {
        error = "model.hotspots must be a list";
        return false;
    }
    int idx = 0;
    for (const auto& item : node) {
        Hotspot h;
        if (!readColor(item["color"], h.color_rgb)) {
            error = "hotspot " + std::to_string(idx) + " needs color [r,g,b] in 0..255";
            return false;
        }
        const cv::FileNode text = item["textDescription"];
        if (!text.isString()) {
            error = "hotspot " + std::to_string(idx) + " needs a textDescription";
            return false;
        }
        h.text_description = static_cast<std::string>(text);
        const cv::FileNode audio = item["audioDescription"];
        if (audio.isString()) {
            h.audio_path = resolveAssetPath(static_cast<std::string>(audio), map_path);
        }
        out.push_back(h);
        ++idx;
    }
    return true;
}

}  // namespace

std::string resolveAssetPath(const std::string& path, const std::string& reference_file) {
    namespace fs = std::filesystem;
    if (path.empty()) {
        return path;
    }
    const fs::path p(path);
    std::error_code ec;
    if (p.is_absolute() || fs::exists(p, ec)) {
        return path;
    }
    const fs::path beside = fs::path(reference_file).parent_path() / p;
    if (fs::exists(beside, ec)) {
        return beside.string();
    }
    return path;
}

bool validateLayout(const MarkerLayout& layout, std::string& error) {
    int dict_id = 0;
    if (!arucoDictionaryFromString(layout.dictionary, dict_id)) {
        error = "unsupported arucoType: " + layout.dictionary;
        return false;
    }
    if (layout.markers.empty()) {
        error = "positioningData.arucoCodes must not be empty";
        return false;
    }
    std::set<int> seen;
    for (const auto& m : layout.markers) {
        if (m.id < 0) {
            error = "aruco id must be >= 0";
            return false;
        }
        if (!seen.insert(m.id).second) {
            error = "duplicate aruco id " + std::to_string(m.id) + " in layout";
            return false;
        }
    }
    error.clear();
    return true;
}

bool parsePositioningData(const cv::FileNode& node, MarkerLayout& out, std::string& error) {
    out = MarkerLayout{};
    if (node.empty() || !node.isMap()) {
        error = "missing positioningData";
        return false;
    }
    const cv::FileNode type = node["arucoType"];
    if (!type.isString()) {
        error = "positioningData.arucoType must be a string";
        return false;
    }
    out.dictionary = static_cast<std::string>(type);

    const cv::FileNode codes = node["arucoCodes"];
    if (codes.type() != cv::FileNode::SEQ) {
        error = "positioningData.arucoCodes must be a list";
        return false;
    }
    for (const auto& code : codes) {
        MarkerGeometry geometry;
        const cv::FileNode id = code["id"];
        if (!id.isInt()) {
            error = "aruco code without integer id";
            return false;
        }
        geometry.id = static_cast<int>(id);

        const cv::FileNode position = code["position"];
        if (position.type() != cv::FileNode::SEQ || position.size() != 4) {
            error = "aruco code " + std::to_string(geometry.id) + " needs 4 corner positions";
            return false;
        }
        for (int i = 0; i < 4; ++i) {
            if (!readCorner(position[i], geometry.corners[i])) {
                error = "aruco code " + std::to_string(geometry.id) + " has a malformed corner";
                return false;
            }
        }
        out.markers.push_back(geometry);
    }
    return validateLayout(out, error);
}

bool loadMapModel(const std::string& path, MapModel& out, std::string& error) {
    out = MapModel{};
    try {
        const cv::FileStorage fs(path, cv::FileStorage::READ);
        if (!fs.isOpened()) {
            error = "map parameters file not found: " + path;
            return false;
        }
        const cv::FileNode model = fs["model"];
        if (model.empty() || !model.isMap()) {
            error = "map parameters file has no 'model' object";
            return false;
        }

        const cv::FileNode filename = model["filename"];
        if (!filename.isString()) {
            error = "model.filename must name the zone image";
            return false;
        }
        out.zone_image_path = resolveAssetPath(static_cast<std::string>(filename), path);

        const cv::FileNode ppcm = model["pixels_per_cm"];
        if (!ppcm.isReal() && !ppcm.isInt()) {
            error = "model.pixels_per_cm must be a number";
            return false;
        }
        ppcm >> out.pixels_per_cm;
        if (!(out.pixels_per_cm > 0.0)) {
            error = "model.pixels_per_cm must be > 0";
            return false;
        }

        if (!parsePositioningData(model["positioningData"], out.layout, error)) {
            error = "model." + error;
            return false;
        }
        if (!parseHotspots(model["hotspots"], path, out.hotspots, error)) {
            return false;
        }
    } catch (const cv::Exception& e) {
        error = "failed to parse map parameters " + path + ": " + e.what();
        return false;
    }

    error.clear();
    return true;
}

bool loadStylusLayout(const std::string& path, MarkerLayout& out, std::string& error) {
    try {
        const cv::FileStorage fs(path, cv::FileStorage::READ);
        if (!fs.isOpened()) {
            error = "stylus parameters file not found: " + path;
            return false;
        }
        const cv::FileNode stylus = fs["stylus"];
        if (stylus.empty() || !stylus.isMap()) {
            error = "stylus parameters file has no 'stylus' object";
            return false;
        }
        if (!parsePositioningData(stylus["positioningData"], out, error)) {
            error = "stylus." + error;
            return false;
        }
    } catch (const cv::Exception& e) {
        error = "failed to parse stylus parameters " + path + ": " + e.what();
        return false;
    }

    error.clear();
    return true;
}

}  // namespace camio
