#include "markers/marker_detector.hpp"

#include <iostream>
#include <utility>

namespace camio {

namespace {

const std::pair<const char*, int> kDictionaries[] = {
    {"DICT_4X4_50", cv::aruco::DICT_4X4_50},
    {"DICT_4X4_100", cv::aruco::DICT_4X4_100},
    {"DICT_4X4_250", cv::aruco::DICT_4X4_250},
    {"DICT_4X4_1000", cv::aruco::DICT_4X4_1000},
    {"DICT_5X5_50", cv::aruco::DICT_5X5_50},
    {"DICT_5X5_100", cv::aruco::DICT_5X5_100},
    {"DICT_5X5_250", cv::aruco::DICT_5X5_250},
    {"DICT_5X5_1000", cv::aruco::DICT_5X5_1000},
    {"DICT_6X6_50", cv::aruco::DICT_6X6_50},
    {"DICT_6X6_100", cv::aruco::DICT_6X6_100},
    {"DICT_6X6_250", cv::aruco::DICT_6X6_250},
    {"DICT_6X6_1000", cv::aruco::DICT_6X6_1000},
    {"DICT_7X7_50", cv::aruco::DICT_7X7_50},
    {"DICT_7X7_100", cv::aruco::DICT_7X7_100},
    {"DICT_7X7_250", cv::aruco::DICT_7X7_250},
    {"DICT_7X7_1000", cv::aruco::DICT_7X7_1000},
    {"DICT_ARUCO_ORIGINAL", cv::aruco::DICT_ARUCO_ORIGINAL},
};

cv::aruco::DetectorParameters subpixelParameters() {
    cv::aruco::DetectorParameters params;
    params.cornerRefinementMethod = cv::aruco::CORNER_REFINE_SUBPIX;
    return params;
}

}  // namespace

bool arucoDictionaryFromString(const std::string& name, int& out_dictionary_id) {
    for (const auto& entry : kDictionaries) {
        if (name == entry.first) {
            out_dictionary_id = entry.second;
            return true;
        }
    }
    return false;
}

ArucoMarkerDetector::ArucoMarkerDetector(int dictionary_id)
    : detector_(cv::aruco::getPredefinedDictionary(dictionary_id), subpixelParameters()) {}

std::vector<MarkerObservation> ArucoMarkerDetector::detect(const cv::Mat& gray) {
    std::vector<MarkerObservation> observations;
    if (gray.empty()) {
        return observations;
    }

    std::vector<std::vector<cv::Point2f>> corners;
    std::vector<std::vector<cv::Point2f>> rejected;
    std::vector<int> ids;
    try {
        detector_.detectMarkers(gray, corners, ids, rejected);
    } catch (const cv::Exception& e) {
        std::cerr << "[Markers] detection failed: " << e.what() << '\n';
        return observations;
    }

    observations.reserve(ids.size());
    for (std::size_t i = 0; i < ids.size() && i < corners.size(); ++i) {
        if (corners[i].size() != 4) {
            continue;
        }
        MarkerObservation obs;
        obs.id = ids[i];
        for (int j = 0; j < 4; ++j) {
            obs.corners[j] = corners[i][j];
        }
        observations.push_back(obs);
    }
    return observations;
}

}  // namespace camio
