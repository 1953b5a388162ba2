#pragma once

#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/objdetect/aruco_detector.hpp>

#include "core/types.hpp"

namespace camio {

// DICT_4X4_50 ... DICT_7X7_1000, DICT_ARUCO_ORIGINAL.
bool arucoDictionaryFromString(const std::string& name, int& out_dictionary_id);

class MarkerDetector {
public:
    virtual ~MarkerDetector() = default;

    // gray: CV_8UC1 frame. Rejected candidates are not reported.
    virtual std::vector<MarkerObservation> detect(const cv::Mat& gray) = 0;
};

class ArucoMarkerDetector : public MarkerDetector {
public:
    explicit ArucoMarkerDetector(int dictionary_id);

    std::vector<MarkerObservation> detect(const cv::Mat& gray) override;

private:
    cv::aruco::ArucoDetector detector_;
};

}  // namespace camio
