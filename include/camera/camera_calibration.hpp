#pragma once

#include <string>

#include <opencv2/core.hpp>

namespace camio {

// Pinhole intrinsics only; the pipeline always assumes zero lens distortion.
struct CameraCalibrationData {
    cv::Matx33d K{cv::Matx33d::eye()};
};

class CameraCalibration {
public:
    bool loadFromFile(const std::string& file_path, std::string& error);
    bool isValid() const;

    const CameraCalibrationData& data() const { return data_; }

private:
    CameraCalibrationData data_;
    bool loaded_{false};
};

}  // namespace camio
