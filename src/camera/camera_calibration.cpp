#include "camera/camera_calibration.hpp"

#include <cmath>

#include <opencv2/core/persistence.hpp>

#include "core/math_utils.hpp"

namespace camio {

namespace {

bool readNumber(const cv::FileNode& node, double& out) {
    if (node.empty() || (!node.isReal() && !node.isInt())) {
        return false;
    }
    node >> out;
    return std::isfinite(out);
}

// {focal_length_x, focal_length_y, camera_center_x, camera_center_y}
bool parseFocalCenterForm(const cv::FileStorage& fs, cv::Matx33d& K) {
    double fx = 0.0;
    double fy = 0.0;
    double cx = 0.0;
    double cy = 0.0;
    if (!readNumber(fs["focal_length_x"], fx) || !readNumber(fs["focal_length_y"], fy) ||
        !readNumber(fs["camera_center_x"], cx) || !readNumber(fs["camera_center_y"], cy)) {
        return false;
    }
    K = intrinsicMatrix(fx, fy, cx, cy);
    return true;
}

bool parseMatrixFromNode(const cv::FileNode& node, cv::Matx33d& K) {
    if (node.empty()) {
        return false;
    }

    // OpenCV matrix form (e.g. !!opencv-matrix)
    if (node.isMap()) {
        cv::Mat m;
        node >> m;
        if (m.total() != 9) {
            return false;
        }
        m.convertTo(m, CV_64F);
        m = m.reshape(1, 3);
        K = cv::Matx33d(m);
        return true;
    }

    // Sequence-of-sequences or flat sequence of 9 numbers
    if (node.type() != cv::FileNode::SEQ) {
        return false;
    }
    double vals[9];
    int n = 0;
    for (const auto& item : node) {
        if (item.type() == cv::FileNode::SEQ) {
            for (const auto& v : item) {
                if (n >= 9) return false;
                v >> vals[n++];
            }
        } else {
            if (n >= 9) return false;
            item >> vals[n++];
        }
    }
    if (n != 9) {
        return false;
    }
    K = cv::Matx33d(vals);
    return true;
}

}  // namespace

bool CameraCalibration::loadFromFile(const std::string& file_path, std::string& error) {
    loaded_ = false;
    data_.K = cv::Matx33d::eye();

    bool parsed = false;
    try {
        const cv::FileStorage fs(file_path, cv::FileStorage::READ);
        if (!fs.isOpened()) {
            error = "camera parameters file not found: " + file_path;
            return false;
        }
        // Support both formats:
        // 1) focal_length_x/y + camera_center_x/y
        // 2) OpenCV style K / camera_matrix
        parsed = parseFocalCenterForm(fs, data_.K) ||
                 parseMatrixFromNode(fs["K"], data_.K) ||
                 parseMatrixFromNode(fs["camera_matrix"], data_.K);
    } catch (const cv::Exception& e) {
        error = "failed to parse camera parameters " + file_path + ": " + e.what();
        return false;
    }

    loaded_ = parsed;
    if (!parsed || !isValid()) {
        loaded_ = false;
        error = "camera parameters file is missing valid focal_length_x/y and camera_center_x/y (or K)";
        return false;
    }

    error.clear();
    return true;
}

bool CameraCalibration::isValid() const {
    if (!loaded_) {
        return false;
    }
    const cv::Matx33d& K = data_.K;
    if (K(0, 0) <= 0.0 || K(1, 1) <= 0.0) {
        return false;
    }
    return K(2, 0) == 0.0 && K(2, 1) == 0.0 && K(2, 2) == 1.0;
}

}  // namespace camio
