#include "camera/camera_ingest.hpp"

#include <opencv2/imgproc.hpp>

#include "core/time_utils.hpp"

#ifdef __linux__
#include <unistd.h>
#endif

namespace camio {

bool CameraIngest::openV4L2(int device_index, std::string& error) {
#ifdef __linux__
    const std::string dev = "/dev/video" + std::to_string(device_index);
    if (::access(dev.c_str(), F_OK) != 0) {
        error = "V4L2 device not found: " + dev;
        return false;
    }
#endif
    if (!cap_.open(device_index, cv::CAP_V4L2)) {
        error = "failed to open V4L2 camera device index " + std::to_string(device_index);
        return false;
    }
    active_source_desc_ = "v4l2:/dev/video" + std::to_string(device_index);
    error.clear();
    return true;
}

bool CameraIngest::openFile(const std::string& path, std::string& error) {
    if (!cap_.open(path)) {
        error = "failed to open video file " + path;
        return false;
    }
    active_source_desc_ = "file:" + path;
    error.clear();
    return true;
}

bool CameraIngest::openDevice(const CameraConfig& config, std::string& error) {
    config_ = config;
    close();

    if (config_.source_mode == "file") {
        return openFile(config_.video_path, error);
    }

    if (!openV4L2(config_.device_index, error)) {
        return false;
    }

    cap_.set(cv::CAP_PROP_FRAME_HEIGHT, static_cast<double>(config_.height));
    cap_.set(cv::CAP_PROP_FRAME_WIDTH, static_cast<double>(config_.width));
    if (config_.disable_autofocus) {
        // Fixed focus keeps the intrinsics valid.
        cap_.set(cv::CAP_PROP_AUTOFOCUS, 0.0);
        cap_.set(cv::CAP_PROP_FOCUS, 0.0);
    }

    error.clear();
    return true;
}

void CameraIngest::close() {
    if (cap_.isOpened()) {
        cap_.release();
    }
    active_source_desc_.clear();
}

bool CameraIngest::isOpen() const {
    return cap_.isOpened();
}

bool CameraIngest::captureFrame(FramePacket& out_packet, std::string& error) {
    if (!cap_.isOpened()) {
        error = "camera is not open";
        return false;
    }

    cv::Mat frame;
    if (!cap_.read(frame) || frame.empty()) {
        error = "no camera image returned";
        return false;
    }

    out_packet.timestamp_ns = nowSteadyNs();
    out_packet.raw_bgr = frame;
    if (frame.channels() == 1) {
        out_packet.gray = frame;
    } else {
        cv::cvtColor(frame, out_packet.gray, cv::COLOR_BGR2GRAY);
    }
    error.clear();
    return true;
}

}  // namespace camio
