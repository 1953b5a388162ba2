#pragma once

#include <string>

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

#include "core/config.hpp"
#include "core/types.hpp"

namespace camio {

class CameraIngest {
public:
    CameraIngest() = default;

    bool openDevice(const CameraConfig& config, std::string& error);
    void close();
    bool isOpen() const;
    const std::string& activeSourceDescription() const { return active_source_desc_; }

    // False at end of stream or on a read failure.
    bool captureFrame(FramePacket& out_packet, std::string& error);

private:
    bool openV4L2(int device_index, std::string& error);
    bool openFile(const std::string& path, std::string& error);

    cv::VideoCapture cap_;
    CameraConfig config_{};
    std::string active_source_desc_;
};

}  // namespace camio
