#include "debug/overlay_renderer.hpp"

#include <cstdio>
#include <string>
#include <vector>

#include <opencv2/calib3d.hpp>
#include <opencv2/imgproc.hpp>

namespace camio {

void OverlayRenderer::drawLayoutProjection(
    cv::Mat& bgr_frame,
    const MarkerLayout& layout,
    const Pose& pose,
    const cv::Matx33d& K) {
    if (bgr_frame.empty() || layout.markers.empty()) {
        return;
    }

    std::vector<cv::Point3f> model;
    model.reserve(layout.markers.size() * 4);
    for (const auto& m : layout.markers) {
        model.insert(model.end(), m.corners.begin(), m.corners.end());
    }

    std::vector<cv::Point2f> projected;
    const std::vector<cv::Point3f> axis{{6.0F, 0.0F, 0.0F}, {0.0F, 6.0F, 0.0F}, {0.0F, 0.0F, -6.0F}, {0.0F, 0.0F, 0.0F}};
    std::vector<cv::Point2f> axis_px;
    try {
        cv::projectPoints(model, pose.rvec, pose.tvec, cv::Mat(K), cv::noArray(), projected);
        cv::projectPoints(axis, pose.rvec, pose.tvec, cv::Mat(K), cv::noArray(), axis_px);
    } catch (const cv::Exception&) {
        return;
    }

    const cv::Scalar white(255, 255, 255);
    const cv::Scalar cross(255, 0, 0);
    for (const auto& p : projected) {
        const cv::Point c(static_cast<int>(p.x), static_cast<int>(p.y));
        cv::circle(bgr_frame, c, 4, white, 2);
        cv::line(bgr_frame, c - cv::Point(1, 0), c + cv::Point(1, 0), cross, 1);
        cv::line(bgr_frame, c - cv::Point(0, 1), c + cv::Point(0, 1), cross, 1);
    }

    const cv::Point origin(static_cast<int>(axis_px[3].x), static_cast<int>(axis_px[3].y));
    const cv::Scalar colors[3] = {cv::Scalar(255, 0, 0), cv::Scalar(0, 255, 0), cv::Scalar(0, 0, 255)};
    for (int i = 0; i < 3; ++i) {
        const cv::Point end(static_cast<int>(axis_px[i].x), static_cast<int>(axis_px[i].y));
        cv::line(bgr_frame, origin, end, colors[i], 5);
    }
}

void OverlayRenderer::drawObservations(
    cv::Mat& bgr_frame,
    const std::vector<MarkerObservation>& observations,
    const cv::Scalar& color) {
    if (bgr_frame.empty()) {
        return;
    }
    for (const auto& obs : observations) {
        std::vector<cv::Point> outline;
        outline.reserve(obs.corners.size());
        for (const auto& c : obs.corners) {
            outline.emplace_back(static_cast<int>(c.x), static_cast<int>(c.y));
        }
        const std::vector<std::vector<cv::Point>> contours{outline};
        cv::polylines(bgr_frame, contours, true, color, 2);
        cv::putText(
            bgr_frame,
            std::to_string(obs.id),
            outline[0] + cv::Point(4, -4),
            cv::FONT_HERSHEY_SIMPLEX,
            0.5,
            color,
            1,
            cv::LINE_AA);
    }
}

void OverlayRenderer::drawStatus(cv::Mat& bgr_frame, const OverlayStatus& status) {
    if (bgr_frame.empty()) {
        return;
    }

    const cv::Scalar bg(20, 20, 20);
    const cv::Scalar fg(220, 220, 220);
    const cv::Scalar ok(60, 200, 60);
    const cv::Scalar bad(40, 40, 220);

    char tip[96];
    std::snprintf(tip, sizeof(tip), "Tip: %.1f %.1f %.1f cm", status.tip_cm.x, status.tip_cm.y, status.tip_cm.z);

    char map_line[64];
    if (status.map_located && status.map_reprojection_px >= 0.0) {
        std::snprintf(map_line, sizeof(map_line), "Map: located (%.2f px)", status.map_reprojection_px);
    } else {
        std::snprintf(map_line, sizeof(map_line), "Map: %s", status.map_located ? "located" : "not found");
    }

    cv::rectangle(bgr_frame, cv::Rect(8, 8, 360, 110), bg, cv::FILLED);
    cv::putText(bgr_frame, "FPS: " + std::to_string(status.fps), cv::Point(16, 30), cv::FONT_HERSHEY_SIMPLEX, 0.5, fg, 1, cv::LINE_AA);
    cv::putText(
        bgr_frame,
        map_line,
        cv::Point(16, 50),
        cv::FONT_HERSHEY_SIMPLEX,
        0.5,
        status.map_located ? ok : bad,
        1,
        cv::LINE_AA);
    cv::putText(
        bgr_frame,
        std::string("Pointer: ") + (status.pointer_located ? tip : "not found"),
        cv::Point(16, 70),
        cv::FONT_HERSHEY_SIMPLEX,
        0.5,
        status.pointer_located ? ok : bad,
        1,
        cv::LINE_AA);
    const std::string zone = status.zone >= 0 && status.zone_name != nullptr
        ? std::to_string(status.zone) + " " + status.zone_name
        : std::string("-");
    cv::putText(bgr_frame, "Zone: " + zone, cv::Point(16, 90), cv::FONT_HERSHEY_SIMPLEX, 0.5, fg, 1, cv::LINE_AA);
}

}  // namespace camio
