#include "pose/pointer_locator.hpp"

#include <utility>

#include "core/math_utils.hpp"

namespace camio {

PointerLocator::PointerLocator(
    MarkerLayout stylus_layout,
    const PoseEstimator& estimator,
    std::unique_ptr<MarkerDetector> detector)
    : solver_(std::move(stylus_layout), estimator, std::move(detector)) {}

cv::Point3d PointerLocator::toMapLocal(const Pose& pointer_pose, const Pose& map_pose) {
    return reverseProject(pointer_pose.tvec, map_pose);
}

std::optional<cv::Point3d> PointerLocator::locate(const cv::Mat& gray, const Pose& map_pose) {
    return finish(solver_.solve(gray), map_pose);
}

std::optional<cv::Point3d> PointerLocator::locateFromObservations(
    const std::vector<MarkerObservation>& observations,
    const Pose& map_pose) {
    return finish(solver_.solveObservations(observations), map_pose);
}

std::optional<cv::Point3d> PointerLocator::finish(const std::optional<Pose>& pointer_pose, const Pose& map_pose) {
    if (!pointer_pose) {
        return std::nullopt;
    }
    return toMapLocal(*pointer_pose, map_pose);
}

}  // namespace camio
