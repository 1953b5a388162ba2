#include "pose/model_locator.hpp"

#include <utility>

namespace camio {

ModelLocator::ModelLocator(
    MarkerLayout map_layout,
    const PoseEstimator& estimator,
    std::unique_ptr<MarkerDetector> detector)
    : solver_(std::move(map_layout), estimator, std::move(detector)) {}

std::optional<Pose> ModelLocator::locate(const cv::Mat& gray) {
    return solver_.solve(gray);
}

std::optional<Pose> ModelLocator::locateFromObservations(const std::vector<MarkerObservation>& observations) {
    return solver_.solveObservations(observations);
}

}  // namespace camio
