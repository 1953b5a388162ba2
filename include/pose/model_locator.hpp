#pragma once

#include <memory>
#include <optional>
#include <vector>

#include <opencv2/core.hpp>

#include "pose/layout_pose_solver.hpp"

namespace camio {

// Pose of the map in camera space, recomputed every frame.
class ModelLocator {
public:
    ModelLocator(MarkerLayout map_layout, const PoseEstimator& estimator, std::unique_ptr<MarkerDetector> detector);

    std::optional<Pose> locate(const cv::Mat& gray);
    std::optional<Pose> locateFromObservations(const std::vector<MarkerObservation>& observations);

    const LayoutPoseSolver& solver() const { return solver_; }

private:
    LayoutPoseSolver solver_;
};

}  // namespace camio
