#pragma once

#include <memory>
#include <optional>
#include <vector>

#include <opencv2/core.hpp>

#include "pose/layout_pose_solver.hpp"

namespace camio {

// Stylus tip in map-local cm. The stylus layout has the tip at its origin,
// so the pose translation is the tip. z is the standoff from the map plane.
class PointerLocator {
public:
    PointerLocator(MarkerLayout stylus_layout, const PoseEstimator& estimator, std::unique_ptr<MarkerDetector> detector);

    std::optional<cv::Point3d> locate(const cv::Mat& gray, const Pose& map_pose);
    std::optional<cv::Point3d> locateFromObservations(
        const std::vector<MarkerObservation>& observations,
        const Pose& map_pose);

    static cv::Point3d toMapLocal(const Pose& pointer_pose, const Pose& map_pose);

    const LayoutPoseSolver& solver() const { return solver_; }

private:
    std::optional<cv::Point3d> finish(const std::optional<Pose>& pointer_pose, const Pose& map_pose);

    LayoutPoseSolver solver_;
};

}  // namespace camio
