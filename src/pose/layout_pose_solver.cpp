#include "pose/layout_pose_solver.hpp"

#include <utility>

namespace camio {

const char* layoutStatusName(LayoutStatus status) {
    switch (status) {
        case LayoutStatus::NotRun: return "not run";
        case LayoutStatus::NoMarkers: return "no markers";
        case LayoutStatus::EstimatorFailed: return "estimator failed";
        case LayoutStatus::Located: return "located";
    }
    return "unknown";
}

LayoutPoseSolver::LayoutPoseSolver(
    MarkerLayout layout,
    const PoseEstimator& estimator,
    std::unique_ptr<MarkerDetector> detector)
    : layout_(std::move(layout)), estimator_(estimator), detector_(std::move(detector)) {}

std::optional<Pose> LayoutPoseSolver::solve(const cv::Mat& gray) {
    if (!detector_) {
        last_observations_.clear();
        last_match_ = CorrespondenceMatch{};
        last_reprojection_px_ = -1.0;
        last_status_ = LayoutStatus::NoMarkers;
        return std::nullopt;
    }
    return solveObservations(detector_->detect(gray));
}

std::optional<Pose> LayoutPoseSolver::solveObservations(const std::vector<MarkerObservation>& observations) {
    last_observations_ = observations;
    last_pose_error_ = PoseError::None;
    last_reprojection_px_ = -1.0;
    last_match_ = matchCorrespondences(observations, layout_);
    if (!last_match_.any_valid) {
        last_status_ = LayoutStatus::NoMarkers;
        return std::nullopt;
    }

    Pose pose;
    if (!estimator_.estimate(last_match_.set, pose, last_pose_error_)) {
        last_status_ = LayoutStatus::EstimatorFailed;
        return std::nullopt;
    }
    last_status_ = LayoutStatus::Located;
    last_reprojection_px_ = estimator_.reprojectionError(last_match_.set, pose);
    return pose;
}

}  // namespace camio
