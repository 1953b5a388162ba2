#pragma once

#include <memory>
#include <optional>
#include <vector>

#include <opencv2/core.hpp>

#include "core/types.hpp"
#include "markers/correspondence_matcher.hpp"
#include "markers/marker_detector.hpp"
#include "pose/pose_estimator.hpp"

namespace camio {

// Outcome of the last solve, kept for logging and the debug overlay.
enum class LayoutStatus {
    NotRun,
    NoMarkers,
    EstimatorFailed,
    Located,
};

const char* layoutStatusName(LayoutStatus status);

// Detect -> match -> PnP against one fixed marker layout.
class LayoutPoseSolver {
public:
    LayoutPoseSolver(MarkerLayout layout, const PoseEstimator& estimator, std::unique_ptr<MarkerDetector> detector);

    std::optional<Pose> solve(const cv::Mat& gray);
    std::optional<Pose> solveObservations(const std::vector<MarkerObservation>& observations);

    const MarkerLayout& layout() const { return layout_; }
    LayoutStatus lastStatus() const { return last_status_; }
    PoseError lastPoseError() const { return last_pose_error_; }
    const std::vector<MarkerObservation>& lastObservations() const { return last_observations_; }
    // Mean pixel error of the last located pose, -1 otherwise.
    double lastReprojectionError() const { return last_reprojection_px_; }

private:
    MarkerLayout layout_;
    PoseEstimator estimator_;
    std::unique_ptr<MarkerDetector> detector_;

    LayoutStatus last_status_{LayoutStatus::NotRun};
    PoseError last_pose_error_{PoseError::None};
    std::vector<MarkerObservation> last_observations_;
    CorrespondenceMatch last_match_;
    double last_reprojection_px_{-1.0};
};

}  // namespace camio
