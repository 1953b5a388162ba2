#pragma once

#include <opencv2/core.hpp>

#include "core/types.hpp"

namespace camio {

enum class PoseError {
    None,
    InsufficientCorrespondences,
    SolverFailure,
};

const char* poseErrorName(PoseError error);

// Model -> camera pose from the valid rows of a correspondence set.
// Zero distortion, iterative PnP, at least 4 non-collinear model points.
class PoseEstimator {
public:
    static constexpr std::size_t kMinCorrespondences = 4;

    explicit PoseEstimator(const cv::Matx33d& K);

    bool estimate(const CorrespondenceSet& correspondences, Pose& out, PoseError& error) const;

    // Mean pixel distance between the valid scene points and the model points
    // projected through pose. Negative when nothing is valid.
    double reprojectionError(const CorrespondenceSet& correspondences, const Pose& pose) const;

private:
    cv::Matx33d K_;
};

}  // namespace camio
