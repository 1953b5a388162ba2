#include "pose/pose_estimator.hpp"

#include <cmath>
#include <vector>

#include <opencv2/calib3d.hpp>

#include "core/math_utils.hpp"

namespace camio {

namespace {

constexpr double kCollinearToleranceCm = 1e-6;

void selectValid(
    const CorrespondenceSet& set,
    std::vector<cv::Point3f>& model,
    std::vector<cv::Point2f>& scene) {
    model.clear();
    scene.clear();
    for (std::size_t i = 0; i < set.size() && i < set.valid.size(); ++i) {
        if (!set.valid[i]) {
            continue;
        }
        model.push_back(set.model_points[i]);
        scene.push_back(set.scene_points[i]);
    }
}

bool isFinite(const cv::Vec3d& v) {
    return std::isfinite(v[0]) && std::isfinite(v[1]) && std::isfinite(v[2]);
}

}  // namespace

const char* poseErrorName(PoseError error) {
    switch (error) {
        case PoseError::None: return "none";
        case PoseError::InsufficientCorrespondences: return "insufficient correspondences";
        case PoseError::SolverFailure: return "solver failure";
    }
    return "unknown";
}

PoseEstimator::PoseEstimator(const cv::Matx33d& K) : K_(K) {}

bool PoseEstimator::estimate(const CorrespondenceSet& correspondences, Pose& out, PoseError& error) const {
    std::vector<cv::Point3f> model;
    std::vector<cv::Point2f> scene;
    selectValid(correspondences, model, scene);

    if (model.size() < kMinCorrespondences || areCollinear(model, kCollinearToleranceCm)) {
        error = PoseError::InsufficientCorrespondences;
        return false;
    }

    cv::Vec3d rvec;
    cv::Vec3d tvec;
    bool ok = false;
    try {
        ok = cv::solvePnP(model, scene, cv::Mat(K_), cv::noArray(), rvec, tvec, false, cv::SOLVEPNP_ITERATIVE);
    } catch (const cv::Exception&) {
        ok = false;
    }

    if (!ok || !isFinite(rvec) || !isFinite(tvec)) {
        error = PoseError::SolverFailure;
        return false;
    }

    out.rvec = rvec;
    out.tvec = tvec;
    error = PoseError::None;
    return true;
}

double PoseEstimator::reprojectionError(const CorrespondenceSet& correspondences, const Pose& pose) const {
    std::vector<cv::Point3f> model;
    std::vector<cv::Point2f> scene;
    selectValid(correspondences, model, scene);
    if (model.empty()) {
        return -1.0;
    }

    std::vector<cv::Point2f> projected;
    cv::projectPoints(model, pose.rvec, pose.tvec, cv::Mat(K_), cv::noArray(), projected);
    double sum = 0.0;
    for (std::size_t i = 0; i < scene.size(); ++i) {
        const cv::Point2f d = projected[i] - scene[i];
        sum += std::sqrt(d.x * d.x + d.y * d.y);
    }
    return sum / static_cast<double>(scene.size());
}

}  // namespace camio
