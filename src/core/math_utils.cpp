#include "core/math_utils.hpp"

#include <cmath>

namespace camio {

cv::Matx33d intrinsicMatrix(double fx, double fy, double cx, double cy) {
    return cv::Matx33d(
        fx, 0.0, cx,
        0.0, fy, cy,
        0.0, 0.0, 1.0);
}

cv::Point3d reverseProject(const cv::Vec3d& camera_point, const Pose& pose) {
    const cv::Matx33d R = pose.rotation();
    const cv::Vec3d local = R.t() * (camera_point - pose.tvec);
    return cv::Point3d(local[0], local[1], local[2]);
}

bool areCollinear(const std::vector<cv::Point3f>& points, double tolerance) {
    if (points.size() < 3) {
        return true;
    }

    // Farthest point from the first one fixes the candidate line.
    const cv::Point3d p0(points[0]);
    cv::Point3d dir(0.0, 0.0, 0.0);
    double best = 0.0;
    for (const auto& p : points) {
        const cv::Point3d d = cv::Point3d(p) - p0;
        const double n = d.dot(d);
        if (n > best) {
            best = n;
            dir = d;
        }
    }
    if (best <= tolerance * tolerance) {
        return true;
    }

    const double dir_norm = std::sqrt(best);
    for (const auto& p : points) {
        const cv::Point3d d = cv::Point3d(p) - p0;
        const cv::Point3d c = dir.cross(d);
        const double dist = std::sqrt(c.dot(c)) / dir_norm;
        if (dist > tolerance) {
            return false;
        }
    }
    return true;
}

}  // namespace camio
