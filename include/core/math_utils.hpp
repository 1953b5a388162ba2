#pragma once

#include <vector>

#include <opencv2/core.hpp>

#include "core/types.hpp"

namespace camio {

cv::Matx33d intrinsicMatrix(double fx, double fy, double cx, double cy);

// Express a camera-space point in the frame described by pose:
// R^-1 * (point - T). R is orthonormal so the inverse is the transpose.
cv::Point3d reverseProject(const cv::Vec3d& camera_point, const Pose& pose);

bool areCollinear(const std::vector<cv::Point3f>& points, double tolerance);

}  // namespace camio
