#include "core/types.hpp"

#include <algorithm>

#include <opencv2/calib3d.hpp>

namespace camio {

std::size_t CorrespondenceSet::validCount() const {
    return static_cast<std::size_t>(std::count(valid.begin(), valid.end(), true));
}

cv::Matx33d Pose::rotation() const {
    cv::Matx33d R;
    cv::Rodrigues(rvec, R);
    return R;
}

}  // namespace camio
