#pragma once

#include <opencv2/core/types.hpp>

#include <vector>

namespace boothsampler::sampling::core {

//! Arithmetic mean of the points. (0,0) for an empty input.
cv::Point2d mean(const std::vector<cv::Point2d>& points);

//! Squared Euclidean distance.
double squaredDistance(const cv::Point2d& a, const cv::Point2d& b);

} // namespace boothsampler::sampling::core
