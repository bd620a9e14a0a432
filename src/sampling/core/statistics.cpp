#include "statistics.hpp"

#include <numeric>

namespace boothsampler::sampling::core {

cv::Point2d mean(const std::vector<cv::Point2d>& points) {
	if (points.empty()) {
		return {};
	}
	const cv::Point2d sum = std::accumulate(points.begin(), points.end(), cv::Point2d{});
	return sum / static_cast<double>(points.size());
}

double squaredDistance(const cv::Point2d& a, const cv::Point2d& b) {
	const cv::Point2d d = a - b;
	return d.dot(d);
}

} // namespace boothsampler::sampling::core
