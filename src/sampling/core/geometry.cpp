#include "sampling/core/geometry.hpp"

#include <algorithm>
#include <limits>

namespace boothsampler::sampling::core {

cv::Rect2d boundingBox(const Boundary& boundary) {
	double minX = std::numeric_limits<double>::infinity();
	double minY = std::numeric_limits<double>::infinity();
	double maxX = -std::numeric_limits<double>::infinity();
	double maxY = -std::numeric_limits<double>::infinity();

	for (const auto& polygon: boundary) {
		for (const auto& p: polygon.exterior) {
			minX = std::min(minX, p.x);
			minY = std::min(minY, p.y);
			maxX = std::max(maxX, p.x);
			maxY = std::max(maxY, p.y);
		}
	}

	if (minX > maxX || minY > maxY) {
		return {};
	}
	return {minX, minY, maxX - minX, maxY - minY};
}

} // namespace boothsampler::sampling::core
