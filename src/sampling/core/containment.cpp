#include "sampling/core/containment.hpp"

#include "sampling/core/debug.hpp"
#include "sampling/core/reprojection.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <iostream>

namespace boothsampler::sampling::core {

namespace {

//! Boundary converted for cv::pointPolygonTest. Coordinates are shifted to the bounding box origin so that
//! projected coordinates (1e5..1e7 m) keep sub-metre resolution in single precision.
struct PreparedBoundary {
	struct PreparedPolygon {
		std::vector<cv::Point2f> exterior;
		std::vector<std::vector<cv::Point2f>> holes;
		cv::Rect2d bounds;
	};

	cv::Point2d origin;
	std::vector<PreparedPolygon> polygons;
};

static std::vector<cv::Point2f> toLocal(const Ring& ring, const cv::Point2d& origin) {
	std::vector<cv::Point2f> out;
	out.reserve(ring.size());
	for (const auto& p: ring) {
		out.emplace_back(static_cast<float>(p.x - origin.x), static_cast<float>(p.y - origin.y));
	}
	return out;
}

static PreparedBoundary prepare(const Boundary& boundary) {
	PreparedBoundary prepared{};
	prepared.origin = boundingBox(boundary).tl();
	prepared.polygons.reserve(boundary.size());

	for (const auto& polygon: boundary) {
		if (polygon.exterior.size() < 3) {
			continue; // Degenerate ring. Nothing can be within.
		}

		PreparedBoundary::PreparedPolygon p{};
		p.exterior = toLocal(polygon.exterior, prepared.origin);
		p.bounds   = boundingBox(Boundary{Polygon{polygon.exterior, {}}});
		for (const auto& hole: polygon.holes) {
			if (hole.size() >= 3) {
				p.holes.push_back(toLocal(hole, prepared.origin));
			}
		}
		prepared.polygons.push_back(std::move(p));
	}
	return prepared;
}

static bool withinPrepared(const PreparedBoundary& prepared, const cv::Point2d& point) {
	if (!std::isfinite(point.x) || !std::isfinite(point.y)) {
		return false;
	}

	const cv::Point2f local(static_cast<float>(point.x - prepared.origin.x), static_cast<float>(point.y - prepared.origin.y));

	for (const auto& polygon: prepared.polygons) {
		// Boundary points are not within: the rect test is inclusive, the polygon test below decides.
		if (point.x < polygon.bounds.x || point.y < polygon.bounds.y || point.x > polygon.bounds.br().x || point.y > polygon.bounds.br().y) {
			continue;
		}
		if (cv::pointPolygonTest(polygon.exterior, local, false) <= 0.0) {
			continue;
		}

		const bool inHole = std::any_of(polygon.holes.begin(), polygon.holes.end(),
		                                [&](const std::vector<cv::Point2f>& hole) { return cv::pointPolygonTest(hole, local, false) >= 0.0; });
		if (!inHole) {
			return true;
		}
	}
	return false;
}

} // namespace

std::string_view referenceLabel(const ReferenceStatus status) {
	switch (status) {
	case ReferenceStatus::Aligned:
		return "aligned";
	case ReferenceStatus::Reprojected:
		return "reprojected";
	case ReferenceStatus::Unreferenced:
		return "unreferenced";
	case ReferenceStatus::Failed:
		return "failed";
	}
	return "unknown";
}

bool isWithin(const Boundary& boundary, const cv::Point2d& point) {
	return withinPrepared(prepare(boundary), point);
}

std::vector<std::size_t> pointsWithin(const Boundary& boundary, const std::vector<cv::Point2d>& points) {
	std::vector<std::size_t> indices;
	if (boundary.empty() || points.empty()) {
		return indices;
	}

	const PreparedBoundary prepared = prepare(boundary);
	for (std::size_t i = 0; i < points.size(); ++i) {
		if (withinPrepared(prepared, points[i])) {
			indices.push_back(i);
		}
	}
	return indices;
}

const RegionFeature* findRegion(const RegionLayer& regions, const std::string& codeField, const std::string& code) {
	for (const auto& feature: regions.features) {
		const auto it = feature.attributes.find(codeField);
		if (it != feature.attributes.end() && it->second == code) {
			return &feature;
		}
	}
	return nullptr;
}

AlignedBooths alignBooths(const BoothLayer& booths, const CoordinateReference& target) {
	AlignedBooths aligned{};
	aligned.layer = &booths;
	aligned.positions.reserve(booths.booths.size());
	for (const auto& booth: booths.booths) {
		aligned.positions.push_back(booth.position);
	}
	aligned.valid.assign(aligned.positions.size(), true);

	if (!booths.reference.known() || !target.known()) {
		std::cerr << "[containment] Booth or boundary layer has no coordinate reference. Testing in raw coordinates.\n";
		aligned.status = ReferenceStatus::Unreferenced;
		return aligned;
	}

	if (isSameReference(booths.reference, target)) {
		aligned.status = ReferenceStatus::Aligned;
		return aligned;
	}

	if (!reproject(aligned.positions, booths.reference, target, &aligned.valid)) {
		std::cerr << "[containment] Could not reproject booths from " << booths.reference.definition << " to " << target.definition << '\n';
		aligned.positions.clear();
		aligned.valid.clear();
		aligned.status = ReferenceStatus::Failed;
		return aligned;
	}

	aligned.dropped = static_cast<std::size_t>(std::count(aligned.valid.begin(), aligned.valid.end(), false));
	if (aligned.dropped > 0) {
		std::cerr << "[containment] Dropped " << aligned.dropped << " of " << aligned.positions.size() << " booths that could not be reprojected to "
		          << target.definition << '\n';
	}

	aligned.status = ReferenceStatus::Reprojected;
	return aligned;
}

ContainmentResult validateBooths(const AlignedBooths& aligned, const Boundary& boundary, const ContainmentConfig& config) {
	ContainmentResult result{};
	result.status      = aligned.status;
	result.regionFound = true;

	if (aligned.status == ReferenceStatus::Failed || (aligned.status == ReferenceStatus::Unreferenced && config.strictReference)) {
		result.usable = false;
		return result;
	}
	if (aligned.layer == nullptr) {
		return result;
	}

	const std::vector<std::size_t> inside = pointsWithin(boundary, aligned.positions);
	result.booths.reserve(inside.size());
	for (const std::size_t index: inside) {
		if (index < aligned.valid.size() && !aligned.valid[index]) {
			continue;
		}
		Booth booth    = aligned.layer->booths[index];
		booth.position = aligned.positions[index];
		result.booths.push_back(std::move(booth));
	}

	if (debugEnabled()) {
		std::cout << "[containment] tested=" << aligned.positions.size() << " within=" << result.booths.size() << " reference=" << referenceLabel(aligned.status)
		          << '\n';
	}
	return result;
}

ContainmentResult validateBooths(const BoothLayer& booths, const RegionLayer& regions, const std::string& codeField, const std::string& code,
                                 const ContainmentConfig& config) {
	const RegionFeature* feature = findRegion(regions, codeField, code);
	if (feature == nullptr) {
		return {};
	}

	const AlignedBooths aligned = alignBooths(booths, regions.reference);
	return validateBooths(aligned, feature->boundary, config);
}

} // namespace boothsampler::sampling::core
