#include "sampling/core/reprojection.hpp"

#include <cpl_error.h>
#include <ogr_spatialref.h>

#include <cmath>
#include <iostream>
#include <memory>
#include <utility>

namespace boothsampler::sampling::core {

namespace {

struct TransformDeleter {
	void operator()(OGRCoordinateTransformation* transform) const { OGRCoordinateTransformation::DestroyCT(transform); }
};

using TransformPtr = std::unique_ptr<OGRCoordinateTransformation, TransformDeleter>;

//! Build a spatial reference with traditional GIS axis order. False if GDAL does not understand the definition.
static bool makeReference(const CoordinateReference& reference, OGRSpatialReference& out) {
	if (!reference.known()) {
		return false;
	}
	if (out.SetFromUserInput(reference.definition.c_str()) != OGRERR_NONE) {
		std::cerr << "[reprojection] Unknown coordinate reference: " << reference.definition << '\n';
		return false;
	}
	out.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
	return true;
}

} // namespace

bool isSameReference(const CoordinateReference& a, const CoordinateReference& b) {
	if (!a.known() || !b.known()) {
		return false;
	}
	if (a.definition == b.definition) {
		return true;
	}

	OGRSpatialReference refA;
	OGRSpatialReference refB;
	if (!makeReference(a, refA) || !makeReference(b, refB)) {
		return false;
	}
	return refA.IsSame(&refB) != 0;
}

bool reproject(std::vector<cv::Point2d>& points, const CoordinateReference& from, const CoordinateReference& to, std::vector<bool>* transformed) {
	OGRSpatialReference source;
	OGRSpatialReference target;
	if (!makeReference(from, source) || !makeReference(to, target)) {
		return false;
	}
	if (points.empty()) {
		if (transformed != nullptr) {
			transformed->clear();
		}
		return true;
	}

	const TransformPtr transform{OGRCreateCoordinateTransformation(&source, &target)};
	if (!transform) {
		std::cerr << "[reprojection] No transformation from " << from.definition << " to " << to.definition << '\n';
		return false;
	}

	std::vector<double> xs(points.size());
	std::vector<double> ys(points.size());
	for (std::size_t i = 0; i < points.size(); ++i) {
		xs[i] = points[i].x;
		ys[i] = points[i].y;
	}

	// GDAL reports FALSE as soon as one point fails. The per-point flags decide.
	std::vector<int> success(points.size(), 0);
	const bool allTransformed = transform->Transform(static_cast<int>(points.size()), xs.data(), ys.data(), nullptr, success.data()) != 0;

	std::vector<bool> ok(points.size(), false);
	std::size_t failed = 0;
	for (std::size_t i = 0; i < points.size(); ++i) {
		ok[i] = success[i] != 0 && std::isfinite(xs[i]) && std::isfinite(ys[i]);
		failed += ok[i] ? 0u : 1u;
	}

	if (failed == points.size()) {
		std::cerr << "[reprojection] Transformation failed: " << CPLGetLastErrorMsg() << '\n';
		return false;
	}
	if (failed > 0 || !allTransformed) {
		std::cerr << "[reprojection] " << failed << " of " << points.size() << " points could not be transformed\n";
		if (transformed == nullptr && failed > 0) {
			return false;
		}
	}

	for (std::size_t i = 0; i < points.size(); ++i) {
		if (ok[i]) {
			points[i] = {xs[i], ys[i]};
		}
	}
	if (transformed != nullptr) {
		*transformed = std::move(ok);
	}
	return true;
}

bool toGeographic(std::vector<cv::Point2d>& points, const CoordinateReference& from, std::vector<bool>* transformed) {
	if (isSameReference(from, WGS84)) {
		if (transformed != nullptr) {
			transformed->assign(points.size(), true);
		}
		return true;
	}
	return reproject(points, from, WGS84, transformed);
}

} // namespace boothsampler::sampling::core
