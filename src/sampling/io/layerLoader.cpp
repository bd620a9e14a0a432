#include "sampling/io/layerLoader.hpp"

#include "sampling/core/debug.hpp"
#include "sampling/core/reprojection.hpp"

#include <cpl_conv.h>
#include <gdal_priv.h>
#include <ogrsf_frmts.h>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <mutex>
#include <system_error>

namespace boothsampler::sampling::io {

namespace {

static void registerDrivers() {
	static std::once_flag once;
	std::call_once(once, []() { GDALAllRegister(); });
}

//! Open the first layer of a vector dataset.
static GDALDatasetUniquePtr openVector(const std::filesystem::path& path) {
	std::error_code ec;
	if (!std::filesystem::exists(path, ec)) {
		std::cerr << "[io] File not found: " << path.string() << '\n';
		return nullptr;
	}

	registerDrivers();
	GDALDatasetUniquePtr dataset(GDALDataset::Open(path.string().c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY));
	if (!dataset || dataset->GetLayerCount() < 1) {
		std::cerr << "[io] Could not open vector layer: " << path.string() << '\n';
		return nullptr;
	}
	return dataset;
}

static core::CoordinateReference readReference(OGRLayer& layer) {
	const OGRSpatialReference* srs = layer.GetSpatialRef();
	if (srs == nullptr) {
		return {};
	}

	const char* authority = srs->GetAuthorityName(nullptr);
	const char* code      = srs->GetAuthorityCode(nullptr);
	if (authority != nullptr && code != nullptr) {
		return {std::string(authority) + ":" + code};
	}

	char* wkt = nullptr;
	if (srs->exportToWkt(&wkt) != OGRERR_NONE || wkt == nullptr) {
		CPLFree(wkt);
		return {};
	}
	core::CoordinateReference reference{wkt};
	CPLFree(wkt);
	return reference;
}

static std::vector<std::string> readFields(OGRLayer& layer) {
	std::vector<std::string> fields;
	const OGRFeatureDefn* definition = layer.GetLayerDefn();
	fields.reserve(static_cast<std::size_t>(definition->GetFieldCount()));
	for (int i = 0; i < definition->GetFieldCount(); ++i) {
		fields.emplace_back(definition->GetFieldDefn(i)->GetNameRef());
	}
	return fields;
}

static core::Attributes readAttributes(const OGRFeature& feature, const std::vector<std::string>& fields) {
	core::Attributes attributes;
	for (int i = 0; i < static_cast<int>(fields.size()); ++i) {
		attributes[fields[static_cast<std::size_t>(i)]] = feature.IsFieldSetAndNotNull(i) ? feature.GetFieldAsString(i) : "";
	}
	return attributes;
}

//! Finite longitude/latitude within the WGS84 range.
static bool isGeographic(const cv::Point2d& p) {
	return std::isfinite(p.x) && std::isfinite(p.y) && std::abs(p.x) <= 180.0 && std::abs(p.y) <= 90.0;
}

//! Ring vertices without the closing duplicate.
static core::Ring readRing(const OGRLinearRing* ring) {
	core::Ring out;
	if (ring == nullptr) {
		return out;
	}

	const int count = ring->getNumPoints();
	out.reserve(static_cast<std::size_t>(count));
	for (int i = 0; i < count; ++i) {
		out.emplace_back(ring->getX(i), ring->getY(i));
	}
	if (out.size() > 1 && out.front() == out.back()) {
		out.pop_back();
	}
	return out;
}

static core::Polygon readPolygon(const OGRPolygon& polygon) {
	core::Polygon out{};
	out.exterior = readRing(polygon.getExteriorRing());
	for (int i = 0; i < polygon.getNumInteriorRings(); ++i) {
		out.holes.push_back(readRing(polygon.getInteriorRing(i)));
	}
	return out;
}

static core::Boundary readBoundary(const OGRGeometry& geometry) {
	core::Boundary boundary;
	switch (wkbFlatten(geometry.getGeometryType())) {
	case wkbPolygon:
		boundary.push_back(readPolygon(*geometry.toPolygon()));
		break;
	case wkbMultiPolygon:
		for (const OGRPolygon* polygon: *geometry.toMultiPolygon()) {
			boundary.push_back(readPolygon(*polygon));
		}
		break;
	default:
		break;
	}
	return boundary;
}

} // namespace

std::vector<std::string> availableStates(const std::filesystem::path& dataDir) {
	std::vector<std::string> states;
	std::error_code ec;
	if (!std::filesystem::is_directory(dataDir, ec)) {
		return states;
	}

	for (const auto& entry: std::filesystem::directory_iterator(dataDir, ec)) {
		const std::string name = entry.path().filename().string();
		if (entry.is_directory(ec) && !name.empty() && name.front() != '.') {
			states.push_back(name);
		}
	}
	std::sort(states.begin(), states.end());
	return states;
}

std::filesystem::path regionLayerPath(const std::filesystem::path& dataDir, const std::string& state, const core::SelectionType type) {
	const char* suffix = type == core::SelectionType::Assembly ? ".assembly.shp" : ".parliamentary.shp";
	return dataDir / state / (state + suffix);
}

std::filesystem::path boothLayerPath(const std::filesystem::path& dataDir, const std::string& state) {
	return dataDir / state / (state + ".booth.shp");
}

std::optional<core::RegionLayer> loadRegionLayer(const std::filesystem::path& path) {
	GDALDatasetUniquePtr dataset = openVector(path);
	if (!dataset) {
		return std::nullopt;
	}

	OGRLayer& layer = *dataset->GetLayer(0);
	core::RegionLayer regions{};
	regions.reference = readReference(layer);
	regions.fields    = readFields(layer);

	std::size_t skipped = 0;
	layer.ResetReading();
	for (OGRFeatureUniquePtr feature(layer.GetNextFeature()); feature; feature.reset(layer.GetNextFeature())) {
		const OGRGeometry* geometry = feature->GetGeometryRef();
		core::Boundary boundary     = geometry != nullptr ? readBoundary(*geometry) : core::Boundary{};
		if (boundary.empty()) {
			++skipped;
			continue;
		}
		regions.features.push_back({readAttributes(*feature, regions.fields), std::move(boundary)});
	}

	if (skipped > 0) {
		std::cerr << "[io] " << path.filename().string() << ": skipped " << skipped << " features without polygon geometry\n";
	}
	if (core::debugEnabled()) {
		std::cout << "[io] " << path.filename().string() << ": regions=" << regions.features.size() << " reference=" << regions.reference.definition << '\n';
	}
	return regions;
}

std::optional<core::BoothLayer> loadBoothLayer(const std::filesystem::path& path) {
	GDALDatasetUniquePtr dataset = openVector(path);
	if (!dataset) {
		return std::nullopt;
	}

	OGRLayer& layer = *dataset->GetLayer(0);
	core::BoothLayer booths{};
	booths.reference = readReference(layer);
	booths.fields    = readFields(layer);

	std::size_t skipped = 0;
	layer.ResetReading();
	for (OGRFeatureUniquePtr feature(layer.GetNextFeature()); feature; feature.reset(layer.GetNextFeature())) {
		const OGRGeometry* geometry = feature->GetGeometryRef();
		if (geometry == nullptr || wkbFlatten(geometry->getGeometryType()) != wkbPoint || geometry->IsEmpty()) {
			++skipped;
			continue;
		}

		const OGRPoint* point = geometry->toPoint();
		core::Booth booth{};
		booth.position   = {point->getX(), point->getY()};
		booth.attributes = readAttributes(*feature, booths.fields);
		booth.code       = core::attributeValue(booth.attributes, core::Field::BoothCode);
		booths.booths.push_back(std::move(booth));
	}

	if (skipped > 0) {
		std::cerr << "[io] " << path.filename().string() << ": skipped " << skipped << " features without point geometry\n";
	}

	std::vector<cv::Point2d> geographic;
	geographic.reserve(booths.booths.size());
	for (const auto& booth: booths.booths) {
		geographic.push_back(booth.position);
	}

	std::vector<bool> transformed(geographic.size(), true);
	if (!booths.reference.known()) {
		std::cerr << "[io] " << path.filename().string() << ": no coordinate reference. Assuming longitude/latitude.\n";
	} else if (!core::toGeographic(geographic, booths.reference, &transformed)) {
		std::cerr << "[io] " << path.filename().string() << ": could not derive latitude/longitude\n";
		return std::nullopt;
	}

	// Booths without a valid longitude/latitude are dropped like features without geometry. Unreferenced layers keep raw coordinates.
	std::vector<core::Booth> kept;
	kept.reserve(booths.booths.size());
	for (std::size_t i = 0; i < booths.booths.size(); ++i) {
		if (!transformed[i] || (booths.reference.known() && !isGeographic(geographic[i]))) {
			continue;
		}
		booths.booths[i].geographic = geographic[i];
		kept.push_back(std::move(booths.booths[i]));
	}
	if (kept.size() < booths.booths.size()) {
		std::cerr << "[io] " << path.filename().string() << ": skipped " << booths.booths.size() - kept.size()
		          << " booths without valid latitude/longitude\n";
	}
	booths.booths = std::move(kept);

	if (core::debugEnabled()) {
		std::cout << "[io] " << path.filename().string() << ": booths=" << booths.booths.size() << " reference=" << booths.reference.definition << '\n';
	}
	return booths;
}

} // namespace boothsampler::sampling::io
