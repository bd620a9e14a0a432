#pragma once

#include <opencv2/core/types.hpp>

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace boothsampler::sampling::core {

//! Field name -> value of one shapefile record. Values are kept as strings, codes are compared as strings.
using Attributes = std::map<std::string, std::string>;

//! Closed ring of vertices. First vertex is not repeated at the end.
using Ring = std::vector<cv::Point2d>;

//! Single polygon with optional holes.
struct Polygon {
	Ring exterior;
	std::vector<Ring> holes{};
};

//! Region outline. Single polygons are stored as a boundary with one entry.
using Boundary = std::vector<Polygon>;

/*! Coordinate reference of a layer.
 *  `definition` is anything GDAL/OSR accepts as user input ("EPSG:32643", WKT, PROJ string).
 *  An empty definition means the layer carries no reference information.
 */
struct CoordinateReference {
	std::string definition{};

	bool known() const { return !definition.empty(); }
};

//! Geographic reference used for latitude/longitude output.
inline const CoordinateReference WGS84{"EPSG:4326"};

//! One record of a region (AC/PC) layer.
struct RegionFeature {
	Attributes attributes;
	Boundary boundary;
};

//! Region layer as loaded from the boundary shapefile.
struct RegionLayer {
	CoordinateReference reference;
	std::vector<std::string> fields;
	std::vector<RegionFeature> features;
};

//! A region to be processed, resolved from the region layer.
struct Region {
	std::string code;
	std::string name;
	std::size_t featureIndex{0}; //!< Index into RegionLayer::features.
};

//! Polling booth.
struct Booth {
	cv::Point2d position;   //!< Point in the coordinates of the layer it currently belongs to.
	cv::Point2d geographic; //!< x = longitude, y = latitude (EPSG:4326).
	std::string code;       //!< Booth code resolved from the attributes. Empty if the layer has no booth column.
	Attributes attributes;
};

//! Booth layer as loaded from the booth shapefile.
struct BoothLayer {
	CoordinateReference reference;
	std::vector<std::string> fields;
	std::vector<Booth> booths;
};

//! Axis aligned bounds of a boundary. Empty boundaries yield an empty rect.
cv::Rect2d boundingBox(const Boundary& boundary);

} // namespace boothsampler::sampling::core
