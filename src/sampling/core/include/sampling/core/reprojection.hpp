#pragma once

#include "sampling/core/geometry.hpp"

#include <vector>

namespace boothsampler::sampling::core {

//! True if both references are known and describe the same coordinate system.
bool isSameReference(const CoordinateReference& a, const CoordinateReference& b);

/*! Transform points in place between two coordinate references.
 *  Axis order is always x = easting/longitude, y = northing/latitude.
 * \param [in,out] points      Points in `from` coordinates. Transformed points are replaced by `to` coordinates, others are left untouched.
 * \param [out]    transformed Optional per-point flags. If given, points that fail on their own (out of domain, not finite) are flagged
 *                             and the call still succeeds. If null, any failing point fails the call and no point is changed.
 * \return         False if a reference is unknown/invalid, no transformation exists or no point could be transformed.
 */
bool reproject(std::vector<cv::Point2d>& points, const CoordinateReference& from, const CoordinateReference& to,
               std::vector<bool>* transformed = nullptr);

//! Transform points in place to EPSG:4326 longitude/latitude. No-op success if `from` already is geographic WGS84.
bool toGeographic(std::vector<cv::Point2d>& points, const CoordinateReference& from, std::vector<bool>* transformed = nullptr);

} // namespace boothsampler::sampling::core
