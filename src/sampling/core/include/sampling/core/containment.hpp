#pragma once

#include "sampling/core/geometry.hpp"

#include <string>
#include <string_view>
#include <vector>

// Containment validation: a booth only counts for a region if its point lies within the region's boundary.
// The boundary is authoritative. Booths are brought into the boundary's coordinate reference, never the reverse.
namespace boothsampler::sampling::core {

//! How booth and boundary coordinates were reconciled before testing.
enum class ReferenceStatus {
	Aligned,      //!< Both layers share the same reference.
	Reprojected,  //!< Booths were transformed into the boundary reference.
	Unreferenced, //!< At least one layer has no reference. Tested in raw coordinates (or rejected in strict mode).
	Failed,       //!< Both references known but the transformation failed. Nothing can be tested.
};

struct ContainmentConfig {
	bool strictReference{false}; //!< Reject regions whose booth or boundary layer has no coordinate reference.
};

//! Booth positions brought into a boundary reference once, reused for every region of that reference.
struct AlignedBooths {
	const BoothLayer* layer{nullptr};
	std::vector<cv::Point2d> positions{}; //!< positions[i] belongs to layer->booths[i]. Empty on failure.
	std::vector<bool> valid{};            //!< valid[i] is false if booth i could not be transformed. It never lies within a boundary.
	std::size_t dropped{0};               //!< Booths that could not be transformed.
	ReferenceStatus status{ReferenceStatus::Aligned};
};

struct ContainmentResult {
	std::vector<Booth> booths{};                      //!< Valid booths in input order, positions in boundary coordinates.
	ReferenceStatus status{ReferenceStatus::Aligned}; //!< How coordinates were reconciled.
	bool regionFound{false};                          //!< A boundary with the requested code exists.
	bool usable{true};                                //!< False if the reference check rejected the region (see status).
};

//! Short label for summaries and logs ("aligned", "reprojected", "unreferenced", "failed").
std::string_view referenceLabel(ReferenceStatus status);

//! True if the point lies strictly within the boundary: inside an exterior ring and not inside or on one of its holes.
bool isWithin(const Boundary& boundary, const cv::Point2d& point);

//! Indices of all points within the boundary, ascending.
std::vector<std::size_t> pointsWithin(const Boundary& boundary, const std::vector<cv::Point2d>& points);

//! First feature whose `codeField` attribute equals `code` (string comparison). Nullptr if there is none.
const RegionFeature* findRegion(const RegionLayer& regions, const std::string& codeField, const std::string& code);

//! Reproject all booth positions into `target` if the references differ. Booths that fail on their own are dropped, not the layer.
AlignedBooths alignBooths(const BoothLayer& booths, const CoordinateReference& target);

/*! Collect the booths within one boundary.
 * \param [in] aligned  Booth positions already in the boundary reference (see alignBooths).
 * \param [in] boundary Region boundary.
 * \param [in] config   Reference handling policy.
 */
ContainmentResult validateBooths(const AlignedBooths& aligned, const Boundary& boundary, const ContainmentConfig& config = ContainmentConfig{});

/*! Collect the booths within the region with the given code.
 *  Returns an empty result with `regionFound == false` if no feature carries the code.
 */
ContainmentResult validateBooths(const BoothLayer& booths, const RegionLayer& regions, const std::string& codeField, const std::string& code,
                                 const ContainmentConfig& config = ContainmentConfig{});

} // namespace boothsampler::sampling::core
