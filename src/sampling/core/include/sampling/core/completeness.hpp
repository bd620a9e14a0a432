#pragma once

#include <cstddef>
#include <string_view>

namespace boothsampler::sampling::core {

//! Why a region did not reach its target. The text of each cause is shown to users verbatim and must stay stable.
enum class Incompleteness {
	None,                //!< Target reached.
	NoBoothsInBoundary,  //!< No booth lies within the boundary (or the boundary is missing).
	InsufficientBooths,  //!< Fewer valid booths than 2 per requested cluster.
	ClusterCountReduced, //!< Fewer valid booths than requested clusters. K was reduced.
	SparseClusters,      //!< Enough booths, but some clusters have fewer than 2 members.
	MissingReference,    //!< Strict mode: booth or boundary layer has no coordinate reference.
	ReprojectionFailed,  //!< Booths could not be transformed into the boundary reference.
	ClusteringFailed,    //!< The clustering step could not run.
};

//! Stable user facing text. Empty for Incompleteness::None.
std::string_view reasonText(Incompleteness cause);

struct Completeness {
	bool complete{false};
	Incompleteness cause{Incompleteness::None};
};

/*! Compare what was selected against the target derived from the request.
 * \param [in] selected          Booths actually selected.
 * \param [in] requestedClusters K from the allocator (before any reduction).
 * \param [in] validBooths       Booths that passed containment.
 * \param [in] reduced           The clustering step used fewer than `requestedClusters` clusters.
 * \param [in] perCluster        Booths selected per cluster.
 */
Completeness evaluateCompleteness(std::size_t selected, int requestedClusters, std::size_t validBooths, bool reduced, std::size_t perCluster = 2);

} // namespace boothsampler::sampling::core
