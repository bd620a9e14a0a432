#include "sampling/core/completeness.hpp"

namespace boothsampler::sampling::core {

std::string_view reasonText(const Incompleteness cause) {
	switch (cause) {
	case Incompleteness::None:
		return "";
	case Incompleteness::NoBoothsInBoundary:
		return "no booths found within boundary";
	case Incompleteness::InsufficientBooths:
		return "insufficient valid booths: fewer than two per requested cluster";
	case Incompleteness::ClusterCountReduced:
		return "insufficient valid booths: cluster count reduced";
	case Incompleteness::SparseClusters:
		return "clusters with fewer than two booths";
	case Incompleteness::MissingReference:
		return "coordinate reference missing on booth or boundary layer";
	case Incompleteness::ReprojectionFailed:
		return "booths could not be reprojected to the boundary reference";
	case Incompleteness::ClusteringFailed:
		return "clustering failed";
	}
	return "";
}

Completeness evaluateCompleteness(const std::size_t selected, const int requestedClusters, const std::size_t validBooths, const bool reduced,
                                  const std::size_t perCluster) {
	const std::size_t target = perCluster * static_cast<std::size_t>(requestedClusters > 0 ? requestedClusters : 0);
	if (validBooths == 0) {
		return {false, Incompleteness::NoBoothsInBoundary};
	}
	if (selected == target) {
		return {true, Incompleteness::None};
	}
	if (reduced) {
		return {false, Incompleteness::ClusterCountReduced};
	}
	if (validBooths < target) {
		return {false, Incompleteness::InsufficientBooths};
	}
	return {false, Incompleteness::SparseClusters};
}

} // namespace boothsampler::sampling::core
