#pragma once

#include "sampling/core/clustering.hpp"
#include "sampling/core/completeness.hpp"
#include "sampling/core/containment.hpp"
#include "sampling/core/geometry.hpp"
#include "sampling/core/selector.hpp"

#include <string>
#include <vector>

// Per-region sampling pipeline:
// 1) Allocate  -> K = max(1, round(samples / 25)).
// 2) Cluster   -> partition the valid booths into K groups (geographic lon/lat coordinates).
// 3) Select    -> up to 2 representatives per cluster.
// 4) Evaluate  -> complete if perCluster * K booths were selected, otherwise a fixed reason.
// The pipeline is a pure function of its inputs. Nothing is kept between calls.
namespace boothsampler::sampling::core {

//! A booth tagged with the cluster it was assigned to.
struct ClusteredBooth {
	Booth booth;
	int cluster{0};
};

//! All parameters of the per-region pipeline.
struct SamplingConfig {
	ContainmentConfig containment{};
	ClusteringConfig clustering{};
	SelectionConfig selection{};
};

//! Outcome of one region.
struct SelectionResult {
	std::string regionCode;
	std::string regionName;
	std::size_t totalBooths{0};                       //!< Valid booths before selection.
	std::vector<ClusteredBooth> selectedBooths{};     //!< Representatives, grouped by cluster id ascending.
	std::vector<ClusteredBooth> clusteredBooths{};    //!< Every valid booth with its cluster id.
	std::vector<cv::Point2d> clusterCenters{};        //!< Cluster centroids, x = longitude, y = latitude.
	int requestedClusters{0};                         //!< K derived from the request.
	int clusterCount{0};                              //!< K actually used (<= requestedClusters).
	std::size_t targetBooths{0};                      //!< Booths needed for completeness: perCluster * requestedClusters.
	ReferenceStatus reference{ReferenceStatus::Aligned};
	bool complete{false};
	Incompleteness cause{Incompleteness::None};
	std::string reason{}; //!< reasonText(cause). Empty when complete.
};

/*! Cluster and select representatives for the valid booths of one region.
 * \param [in] region      Region being processed.
 * \param [in] validBooths Booths that passed containment for this region.
 * \param [in] samples     Requested samples per region.
 * \param [in] config      Pipeline parameters.
 * \param [in] policy      Representative selection policy.
 */
SelectionResult sampleBooths(const Region& region, std::vector<Booth> validBooths, int samples, const SamplingConfig& config = SamplingConfig{},
                             const SelectionPolicy& policy = closestToCentroid());

//! Same as sampleBooths, starting from a containment result. Unusable or empty containment results never reach clustering.
SelectionResult sampleRegion(const Region& region, ContainmentResult containment, int samples, const SamplingConfig& config = SamplingConfig{},
                             const SelectionPolicy& policy = closestToCentroid());

} // namespace boothsampler::sampling::core
