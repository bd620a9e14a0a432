#pragma once

#include "sampling/core/clustering.hpp"
#include "sampling/core/geometry.hpp"

#include <cstddef>
#include <vector>

namespace boothsampler::sampling::core {

struct SelectionConfig {
	std::size_t perCluster{BOOTHS_PER_CLUSTER}; //!< Representatives taken from each cluster.
};

//! Decides which members of one cluster represent it.
class SelectionPolicy {
public:
	virtual ~SelectionPolicy() = default;

	/*! Pick representatives of one cluster.
	 * \param [in] members Indices into `booths`/`points` of the cluster members, ascending.
	 * \param [in] booths  All clustered booths.
	 * \param [in] points  Working coordinates of all clustered booths (same indexing as `booths`).
	 * \param [in] center  Cluster centroid.
	 * \param [in] count   Maximum number of representatives.
	 * \return     Selected indices in selection order. Must be a subset of `members` of size <= count.
	 */
	virtual std::vector<std::size_t> select(const std::vector<std::size_t>& members, const std::vector<Booth>& booths,
	                                        const std::vector<cv::Point2d>& points, const cv::Point2d& center, std::size_t count) const = 0;
};

//! Members closest to the centroid (Euclidean). Ties broken by booth code, then by input order.
class ClosestToCentroid : public SelectionPolicy {
public:
	std::vector<std::size_t> select(const std::vector<std::size_t>& members, const std::vector<Booth>& booths, const std::vector<cv::Point2d>& points,
	                                const cv::Point2d& center, std::size_t count) const override;
};

//! Shared instance of the default policy.
const SelectionPolicy& closestToCentroid();

/*! Select representatives of every cluster.
 *  Clusters with fewer members than `config.perCluster` give all of their members. Nothing is borrowed from other clusters.
 * \return Indices into `booths`, grouped by cluster id ascending.
 */
std::vector<std::size_t> selectRepresentatives(const std::vector<Booth>& booths, const std::vector<cv::Point2d>& points, const ClusterResult& clusters,
                                               const SelectionConfig& config = SelectionConfig{}, const SelectionPolicy& policy = closestToCentroid());

} // namespace boothsampler::sampling::core
