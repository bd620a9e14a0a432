#pragma once

#include <opencv2/core/types.hpp>

#include <cstdint>
#include <vector>

namespace boothsampler::sampling::core {

//! Samples per cluster. 25 requested samples make one cluster.
inline constexpr int SAMPLES_PER_CLUSTER = 25;
//! Booths selected from each cluster.
inline constexpr int BOOTHS_PER_CLUSTER = 2;

//! Number of clusters for a requested sample size: max(1, round(samples / 25)).
int clustersForSamples(int samples);

//! Number of booths a region should yield for a requested sample size (`perCluster` per cluster, 2 by default).
int targetSelection(int samples, int perCluster = BOOTHS_PER_CLUSTER);

//! k-means parameters. The seed makes repeated runs on unchanged input produce identical clusters.
struct ClusteringConfig {
	std::uint64_t seed{42};  //!< Seed for k-means++ initialisation.
	int attempts{10};        //!< Restarts. The most compact labelling wins.
	int maxIterations{300};  //!< Iteration cap per attempt.
	double epsilon{1e-7};    //!< Stop once no centre moves further than this (working units).
};

struct ClusterResult {
	bool success{false};              //!< False if clustering could not run (see log).
	std::vector<int> labels{};        //!< Cluster id per input point, 0..centers.size()-1.
	std::vector<cv::Point2d> centers; //!< Arithmetic mean of the members of each cluster.
	int requestedClusters{0};         //!< K asked for.

	//! Fewer clusters than requested (fewer points than K).
	bool reduced() const { return static_cast<int>(centers.size()) < requestedClusters; }
};

/*! Partition points into k spatial clusters (k-means, k-means++ seeding).
 *  Every point receives exactly one label. If there are fewer points than k, or some clusters end up empty,
 *  the cluster count is reduced and labels are renumbered to stay contiguous.
 * \param [in] points Points in the working coordinate system.
 * \param [in] k      Requested number of clusters (values below 1 are treated as 1).
 * \param [in] config Clustering parameters.
 */
ClusterResult clusterPoints(const std::vector<cv::Point2d>& points, int k, const ClusteringConfig& config = ClusteringConfig{});

} // namespace boothsampler::sampling::core
