#include "sampling/core/clustering.hpp"

#include "sampling/core/debug.hpp"
#include "statistics.hpp"

#include <opencv2/core.hpp>

#include <algorithm>
#include <cmath>
#include <iostream>

namespace boothsampler::sampling::core {

namespace {

//! Restores OpenCV's thread local RNG on scope exit so seeding here does not leak into other callers.
class ScopedSeed {
public:
	explicit ScopedSeed(const std::uint64_t seed) : m_saved(cv::theRNG()) { cv::theRNG().state = seed; }
	~ScopedSeed() { cv::theRNG() = m_saved; }

	ScopedSeed(const ScopedSeed&)            = delete;
	ScopedSeed& operator=(const ScopedSeed&) = delete;

private:
	cv::RNG m_saved;
};

//! Renumber labels so that only non-empty clusters remain (ids kept in ascending order) and recompute centres in double precision.
static void compact(const std::vector<cv::Point2d>& points, const int k, ClusterResult& result) {
	std::vector<std::vector<cv::Point2d>> members(static_cast<std::size_t>(k));
	for (std::size_t i = 0; i < points.size(); ++i) {
		members[static_cast<std::size_t>(result.labels[i])].push_back(points[i]);
	}

	std::vector<int> remap(static_cast<std::size_t>(k), -1);
	result.centers.clear();
	for (int c = 0; c < k; ++c) {
		const auto& group = members[static_cast<std::size_t>(c)];
		if (group.empty()) {
			continue;
		}
		remap[static_cast<std::size_t>(c)] = static_cast<int>(result.centers.size());
		result.centers.push_back(mean(group));
	}

	for (int& label: result.labels) {
		label = remap[static_cast<std::size_t>(label)];
	}
}

} // namespace

int clustersForSamples(const int samples) {
	const long rounded = std::lround(static_cast<double>(samples) / static_cast<double>(SAMPLES_PER_CLUSTER));
	return static_cast<int>(std::max(1L, rounded));
}

int targetSelection(const int samples, const int perCluster) {
	return std::max(0, perCluster) * clustersForSamples(samples);
}

ClusterResult clusterPoints(const std::vector<cv::Point2d>& points, const int k, const ClusteringConfig& config) {
	ClusterResult result{};
	result.requestedClusters = std::max(1, k);

	if (points.empty()) {
		result.success = true;
		return result;
	}

	// Clustering cannot manufacture more groups than points.
	const int effectiveK = std::min(result.requestedClusters, static_cast<int>(points.size()));

	if (effectiveK == 1) {
		result.labels.assign(points.size(), 0);
		result.centers = {mean(points)};
		result.success = true;
		return result;
	}

	// cv::kmeans works on 32 bit floats. Centre the data first so geographic or projected magnitudes do not eat the mantissa.
	const cv::Point2d offset = mean(points);
	cv::Mat samples(static_cast<int>(points.size()), 2, CV_32F);
	for (std::size_t i = 0; i < points.size(); ++i) {
		samples.at<float>(static_cast<int>(i), 0) = static_cast<float>(points[i].x - offset.x);
		samples.at<float>(static_cast<int>(i), 1) = static_cast<float>(points[i].y - offset.y);
	}

	cv::Mat labels;
	cv::Mat centers;
	const cv::TermCriteria criteria(cv::TermCriteria::EPS + cv::TermCriteria::MAX_ITER, std::max(1, config.maxIterations), config.epsilon);
	try {
		const ScopedSeed seed(config.seed);
		cv::kmeans(samples, effectiveK, labels, criteria, std::max(1, config.attempts), cv::KMEANS_PP_CENTERS, centers);
	} catch (const cv::Exception& e) {
		std::cerr << "[clustering] k-means failed: " << e.what() << '\n';
		return result;
	}

	if (labels.rows != static_cast<int>(points.size())) {
		std::cerr << "[clustering] k-means returned " << labels.rows << " labels for " << points.size() << " points\n";
		return result;
	}

	result.labels.resize(points.size());
	for (std::size_t i = 0; i < points.size(); ++i) {
		result.labels[i] = std::clamp(labels.at<int>(static_cast<int>(i)), 0, effectiveK - 1);
	}
	compact(points, effectiveK, result);
	result.success = true;

	if (debugEnabled()) {
		std::cout << "[clustering] points=" << points.size() << " requested=" << result.requestedClusters << " used=" << result.centers.size() << '\n';
	}
	return result;
}

} // namespace boothsampler::sampling::core
