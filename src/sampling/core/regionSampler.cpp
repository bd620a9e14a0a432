#include "sampling/core/regionSampler.hpp"

#include "sampling/core/debug.hpp"

#include <iostream>
#include <utility>

namespace boothsampler::sampling::core {

namespace {

//! Result for a region that stops before clustering.
static std::size_t targetBooths(const int samples, const SelectionConfig& selection) {
	return static_cast<std::size_t>(clustersForSamples(samples)) * selection.perCluster;
}

static SelectionResult incompleteResult(const Region& region, const int samples, const SelectionConfig& selection, const ReferenceStatus reference,
                                        const Incompleteness cause) {
	SelectionResult result{};
	result.regionCode        = region.code;
	result.regionName        = region.name;
	result.requestedClusters = clustersForSamples(samples);
	result.targetBooths      = targetBooths(samples, selection);
	result.reference         = reference;
	result.complete          = false;
	result.cause             = cause;
	result.reason            = std::string(reasonText(cause));
	return result;
}

static void finish(SelectionResult& result, const Completeness completeness) {
	result.complete = completeness.complete;
	result.cause    = completeness.cause;
	result.reason   = std::string(reasonText(completeness.cause));
}

} // namespace

SelectionResult sampleBooths(const Region& region, std::vector<Booth> validBooths, const int samples, const SamplingConfig& config,
                             const SelectionPolicy& policy) {
	if (validBooths.empty()) {
		return incompleteResult(region, samples, config.selection, ReferenceStatus::Aligned, Incompleteness::NoBoothsInBoundary);
	}

	SelectionResult result{};
	result.regionCode        = region.code;
	result.regionName        = region.name;
	result.totalBooths       = validBooths.size();
	result.requestedClusters = clustersForSamples(samples);
	result.targetBooths      = targetBooths(samples, config.selection);

	std::vector<cv::Point2d> points;
	points.reserve(validBooths.size());
	for (const auto& booth: validBooths) {
		points.push_back(booth.geographic);
	}

	const ClusterResult clusters = clusterPoints(points, result.requestedClusters, config.clustering);
	if (!clusters.success) {
		result.complete = false;
		result.cause    = Incompleteness::ClusteringFailed;
		result.reason   = std::string(reasonText(result.cause));
		return result;
	}

	result.clusterCount   = static_cast<int>(clusters.centers.size());
	result.clusterCenters = clusters.centers;

	const std::vector<std::size_t> selected = selectRepresentatives(validBooths, points, clusters, config.selection, policy);
	result.selectedBooths.reserve(selected.size());
	for (const std::size_t index: selected) {
		result.selectedBooths.push_back({validBooths[index], clusters.labels[index]});
	}

	result.clusteredBooths.reserve(validBooths.size());
	for (std::size_t i = 0; i < validBooths.size(); ++i) {
		result.clusteredBooths.push_back({std::move(validBooths[i]), clusters.labels[i]});
	}

	finish(result, evaluateCompleteness(result.selectedBooths.size(), result.requestedClusters, result.totalBooths, clusters.reduced(),
	                                    config.selection.perCluster));

	if (debugEnabled()) {
		std::cout << "[sampler] region=" << region.code << " booths=" << result.totalBooths << " clusters=" << result.clusterCount << "/"
		          << result.requestedClusters << " selected=" << result.selectedBooths.size() << " complete=" << (result.complete ? 1 : 0) << '\n';
	}
	return result;
}

SelectionResult sampleRegion(const Region& region, ContainmentResult containment, const int samples, const SamplingConfig& config,
                             const SelectionPolicy& policy) {
	if (!containment.usable) {
		const Incompleteness cause =
		        containment.status == ReferenceStatus::Failed ? Incompleteness::ReprojectionFailed : Incompleteness::MissingReference;
		return incompleteResult(region, samples, config.selection, containment.status, cause);
	}
	if (containment.booths.empty()) {
		return incompleteResult(region, samples, config.selection, containment.status, Incompleteness::NoBoothsInBoundary);
	}

	SelectionResult result = sampleBooths(region, std::move(containment.booths), samples, config, policy);
	result.reference       = containment.status;
	return result;
}

} // namespace boothsampler::sampling::core
