#include "sampling/core/selector.hpp"

#include "statistics.hpp"

#include <algorithm>
#include <iostream>
#include <string>

namespace boothsampler::sampling::core {

std::vector<std::size_t> ClosestToCentroid::select(const std::vector<std::size_t>& members, const std::vector<Booth>& booths,
                                                   const std::vector<cv::Point2d>& points, const cv::Point2d& center, const std::size_t count) const {
	struct Candidate {
		double distance;
		std::size_t index;
	};

	std::vector<Candidate> candidates;
	candidates.reserve(members.size());
	for (const std::size_t index: members) {
		candidates.push_back({squaredDistance(points[index], center), index});
	}

	std::sort(candidates.begin(), candidates.end(), [&](const Candidate& left, const Candidate& right) {
		if (left.distance != right.distance) {
			return left.distance < right.distance;
		}
		const std::string& leftCode  = booths[left.index].code;
		const std::string& rightCode = booths[right.index].code;
		if (leftCode != rightCode) {
			return leftCode < rightCode;
		}
		return left.index < right.index;
	});

	const std::size_t take = std::min(count, candidates.size());
	std::vector<std::size_t> selected;
	selected.reserve(take);
	for (std::size_t i = 0; i < take; ++i) {
		selected.push_back(candidates[i].index);
	}
	return selected;
}

const SelectionPolicy& closestToCentroid() {
	static const ClosestToCentroid POLICY{};
	return POLICY;
}

std::vector<std::size_t> selectRepresentatives(const std::vector<Booth>& booths, const std::vector<cv::Point2d>& points, const ClusterResult& clusters,
                                               const SelectionConfig& config, const SelectionPolicy& policy) {
	std::vector<std::vector<std::size_t>> members(clusters.centers.size());
	for (std::size_t i = 0; i < clusters.labels.size(); ++i) {
		members[static_cast<std::size_t>(clusters.labels[i])].push_back(i);
	}

	std::vector<std::size_t> selected;
	selected.reserve(config.perCluster * clusters.centers.size());

	for (std::size_t c = 0; c < members.size(); ++c) {
		const auto& group = members[c];
		std::vector<std::size_t> picked = policy.select(group, booths, points, clusters.centers[c], config.perCluster);

		// A policy must not return more than asked for, duplicates, or booths of another cluster.
		std::vector<std::size_t> accepted;
		for (const std::size_t index: picked) {
			if (accepted.size() >= config.perCluster) {
				break;
			}
			const bool isMember   = std::binary_search(group.begin(), group.end(), index);
			const bool isSelected = std::find(accepted.begin(), accepted.end(), index) != accepted.end();
			if (!isMember || isSelected) {
				std::cerr << "[selector] Policy returned invalid index " << index << " for cluster " << c << ". Ignored.\n";
				continue;
			}
			accepted.push_back(index);
		}
		selected.insert(selected.end(), accepted.begin(), accepted.end());
	}
	return selected;
}

} // namespace boothsampler::sampling::core
