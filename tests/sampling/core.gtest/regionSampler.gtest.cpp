#include "sampling/core/regionSampler.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace boothsampler::sampling::core {
namespace gtest {

static Booth boothAt(const std::string& code, const cv::Point2d& p) {
	Booth b{};
	b.code       = code;
	b.position   = p;
	b.geographic = p;
	b.attributes = {{"booth", code}};
	return b;
}

//! `blobs` tight groups of `perBlob` booths, 0.1 degrees apart.
static std::vector<Booth> blobBooths(const int blobs, const int perBlob) {
	std::vector<Booth> booths;
	const double step = 2.0 * CV_PI / perBlob;
	for (int b = 0; b < blobs; ++b) {
		const cv::Point2d center(77.0 + 0.1 * (b % 4), 28.0 + 0.1 * (b / 4));
		for (int i = 0; i < perBlob; ++i) {
			const cv::Point2d p = center + 0.005 * cv::Point2d(std::cos(i * step), std::sin(i * step));
			booths.push_back(boothAt(std::to_string(b * perBlob + i + 1), p));
		}
	}
	return booths;
}

static const Region REGION{"101", "Test Region", 0};

TEST(RegionSampler, NoBooths) {
	const SelectionResult result = sampleBooths(REGION, {}, 300);
	EXPECT_EQ(result.regionCode, "101");
	EXPECT_EQ(result.regionName, "Test Region");
	EXPECT_EQ(result.totalBooths, 0u);
	EXPECT_TRUE(result.selectedBooths.empty());
	EXPECT_EQ(result.requestedClusters, 12);
	EXPECT_EQ(result.targetBooths, 24u);
	EXPECT_FALSE(result.complete);
	EXPECT_EQ(result.cause, Incompleteness::NoBoothsInBoundary);
	EXPECT_EQ(result.reason, "no booths found within boundary");

	// Clustering never ran.
	EXPECT_TRUE(result.clusteredBooths.empty());
	EXPECT_TRUE(result.clusterCenters.empty());
	EXPECT_EQ(result.clusterCount, 0);
}

TEST(RegionSampler, SixtyBoothsInTwelveGroups_Complete) {
	const SelectionResult result = sampleBooths(REGION, blobBooths(12, 5), 300);
	EXPECT_EQ(result.totalBooths, 60u);
	EXPECT_EQ(result.requestedClusters, 12);
	EXPECT_EQ(result.clusterCount, 12);
	ASSERT_EQ(result.selectedBooths.size(), 24u);
	EXPECT_TRUE(result.complete);
	EXPECT_TRUE(result.reason.empty());

	std::map<int, int> perCluster;
	for (const auto& s: result.selectedBooths) {
		++perCluster[s.cluster];
	}
	EXPECT_EQ(perCluster.size(), 12u);
	for (const auto& [cluster, count]: perCluster) {
		EXPECT_EQ(count, 2) << "cluster " << cluster;
	}
}

TEST(RegionSampler, SelectedBoothsAreClusteredBooths) {
	const SelectionResult result = sampleBooths(REGION, blobBooths(12, 5), 300);
	ASSERT_EQ(result.clusteredBooths.size(), 60u);

	std::map<std::string, int> clusterOf;
	for (const auto& c: result.clusteredBooths) {
		clusterOf[c.booth.code] = c.cluster;
	}
	std::set<std::string> seen;
	for (const auto& s: result.selectedBooths) {
		ASSERT_EQ(clusterOf.count(s.booth.code), 1u);
		EXPECT_EQ(clusterOf[s.booth.code], s.cluster);
		EXPECT_TRUE(seen.insert(s.booth.code).second) << "duplicate " << s.booth.code;
	}
	EXPECT_LE(result.selectedBooths.size(), result.totalBooths);
}

TEST(RegionSampler, SelectionIsGroupedByCluster) {
	const SelectionResult result = sampleBooths(REGION, blobBooths(12, 5), 300);
	for (std::size_t i = 1; i < result.selectedBooths.size(); ++i) {
		EXPECT_LE(result.selectedBooths[i - 1].cluster, result.selectedBooths[i].cluster);
	}
}

TEST(RegionSampler, Repeatable) {
	const SelectionResult first  = sampleBooths(REGION, blobBooths(12, 5), 300);
	const SelectionResult second = sampleBooths(REGION, blobBooths(12, 5), 300);
	ASSERT_EQ(first.selectedBooths.size(), second.selectedBooths.size());
	for (std::size_t i = 0; i < first.selectedBooths.size(); ++i) {
		EXPECT_EQ(first.selectedBooths[i].booth.code, second.selectedBooths[i].booth.code);
	}
}

TEST(RegionSampler, FewerBoothsThanClusters_ReducesClusterCount) {
	const SelectionResult result = sampleBooths(REGION, blobBooths(3, 1), 300);
	EXPECT_EQ(result.requestedClusters, 12);
	EXPECT_EQ(result.clusterCount, 3);
	EXPECT_EQ(result.selectedBooths.size(), 3u);
	EXPECT_FALSE(result.complete);
	EXPECT_EQ(result.cause, Incompleteness::ClusterCountReduced);
}

TEST(RegionSampler, FewerThanTwoPerCluster_IsInsufficient) {
	// Four groups of sizes 2, 2, 1, 1 with K = 4: six booths for a target of eight.
	std::vector<Booth> booths = blobBooths(2, 2);
	booths.push_back(boothAt("x1", {77.2, 28.0}));
	booths.push_back(boothAt("x2", {77.3, 28.0}));

	const SelectionResult result = sampleBooths(REGION, booths, 100);
	EXPECT_EQ(result.requestedClusters, 4);
	EXPECT_EQ(result.clusterCount, 4);
	EXPECT_EQ(result.selectedBooths.size(), 6u);
	EXPECT_FALSE(result.complete);
	EXPECT_EQ(result.cause, Incompleteness::InsufficientBooths);
}

TEST(RegionSampler, OutlierCluster_IsSparse) {
	// K = 2: one group of five plus a lone outlier. Enough booths, but one cluster has a single member.
	std::vector<Booth> booths = blobBooths(1, 5);
	booths.push_back(boothAt("far", {79.0, 30.0}));

	const SelectionResult result = sampleBooths(REGION, booths, 50);
	EXPECT_EQ(result.requestedClusters, 2);
	EXPECT_EQ(result.clusterCount, 2);
	EXPECT_EQ(result.selectedBooths.size(), 3u);
	EXPECT_FALSE(result.complete);
	EXPECT_EQ(result.cause, Incompleteness::SparseClusters);
}

TEST(RegionSampler, SmallRequest_UsesOneCluster) {
	const SelectionResult result = sampleBooths(REGION, blobBooths(3, 5), 10);
	EXPECT_EQ(result.requestedClusters, 1);
	EXPECT_EQ(result.clusterCount, 1);
	EXPECT_EQ(result.selectedBooths.size(), 2u);
	EXPECT_TRUE(result.complete);
}

TEST(RegionSampler, UnusableContainment_NeverClusters) {
	ContainmentResult missing{};
	missing.regionFound = true;
	missing.usable      = false;
	missing.status      = ReferenceStatus::Unreferenced;
	missing.booths      = blobBooths(12, 5);

	const SelectionResult unreferenced = sampleRegion(REGION, missing, 300);
	EXPECT_FALSE(unreferenced.complete);
	EXPECT_EQ(unreferenced.cause, Incompleteness::MissingReference);
	EXPECT_TRUE(unreferenced.selectedBooths.empty());
	EXPECT_EQ(unreferenced.totalBooths, 0u);

	ContainmentResult failed = missing;
	failed.status            = ReferenceStatus::Failed;
	const SelectionResult reprojection = sampleRegion(REGION, failed, 300);
	EXPECT_EQ(reprojection.cause, Incompleteness::ReprojectionFailed);
	EXPECT_EQ(reprojection.reference, ReferenceStatus::Failed);
}

TEST(RegionSampler, ContainmentStatusIsReported) {
	ContainmentResult containment{};
	containment.regionFound = true;
	containment.status      = ReferenceStatus::Reprojected;
	containment.booths      = blobBooths(12, 5);

	const SelectionResult result = sampleRegion(REGION, containment, 300);
	EXPECT_TRUE(result.complete);
	EXPECT_EQ(result.reference, ReferenceStatus::Reprojected);
}

TEST(RegionSampler, TargetFollowsBoothsPerCluster) {
	const SelectionResult byDefault = sampleBooths(REGION, blobBooths(12, 5), 300);
	EXPECT_EQ(byDefault.targetBooths, 24u);

	SamplingConfig config{};
	config.selection.perCluster = 1;
	const SelectionResult single = sampleBooths(REGION, blobBooths(12, 5), 300, config);
	EXPECT_EQ(single.targetBooths, 12u);
	EXPECT_EQ(single.selectedBooths.size(), 12u);
	EXPECT_TRUE(single.complete);
	EXPECT_EQ(targetSelection(300, 1), 12);

	config.selection.perCluster = 3;
	const SelectionResult triple = sampleBooths(REGION, blobBooths(12, 5), 300, config);
	EXPECT_EQ(triple.targetBooths, 36u);
	EXPECT_EQ(triple.selectedBooths.size(), 36u);
	EXPECT_TRUE(triple.complete);
}

} // namespace gtest
} // namespace boothsampler::sampling::core
