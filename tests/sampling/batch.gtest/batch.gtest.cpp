#include "sampling/batch.hpp"
#include "testLayers.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <string>
#include <vector>

namespace boothsampler::sampling {
namespace gtest {

//! Square region feature with AC attributes.
static core::RegionFeature acRegion(const std::string& code, const std::string& name, const double x0, const double y0, const double size) {
	core::RegionFeature feature{};
	feature.attributes = {{"ac_no", code}, {"ac_name", name}};
	feature.boundary   = {core::Polygon{{{x0, y0}, {x0 + size, y0}, {x0 + size, y0 + size}, {x0, y0 + size}}, {}}};
	return feature;
}

//! Twelve tight groups of five booths inside the 0.5 degree square at (x0, y0).
static std::vector<core::Booth> groupedBooths(const double x0, const double y0, const std::string& prefix) {
	std::vector<core::Booth> booths;
	for (int g = 0; g < 12; ++g) {
		const cv::Point2d center(x0 + 0.05 + 0.1 * (g % 4), y0 + 0.1 + 0.1 * (g / 4));
		for (int i = 0; i < 5; ++i) {
			const double angle = 2.0 * CV_PI * i / 5.0;
			core::Booth booth{};
			booth.position   = center + 0.005 * cv::Point2d(std::cos(angle), std::sin(angle));
			booth.geographic = booth.position;
			booth.code       = prefix + std::to_string(g * 5 + i + 1);
			booth.attributes = {{"booth", booth.code}};
			booths.push_back(booth);
		}
	}
	return booths;
}

//! Region "101" with 60 booths, "102" empty and "099" with 60 booths.
static void makeLayers(core::RegionLayer& regions, core::BoothLayer& booths) {
	regions.reference = core::WGS84;
	regions.fields    = {"ac_no", "ac_name"};
	regions.features  = {acRegion("101", "North", 77.0, 28.0, 0.5), acRegion("102", "Empty", 80.0, 28.0, 0.5), acRegion("099", "South", 77.0, 27.0, 0.5)};

	booths.reference = core::WGS84;
	booths.fields    = {"booth"};
	booths.booths    = groupedBooths(77.0, 28.0, "n");
	const auto south = groupedBooths(77.0, 27.0, "s");
	booths.booths.insert(booths.booths.end(), south.begin(), south.end());
}

static BatchParameters acParameters(const unsigned workers) {
	BatchParameters parameters{};
	parameters.state            = "Test";
	parameters.type             = core::SelectionType::Assembly;
	parameters.samplesPerRegion = 300;
	parameters.workers          = workers;
	return parameters;
}

TEST(Batch, ListRegions_SortedByCode) {
	core::RegionLayer regions{};
	core::BoothLayer booths{};
	makeLayers(regions, booths);

	const auto list = listRegions(regions, core::SelectionType::Assembly);
	ASSERT_EQ(list.size(), 3u);
	EXPECT_EQ(list[0].code, "099");
	EXPECT_EQ(list[0].name, "South");
	EXPECT_EQ(list[0].featureIndex, 2u);
	EXPECT_EQ(list[1].code, "101");
	EXPECT_EQ(list[2].code, "102");

	EXPECT_TRUE(listRegions(regions, core::SelectionType::Parliamentary).empty());
}

TEST(Batch, ProcessesEveryRegion) {
	core::RegionLayer regions{};
	core::BoothLayer booths{};
	makeLayers(regions, booths);

	const BatchResult result = runBatch(regions, booths, acParameters(1));
	ASSERT_TRUE(result.success);
	EXPECT_FALSE(result.cancelled);
	ASSERT_EQ(result.regions.size(), 3u);

	const auto& south = result.regions[0];
	const auto& north = result.regions[1];
	const auto& empty = result.regions[2];
	EXPECT_EQ(north.regionCode, "101");
	EXPECT_EQ(north.totalBooths, 60u);
	EXPECT_EQ(north.selectedBooths.size(), 24u);
	EXPECT_TRUE(north.complete);
	for (const auto& s: north.selectedBooths) {
		EXPECT_EQ(s.booth.code.front(), 'n');
	}

	EXPECT_EQ(south.regionCode, "099");
	EXPECT_TRUE(south.complete);

	EXPECT_EQ(empty.regionCode, "102");
	EXPECT_EQ(empty.totalBooths, 0u);
	EXPECT_FALSE(empty.complete);
	EXPECT_EQ(empty.reason, "no booths found within boundary");

	EXPECT_EQ(result.totals.regions, 3u);
	EXPECT_EQ(result.totals.withBooths, 2u);
	EXPECT_EQ(result.totals.completed, 2u);
	EXPECT_EQ(result.totals.totalBooths, 120u);
	EXPECT_EQ(result.totals.totalSelected, 48u);
}

TEST(Batch, SharedCodeUsesEachFeatureBoundary) {
	core::RegionLayer regions{};
	core::BoothLayer booths{};
	makeLayers(regions, booths);
	regions.features = {acRegion("101", "North", 77.0, 28.0, 0.5), acRegion("101", "North (part)", 77.0, 27.0, 0.5)};

	const BatchResult result = runBatch(regions, booths, acParameters(2));
	ASSERT_TRUE(result.success);
	ASSERT_EQ(result.regions.size(), 2u);

	std::vector<char> prefixes;
	for (const auto& region: result.regions) {
		EXPECT_EQ(region.regionCode, "101");
		EXPECT_EQ(region.totalBooths, 60u);
		ASSERT_EQ(region.selectedBooths.size(), 24u);
		const char prefix = region.selectedBooths.front().booth.code.front();
		for (const auto& s: region.selectedBooths) {
			EXPECT_EQ(s.booth.code.front(), prefix);
		}
		prefixes.push_back(prefix);
	}
	std::sort(prefixes.begin(), prefixes.end());
	EXPECT_EQ(prefixes, (std::vector<char>{'n', 's'}));
}

TEST(Batch, WorkerCountDoesNotChangeResults) {
	core::RegionLayer regions{};
	core::BoothLayer booths{};
	makeLayers(regions, booths);

	const BatchResult single = runBatch(regions, booths, acParameters(1));
	const BatchResult multi  = runBatch(regions, booths, acParameters(4));
	ASSERT_TRUE(single.success);
	ASSERT_TRUE(multi.success);
	ASSERT_EQ(single.regions.size(), multi.regions.size());
	for (std::size_t r = 0; r < single.regions.size(); ++r) {
		const auto& a = single.regions[r];
		const auto& b = multi.regions[r];
		EXPECT_EQ(a.regionCode, b.regionCode);
		ASSERT_EQ(a.selectedBooths.size(), b.selectedBooths.size());
		for (std::size_t i = 0; i < a.selectedBooths.size(); ++i) {
			EXPECT_EQ(a.selectedBooths[i].booth.code, b.selectedBooths[i].booth.code);
			EXPECT_EQ(a.selectedBooths[i].cluster, b.selectedBooths[i].cluster);
		}
	}
}

TEST(Batch, MissingCodeColumn_FailsBatch) {
	core::RegionLayer regions{};
	core::BoothLayer booths{};
	makeLayers(regions, booths);

	const BatchResult result = runBatch(regions, booths, [] {
		BatchParameters parameters = acParameters(1);
		parameters.type            = core::SelectionType::Parliamentary;
		return parameters;
	}());
	EXPECT_FALSE(result.success);
	EXPECT_NE(result.error.find("PC wise"), std::string::npos);
	EXPECT_TRUE(result.regions.empty());
}

TEST(Batch, MissingNameColumn_FailsBatch) {
	core::RegionLayer regions{};
	core::BoothLayer booths{};
	makeLayers(regions, booths);
	regions.fields = {"ac_no"};

	const BatchResult result = runBatch(regions, booths, acParameters(1));
	EXPECT_FALSE(result.success);
	EXPECT_FALSE(result.error.empty());
}

TEST(Batch, CancelledBeforeStart) {
	core::RegionLayer regions{};
	core::BoothLayer booths{};
	makeLayers(regions, booths);

	const std::atomic<bool> cancel{true};
	const BatchResult result = runBatch(regions, booths, acParameters(2), &cancel);
	EXPECT_TRUE(result.success);
	EXPECT_TRUE(result.cancelled);
	EXPECT_TRUE(result.regions.empty());
	EXPECT_EQ(result.totals.regions, 0u);
}

TEST(Batch, StrictReference_RejectsUnreferencedRegions) {
	core::RegionLayer regions{};
	core::BoothLayer booths{};
	makeLayers(regions, booths);
	booths.reference = {};

	BatchParameters parameters                       = acParameters(1);
	parameters.sampling.containment.strictReference = true;

	const BatchResult result = runBatch(regions, booths, parameters);
	ASSERT_TRUE(result.success);
	ASSERT_EQ(result.regions.size(), 3u);
	for (const auto& region: result.regions) {
		EXPECT_FALSE(region.complete);
		EXPECT_EQ(region.cause, core::Incompleteness::MissingReference);
	}
}

TEST(Batch, FromDataDirectory) {
	sampling::gtest::TempDir dir;
	const auto stateDir = dir.path() / "Test";

	sampling::gtest::writePolygons(stateDir / "Test.assembly.shp", "EPSG:4326", {"ac_no", "ac_name"},
	                               {sampling::gtest::PolygonRecord{sampling::gtest::square(77.0, 28.0, 0.5), {{"ac_no", "101"}, {"ac_name", "North"}}}});

	std::vector<sampling::gtest::PointRecord> points;
	for (const auto& booth: groupedBooths(77.0, 28.0, "")) {
		points.push_back({booth.position.x, booth.position.y, {{"booth", booth.code}}});
	}
	sampling::gtest::writePoints(stateDir / "Test.booth.shp", "EPSG:4326", {"booth"}, points);

	const BatchResult result = runBatch(dir.path(), acParameters(0));
	ASSERT_TRUE(result.success) << result.error;
	ASSERT_EQ(result.regions.size(), 1u);
	EXPECT_EQ(result.regions[0].regionCode, "101");
	EXPECT_EQ(result.regions[0].totalBooths, 60u);
	EXPECT_TRUE(result.regions[0].complete);

	BatchParameters parliamentary = acParameters(0);
	parliamentary.type            = core::SelectionType::Parliamentary;
	const BatchResult missing     = runBatch(dir.path(), parliamentary);
	EXPECT_FALSE(missing.success);
	EXPECT_NE(missing.error.find("Test.parliamentary.shp"), std::string::npos);
}

} // namespace gtest
} // namespace boothsampler::sampling
