#include "sampling/io/exporter.hpp"
#include "testLayers.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <sstream>

namespace boothsampler::sampling::io {
namespace gtest {

static core::SelectionResult completedRegion() {
	core::SelectionResult result{};
	result.regionCode        = "12";
	result.regionName        = "Central, North";
	result.totalBooths       = 60;
	result.requestedClusters = 1;
	result.clusterCount      = 1;
	result.complete          = true;

	core::Booth booth{};
	booth.code       = "45";
	booth.geographic = {77.2090001, 28.6139004};
	booth.attributes = {{"district", "3"}, {"ac", "12"}, {"ac_name", "Central, North"}, {"booth_name", "Primary \"A\" School"}};
	result.selectedBooths.push_back({booth, 0});

	booth.code       = "46";
	booth.attributes = {{"state", "Goa"}, {"booth", "46"}};
	result.selectedBooths.push_back({booth, 0});
	return result;
}

static core::SelectionResult emptyRegion() {
	core::SelectionResult result{};
	result.regionCode        = "13";
	result.regionName        = "East";
	result.requestedClusters = 1;
	result.cause             = core::Incompleteness::NoBoothsInBoundary;
	result.reason            = std::string(core::reasonText(result.cause));
	return result;
}

TEST(Exporter, SummaryColumnsFollowSelectionType) {
	const Table ac = summaryTable({completedRegion()}, core::SelectionType::Assembly, 50);
	EXPECT_EQ(ac.header, (Row{"AC", "AC_Name", "Total_Booths", "Selected_Booths", "Status", "Reason", "Samples_Requested", "Reference"}));

	const Table pc = summaryTable({completedRegion()}, core::SelectionType::Parliamentary, 50);
	EXPECT_EQ(pc.header[0], "PC");
	EXPECT_EQ(pc.header[1], "PC_Name");
}

TEST(Exporter, SummaryRows) {
	const Table table = summaryTable({completedRegion(), emptyRegion()}, core::SelectionType::Assembly, 50);
	ASSERT_EQ(table.rows.size(), 2u);
	EXPECT_EQ(table.rows[0], (Row{"12", "Central, North", "60", "2", "Completed", "", "50", "aligned"}));
	EXPECT_EQ(table.rows[1], (Row{"13", "East", "0", "0", "Not completed", "no booths found within boundary", "50", "aligned"}));
}

TEST(Exporter, SummaryFlagsRegionsWithoutReference) {
	core::SelectionResult raw         = completedRegion();
	core::SelectionResult reprojected = completedRegion();
	raw.reference                     = core::ReferenceStatus::Unreferenced;
	reprojected.reference             = core::ReferenceStatus::Reprojected;

	const Table table = summaryTable({raw, reprojected}, core::SelectionType::Assembly, 50);
	ASSERT_EQ(table.rows.size(), 2u);
	EXPECT_EQ(table.rows[0][4], "Completed");
	EXPECT_EQ(table.rows[0].back(), "unreferenced");
	EXPECT_EQ(table.rows[1].back(), "reprojected");
	EXPECT_NE(toCsv(table).find(",unreferenced\n"), std::string::npos);
}

TEST(Exporter, SelectedBooths_StateFallsBackToRunState) {
	const Table table = selectedBoothTable({completedRegion(), emptyRegion()}, "Delhi");
	ASSERT_EQ(table.rows.size(), 2u);
	EXPECT_EQ(table.header.size(), 12u);

	const Row& first = table.rows[0];
	EXPECT_EQ(first[0], "Delhi");
	EXPECT_EQ(first[1], "3");
	EXPECT_EQ(first[5], "12");
	EXPECT_EQ(first[7], "45");
	EXPECT_EQ(first[9], "0");
	EXPECT_EQ(first[10], "28.613900");
	EXPECT_EQ(first[11], "77.209000");

	EXPECT_EQ(table.rows[1][0], "Goa");
	EXPECT_EQ(table.rows[1][3], ""); // no pc attribute
}

TEST(Exporter, CsvQuoting) {
	Table table{};
	table.header = {"a", "b"};
	table.rows   = {{"plain", "with, comma"}, {"say \"hi\"", "line\nbreak"}};

	EXPECT_EQ(toCsv(table), "a,b\nplain,\"with, comma\"\n\"say \"\"hi\"\"\",\"line\nbreak\"\n");
}

TEST(Exporter, WriteCsv) {
	sampling::gtest::TempDir dir;
	const auto path = dir.path() / "summary.csv";
	const Table table = summaryTable({emptyRegion()}, core::SelectionType::Parliamentary, 300);
	ASSERT_TRUE(writeCsv(path, table));

	std::ifstream file(path, std::ios::binary);
	std::stringstream content;
	content << file.rdbuf();
	EXPECT_EQ(content.str(), toCsv(table));

	EXPECT_FALSE(writeCsv(dir.path() / "missing" / "summary.csv", table));
}

} // namespace gtest
} // namespace boothsampler::sampling::io
