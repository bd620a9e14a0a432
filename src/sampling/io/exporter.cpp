#include "sampling/io/exporter.hpp"

#include <format>
#include <fstream>
#include <iostream>

namespace boothsampler::sampling::io {

namespace {

static std::string escapeCsv(const std::string& value) {
	if (value.find_first_of(",\"\r\n") == std::string::npos) {
		return value;
	}

	std::string out;
	out.reserve(value.size() + 2);
	out.push_back('"');
	for (const char c: value) {
		if (c == '"') {
			out.push_back('"');
		}
		out.push_back(c);
	}
	out.push_back('"');
	return out;
}

static void appendRow(std::string& out, const Row& row) {
	for (std::size_t i = 0; i < row.size(); ++i) {
		if (i > 0) {
			out.push_back(',');
		}
		out += escapeCsv(row[i]);
	}
	out.push_back('\n');
}

} // namespace

Table summaryTable(const std::vector<core::SelectionResult>& results, const core::SelectionType type, const int samplesRequested) {
	const bool assembly = type == core::SelectionType::Assembly;

	Table table{};
	table.header = {assembly ? "AC" : "PC", assembly ? "AC_Name" : "PC_Name", "Total_Booths", "Selected_Booths", "Status", "Reason", "Samples_Requested", "Reference"};
	table.rows.reserve(results.size());

	for (const auto& result: results) {
		table.rows.push_back({
		        result.regionCode,
		        result.regionName,
		        std::to_string(result.totalBooths),
		        std::to_string(result.selectedBooths.size()),
		        result.complete ? "Completed" : "Not completed",
		        result.reason,
		        std::to_string(samplesRequested),
		        std::string(core::referenceLabel(result.reference)),
		});
	}
	return table;
}

Table selectedBoothTable(const std::vector<core::SelectionResult>& results, const std::string& state) {
	using core::Field;

	Table table{};
	table.header = {"state", "district", "district_n", "pc", "pc_name", "ac", "ac_name", "booth", "booth_name", "cluster", "latitude", "longitude"};

	for (const auto& result: results) {
		for (const auto& selected: result.selectedBooths) {
			const core::Attributes& a = selected.booth.attributes;
			std::string boothState    = core::attributeValue(a, Field::State);
			if (boothState.empty()) {
				boothState = state;
			}

			table.rows.push_back({
			        boothState,
			        core::attributeValue(a, Field::District),
			        core::attributeValue(a, Field::DistrictName),
			        core::attributeValue(a, Field::PcCode),
			        core::attributeValue(a, Field::PcName),
			        core::attributeValue(a, Field::AcCode),
			        core::attributeValue(a, Field::AcName),
			        selected.booth.code,
			        core::attributeValue(a, Field::BoothName),
			        std::to_string(selected.cluster),
			        std::format("{:.6f}", selected.booth.geographic.y),
			        std::format("{:.6f}", selected.booth.geographic.x),
			});
		}
	}
	return table;
}

std::string toCsv(const Table& table) {
	std::string out;
	appendRow(out, table.header);
	for (const auto& row: table.rows) {
		appendRow(out, row);
	}
	return out;
}

bool writeCsv(const std::filesystem::path& path, const Table& table) {
	std::ofstream file(path, std::ios::binary | std::ios::trunc);
	if (!file) {
		std::cerr << "[io] Cannot write " << path.string() << '\n';
		return false;
	}

	file << toCsv(table);
	if (!file) {
		std::cerr << "[io] Failed while writing " << path.string() << '\n';
		return false;
	}
	return true;
}

} // namespace boothsampler::sampling::io
