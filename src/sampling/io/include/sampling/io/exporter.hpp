#pragma once

#include "sampling/core/regionSampler.hpp"
#include "sampling/core/schemaResolver.hpp"

#include <filesystem>
#include <string>
#include <vector>

// Tabular output of a run: one summary row per region and one record per selected booth.
namespace boothsampler::sampling::io {

using Row = std::vector<std::string>;

struct Table {
	Row header;
	std::vector<Row> rows{};
};

/*! One row per region: code, name, total booths, selected booths, status, reason, samples requested, reference handling.
 *  The reference column flags regions tested in raw coordinates ("unreferenced") or with reprojected booths.
 *  Column names follow the selection type ("AC"/"AC_Name" or "PC"/"PC_Name").
 */
Table summaryTable(const std::vector<core::SelectionResult>& results, core::SelectionType type, int samplesRequested);

/*! One row per selected booth: state, district, district name, PC, PC name, AC, AC name, booth, booth name, cluster, latitude, longitude.
 *  The state column falls back to `state` when the booth layer has no state attribute.
 */
Table selectedBoothTable(const std::vector<core::SelectionResult>& results, const std::string& state);

//! Serialise as CSV (comma separated, fields quoted when they contain a comma, quote or line break).
std::string toCsv(const Table& table);

//! Write a table as CSV. False if the file cannot be written.
bool writeCsv(const std::filesystem::path& path, const Table& table);

} // namespace boothsampler::sampling::io
