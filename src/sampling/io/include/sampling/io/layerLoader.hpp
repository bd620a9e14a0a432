#pragma once

#include "sampling/core/geometry.hpp"
#include "sampling/core/schemaResolver.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// Loads booth and boundary layers from shapefiles (GDAL/OGR).
// Data layout per state:  <dataDir>/<state>/<state>.assembly.shp | <state>.parliamentary.shp | <state>.booth.shp
namespace boothsampler::sampling::io {

//! Sorted names of the state directories in the data directory. Hidden directories are skipped.
std::vector<std::string> availableStates(const std::filesystem::path& dataDir);

//! Path of the boundary layer of a state for the selection type.
std::filesystem::path regionLayerPath(const std::filesystem::path& dataDir, const std::string& state, core::SelectionType type);

//! Path of the booth layer of a state.
std::filesystem::path boothLayerPath(const std::filesystem::path& dataDir, const std::string& state);

/*! Load a polygon layer. Features without polygon geometry are skipped.
 * \return Nullopt if the file is missing or cannot be read.
 */
std::optional<core::RegionLayer> loadRegionLayer(const std::filesystem::path& path);

/*! Load a point layer and derive longitude/latitude (EPSG:4326) for each booth.
 *  Features without point geometry are skipped. Booth codes are resolved from the known aliases.
 * \return Nullopt if the file is missing, cannot be read or the points cannot be transformed to EPSG:4326.
 */
std::optional<core::BoothLayer> loadBoothLayer(const std::filesystem::path& path);

} // namespace boothsampler::sampling::io
