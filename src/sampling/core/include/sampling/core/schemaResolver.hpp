#pragma once

#include "sampling/core/geometry.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Booth and boundary shapefiles come from different sources and name the same column differently (`booth`, `BOOTH_NO`, ...).
// Every semantic field has a fixed list of known aliases, most preferred first. The first alias present in a layer wins.
namespace boothsampler::sampling::core {

//! Semantic attribute fields read from the layers.
enum class Field { State, District, DistrictName, PcCode, PcName, AcCode, AcName, BoothCode, BoothName, RegionName };

//! Kind of region processed in a run.
enum class SelectionType { Assembly, Parliamentary };

using AliasList = std::vector<std::string_view>;

//! Ordered aliases for a semantic field.
const AliasList& aliasesFor(Field field);

//! Ordered aliases of the region code column in the boundary layer of the given type.
const AliasList& regionCodeAliases(SelectionType type);

/*! Find the column matching one of the aliases.
 * \param [in] fields  Column names of the layer (any order).
 * \param [in] aliases Candidate names, most preferred first.
 * \return     First alias contained in `fields`. Nullopt if none matches.
 */
std::optional<std::string> resolveField(const std::vector<std::string>& fields, const AliasList& aliases);

//! Value of a semantic field in a record. Empty if no alias is present.
std::string attributeValue(const Attributes& attributes, Field field);

//! Human readable name of the selection type ("AC wise", "PC wise").
std::string_view selectionTypeLabel(SelectionType type);

//! Parse "AC"/"assembly"/"AC wise" or "PC"/"parliamentary"/"PC wise" (case sensitive variants listed in the source).
std::optional<SelectionType> parseSelectionType(std::string_view text);

} // namespace boothsampler::sampling::core
