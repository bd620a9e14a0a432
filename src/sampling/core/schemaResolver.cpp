#include "sampling/core/schemaResolver.hpp"

#include <algorithm>
#include <array>

namespace boothsampler::sampling::core {

const AliasList& aliasesFor(const Field field) {
	static const AliasList STATE         = {"state", "STATE", "st_name", "ST_NAME"};
	static const AliasList DISTRICT      = {"district", "DISTRICT", "dist", "DIST"};
	static const AliasList DISTRICT_NAME = {"district_n", "DISTRICT_N", "dist_name", "DIST_NAME"};
	static const AliasList PC_CODE       = {"pc", "PC", "pc_no", "PC_NO"};
	static const AliasList PC_NAME       = {"pc_name", "PC_NAME"};
	static const AliasList AC_CODE       = {"ac", "AC", "ac_no", "AC_NO"};
	static const AliasList AC_NAME       = {"ac_name", "AC_NAME"};
	static const AliasList BOOTH_CODE    = {"booth", "booth_no", "BOOTH_NO", "BOOTH"};
	static const AliasList BOOTH_NAME    = {"booth_name", "BOOTH_NAME", "name", "NAME"};
	static const AliasList REGION_NAME   = {"ac_name", "pc_name", "name", "AC_NAME", "PC_NAME", "NAME"};

	switch (field) {
	case Field::State:
		return STATE;
	case Field::District:
		return DISTRICT;
	case Field::DistrictName:
		return DISTRICT_NAME;
	case Field::PcCode:
		return PC_CODE;
	case Field::PcName:
		return PC_NAME;
	case Field::AcCode:
		return AC_CODE;
	case Field::AcName:
		return AC_NAME;
	case Field::BoothCode:
		return BOOTH_CODE;
	case Field::BoothName:
		return BOOTH_NAME;
	case Field::RegionName:
		return REGION_NAME;
	}
	return REGION_NAME;
}

const AliasList& regionCodeAliases(const SelectionType type) {
	static const AliasList ASSEMBLY      = {"ac_no", "ac", "AC_NO", "AC"};
	static const AliasList PARLIAMENTARY = {"pc_no", "pc", "PC_NO", "PC"};
	return type == SelectionType::Assembly ? ASSEMBLY : PARLIAMENTARY;
}

std::optional<std::string> resolveField(const std::vector<std::string>& fields, const AliasList& aliases) {
	// Iterate the aliases, not the fields, so the layer's column order has no influence.
	for (const auto alias: aliases) {
		if (std::find(fields.begin(), fields.end(), alias) != fields.end()) {
			return std::string(alias);
		}
	}
	return std::nullopt;
}

std::string attributeValue(const Attributes& attributes, const Field field) {
	for (const auto alias: aliasesFor(field)) {
		const auto it = attributes.find(std::string(alias));
		if (it != attributes.end()) {
			return it->second;
		}
	}
	return {};
}

std::string_view selectionTypeLabel(const SelectionType type) {
	return type == SelectionType::Assembly ? "AC wise" : "PC wise";
}

std::optional<SelectionType> parseSelectionType(const std::string_view text) {
	static constexpr std::array<std::string_view, 5> ASSEMBLY      = {"AC", "ac", "AC wise", "assembly", "Assembly"};
	static constexpr std::array<std::string_view, 5> PARLIAMENTARY = {"PC", "pc", "PC wise", "parliamentary", "Parliamentary"};

	if (std::find(ASSEMBLY.begin(), ASSEMBLY.end(), text) != ASSEMBLY.end()) {
		return SelectionType::Assembly;
	}
	if (std::find(PARLIAMENTARY.begin(), PARLIAMENTARY.end(), text) != PARLIAMENTARY.end()) {
		return SelectionType::Parliamentary;
	}
	return std::nullopt;
}

} // namespace boothsampler::sampling::core
