#include "sampling/batch.hpp"

#include "sampling/core/containment.hpp"
#include "sampling/core/debug.hpp"
#include "sampling/io/layerLoader.hpp"

#include <algorithm>
#include <iostream>
#include <thread>
#include <utility>

namespace boothsampler::sampling {

namespace {

static BatchResult failure(std::string message) {
	std::cerr << "[batch] " << message << '\n';
	BatchResult result{};
	result.success = false;
	result.error   = std::move(message);
	return result;
}

static unsigned workerCount(const unsigned requested, const std::size_t regions) {
	unsigned workers = requested != 0u ? requested : std::thread::hardware_concurrency();
	workers          = std::max(1u, workers);
	return static_cast<unsigned>(std::min<std::size_t>(workers, std::max<std::size_t>(1, regions)));
}

} // namespace

std::vector<core::Region> listRegions(const core::RegionLayer& layer, const core::SelectionType type) {
	const auto codeField = core::resolveField(layer.fields, core::regionCodeAliases(type));
	const auto nameField = core::resolveField(layer.fields, core::aliasesFor(core::Field::RegionName));
	if (!codeField || !nameField) {
		return {};
	}

	std::vector<core::Region> regions;
	regions.reserve(layer.features.size());
	for (std::size_t i = 0; i < layer.features.size(); ++i) {
		const auto& attributes = layer.features[i].attributes;
		const auto code        = attributes.find(*codeField);
		const auto name        = attributes.find(*nameField);
		regions.push_back({code != attributes.end() ? code->second : "", name != attributes.end() ? name->second : "", i});
	}

	std::stable_sort(regions.begin(), regions.end(), [](const core::Region& left, const core::Region& right) { return left.code < right.code; });
	return regions;
}

BatchTotals computeTotals(const std::vector<core::SelectionResult>& regions) {
	BatchTotals totals{};
	totals.regions = regions.size();
	for (const auto& region: regions) {
		totals.withBooths += region.totalBooths > 0 ? 1u : 0u;
		totals.completed += region.complete ? 1u : 0u;
		totals.totalBooths += region.totalBooths;
		totals.totalSelected += region.selectedBooths.size();
	}
	return totals;
}

BatchResult runBatch(const core::RegionLayer& regions, const core::BoothLayer& booths, const BatchParameters& parameters, const std::atomic<bool>* cancel) {
	const auto codeField = core::resolveField(regions.fields, core::regionCodeAliases(parameters.type));
	if (!codeField) {
		return failure("Could not determine the " + std::string(core::selectionTypeLabel(parameters.type)) + " code column in the boundary layer");
	}

	const std::vector<core::Region> regionList = listRegions(regions, parameters.type);
	if (regionList.empty()) {
		return failure("Could not parse the region list of " + parameters.state);
	}

	// Booths are brought into the boundary reference once. Each region only reads the aligned positions.
	const core::AlignedBooths aligned = core::alignBooths(booths, regions.reference);

	std::vector<core::SelectionResult> results(regionList.size());
	std::vector<char> done(regionList.size(), 0);
	std::atomic<std::size_t> next{0};

	const auto worker = [&]() {
		for (;;) {
			if (cancel != nullptr && cancel->load()) {
				return;
			}
			const std::size_t index = next.fetch_add(1);
			if (index >= regionList.size()) {
				return;
			}

			const core::Region& region = regionList[index];
			core::ContainmentResult containment =
			        core::validateBooths(aligned, regions.features[region.featureIndex].boundary, parameters.sampling.containment);

			results[index] = core::sampleRegion(region, std::move(containment), parameters.samplesPerRegion, parameters.sampling);
			done[index]    = 1;
		}
	};

	const unsigned workers = workerCount(parameters.workers, regionList.size());
	if (workers == 1u) {
		worker();
	} else {
		std::vector<std::thread> threads;
		threads.reserve(workers);
		for (unsigned i = 0; i < workers; ++i) {
			threads.emplace_back(worker);
		}
		for (auto& thread: threads) {
			thread.join();
		}
	}

	BatchResult batch{};
	batch.success   = true;
	batch.cancelled = cancel != nullptr && cancel->load() && std::find(done.begin(), done.end(), 0) != done.end();
	batch.regions.reserve(results.size());
	for (std::size_t i = 0; i < results.size(); ++i) {
		if (done[i] != 0) {
			batch.regions.push_back(std::move(results[i]));
		}
	}
	std::stable_sort(batch.regions.begin(), batch.regions.end(),
	                 [](const core::SelectionResult& left, const core::SelectionResult& right) { return left.regionCode < right.regionCode; });
	batch.totals = computeTotals(batch.regions);

	std::cout << "[batch] " << parameters.state << " " << core::selectionTypeLabel(parameters.type) << ": processed " << batch.totals.regions << "/"
	          << regionList.size() << " regions, completed " << batch.totals.completed << ", selected " << batch.totals.totalSelected << " of "
	          << batch.totals.totalBooths << " booths" << (batch.cancelled ? " (cancelled)" : "") << '\n';
	return batch;
}

BatchResult runBatch(const std::filesystem::path& dataDir, const BatchParameters& parameters, const std::atomic<bool>* cancel) {
	if (parameters.state.empty()) {
		return failure("No state given");
	}

	const auto regionPath = io::regionLayerPath(dataDir, parameters.state, parameters.type);
	const auto boothPath  = io::boothLayerPath(dataDir, parameters.state);

	const auto regions = io::loadRegionLayer(regionPath);
	if (!regions) {
		return failure("Could not load boundary layer for " + parameters.state + ": " + regionPath.string());
	}
	const auto booths = io::loadBoothLayer(boothPath);
	if (!booths) {
		return failure("Could not load booth layer for " + parameters.state + ": " + boothPath.string());
	}

	if (core::debugEnabled()) {
		std::cout << "[batch] regions=" << regions->features.size() << " booths=" << booths->booths.size() << '\n';
	}
	return runBatch(*regions, *booths, parameters, cancel);
}

} // namespace boothsampler::sampling
