#pragma once

#include "sampling/core/geometry.hpp"
#include "sampling/core/regionSampler.hpp"
#include "sampling/core/schemaResolver.hpp"

#include <atomic>
#include <filesystem>
#include <string>
#include <vector>

namespace boothsampler::sampling {

//! Parameters of one run. They apply uniformly to every region processed in the run.
struct BatchParameters {
	std::string state;
	core::SelectionType type{core::SelectionType::Assembly};
	int samplesPerRegion{300};
	unsigned workers{0}; //!< Worker threads. 0 -> hardware concurrency.
	core::SamplingConfig sampling{};
};

struct BatchTotals {
	std::size_t regions{0};       //!< Regions processed.
	std::size_t withBooths{0};    //!< Regions with at least one valid booth.
	std::size_t completed{0};     //!< Regions that reached their target.
	std::size_t totalBooths{0};   //!< Valid booths over all regions.
	std::size_t totalSelected{0}; //!< Selected booths over all regions.
};

//! Outcome of a run. Per-region problems are part of the region results, only batch level failures clear `success`.
struct BatchResult {
	bool success{false};
	std::string error{};                         //!< Description of the batch level failure.
	bool cancelled{false};                       //!< The caller stopped the run. `regions` holds what was finished.
	std::vector<core::SelectionResult> regions{}; //!< Sorted by region code.
	BatchTotals totals{};
};

/*! Regions listed in a boundary layer, sorted by code (string order).
 *  Empty if the code or name column cannot be resolved.
 */
std::vector<core::Region> listRegions(const core::RegionLayer& layer, core::SelectionType type);

//! Aggregate counts over region results.
BatchTotals computeTotals(const std::vector<core::SelectionResult>& regions);

/*! Process every region of an already loaded boundary layer.
 *  Regions are independent and handed to worker threads one at a time. Once `cancel` is set no further region is started.
 * \param [in] regions    Boundary layer.
 * \param [in] booths     Booth layer of the same state.
 * \param [in] parameters Run parameters.
 * \param [in] cancel     Optional stop flag owned by the caller.
 */
BatchResult runBatch(const core::RegionLayer& regions, const core::BoothLayer& booths, const BatchParameters& parameters,
                     const std::atomic<bool>* cancel = nullptr);

//! Load the state's layers from `dataDir` and process them. Missing or unreadable layers fail the batch.
BatchResult runBatch(const std::filesystem::path& dataDir, const BatchParameters& parameters, const std::atomic<bool>* cancel = nullptr);

} // namespace boothsampler::sampling
