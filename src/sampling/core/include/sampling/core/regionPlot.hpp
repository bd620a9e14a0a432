#pragma once

#include "sampling/core/regionSampler.hpp"

#include <opencv2/core/mat.hpp>

#include <string>
#include <vector>

// Static preview of a region's clustering: every booth coloured by cluster, selected booths ringed, centroids crossed.
namespace boothsampler::sampling::core {

struct PlotConfig {
	int size{720};          //!< Width and height of a region plot in pixels.
	int margin{36};         //!< Empty border around the booths.
	int boothRadius{3};     //!< Radius of a booth dot.
	int selectedRadius{8};  //!< Radius of the ring marking a selected booth.
	int headerHeight{34};   //!< Height of the title bar.
	int maxMosaicWidth{2400};
};

//! Render one region. Returns a title-only tile for regions without booths.
cv::Mat renderRegionPlot(const SelectionResult& result, const PlotConfig& config = PlotConfig{});

//! Collects region plots of one run and lays them out as a single overview image.
class RegionPlotter {
public:
	explicit RegionPlotter(PlotConfig config = PlotConfig{});

	void add(const SelectionResult& result); //!< Render and keep the plot of a region.
	void clear();

	const std::vector<cv::Mat>& plots() const { return m_plots; }
	const std::vector<std::string>& codes() const { return m_codes; }

	cv::Mat buildMosaic() const; //!< Grid of all plots in insertion order. Empty if nothing was added.

private:
	PlotConfig m_config;
	std::vector<cv::Mat> m_plots{};
	std::vector<std::string> m_codes{};
};

} // namespace boothsampler::sampling::core
