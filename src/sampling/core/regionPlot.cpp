#include "sampling/core/regionPlot.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace boothsampler::sampling::core {

namespace {

static const cv::Scalar BG(20, 20, 20);
static const cv::Scalar HEADER_BG(0, 0, 0);
static const cv::Scalar HEADER_FG(255, 255, 255);
static const cv::Scalar CENTER_COLOUR(255, 255, 255);

//! Distinct colour per cluster id (golden angle walk through hue).
static cv::Scalar clusterColour(const int cluster) {
	const int hue = static_cast<int>(std::lround(std::fmod(static_cast<double>(cluster) * 137.508, 360.0) / 2.0)); // OpenCV hue range 0..179
	cv::Mat hsv(1, 1, CV_8UC3, cv::Scalar(hue, 200, 235));
	cv::Mat bgr;
	cv::cvtColor(hsv, bgr, cv::COLOR_HSV2BGR);
	const cv::Vec3b c = bgr.at<cv::Vec3b>(0, 0);
	return {static_cast<double>(c[0]), static_cast<double>(c[1]), static_cast<double>(c[2])};
}

static cv::Mat labelTile(const cv::Mat& tile, const std::string& text, const int barHeight) {
	cv::Mat out = tile.clone();
	cv::rectangle(out, cv::Rect(0, 0, out.cols, barHeight), HEADER_BG, cv::FILLED);
	cv::putText(out, text, cv::Point(8, barHeight - 10), cv::FONT_HERSHEY_SIMPLEX, 0.6, HEADER_FG, 1, cv::LINE_AA);
	return out;
}

//! Maps lon/lat to pixels keeping the aspect ratio. Latitude grows upwards.
struct Projection {
	double minX{0.0};
	double maxY{0.0};
	double scale{1.0};
	cv::Point2d offset{};

	cv::Point operator()(const cv::Point2d& p) const {
		return {static_cast<int>(std::lround(offset.x + (p.x - minX) * scale)), static_cast<int>(std::lround(offset.y + (maxY - p.y) * scale))};
	}
};

static Projection fitProjection(const std::vector<ClusteredBooth>& booths, const PlotConfig& config) {
	double minX = std::numeric_limits<double>::infinity();
	double minY = std::numeric_limits<double>::infinity();
	double maxX = -std::numeric_limits<double>::infinity();
	double maxY = -std::numeric_limits<double>::infinity();
	for (const auto& b: booths) {
		minX = std::min(minX, b.booth.geographic.x);
		minY = std::min(minY, b.booth.geographic.y);
		maxX = std::max(maxX, b.booth.geographic.x);
		maxY = std::max(maxY, b.booth.geographic.y);
	}

	const double avail  = static_cast<double>(std::max(1, config.size - 2 * config.margin));
	const double availH = static_cast<double>(std::max(1, config.size - config.headerHeight - 2 * config.margin));
	const double spanX  = std::max(maxX - minX, 1e-9);
	const double spanY  = std::max(maxY - minY, 1e-9);

	Projection p{};
	p.minX     = minX;
	p.maxY     = maxY;
	p.scale    = std::min(avail / spanX, availH / spanY);
	p.offset.x = config.margin + (avail - spanX * p.scale) / 2.0;
	p.offset.y = config.headerHeight + config.margin + (availH - spanY * p.scale) / 2.0;
	return p;
}

} // namespace

cv::Mat renderRegionPlot(const SelectionResult& result, const PlotConfig& config) {
	cv::Mat plot(config.size, config.size, CV_8UC3, BG);

	std::string title = result.regionCode + " " + result.regionName + " (" + std::to_string(result.selectedBooths.size()) + "/" +
	                    std::to_string(result.targetBooths) + ")";
	if (result.clusteredBooths.empty()) {
		cv::putText(plot, result.reason, cv::Point(config.margin, config.size / 2), cv::FONT_HERSHEY_SIMPLEX, 0.6, HEADER_FG, 1, cv::LINE_AA);
		return labelTile(plot, title, config.headerHeight);
	}

	const Projection project = fitProjection(result.clusteredBooths, config);

	for (const auto& b: result.clusteredBooths) {
		cv::circle(plot, project(b.booth.geographic), config.boothRadius, clusterColour(b.cluster), cv::FILLED, cv::LINE_AA);
	}
	for (const auto& b: result.selectedBooths) {
		cv::circle(plot, project(b.booth.geographic), config.selectedRadius, clusterColour(b.cluster), 2, cv::LINE_AA);
	}
	for (const auto& center: result.clusterCenters) {
		cv::drawMarker(plot, project(center), CENTER_COLOUR, cv::MARKER_CROSS, 2 * config.selectedRadius, 1, cv::LINE_AA);
	}

	return labelTile(plot, title, config.headerHeight);
}

RegionPlotter::RegionPlotter(PlotConfig config) : m_config(config) {
}

void RegionPlotter::add(const SelectionResult& result) {
	m_plots.push_back(renderRegionPlot(result, m_config));
	m_codes.push_back(result.regionCode);
}

void RegionPlotter::clear() {
	m_plots.clear();
	m_codes.clear();
}

cv::Mat RegionPlotter::buildMosaic() const {
	if (m_plots.empty()) {
		return {};
	}

	const int tile  = std::max(1, m_config.size);
	const int count = static_cast<int>(m_plots.size());
	const int cols  = std::clamp(m_config.maxMosaicWidth / tile, 1, count);
	const int rows  = (count + cols - 1) / cols;

	cv::Mat mosaic(rows * tile, cols * tile, CV_8UC3, BG);
	for (int i = 0; i < count; ++i) {
		const cv::Mat& plot = m_plots[static_cast<std::size_t>(i)];
		if (plot.empty()) {
			continue;
		}

		cv::Mat cell = mosaic(cv::Rect((i % cols) * tile, (i / cols) * tile, tile, tile));
		if (plot.cols == tile && plot.rows == tile) {
			plot.copyTo(cell);
		} else {
			cv::Mat resized;
			cv::resize(plot, resized, cv::Size(tile, tile), 0.0, 0.0, cv::INTER_AREA);
			resized.copyTo(cell);
		}
	}
	return mosaic;
}

} // namespace boothsampler::sampling::core
