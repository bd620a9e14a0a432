#include <charconv>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <opencv2/imgcodecs.hpp>

#include "sampling/batch.hpp"
#include "sampling/core/regionPlot.hpp"
#include "sampling/io/exporter.hpp"
#include "sampling/io/layerLoader.hpp"

namespace boothsampler {

//! Command line options of one run.
struct Options {
	std::filesystem::path dataDir;
	std::filesystem::path outDir{"output"};
	sampling::BatchParameters parameters{};
	bool plots{false};
	bool listStates{false};
};

static void printUsage(const char* program) {
	std::cerr << "Usage: " << program << " <dataDir> <state> <AC|PC> [options]\n"
	          << "       " << program << " <dataDir> --list-states\n"
	          << "Options:\n"
	          << "  --samples N   Samples per region (default 300). 25 samples = 1 cluster, 2 booths per cluster.\n"
	          << "  --out DIR     Output directory (default ./output).\n"
	          << "  --plots       Write a PNG cluster plot per region and an overview mosaic.\n"
	          << "  --workers N   Worker threads (default: hardware concurrency).\n"
	          << "  --seed N      Clustering seed (default 42).\n"
	          << "  --strict      Reject regions whose layers lack a coordinate reference.\n";
}

template <typename T>
static std::optional<T> parseNumber(const std::string_view text) {
	T value{};
	const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
	if (ec != std::errc{} || end != text.data() + text.size()) {
		return std::nullopt;
	}
	return value;
}

static std::optional<Options> parseOptions(const int argc, char** argv) {
	if (argc < 3) {
		return std::nullopt;
	}

	Options options{};
	options.dataDir = argv[1];
	if (std::string_view(argv[2]) == "--list-states") {
		options.listStates = true;
		return options;
	}
	if (argc < 4) {
		return std::nullopt;
	}

	options.parameters.state = argv[2];
	const auto type          = sampling::core::parseSelectionType(argv[3]);
	if (!type) {
		std::cerr << "[Error] Unknown selection type: " << argv[3] << '\n';
		return std::nullopt;
	}
	options.parameters.type = *type;

	for (int i = 4; i < argc; ++i) {
		const std::string_view arg = argv[i];
		const bool hasValue        = i + 1 < argc;

		if (arg == "--plots") {
			options.plots = true;
		} else if (arg == "--strict") {
			options.parameters.sampling.containment.strictReference = true;
		} else if (arg == "--out" && hasValue) {
			options.outDir = argv[++i];
		} else if (arg == "--samples" && hasValue) {
			const auto samples = parseNumber<int>(argv[++i]);
			if (!samples || *samples < 1) {
				std::cerr << "[Error] --samples expects a positive integer\n";
				return std::nullopt;
			}
			options.parameters.samplesPerRegion = *samples;
		} else if (arg == "--workers" && hasValue) {
			const auto workers = parseNumber<unsigned>(argv[++i]);
			if (!workers) {
				std::cerr << "[Error] --workers expects a non-negative integer\n";
				return std::nullopt;
			}
			options.parameters.workers = *workers;
		} else if (arg == "--seed" && hasValue) {
			const auto seed = parseNumber<std::uint64_t>(argv[++i]);
			if (!seed) {
				std::cerr << "[Error] --seed expects a non-negative integer\n";
				return std::nullopt;
			}
			options.parameters.sampling.clustering.seed = *seed;
		} else {
			std::cerr << "[Error] Unknown or incomplete option: " << arg << '\n';
			return std::nullopt;
		}
	}
	return options;
}

//! File name safe variant of a region name.
static std::string safeName(std::string name) {
	for (char& c: name) {
		if (c == ' ' || c == '/' || c == '\\') {
			c = '_';
		}
	}
	return name;
}

static bool writePlots(const std::vector<sampling::core::SelectionResult>& results, const std::filesystem::path& dir) {
	std::error_code ec;
	std::filesystem::create_directories(dir, ec);
	if (ec) {
		std::cerr << "[Error] Cannot create " << dir.string() << ": " << ec.message() << '\n';
		return false;
	}

	sampling::core::RegionPlotter plotter;
	bool ok = true;
	for (const auto& result: results) {
		if (result.selectedBooths.empty()) {
			continue;
		}
		plotter.add(result);
		const auto file = dir / (result.regionCode + "_" + safeName(result.regionName) + "_plot.png");
		if (!cv::imwrite(file.string(), plotter.plots().back())) {
			std::cerr << "[Error] Failed to write " << file.string() << '\n';
			ok = false;
		}
	}

	const cv::Mat overview = plotter.buildMosaic();
	if (!overview.empty() && !cv::imwrite((dir / "overview.png").string(), overview)) {
		std::cerr << "[Error] Failed to write overview plot\n";
		ok = false;
	}
	return ok;
}

static int run(const Options& options) {
	if (options.listStates) {
		for (const auto& state: sampling::io::availableStates(options.dataDir)) {
			std::cout << state << '\n';
		}
		return 0;
	}

	const sampling::BatchResult batch = sampling::runBatch(options.dataDir, options.parameters);
	if (!batch.success) {
		std::cerr << "[Error] " << batch.error << '\n';
		return 1;
	}

	std::error_code ec;
	std::filesystem::create_directories(options.outDir, ec);
	if (ec) {
		std::cerr << "[Error] Cannot create " << options.outDir.string() << ": " << ec.message() << '\n';
		return 1;
	}

	const auto& p = options.parameters;
	bool ok       = sampling::io::writeCsv(options.outDir / "summary.csv", sampling::io::summaryTable(batch.regions, p.type, p.samplesPerRegion));
	ok            = sampling::io::writeCsv(options.outDir / "selected_booths.csv", sampling::io::selectedBoothTable(batch.regions, p.state)) && ok;
	if (options.plots) {
		ok = writePlots(batch.regions, options.outDir / "plots") && ok;
	}

	const int clusters = sampling::core::clustersForSamples(p.samplesPerRegion);
	const int target   = sampling::core::targetSelection(p.samplesPerRegion, static_cast<int>(p.sampling.selection.perCluster));
	std::cout << "Clusters per region: " << clusters << ", booths per region: " << target << '\n'
	          << "Regions with booths: " << batch.totals.withBooths << "/" << batch.totals.regions << '\n'
	          << "Completed:           " << batch.totals.completed << "/" << batch.totals.regions << '\n'
	          << "Valid booths:        " << batch.totals.totalBooths << '\n'
	          << "Selected booths:     " << batch.totals.totalSelected << '\n';
	return ok ? 0 : 1;
}

} // namespace boothsampler

int main(int argc, char** argv) {
	const auto options = boothsampler::parseOptions(argc, argv);
	if (!options) {
		boothsampler::printUsage(argv[0]);
		return 2;
	}
	return boothsampler::run(*options);
}
