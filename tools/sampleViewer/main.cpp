#include <charconv>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>

#include <QApplication>

#include "mainWindow.hpp"
#include "sampling/batch.hpp"

// Runs one batch and shows the cluster plots: the overview of all regions and each region on its own.
int main(int argc, char** argv) {
	QApplication application(argc, argv);

	if (argc < 4) {
		std::cerr << "Usage: " << argv[0] << " <dataDir> <state> <AC|PC> [samples]\n";
		return 2;
	}

	namespace sampling = boothsampler::sampling;

	sampling::BatchParameters parameters{};
	parameters.state = argv[2];
	if (const auto type = sampling::core::parseSelectionType(argv[3])) {
		parameters.type = *type;
	} else {
		std::cerr << "[Error] Unknown selection type: " << argv[3] << '\n';
		return 2;
	}
	if (argc > 4) {
		const std::string_view text(argv[4]);
		int samples          = 0;
		const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), samples);
		if (ec != std::errc{} || end != text.data() + text.size() || samples < 1) {
			std::cerr << "[Error] Invalid sample count: " << text << '\n';
			return 2;
		}
		parameters.samplesPerRegion = samples;
	}

	const sampling::BatchResult batch = sampling::runBatch(std::filesystem::path(argv[1]), parameters);
	if (!batch.success) {
		std::cerr << "[Error] " << batch.error << '\n';
		return 1;
	}

	boothsampler::MainWindow window;
	window.resize(1400, 900);
	window.setRun(batch, parameters.state + " " + std::string(sampling::core::selectionTypeLabel(parameters.type)));
	window.show();

	return application.exec();
}
