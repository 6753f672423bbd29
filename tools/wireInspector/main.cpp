#include <filesystem>
#include <iostream>

#include <QApplication>

#include "analyser.hpp"
#include "mainWindow.hpp"

#include "detection/documentAnalysis.hpp"
#include "detection/fileStorageDocument.hpp"

// Wire Inspector
// Loads a page description document (YAML / JSON, see FileStorageDocument), prints the document statistics and shows the
// debug mosaic of the selected page and pipeline stage:
//   Extraction     -> segments in their stroke colors.
//   Classification -> one color per line type, then the wires only.
//   Tracing        -> every traced route in its own color, junctions circled.
// Set WIRESCAN_DEBUG=1 for per page diagnostics on the console.
int main(int argc, char** argv) {
	QApplication application(argc, argv);

	// If a path is passed here then use this document. Else use the sample schematic.
	const std::filesystem::path inputPath = argc > 1 ? std::filesystem::path(argv[1]) : std::filesystem::path(PATH_TEST_DATA) / "schematic.yml";

	const auto document = wirescan::detection::FileStorageDocument::load(inputPath);
	if (!document.has_value()) {
		std::cerr << "[Error] Could not load document: " << inputPath << "\n";
		return 1;
	}

	const wirescan::detection::DocumentResult documentResult = wirescan::detection::analyseDocument(*document);
	std::cout << "Document: " << inputPath << "\n";
	wirescan::detection::printStatistics(std::cout, documentResult.statistics);
	if (!documentResult.success) {
		std::cerr << "[Error] Some pages could not be analysed.\n";
	}

	const wirescan::detection::Analyser analyser(*document);

	wirescan::MainWindow window(analyser.pageCount());
	window.resize(1400, 900);
	window.setSelectionChangedCallback([&](const std::size_t page, const wirescan::PipelineStep step) { window.setImage(analyser.analyse(page, step)); });
	window.setImage(analyser.analyse(window.selectedPage(), window.selectedPipelineStep()));
	window.show();

	return application.exec();
}
