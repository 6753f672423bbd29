#include "analyser.hpp"

#include "detection/core/debugVisualizer.hpp"

#include <opencv2/imgproc.hpp>

#include <iostream>
#include <string>

namespace wirescan::detection {

static cv::Mat buildInfoTile(const std::string& title, const std::string& message) {
	cv::Mat tile(540, 960, CV_8UC3, cv::Scalar(20, 20, 20));
	cv::putText(tile, title, cv::Point(40, 120), cv::FONT_HERSHEY_SIMPLEX, 1.1, cv::Scalar(250, 250, 250), 2, cv::LINE_AA);
	cv::putText(tile, message, cv::Point(40, 200), cv::FONT_HERSHEY_SIMPLEX, 0.85, cv::Scalar(200, 200, 200), 2, cv::LINE_AA);
	return tile;
}

Analyser::Analyser(const Document& document, PipelineConfig config) : m_document(document), m_config(config) {
}

std::size_t Analyser::pageCount() const {
	return m_document.pageCount();
}

cv::Mat Analyser::analyse(const std::size_t page, const PipelineStep step) const {
	if (page >= m_document.pageCount()) {
		return buildInfoTile("Input Error", "Page " + std::to_string(page) + " does not exist.");
	}

	core::DebugVisualizer debugger;
	const PageResult result = analysePage(m_document, page, m_config, &debugger);
	if (!result.success) {
		return buildInfoTile("Page " + std::to_string(page), "analysePage failed for this page.");
	}

	std::cout << "Page " << page << "\n";
	printStatistics(std::cout, result.statistics);

	const cv::Mat mosaic = step == PipelineStep::All ? debugger.buildMosaic() : debugger.buildStageMosaic(static_cast<std::size_t>(step));
	if (mosaic.empty()) {
		return buildInfoTile("No Debug Output", "Selected stage produced no visuals.");
	}
	return mosaic;
}

} // namespace wirescan::detection
