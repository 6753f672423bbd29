#pragma once

#include "pipelineStep.hpp"

#include "detection/document.hpp"
#include "detection/pagePipeline.hpp"

#include <opencv2/core/mat.hpp>

#include <cstddef>

namespace wirescan::detection {

//! Runs the page pipeline with the DebugVisualizer attached and returns the mosaic of the desired PipelineStep.
class Analyser {
public:
	explicit Analyser(const Document& document, PipelineConfig config = PipelineConfig{});

	cv::Mat analyse(std::size_t page, PipelineStep step) const;

	std::size_t pageCount() const;

private:
	const Document& m_document;
	PipelineConfig m_config;
};

} // namespace wirescan::detection
