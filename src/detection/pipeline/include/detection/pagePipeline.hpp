#pragma once

#include "detection/document.hpp"
#include "detection/wireStatistics.hpp"

#include "detection/core/debugVisualizer.hpp"
#include "detection/core/lineClassifier.hpp"
#include "detection/core/lineSegment.hpp"
#include "detection/core/wirePathTracer.hpp"

#include <opencv2/core/types.hpp>

#include <array>
#include <cstddef>
#include <vector>

// Page pipeline:
//   1) Extract straight line strokes from the page drawings (extractSegments). Everything else on the page is skipped.
//   2) Classify every segment against the whole page population (classifyLines).
//   3) Trace wire routes and junctions from the segments labelled as wires.
//   4) Aggregate statistics.
namespace wirescan::detection {

//! Primitive extraction parameters.
struct ExtractionConfig {
	double minWireLength{8.0};    //!< Shorter lines are dropped by the prefilter.
	double maxWireThickness{5.0}; //!< Thicker strokes (fills, frames) are dropped by the prefilter.
	bool prefilter{true};         //!< Apply the cheap length / thickness / angle gate before classification.
};

//! Full page pipeline configuration.
struct PipelineConfig {
	ExtractionConfig extraction{};
	core::ClassifierConfig classifier{};
	core::TracerConfig tracer{};
	bool classify{true}; //!< False: every extracted segment is treated as a wire.
};

//! Segments of a page grouped by line type. Index with static_cast<std::size_t>(LineType).
struct ClassifiedLines {
	std::array<std::vector<core::LineSegment>, core::LINE_TYPE_COUNT> buckets{};
};

const std::vector<core::LineSegment>& linesOf(const ClassifiedLines& lines, core::LineType type);

//! Everything the pipeline produces for one page.
struct PageResult {
	bool success{false};                       //!< False if the page does not exist in the document.
	std::size_t page{0};                       //!< Page index.
	PageSize size{};                           //!< Page size.
	std::vector<core::LineSegment> segments{}; //!< All extracted segments (classification input).
	ClassifiedLines lines{};                   //!< Segments by line type.
	std::vector<core::WirePath> paths{};       //!< Traced wire routes.
	std::vector<cv::Point2d> junctions{};      //!< Wire branch points.
	WireStatistics statistics{};               //!< Aggregated page statistics.
};

//! Cheap wire gate: minimum length, and either axis aligned, long enough, or at a common connector angle (30, 45, 60 degrees).
bool passesWireGate(const cv::Point2d& start, const cv::Point2d& end, const ExtractionConfig& config);

/*! Extract line segments from a page.
 *  Only straight line commands of drawings with a color are used. Non-line commands, malformed items and zero-length lines are skipped.
 * \param [in] document Drawing source.
 * \param [in] page     Page index.
 * \param [in] config   Extraction parameters.
 * \return     Segments in drawing order. Empty for an invalid page.
 */
std::vector<core::LineSegment> extractSegments(const Document& document, std::size_t page, const ExtractionConfig& config = ExtractionConfig{});

//! Classify every segment against the full population. Bucket order follows the input order.
ClassifiedLines classifyLines(const std::vector<core::LineSegment>& segments, const PageSize& size,
                              const core::ClassifierConfig& config = core::ClassifierConfig{});

/*! Run the full pipeline on one page.
 * \param [in]     document Drawing source.
 * \param [in]     page     Page index.
 * \param [in]     config   Pipeline configuration.
 * \param [in,out] debugger Optional debug visualizer (segments, classification and traced paths overlays).
 * \return         Page result. success is false for an invalid page.
 */
PageResult analysePage(const Document& document, std::size_t page, const PipelineConfig& config = PipelineConfig{},
                       core::DebugVisualizer* debugger = nullptr);

//! Classify all lines of a page. Empty buckets for an invalid page.
ClassifiedLines classifyAll(const Document& document, std::size_t page, const PipelineConfig& config = PipelineConfig{});

//! Only the segments of a page that are classified as wires (every segment if classification is disabled).
std::vector<core::LineSegment> detectWiresOnly(const Document& document, std::size_t page, const PipelineConfig& config = PipelineConfig{});

} // namespace wirescan::detection
