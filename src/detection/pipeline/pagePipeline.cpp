#include "detection/pagePipeline.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <numbers>
#include <optional>
#include <string>
#include <string_view>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

// Pipeline overview:
// 1) Extraction     -> line commands of colored, thin drawings become segments (cheap gate optional).
// 2) Classification -> every segment is labelled against the whole page (border, title block, grid, outline, wire).
// 3) Tracing        -> wire segments are grouped into same-colored routes, branch points are collected.
// 4) Statistics     -> per page counts, merged per document by the caller.
// 5) Debugging      -> overlays of every stage and verbose diagnostics (WIRESCAN_DEBUG=1).
namespace wirescan::detection {

using namespace core;

namespace {

static constexpr double AXIS_ALIGNED_DELTA   = 2.0;  //!< dx or dy below this counts as axis aligned.
static constexpr double LONG_DIAGONAL_LENGTH = 15.0; //!< Diagonals longer than this always pass the gate.
static constexpr double SHORT_DIAGONAL_MIN   = 8.0;  //!< Short diagonals must at least have this length.
static constexpr double ANGLE_TOLERANCE_DEG  = 10.0;
static constexpr std::array<double, 3> CONNECTOR_ANGLES_DEG{30.0, 45.0, 60.0};

static bool isFinite(const cv::Point2d& p) {
	return std::isfinite(p.x) && std::isfinite(p.y);
}

//! Stroke color wins over the fill color.
static std::optional<ColorSample> drawingColor(const Drawing& drawing) {
	if (drawing.stroke.has_value()) {
		return drawing.stroke;
	}
	return drawing.fill;
}

//! Page size or nullopt for invalid pages. Also rejects degenerate sizes.
static std::optional<PageSize> validPageSize(const Document& document, const std::size_t page) {
	if (page >= document.pageCount()) {
		return std::nullopt;
	}
	const auto size = document.pageSize(page);
	if (!size.has_value() || !(size->width > 0.0) || !(size->height > 0.0)) {
		return std::nullopt;
	}
	return size;
}

} // namespace

namespace Debugging {

static constexpr double CANVAS_MAX_DIM = 1000.0; //!< Larger page dimension in overlay pixels.

static bool detectionDebugEnabled() {
	const char* env = std::getenv("WIRESCAN_DEBUG");
	return env != nullptr && std::string_view(env) == "1";
}

//! Blank page canvas and the scale from page units to pixels.
static cv::Mat makeCanvas(const PageSize& size, double& outScale) {
	outScale         = CANVAS_MAX_DIM / std::max(size.width, size.height);
	const int width  = std::max(1, static_cast<int>(std::ceil(size.width * outScale)));
	const int height = std::max(1, static_cast<int>(std::ceil(size.height * outScale)));
	return cv::Mat(height, width, CV_8UC3, cv::Scalar(255, 255, 255));
}

static cv::Point toPixel(const cv::Point2d& p, const double scale) {
	return {static_cast<int>(std::lround(p.x * scale)), static_cast<int>(std::lround(p.y * scale))};
}

static cv::Scalar toBgr(const ColorSample& rgb) {
	const auto channel = [](const double v) { return std::clamp(v, 0.0, 1.0) * 255.0; };
	return {channel(rgb[2]), channel(rgb[1]), channel(rgb[0])};
}

static cv::Scalar lineTypeColor(const LineType type) {
	switch (type) {
	case LineType::Wire:
		return {0, 0, 220};
	case LineType::Border:
		return {200, 120, 0};
	case LineType::TitleBlock:
		return {200, 0, 200};
	case LineType::TableGrid:
		return {0, 160, 0};
	case LineType::ComponentOutline:
		return {0, 140, 220};
	case LineType::Unknown:
		return {150, 150, 150};
	}
	return {150, 150, 150};
}

//! Distinct colors for neighbouring path indices (golden angle hue walk).
static cv::Scalar pathColor(const std::size_t index) {
	const double hue = std::fmod(static_cast<double>(index) * 137.508, 360.0);
	cv::Mat hsv(1, 1, CV_32FC3, cv::Scalar(static_cast<float>(hue), 0.9f, 0.85f));
	cv::Mat bgr;
	cv::cvtColor(hsv, bgr, cv::COLOR_HSV2BGR);
	const cv::Vec3f c = bgr.at<cv::Vec3f>(0, 0);
	return {c[0] * 255.0, c[1] * 255.0, c[2] * 255.0};
}

static void drawSegments(cv::Mat& canvas, const std::vector<LineSegment>& segments, const double scale, const cv::Scalar* color) {
	for (const auto& s: segments) {
		const cv::Scalar c = color != nullptr ? *color : toBgr(s.rgb);
		cv::line(canvas, toPixel(s.start, scale), toPixel(s.end, scale), c, 1, cv::LINE_AA);
	}
}

static void addExtractionStage(DebugVisualizer& debugger, const PageSize& size, const std::vector<LineSegment>& segments) {
	double scale   = 1.0;
	cv::Mat canvas = makeCanvas(size, scale);
	drawSegments(canvas, segments, scale, nullptr);
	debugger.add("Segments", canvas);
}

static void addClassificationStage(DebugVisualizer& debugger, const PageSize& size, const ClassifiedLines& lines) {
	double scale   = 1.0;
	cv::Mat canvas = makeCanvas(size, scale);
	for (std::size_t t = 0; t < LINE_TYPE_COUNT; ++t) {
		const cv::Scalar color = lineTypeColor(static_cast<LineType>(t));
		drawSegments(canvas, lines.buckets[t], scale, &color);
	}
	int y = 20;
	for (std::size_t t = 0; t < LINE_TYPE_COUNT; ++t) {
		const auto type        = static_cast<LineType>(t);
		const std::string text = std::string(toString(type)) + ": " + std::to_string(lines.buckets[t].size());
		cv::putText(canvas, text, cv::Point(8, y), cv::FONT_HERSHEY_SIMPLEX, 0.5, lineTypeColor(type), 1, cv::LINE_AA);
		y += 20;
	}
	debugger.add("Line Types", canvas);

	cv::Mat wires = makeCanvas(size, scale);
	drawSegments(wires, lines.buckets[static_cast<std::size_t>(LineType::Wire)], scale, nullptr);
	debugger.add("Wires", wires);
}

static void addTracingStage(DebugVisualizer& debugger, const PageSize& size, const std::vector<WirePath>& paths,
                            const std::vector<cv::Point2d>& junctions) {
	double scale   = 1.0;
	cv::Mat canvas = makeCanvas(size, scale);
	for (std::size_t i = 0; i < paths.size(); ++i) {
		const cv::Scalar color = pathColor(i);
		drawSegments(canvas, paths[i].segments, scale, &color);
	}
	for (const auto& j: junctions) {
		cv::circle(canvas, toPixel(j, scale), 4, cv::Scalar(0, 0, 0), 1, cv::LINE_AA);
	}
	debugger.add("Paths + Junctions", canvas);
}

static void emitRuntimeDebug(const PageResult& result) {
	std::cout << "[wire-debug] page=" << result.page << " size=" << result.size.width << "x" << result.size.height
	          << " segments=" << result.segments.size();
	for (std::size_t t = 0; t < LINE_TYPE_COUNT; ++t) {
		std::cout << " " << toString(static_cast<LineType>(t)) << "=" << result.lines.buckets[t].size();
	}
	std::cout << " paths=" << result.paths.size() << " junctions=" << result.junctions.size() << '\n';
}

} // namespace Debugging

const std::vector<LineSegment>& linesOf(const ClassifiedLines& lines, const LineType type) {
	return lines.buckets[static_cast<std::size_t>(type)];
}

bool passesWireGate(const cv::Point2d& start, const cv::Point2d& end, const ExtractionConfig& config) {
	const double dx  = std::abs(end.x - start.x);
	const double dy  = std::abs(end.y - start.y);
	const double len = std::hypot(dx, dy);

	if (len < config.minWireLength) {
		return false;
	}
	if (dy < AXIS_ALIGNED_DELTA || dx < AXIS_ALIGNED_DELTA) {
		return true;
	}
	if (len > LONG_DIAGONAL_LENGTH) {
		return true;
	}
	if (len > SHORT_DIAGONAL_MIN) {
		const double angle = std::atan2(dy, dx) * 180.0 / std::numbers::pi;
		return std::any_of(CONNECTOR_ANGLES_DEG.begin(), CONNECTOR_ANGLES_DEG.end(),
		                   [&](const double target) { return std::abs(angle - target) < ANGLE_TOLERANCE_DEG; });
	}
	return false;
}

std::vector<LineSegment> extractSegments(const Document& document, const std::size_t page, const ExtractionConfig& config) {
	if (page >= document.pageCount()) {
		return {};
	}

	const bool verbose       = Debugging::detectionDebugEnabled();
	std::size_t skippedItems = 0;

	std::vector<LineSegment> segments;
	for (const auto& drawing: document.drawings(page)) {
		const auto color = drawingColor(drawing);
		if (!color.has_value() || drawing.items.empty()) {
			continue;
		}
		if (config.prefilter && drawing.width > config.maxWireThickness) {
			continue;
		}

		for (const auto& item: drawing.items) {
			if (item.command != PathCommand::Line || item.points.size() < 2u) {
				++skippedItems;
				continue;
			}
			const cv::Point2d& start = item.points[0];
			const cv::Point2d& end   = item.points[1];
			if (!isFinite(start) || !isFinite(end) || start == end) {
				++skippedItems;
				continue;
			}
			if (config.prefilter && !passesWireGate(start, end, config)) {
				continue;
			}
			segments.push_back(makeSegment(static_cast<int>(page), start, end, *color, drawing.width));
		}
	}

	if (verbose && skippedItems > 0u) {
		std::cout << "[wire-debug] page=" << page << " skipped-items=" << skippedItems << '\n';
	}
	return segments;
}

ClassifiedLines classifyLines(const std::vector<LineSegment>& segments, const PageSize& size, const ClassifierConfig& config) {
	ClassifiedLines lines{};
	const LineClassifier classifier(size.width, size.height, config);
	for (const auto& segment: segments) {
		const LineType type = classifier.classifyLine(segment, segments);
		lines.buckets[static_cast<std::size_t>(type)].push_back(segment);
	}
	return lines;
}

//! Classification step of a page run. Without classification every segment is a wire.
static ClassifiedLines labelSegments(const std::vector<LineSegment>& segments, const PageSize& size, const PipelineConfig& config) {
	if (!config.classify) {
		ClassifiedLines lines{};
		lines.buckets[static_cast<std::size_t>(LineType::Wire)] = segments;
		return lines;
	}
	return classifyLines(segments, size, config.classifier);
}

PageResult analysePage(const Document& document, const std::size_t page, const PipelineConfig& config, DebugVisualizer* debugger) {
	PageResult result{};
	result.page = page;

	const auto size = validPageSize(document, page);
	if (!size.has_value()) {
		std::cerr << "[Error] Page " << page << " does not exist (document has " << document.pageCount() << " pages)\n";
		return result;
	}
	result.size = *size;

	// 1) Extraction
	if (debugger) {
		debugger->beginStage("Extraction");
	}
	result.segments = extractSegments(document, page, config.extraction);
	if (debugger) {
		Debugging::addExtractionStage(*debugger, result.size, result.segments);
		debugger->endStage();
	}

	// 2) Classification
	if (debugger) {
		debugger->beginStage("Classification");
	}
	result.lines = labelSegments(result.segments, result.size, config);
	if (debugger) {
		Debugging::addClassificationStage(*debugger, result.size, result.lines);
		debugger->endStage();
	}

	// 3) Tracing
	if (debugger) {
		debugger->beginStage("Tracing");
	}
	const auto& wires = linesOf(result.lines, LineType::Wire);
	const WirePathTracer tracer(config.tracer);
	result.paths     = tracer.tracePaths(wires);
	result.junctions = tracer.findJunctions(wires);
	if (debugger) {
		Debugging::addTracingStage(*debugger, result.size, result.paths, result.junctions);
		debugger->endStage();
	}

	// 4) Statistics
	result.statistics = computeStatistics(result.lines.buckets, result.paths, result.junctions);
	result.success    = true;

	if (Debugging::detectionDebugEnabled()) {
		Debugging::emitRuntimeDebug(result);
	}
	return result;
}

ClassifiedLines classifyAll(const Document& document, const std::size_t page, const PipelineConfig& config) {
	const auto size = validPageSize(document, page);
	if (!size.has_value()) {
		return {};
	}
	return labelSegments(extractSegments(document, page, config.extraction), *size, config);
}

std::vector<LineSegment> detectWiresOnly(const Document& document, const std::size_t page, const PipelineConfig& config) {
	return linesOf(classifyAll(document, page, config), LineType::Wire);
}

} // namespace wirescan::detection
