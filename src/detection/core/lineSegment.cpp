#include "detection/core/lineSegment.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>

namespace wirescan::detection::core {

LineSegment makeSegment(const int page, const cv::Point2d& start, const cv::Point2d& end, const ColorSample& rgb, const double thickness) {
	return LineSegment{page, start, end, rgb, classifyColor(rgb), thickness};
}

double length(const LineSegment& segment) {
	return cv::norm(segment.end - segment.start);
}

bool isHorizontal(const LineSegment& segment) {
	const double dx = std::abs(segment.end.x - segment.start.x);
	const double dy = std::abs(segment.end.y - segment.start.y);
	return dx > dy * 3.0;
}

bool isVertical(const LineSegment& segment) {
	const double dx = std::abs(segment.end.x - segment.start.x);
	const double dy = std::abs(segment.end.y - segment.start.y);
	return dy > dx * 3.0;
}

std::string_view voltageType(const WireColor color) {
	switch (color) {
	case WireColor::Red:
	case WireColor::Brown:
	case WireColor::Orange:
		return "24VDC";
	case WireColor::Blue:
		return "0V";
	case WireColor::Green:
	case WireColor::YellowGreen:
		return "PE";
	case WireColor::Black:
		return "400VAC";
	case WireColor::White:
	case WireColor::Gray:
	case WireColor::Other:
		break;
	}
	return "UNKNOWN";
}

std::string_view voltageType(const LineSegment& segment) {
	return voltageType(segment.color);
}

double distanceToSegment(const cv::Point2d& point, const LineSegment& segment) {
	const cv::Point2d d = segment.end - segment.start;
	const double len2   = d.dot(d);
	if (len2 == 0.0) {
		return cv::norm(point - segment.start);
	}

	// Project onto the segment and clamp to its extent.
	const double t              = std::clamp((point - segment.start).dot(d) / len2, 0.0, 1.0);
	const cv::Point2d onSegment = segment.start + t * d;
	return cv::norm(point - onSegment);
}

std::optional<std::size_t> findNearestWire(const cv::Point2d& point, const std::vector<LineSegment>& segments, const double tolerance) {
	std::optional<std::size_t> nearest;
	double best = std::numeric_limits<double>::infinity();

	for (std::size_t i = 0; i < segments.size(); ++i) {
		const double dist = distanceToSegment(point, segments[i]);
		if (dist < best && dist <= tolerance) {
			best    = dist;
			nearest = i;
		}
	}
	return nearest;
}

std::vector<LineSegment> filterByColor(const std::vector<LineSegment>& segments, const WireColor color) {
	std::vector<LineSegment> out;
	std::copy_if(segments.begin(), segments.end(), std::back_inserter(out), [color](const LineSegment& s) { return s.color == color; });
	return out;
}

std::size_t EndpointKeyHash::operator()(const EndpointKey& key) const noexcept {
	const std::size_t hx = std::hash<std::int64_t>{}(key.x);
	const std::size_t hy = std::hash<std::int64_t>{}(key.y);
	return hx ^ (hy + 0x9e3779b97f4a7c15ull + (hx << 6) + (hx >> 2));
}

EndpointKey endpointKey(const cv::Point2d& point) {
	return {static_cast<std::int64_t>(std::llround(point.x / ENDPOINT_RESOLUTION)),
	        static_cast<std::int64_t>(std::llround(point.y / ENDPOINT_RESOLUTION))};
}

} // namespace wirescan::detection::core
