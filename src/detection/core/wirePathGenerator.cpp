#include "detection/core/wirePathGenerator.hpp"

#include <algorithm>
#include <cmath>

namespace wirescan::detection::core {

namespace {

static constexpr double SMOOTH_OFFSET_FRAC = 0.1; //!< Control point offset relative to the endpoint distance.
static constexpr double SMOOTH_MIN_LENGTH  = 1.0; //!< Below this, a curve is not worth it.

} // namespace

std::string_view toString(const RoutingStyle style) {
	switch (style) {
	case RoutingStyle::Manhattan:
		return "manhattan";
	case RoutingStyle::LPath:
		return "l_path";
	case RoutingStyle::Straight:
		return "straight";
	case RoutingStyle::Smooth:
		return "smooth";
	}
	return "straight";
}

std::vector<cv::Point2d> generateManhattanPath(const cv::Point2d& start, const cv::Point2d& end, ManhattanExit exit) {
	const double dx = end.x - start.x;
	const double dy = end.y - start.y;

	if (exit == ManhattanExit::Auto) {
		exit = std::abs(dx) > std::abs(dy) ? ManhattanExit::Horizontal : ManhattanExit::Vertical;
	}

	if (exit == ManhattanExit::Horizontal) {
		const double midX = start.x + dx / 2.0;
		return {start, {midX, start.y}, {midX, end.y}, end};
	}

	const double midY = start.y + dy / 2.0;
	return {start, {start.x, midY}, {end.x, midY}, end};
}

std::vector<cv::Point2d> generateLPath(const cv::Point2d& start, const cv::Point2d& end, const bool horizontalFirst) {
	const cv::Point2d corner = horizontalFirst ? cv::Point2d{end.x, start.y} : cv::Point2d{start.x, end.y};
	return {start, corner, end};
}

std::vector<cv::Point2d> generateStraightLine(const cv::Point2d& start, const cv::Point2d& end) {
	return {start, end};
}

std::vector<cv::Point2d> generateSmoothPath(const cv::Point2d& start, const cv::Point2d& end, int segments) {
	const cv::Point2d d = end - start;
	const double len    = cv::norm(d);
	if (len < SMOOTH_MIN_LENGTH) {
		return {start, end};
	}
	segments = std::max(1, segments);

	// Control point: midpoint shifted along the left normal (-dy, dx).
	const cv::Point2d mid     = 0.5 * (start + end);
	const double offset       = len * SMOOTH_OFFSET_FRAC;
	const cv::Point2d control = mid + cv::Point2d{-d.y, d.x} * (offset / len);

	std::vector<cv::Point2d> points;
	points.reserve(static_cast<std::size_t>(segments) + 1u);
	points.push_back(start);
	for (int i = 1; i < segments; ++i) {
		const double t = static_cast<double>(i) / static_cast<double>(segments);
		const double u = 1.0 - t;
		points.push_back(u * u * start + 2.0 * u * t * control + t * t * end);
	}
	points.push_back(end); // Exact, no rounding from the curve formula.
	return points;
}

std::vector<cv::Point2d> generatePath(const RoutingStyle style, const cv::Point2d& start, const cv::Point2d& end) {
	switch (style) {
	case RoutingStyle::Manhattan:
		return generateManhattanPath(start, end);
	case RoutingStyle::LPath:
		return generateLPath(start, end);
	case RoutingStyle::Smooth:
		return generateSmoothPath(start, end);
	case RoutingStyle::Straight:
		break;
	}
	return generateStraightLine(start, end);
}

} // namespace wirescan::detection::core
