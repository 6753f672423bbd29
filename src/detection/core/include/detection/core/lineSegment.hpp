#pragma once

#include "detection/core/colorClassifier.hpp"

#include <opencv2/core/types.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>
#include <vector>

namespace wirescan::detection::core {

//! A straight stroke on a schematic page. Page coordinates, origin top-left.
struct LineSegment {
	int page{0};                       //!< Page index (>= 0).
	cv::Point2d start;                 //!< Start point.
	cv::Point2d end;                   //!< End point.
	ColorSample rgb;                   //!< Stroke color as found on the page.
	WireColor color{WireColor::Other}; //!< Classified stroke color.
	double thickness{1.0};             //!< Stroke width.
};

//! Build a segment and classify its stroke color.
LineSegment makeSegment(int page, const cv::Point2d& start, const cv::Point2d& end, const ColorSample& rgb, double thickness = 1.0);

double length(const LineSegment& segment);
bool isHorizontal(const LineSegment& segment); //!< dx > 3 * dy
bool isVertical(const LineSegment& segment);   //!< dy > 3 * dx

//! Nominal voltage / signal class of a wire color ("24VDC", "0V", "PE", "400VAC" or "UNKNOWN").
std::string_view voltageType(WireColor color);
std::string_view voltageType(const LineSegment& segment);

//! Distance from a point to the closest point on the (closed) segment.
double distanceToSegment(const cv::Point2d& point, const LineSegment& segment);

/*! Find the segment closest to a point.
 * \param [in] point     Query point in page coordinates.
 * \param [in] segments  Candidate segments.
 * \param [in] tolerance Maximum accepted distance.
 * \return     Index into segments of the nearest segment within tolerance, or nullopt.
 */
std::optional<std::size_t> findNearestWire(const cv::Point2d& point, const std::vector<LineSegment>& segments, double tolerance = 10.0);

//! All segments of a single classified color (order preserved).
std::vector<LineSegment> filterByColor(const std::vector<LineSegment>& segments, WireColor color);

//! Resolution used to group endpoints: points closer than this share a key.
static constexpr double ENDPOINT_RESOLUTION = 0.1;

//! Discretised endpoint. Two endpoints are the same if their keys are equal.
struct EndpointKey {
	std::int64_t x;
	std::int64_t y;

	bool operator==(const EndpointKey&) const = default;
};

struct EndpointKeyHash {
	std::size_t operator()(const EndpointKey& key) const noexcept;
};

//! Snap a point onto the endpoint grid.
EndpointKey endpointKey(const cv::Point2d& point);

} // namespace wirescan::detection::core
