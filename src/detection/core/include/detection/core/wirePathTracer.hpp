#pragma once

#include "detection/core/lineSegment.hpp"

#include <opencv2/core/types.hpp>

#include <cstddef>
#include <string_view>
#include <vector>

namespace wirescan::detection::core {

//! A continuous wire route: same-colored, transitively connected segments of one page.
struct WirePath {
	std::vector<LineSegment> segments{}; //!< Segments in traversal order.
	WireColor color{WireColor::Other};   //!< Shared color of all segments.
	int page{0};                         //!< Page the segments come from.
};

//! Polyline of the path: start of the first segment, then the end of every segment. Empty for an empty path.
std::vector<cv::Point2d> pathPoints(const WirePath& path);

double totalLength(const WirePath& path);

//! Voltage label of the first segment. "UNKNOWN" for an empty path.
std::string_view voltageType(const WirePath& path);

//! Path tracing parameters.
struct TracerConfig {
	double tolerance{5.0}; //!< Endpoints closer than this (and not identical) are bridged.
};

/*! Reconstructs wire routes from wire segments.
 *  Segments are connected when they share an endpoint or when two endpoints are within the connectivity tolerance (bridges small
 *  rendering gaps). Routes are the connected components of this graph, where an edge is only crossed between segments of the
 *  same wire color. Different colored wires that touch stay separate routes.
 */
class WirePathTracer {
public:
	explicit WirePathTracer(TracerConfig config = TracerConfig{});

	/*! Trace all continuous routes.
	 * \param [in] segments Wire segments of one page.
	 * \return     One WirePath per color-guarded connected component. Every segment is in exactly one path.
	 */
	std::vector<WirePath> tracePaths(const std::vector<LineSegment>& segments) const;

	/*! Find branch points.
	 * \param [in] segments Wire segments of one page.
	 * \return     Points where three or more segment endpoints meet (tolerance bridges are not counted).
	 */
	std::vector<cv::Point2d> findJunctions(const std::vector<LineSegment>& segments) const;

	double tolerance() const {
		return m_config.tolerance;
	}

private:
	TracerConfig m_config;
};

} // namespace wirescan::detection::core
