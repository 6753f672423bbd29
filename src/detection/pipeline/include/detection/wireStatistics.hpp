#pragma once

#include "detection/core/colorClassifier.hpp"
#include "detection/core/lineClassifier.hpp"
#include "detection/core/lineSegment.hpp"
#include "detection/core/wirePathTracer.hpp"

#include <opencv2/core/types.hpp>

#include <array>
#include <cstddef>
#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace wirescan::detection {

/*! Aggregate counts of a page or a whole document.
 *  Color, voltage, length and orientation figures refer to the segments classified as wires.
 *  Document totals are built with merge(), which is commutative and associative, so pages can be merged in any order.
 */
struct WireStatistics {
	std::size_t pageCount{0};                                        //!< Pages merged into these statistics.
	std::size_t totalSegments{0};                                    //!< All classified segments.
	std::array<std::size_t, core::LINE_TYPE_COUNT> lineTypeCounts{}; //!< Index: static_cast<std::size_t>(LineType).
	std::array<std::size_t, core::WIRE_COLOR_COUNT> colorCounts{};   //!< Index: static_cast<std::size_t>(WireColor).
	std::map<std::string, std::size_t> voltageCounts{};              //!< Voltage label -> wire segments.
	std::size_t wireCount{0};
	double wireLengthSum{0.0};
	double minWireLength{0.0}; //!< 0 if there are no wires.
	double maxWireLength{0.0}; //!< 0 if there are no wires.
	std::size_t horizontalCount{0};
	std::size_t verticalCount{0};
	std::size_t pathCount{0};
	std::size_t junctionCount{0};
};

//! Statistics of one page.
WireStatistics computeStatistics(const std::array<std::vector<core::LineSegment>, core::LINE_TYPE_COUNT>& buckets,
                                 const std::vector<core::WirePath>& paths, const std::vector<cv::Point2d>& junctions);

//! Add other into into.
void merge(WireStatistics& into, const WireStatistics& other);

double averageWireLength(const WireStatistics& statistics); //!< 0 if there are no wires.

std::size_t countOf(const WireStatistics& statistics, core::LineType type);
std::size_t countOf(const WireStatistics& statistics, core::WireColor color);

//! Human readable multi-line report.
void printStatistics(std::ostream& os, const WireStatistics& statistics);

} // namespace wirescan::detection
