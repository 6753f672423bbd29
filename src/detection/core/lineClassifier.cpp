#include "detection/core/lineClassifier.hpp"

#include "statistics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace wirescan::detection::core {

namespace {

struct Line1D {
	double pos;    // y for horizontal, x for vertical
	double weight; // segment length
};

//! Position and extent of an axis-aligned segment along its own direction.
struct AxisExtent {
	double pos; //!< Cross-axis coordinate (mean of both endpoints).
	double lo;  //!< Smaller coordinate along the line direction.
	double hi;  //!< Larger coordinate along the line direction.
};

static AxisExtent axisExtent(const LineSegment& s, const bool horizontal) {
	if (horizontal) {
		return {0.5 * (s.start.y + s.end.y), std::min(s.start.x, s.end.x), std::max(s.start.x, s.end.x)};
	}
	return {0.5 * (s.start.x + s.end.x), std::min(s.start.y, s.end.y), std::max(s.start.y, s.end.y)};
}

static std::vector<double> clusterWeighted1D(std::vector<Line1D> values, double eps) {
	if (values.empty()) {
		return {};
	}

	std::sort(values.begin(), values.end(), [](const Line1D& a, const Line1D& b) { return a.pos < b.pos; });

	std::vector<double> centers;
	double wSum = values[0].weight;
	double pSum = values[0].pos * values[0].weight;
	for (size_t i = 1; i < values.size(); ++i) {
		if (std::abs(values[i].pos - values[i - 1].pos) <= eps) {
			wSum += values[i].weight;
			pSum += values[i].pos * values[i].weight;
		} else {
			centers.push_back(pSum / wSum);
			wSum = values[i].weight;
			pSum = values[i].pos * values[i].weight;
		}
	}
	centers.push_back(pSum / wSum);

	return centers;
}

//! Index of the center closest to pos.
static std::size_t nearestIndex(const std::vector<double>& centers, const double pos) {
	std::size_t best = 0u;
	double bestDist  = std::numeric_limits<double>::infinity();
	for (std::size_t i = 0; i < centers.size(); ++i) {
		const double d = std::abs(centers[i] - pos);
		if (d < bestDist) {
			bestDist = d;
			best     = i;
		}
	}
	return best;
}

//! Three consecutive positions with (nearly) equal gaps.
static bool evenlySpaced(const std::vector<double>& centers, const std::size_t first, const double tolerance) {
	const std::vector<double> window(centers.begin() + static_cast<std::ptrdiff_t>(first), centers.begin() + static_cast<std::ptrdiff_t>(first) + 3);
	const std::vector<double> gaps = adjacentGaps(window);
	const double spacing           = mean(gaps);
	return spacing > tolerance && maxAbsDeviation(gaps, spacing) < tolerance * 2.0;
}

static bool isWireColored(const WireColor color) {
	return color == WireColor::Red || color == WireColor::Blue || color == WireColor::Green || color == WireColor::Brown || color == WireColor::Orange;
}

static bool endpointsClose(const LineSegment& a, const LineSegment& b, const double tolerance) {
	return cv::norm(a.start - b.start) < tolerance || cv::norm(a.start - b.end) < tolerance || cv::norm(a.end - b.start) < tolerance ||
	       cv::norm(a.end - b.end) < tolerance;
}

} // namespace

std::string_view toString(const LineType type) {
	switch (type) {
	case LineType::Wire:
		return "wire";
	case LineType::Border:
		return "border";
	case LineType::TitleBlock:
		return "title_block";
	case LineType::TableGrid:
		return "table_grid";
	case LineType::ComponentOutline:
		return "component_outline";
	case LineType::Unknown:
		return "unknown";
	}
	return "unknown";
}

LineClassifier::LineClassifier(const double pageWidth, const double pageHeight, ClassifierConfig config)
    : m_pageWidth{pageWidth}, m_pageHeight{pageHeight}, m_titleBlockY{pageHeight * config.titleBlockRatio}, m_config{config} {
}

LineType LineClassifier::classifyLine(const LineSegment& segment, const std::vector<LineSegment>& pageSegments) const {
	if (isBorder(segment)) {
		return LineType::Border;
	}
	if (isTitleBlock(segment)) {
		return LineType::TitleBlock;
	}
	if (!pageSegments.empty() && isGridLine(segment, pageSegments)) {
		return LineType::TableGrid;
	}
	if (!pageSegments.empty() && isComponentOutline(segment, pageSegments)) {
		return LineType::ComponentOutline;
	}
	if (hasWireCharacteristics(segment)) {
		return LineType::Wire;
	}
	return LineType::Unknown;
}

//! Frame lines run along a page edge and span most of the page.
bool LineClassifier::isBorder(const LineSegment& s) const {
	const double margin = m_config.borderMargin;
	const double len    = length(s);

	const bool nearLeft   = s.start.x < margin || s.end.x < margin;
	const bool nearRight  = s.start.x > m_pageWidth - margin || s.end.x > m_pageWidth - margin;
	const bool nearTop    = s.start.y < margin || s.end.y < margin;
	const bool nearBottom = s.start.y > m_pageHeight - margin || s.end.y > m_pageHeight - margin;

	if (isHorizontal(s) && (nearTop || nearBottom) && len >= m_pageWidth * m_config.borderSpanFrac) {
		return true;
	}
	if (isVertical(s) && (nearLeft || nearRight) && len >= m_pageHeight * m_config.borderSpanFrac) {
		return true;
	}
	return false;
}

//! Header band at the top or title block at the bottom. Cells are short, rules are wide and horizontal.
bool LineClassifier::isTitleBlock(const LineSegment& s) const {
	const bool inHeader     = s.start.y < m_config.headerBand && s.end.y < m_config.headerBand;
	const bool inTitleBlock = s.start.y > m_titleBlockY && s.end.y > m_titleBlockY;
	if (!inHeader && !inTitleBlock) {
		return false;
	}

	const double len = length(s);
	if (len < m_pageWidth * m_config.titleShortFrac) {
		return true;
	}
	return isHorizontal(s) && len >= m_pageWidth * m_config.titleWideFrac;
}

/*! Table grids are stacks of parallel lines with the same extent and a constant spacing.
 *  1) Collect the other lines of the same orientation whose extent matches this one.
 *  2) Cluster their cross-axis positions (duplicate strokes of the same rule merge).
 *  3) Check every window of three consecutive rules that contains this line for constant spacing.
 */
bool LineClassifier::isGridLine(const LineSegment& segment, const std::vector<LineSegment>& pageSegments) const {
	const bool horizontal = isHorizontal(segment);
	if (!horizontal && !isVertical(segment)) {
		return false;
	}

	const double tolerance = m_config.gridTolerance;
	const AxisExtent own   = axisExtent(segment, horizontal);

	std::vector<Line1D> rules;
	rules.push_back({own.pos, std::max(length(segment), 1e-6)});
	std::size_t alignedOthers = 0u;
	for (const auto& other: pageSegments) {
		if (&other == &segment) {
			continue;
		}
		if ((horizontal && !isHorizontal(other)) || (!horizontal && !isVertical(other))) {
			continue;
		}

		const AxisExtent ext = axisExtent(other, horizontal);
		if (std::abs(ext.lo - own.lo) > tolerance || std::abs(ext.hi - own.hi) > tolerance) {
			continue;
		}

		rules.push_back({ext.pos, std::max(length(other), 1e-6)});
		++alignedOthers;
	}

	if (alignedOthers < 2u) {
		return false;
	}

	const std::vector<double> centers = clusterWeighted1D(std::move(rules), tolerance);
	if (centers.size() < 3u) {
		return false;
	}

	const std::size_t idx   = nearestIndex(centers, own.pos);
	const std::size_t first = idx >= 2u ? idx - 2u : 0u;
	const std::size_t last  = std::min(idx, centers.size() - 3u);
	for (std::size_t start = first; start <= last; ++start) {
		if (evenlySpaced(centers, start, tolerance)) {
			return true;
		}
	}
	return false;
}

//! Short uncolored edges with several similar-length neighbours at their endpoints form symbol outlines.
bool LineClassifier::isComponentOutline(const LineSegment& segment, const std::vector<LineSegment>& pageSegments) const {
	const double len = length(segment);
	if (len > m_config.outlineMaxLength || isWireColored(segment.color)) {
		return false;
	}
	if (len >= m_config.outlineStrictLength || len <= 0.0) {
		return false;
	}

	std::size_t neighbours = 0u;
	for (const auto& other: pageSegments) {
		if (&other == &segment) {
			continue;
		}

		const double otherLen = length(other);
		if (otherLen > m_config.outlineMaxLength) {
			continue;
		}
		if (!endpointsClose(segment, other, m_config.outlineTolerance)) {
			continue;
		}

		const double ratio = otherLen / len;
		if (ratio > 0.5 && ratio < 2.0) {
			++neighbours;
		}
		if (neighbours >= m_config.minOutlineNeighbours) {
			return true;
		}
	}
	return neighbours >= m_config.minOutlineNeighbours;
}

bool LineClassifier::hasWireCharacteristics(const LineSegment& s) {
	const double len     = length(s);
	const bool straight  = isHorizontal(s) || isVertical(s);
	const WireColor c    = s.color;
	const bool neutral   = c == WireColor::Black || c == WireColor::Gray || c == WireColor::White || c == WireColor::Other;
	const bool primaries = c == WireColor::Red || c == WireColor::Blue || c == WireColor::Green;

	// Long lines are wires whatever their color.
	if (len > 50.0) {
		return true;
	}
	if (len > 30.0 && (!neutral || straight)) {
		return true;
	}
	if (len > 15.0 && isWireColored(c)) {
		return true;
	}
	if (len > 15.0 && c == WireColor::Gray && straight) {
		return true;
	}
	// Short colored diagonal connector stubs.
	return len >= 8.0 && primaries;
}

} // namespace wirescan::detection::core
