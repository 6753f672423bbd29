#pragma once

#include "detection/core/lineSegment.hpp"

#include <cstddef>
#include <string_view>
#include <vector>

namespace wirescan::detection::core {

//! Structural role of a line segment on a schematic page.
enum class LineType { Wire, Border, TitleBlock, TableGrid, ComponentOutline, Unknown };

static constexpr std::size_t LINE_TYPE_COUNT = 6u;

std::string_view toString(LineType type);

//! Line classification parameters (page units).
struct ClassifierConfig {
	double borderMargin{20.0};            //!< Distance from a page edge that still counts as "on the frame".
	double borderSpanFrac{0.70};          //!< Frame lines span at least this fraction of the page dimension.
	double headerBand{20.0};              //!< Header region at the top of the page.
	double titleBlockRatio{0.85};         //!< Title block starts at this fraction of the page height.
	double titleShortFrac{0.40};          //!< Title block cell lines are shorter than this fraction of the page width.
	double titleWideFrac{0.50};           //!< Horizontal title block rules are at least this fraction of the page width.
	double gridTolerance{3.0};            //!< Alignment tolerance for table grids.
	double outlineTolerance{8.0};         //!< Endpoint proximity for component outline edges.
	double outlineMaxLength{50.0};        //!< Longer segments are never outline edges.
	double outlineStrictLength{25.0};     //!< Only segments shorter than this are tested for outline neighbours.
	std::size_t minOutlineNeighbours{2u}; //!< Similar-length neighbours needed to call a segment an outline edge.
};

/*! Decides whether a segment is a wire or page furniture (frame, title block, table, symbol outline).
 *  Rules are checked in a fixed order and the first match wins:
 *   1) Border, 2) Title block, 3) Table grid, 4) Component outline, 5) Wire, 6) Unknown.
 *  Position and repetition identify the page furniture (schematic frames are usually black). Color and length identify wires.
 *  The classifier holds no state between calls and can be shared between threads.
 */
class LineClassifier {
public:
	LineClassifier(double pageWidth, double pageHeight, ClassifierConfig config = ClassifierConfig{});

	/*! Classify one segment of a page.
	 * \param [in] segment      Segment to classify. Should be an element of pageSegments (compared by address to skip itself).
	 * \param [in] pageSegments Every segment of the same page. Needed for grid and outline detection.
	 * \return     Line type of the segment.
	 */
	LineType classifyLine(const LineSegment& segment, const std::vector<LineSegment>& pageSegments) const;

	bool isBorder(const LineSegment& segment) const;
	bool isTitleBlock(const LineSegment& segment) const;
	bool isGridLine(const LineSegment& segment, const std::vector<LineSegment>& pageSegments) const;
	bool isComponentOutline(const LineSegment& segment, const std::vector<LineSegment>& pageSegments) const;

	//! Wire likelihood test from length, orientation and color.
	static bool hasWireCharacteristics(const LineSegment& segment);

	const ClassifierConfig& config() const {
		return m_config;
	}

private:
	double m_pageWidth;
	double m_pageHeight;
	double m_titleBlockY; //!< Title block starts below this y.
	ClassifierConfig m_config;
};

} // namespace wirescan::detection::core
