#pragma once

#include "detection/core/colorClassifier.hpp"

#include <opencv2/core/types.hpp>

#include <cstddef>
#include <optional>
#include <vector>

namespace wirescan::detection {

//! Path command of a vector drawing.
enum class PathCommand {
	Line,       //!< Straight line: points = {start, end}.
	Move,       //!< Move without drawing.
	Curve,      //!< Cubic Bezier: 4 points.
	Rect,       //!< Axis-aligned rectangle: 2 corner points.
	Quad,       //!< Quadrilateral: 4 points.
	Unsupported //!< Unknown command or unreadable operands.
};

//! One command of a drawing path.
struct PathItem {
	PathCommand command{PathCommand::Unsupported};
	std::vector<cv::Point2d> points{};
};

//! A stroked or filled vector path as extracted from a page.
struct Drawing {
	std::vector<PathItem> items{};
	std::optional<core::ColorSample> stroke{}; //!< Stroke color, if stroked.
	std::optional<core::ColorSample> fill{};   //!< Fill color, if filled.
	double width{1.0};                         //!< Stroke width.
};

struct PageSize {
	double width{0.0};
	double height{0.0};
};

/*! Source of vector drawings (e.g. a PDF page description).
 *  Implementations must allow concurrent const calls for different pages.
 */
class Document {
public:
	virtual ~Document() = default;

	virtual std::size_t pageCount() const = 0;

	//! Page size in the same units as the drawing coordinates. Nullopt for an invalid page.
	virtual std::optional<PageSize> pageSize(std::size_t page) const = 0;

	//! All vector drawings of a page. Empty for an invalid page.
	virtual std::vector<Drawing> drawings(std::size_t page) const = 0;
};

} // namespace wirescan::detection
