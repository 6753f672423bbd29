#pragma once

#include <opencv2/core/matx.hpp>

#include <cstddef>
#include <string_view>

namespace wirescan::detection::core {

//! Stroke color sample. Channels are (red, green, blue), each in [0, 1].
using ColorSample = cv::Vec3d;

//! Semantic wire color buckets (industrial wiring conventions).
enum class WireColor { Red, Blue, Green, YellowGreen, Black, Brown, White, Orange, Gray, Other };

static constexpr std::size_t WIRE_COLOR_COUNT = 10u;

//! Color sample in HSV space.
struct Hsv {
	double hue;        //!< Degrees in [0, 360).
	double saturation; //!< [0, 1]
	double value;      //!< [0, 1]
};

//! Convert an RGB sample (channels in [0, 1]) to HSV.
Hsv rgbToHsv(const ColorSample& rgb);

/*! Map a color sample onto the wire color palette.
 *  Rules are evaluated in a fixed order (black, white, gray, saturated hue bands, RGB ratio fallback) and the first match wins.
 *  Every sample maps to exactly one color. Unrecognised samples resolve to WireColor::Other.
 *
 * \param [in] rgb Color sample, channels in [0, 1]. Values outside are clamped.
 * \return     Wire color bucket.
 */
WireColor classifyColor(const ColorSample& rgb);

std::string_view toString(WireColor color);

} // namespace wirescan::detection::core
