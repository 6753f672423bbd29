#include "detection/core/colorClassifier.hpp"

#include <algorithm>
#include <cmath>

namespace wirescan::detection::core {

namespace {

static constexpr double BLACK_MAX_VALUE      = 0.15;
static constexpr double WHITE_MIN_VALUE      = 0.85;
static constexpr double NEUTRAL_MAX_SAT      = 0.15; //!< White and gray are unsaturated.
static constexpr double GRAY_MIN_VALUE       = 0.30;
static constexpr double SATURATED_MIN_SAT    = 0.25; //!< Hue is only trusted above this saturation.
static constexpr double BROWN_MAX_VALUE      = 0.60;
static constexpr double DOMINANCE_MIN        = 0.5;
static constexpr double DOMINANCE_OTHERS_MAX = 0.4;
static constexpr double DOMINANCE_RATIO      = 1.5;

//! Classify by hue band. Only called for saturated samples.
static bool classifyHue(const Hsv& hsv, const ColorSample& rgb, WireColor& out) {
	const double h = hsv.hue;
	const double r = rgb[0];
	const double g = rgb[1];

	if (h < 20.0 || h > 340.0) {
		out = WireColor::Red;
		return true;
	}
	if (h >= 20.0 && h < 45.0) {
		out = WireColor::Orange;
		return true;
	}
	if (h >= 45.0 && h < 80.0) {
		// Typical yellow-green protective earth.
		out = (g > 0.5 && r > 0.5) ? WireColor::YellowGreen : WireColor::Other;
		return true;
	}
	if (h >= 80.0 && h < 160.0) {
		out = WireColor::Green;
		return true;
	}
	if (h >= 200.0 && h < 260.0) {
		out = WireColor::Blue;
		return true;
	}
	// Overlaps the orange band. Only hue in [15, 20) can still reach this.
	if (h >= 15.0 && h < 40.0 && hsv.value < BROWN_MAX_VALUE) {
		out = WireColor::Brown;
		return true;
	}
	return false;
}

//! One channel clearly dominates the two others.
static bool dominates(double channel, double otherA, double otherB) {
	return channel > DOMINANCE_MIN && otherA < DOMINANCE_OTHERS_MAX && otherB < DOMINANCE_OTHERS_MAX &&
	       channel > std::max(otherA, otherB) * DOMINANCE_RATIO;
}

//! RGB ratio heuristics for samples the HSV rules did not settle.
static WireColor classifyRgbFallback(const ColorSample& rgb) {
	const double r = rgb[0];
	const double g = rgb[1];
	const double b = rgb[2];

	if (dominates(r, g, b)) {
		return WireColor::Red;
	}
	if (dominates(b, r, g)) {
		return WireColor::Blue;
	}
	if (dominates(g, r, b)) {
		return WireColor::Green;
	}
	if (r > 0.3 && r < 0.7 && g < 0.4 && b < 0.3) {
		return WireColor::Brown;
	}
	if (r < 0.25 && g < 0.25 && b < 0.25) {
		return WireColor::Black;
	}
	return WireColor::Other;
}

static ColorSample clampSample(const ColorSample& rgb) {
	return {std::clamp(rgb[0], 0.0, 1.0), std::clamp(rgb[1], 0.0, 1.0), std::clamp(rgb[2], 0.0, 1.0)};
}

} // namespace

Hsv rgbToHsv(const ColorSample& rgb) {
	const ColorSample c = clampSample(rgb);
	const double r      = c[0];
	const double g      = c[1];
	const double b      = c[2];

	// Double precision: classification thresholds are compared exactly.
	const double maxc = std::max({r, g, b});
	const double minc = std::min({r, g, b});
	if (maxc == minc) {
		return {0.0, 0.0, maxc};
	}

	const double delta = maxc - minc;
	const double rc    = (maxc - r) / delta;
	const double gc    = (maxc - g) / delta;
	const double bc    = (maxc - b) / delta;

	double h = 0.0;
	if (r == maxc) {
		h = bc - gc;
	} else if (g == maxc) {
		h = 2.0 + rc - bc;
	} else {
		h = 4.0 + gc - rc;
	}
	h = std::fmod(h / 6.0, 1.0);
	if (h < 0.0) {
		h += 1.0;
	}
	return {h * 360.0, delta / maxc, maxc};
}

WireColor classifyColor(const ColorSample& sample) {
	const ColorSample rgb = clampSample(sample);
	const Hsv hsv         = rgbToHsv(rgb);

	if (hsv.value < BLACK_MAX_VALUE) {
		return WireColor::Black;
	}
	// White before gray: both are unsaturated, white is brighter.
	if (hsv.value > WHITE_MIN_VALUE && hsv.saturation < NEUTRAL_MAX_SAT) {
		return WireColor::White;
	}
	if (hsv.saturation < NEUTRAL_MAX_SAT && hsv.value > GRAY_MIN_VALUE && hsv.value <= WHITE_MIN_VALUE) {
		return WireColor::Gray;
	}

	if (hsv.saturation >= SATURATED_MIN_SAT) {
		WireColor color = WireColor::Other;
		if (classifyHue(hsv, rgb, color)) {
			return color;
		}
	}

	return classifyRgbFallback(rgb);
}

std::string_view toString(const WireColor color) {
	switch (color) {
	case WireColor::Red:
		return "red";
	case WireColor::Blue:
		return "blue";
	case WireColor::Green:
		return "green";
	case WireColor::YellowGreen:
		return "yellow_green";
	case WireColor::Black:
		return "black";
	case WireColor::Brown:
		return "brown";
	case WireColor::White:
		return "white";
	case WireColor::Orange:
		return "orange";
	case WireColor::Gray:
		return "gray";
	case WireColor::Other:
		return "other";
	}
	return "other";
}

} // namespace wirescan::detection::core
