#include "detection/core/lineSegment.hpp"

#include <gtest/gtest.h>

#include <vector>

namespace wirescan::detection::core {
namespace gtest {

static const ColorSample RED{1.0, 0.0, 0.0};
static const ColorSample BLUE{0.0, 0.0, 1.0};

TEST(LineSegment, MakeSegmentClassifiesColor) {
	const LineSegment s = makeSegment(2, {0.0, 0.0}, {30.0, 40.0}, BLUE, 0.5);
	EXPECT_EQ(s.page, 2);
	EXPECT_EQ(s.color, WireColor::Blue);
	EXPECT_DOUBLE_EQ(s.thickness, 0.5);
	EXPECT_DOUBLE_EQ(length(s), 50.0);
	EXPECT_EQ(voltageType(s), "0V");
}

TEST(LineSegment, Orientation) {
	EXPECT_TRUE(isHorizontal(makeSegment(0, {0, 0}, {100, 10}, RED)));
	EXPECT_FALSE(isVertical(makeSegment(0, {0, 0}, {100, 10}, RED)));
	EXPECT_TRUE(isVertical(makeSegment(0, {0, 0}, {5, 100}, RED)));

	const LineSegment diagonal = makeSegment(0, {0, 0}, {50, 50}, RED);
	EXPECT_FALSE(isHorizontal(diagonal));
	EXPECT_FALSE(isVertical(diagonal));
}

TEST(LineSegment, DistanceToSegment) {
	const LineSegment s = makeSegment(0, {0, 0}, {100, 0}, RED);
	EXPECT_DOUBLE_EQ(distanceToSegment({50, 7}, s), 7.0);
	EXPECT_DOUBLE_EQ(distanceToSegment({-3, 4}, s), 5.0);  // Before the start.
	EXPECT_DOUBLE_EQ(distanceToSegment({106, 8}, s), 10.0); // Past the end.

	const LineSegment point = makeSegment(0, {10, 10}, {10, 10}, RED);
	EXPECT_DOUBLE_EQ(distanceToSegment({13, 14}, point), 5.0);
}

TEST(LineSegment, FindNearestWire) {
	const std::vector<LineSegment> segments = {
	        makeSegment(0, {0, 0}, {100, 0}, RED),
	        makeSegment(0, {0, 20}, {100, 20}, BLUE),
	};

	const auto nearest = findNearestWire({50, 14}, segments);
	ASSERT_TRUE(nearest.has_value());
	EXPECT_EQ(*nearest, 1u);

	EXPECT_FALSE(findNearestWire({50, 60}, segments).has_value());
	EXPECT_FALSE(findNearestWire({50, 14}, segments, 5.0).has_value());
	EXPECT_FALSE(findNearestWire({0, 0}, {}).has_value());
}

TEST(LineSegment, FilterByColor) {
	const std::vector<LineSegment> segments = {
	        makeSegment(0, {0, 0}, {100, 0}, RED),
	        makeSegment(0, {0, 20}, {100, 20}, BLUE),
	        makeSegment(0, {0, 40}, {100, 40}, RED),
	};

	const auto reds = filterByColor(segments, WireColor::Red);
	ASSERT_EQ(reds.size(), 2u);
	EXPECT_DOUBLE_EQ(reds[0].start.y, 0.0);
	EXPECT_DOUBLE_EQ(reds[1].start.y, 40.0);
	EXPECT_TRUE(filterByColor(segments, WireColor::Green).empty());
}

TEST(LineSegment, EndpointKeys) {
	EXPECT_EQ(endpointKey({10.0, 20.0}), endpointKey({10.0, 20.0}));
	EXPECT_EQ(endpointKey({10.0, 20.0}), endpointKey({10.02, 19.99}));
	EXPECT_FALSE(endpointKey({10.0, 20.0}) == endpointKey({10.3, 20.0}));
	EXPECT_EQ(EndpointKeyHash{}(endpointKey({1.0, 2.0})), EndpointKeyHash{}(endpointKey({1.0, 2.0})));
}

} // namespace gtest
} // namespace wirescan::detection::core
