#include "detection/core/wirePathTracer.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

namespace wirescan::detection::core {
namespace gtest {

static const ColorSample RED{1.0, 0.0, 0.0};
static const ColorSample BLUE{0.0, 0.0, 1.0};

static std::size_t segmentCount(const std::vector<WirePath>& paths) {
	std::size_t count = 0u;
	for (const auto& path: paths) {
		count += path.segments.size();
	}
	return count;
}

TEST(WirePathTracer, EmptyInput) {
	const WirePathTracer tracer;
	EXPECT_TRUE(tracer.tracePaths({}).empty());
	EXPECT_TRUE(tracer.findJunctions({}).empty());
}

TEST(WirePathTracer, ConnectedChain_IsOnePath) {
	const std::vector<LineSegment> segments = {
	        makeSegment(0, {0, 0}, {100, 0}, RED),
	        makeSegment(0, {100, 0}, {100, 100}, RED),
	        makeSegment(0, {100, 100}, {200, 100}, RED),
	};

	const WirePathTracer tracer;
	const auto paths = tracer.tracePaths(segments);
	ASSERT_EQ(paths.size(), 1u);
	EXPECT_EQ(paths[0].segments.size(), 3u);
	EXPECT_EQ(paths[0].color, WireColor::Red);
	EXPECT_DOUBLE_EQ(totalLength(paths[0]), 300.0);
	EXPECT_EQ(voltageType(paths[0]), "24VDC");

	const auto points = pathPoints(paths[0]);
	ASSERT_EQ(points.size(), 4u);
	EXPECT_EQ(points.front(), cv::Point2d(0, 0));
	EXPECT_EQ(points.back(), cv::Point2d(200, 100));
}

TEST(WirePathTracer, DifferentColors_StaySeparate) {
	const std::vector<LineSegment> segments = {
	        makeSegment(0, {0, 0}, {100, 0}, RED),
	        makeSegment(0, {100, 0}, {200, 0}, BLUE),
	};

	const WirePathTracer tracer;
	const auto paths = tracer.tracePaths(segments);
	ASSERT_EQ(paths.size(), 2u);
	for (const auto& path: paths) {
		ASSERT_EQ(path.segments.size(), 1u);
		EXPECT_EQ(path.segments[0].color, path.color);
	}
}

// A red wire that is only connected to another red wire through a blue one is not merged.
TEST(WirePathTracer, ColorGuard_NoTransitiveMerge) {
	const std::vector<LineSegment> segments = {
	        makeSegment(0, {0, 0}, {100, 0}, RED),
	        makeSegment(0, {100, 0}, {200, 0}, BLUE),
	        makeSegment(0, {200, 0}, {300, 0}, RED),
	};

	const WirePathTracer tracer;
	EXPECT_EQ(tracer.tracePaths(segments).size(), 3u);
}

TEST(WirePathTracer, ClosedSquare_Terminates) {
	const std::vector<LineSegment> segments = {
	        makeSegment(0, {0, 0}, {50, 0}, RED),
	        makeSegment(0, {50, 0}, {50, 50}, RED),
	        makeSegment(0, {50, 50}, {0, 50}, RED),
	        makeSegment(0, {0, 50}, {0, 0}, RED),
	};

	const WirePathTracer tracer;
	const auto paths = tracer.tracePaths(segments);
	ASSERT_EQ(paths.size(), 1u);
	EXPECT_EQ(paths[0].segments.size(), 4u);
}

TEST(WirePathTracer, ToleranceBridge) {
	const WirePathTracer tracer; // tolerance 5

	const std::vector<LineSegment> close = {
	        makeSegment(0, {0, 0}, {100, 0}, RED),
	        makeSegment(0, {104.9, 0}, {200, 0}, RED),
	};
	EXPECT_EQ(tracer.tracePaths(close).size(), 1u);

	const std::vector<LineSegment> far = {
	        makeSegment(0, {0, 0}, {100, 0}, RED),
	        makeSegment(0, {105.1, 0}, {200, 0}, RED),
	};
	EXPECT_EQ(tracer.tracePaths(far).size(), 2u);
}

TEST(WirePathTracer, ZeroTolerance_OnlySharedEndpoints) {
	const WirePathTracer tracer(TracerConfig{0.0});
	const std::vector<LineSegment> segments = {
	        makeSegment(0, {0, 0}, {100, 0}, RED),
	        makeSegment(0, {100, 0}, {100, 50}, RED),
	        makeSegment(0, {101, 50}, {200, 50}, RED),
	};
	EXPECT_EQ(tracer.tracePaths(segments).size(), 2u);
}

// Every input segment ends up in exactly one path.
TEST(WirePathTracer, ExhaustivePartition) {
	std::vector<LineSegment> segments;
	for (int i = 0; i < 20; ++i) {
		const double y         = 10.0 * static_cast<double>(i / 4);
		const double x         = 30.0 * static_cast<double>(i % 4);
		const ColorSample& rgb = (i % 3 == 0) ? BLUE : RED;
		segments.push_back(makeSegment(0, {x, y}, {x + 30.0, y}, rgb));
	}

	const WirePathTracer tracer;
	const auto paths = tracer.tracePaths(segments);
	EXPECT_EQ(segmentCount(paths), segments.size());

	for (const auto& s: segments) {
		std::size_t occurrences = 0u;
		for (const auto& path: paths) {
			occurrences += static_cast<std::size_t>(std::count_if(path.segments.begin(), path.segments.end(), [&](const LineSegment& p) {
				return p.start == s.start && p.end == s.end;
			}));
		}
		EXPECT_EQ(occurrences, 1u);
	}
}

TEST(WirePathTracer, ThreeWayJoint_IsJunction) {
	const std::vector<LineSegment> segments = {
	        makeSegment(0, {0, 50}, {50, 50}, RED),
	        makeSegment(0, {50, 50}, {100, 50}, RED),
	        makeSegment(0, {50, 50}, {50, 100}, RED),
	};

	const WirePathTracer tracer;
	const auto junctions = tracer.findJunctions(segments);
	ASSERT_EQ(junctions.size(), 1u);
	EXPECT_EQ(junctions[0], cv::Point2d(50, 50));
}

TEST(WirePathTracer, TwoWayJoint_NoJunction) {
	const std::vector<LineSegment> segments = {
	        makeSegment(0, {0, 50}, {50, 50}, RED),
	        makeSegment(0, {50, 50}, {100, 50}, RED),
	};

	const WirePathTracer tracer;
	EXPECT_TRUE(tracer.findJunctions(segments).empty());
}

// Ends joined only within the tolerance form one path, but never a junction.
TEST(WirePathTracer, BridgedEnds_OnePathNoJunction) {
	const std::vector<LineSegment> segments = {
	        makeSegment(0, {0, 50}, {50, 50}, RED),
	        makeSegment(0, {52, 50}, {150, 50}, RED),
	        makeSegment(0, {50, 52}, {50, 150}, RED),
	};

	const WirePathTracer tracer;
	const auto paths = tracer.tracePaths(segments);
	ASSERT_EQ(paths.size(), 1u);
	EXPECT_EQ(paths[0].segments.size(), 3u);
	EXPECT_TRUE(tracer.findJunctions(segments).empty());
}

TEST(WirePathTracer, ZeroLengthSegment_IsOwnPath) {
	const std::vector<LineSegment> segments = {
	        makeSegment(0, {300, 300}, {300, 300}, RED),
	        makeSegment(0, {0, 50}, {100, 50}, RED),
	};

	const WirePathTracer tracer;
	const auto paths = tracer.tracePaths(segments);
	ASSERT_EQ(paths.size(), 2u);
	ASSERT_EQ(paths[0].segments.size(), 1u);
	EXPECT_EQ(paths[0].segments[0].start, cv::Point2d(300, 300));
	EXPECT_EQ(paths[1].segments.size(), 1u);
	EXPECT_TRUE(tracer.findJunctions(segments).empty());
}

TEST(WirePathTracer, EmptyPath) {
	const WirePath path{};
	EXPECT_TRUE(pathPoints(path).empty());
	EXPECT_DOUBLE_EQ(totalLength(path), 0.0);
	EXPECT_EQ(voltageType(path), "UNKNOWN");
}

} // namespace gtest
} // namespace wirescan::detection::core
