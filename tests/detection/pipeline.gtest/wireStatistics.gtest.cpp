#include "detection/wireStatistics.hpp"

#include <gtest/gtest.h>

#include <array>
#include <sstream>
#include <vector>

namespace wirescan::detection {
namespace gtest {

using namespace core;

using Buckets = std::array<std::vector<LineSegment>, LINE_TYPE_COUNT>;

static const ColorSample BLACK{0.0, 0.0, 0.0};
static const ColorSample RED{1.0, 0.0, 0.0};
static const ColorSample GREEN{0.0, 1.0, 0.0};

static void addLine(Buckets& buckets, const LineType type, const LineSegment& segment) {
	buckets[static_cast<std::size_t>(type)].push_back(segment);
}

static WireStatistics makeStatsA() {
	Buckets buckets{};
	addLine(buckets, LineType::Wire, makeSegment(0, {0, 0}, {40, 0}, RED));
	addLine(buckets, LineType::Wire, makeSegment(0, {0, 0}, {0, 60}, GREEN));
	addLine(buckets, LineType::Border, makeSegment(0, {0, 5}, {590, 5}, BLACK));
	return computeStatistics(buckets, std::vector<WirePath>(2), {});
}

static WireStatistics makeStatsB() {
	Buckets buckets{};
	addLine(buckets, LineType::Wire, makeSegment(1, {0, 0}, {300, 0}, RED));
	addLine(buckets, LineType::TableGrid, makeSegment(1, {0, 10}, {100, 10}, BLACK));
	return computeStatistics(buckets, std::vector<WirePath>(1), {cv::Point2d(0, 0)});
}

static void expectEqual(const WireStatistics& a, const WireStatistics& b) {
	EXPECT_EQ(a.pageCount, b.pageCount);
	EXPECT_EQ(a.totalSegments, b.totalSegments);
	EXPECT_EQ(a.lineTypeCounts, b.lineTypeCounts);
	EXPECT_EQ(a.colorCounts, b.colorCounts);
	EXPECT_EQ(a.voltageCounts, b.voltageCounts);
	EXPECT_EQ(a.wireCount, b.wireCount);
	EXPECT_DOUBLE_EQ(a.wireLengthSum, b.wireLengthSum);
	EXPECT_DOUBLE_EQ(a.minWireLength, b.minWireLength);
	EXPECT_DOUBLE_EQ(a.maxWireLength, b.maxWireLength);
	EXPECT_EQ(a.horizontalCount, b.horizontalCount);
	EXPECT_EQ(a.verticalCount, b.verticalCount);
	EXPECT_EQ(a.pathCount, b.pathCount);
	EXPECT_EQ(a.junctionCount, b.junctionCount);
}

TEST(WireStatistics, ComputePage) {
	const WireStatistics stats = makeStatsA();
	EXPECT_EQ(stats.pageCount, 1u);
	EXPECT_EQ(stats.totalSegments, 3u);
	EXPECT_EQ(countOf(stats, LineType::Wire), 2u);
	EXPECT_EQ(countOf(stats, LineType::Border), 1u);
	EXPECT_EQ(countOf(stats, WireColor::Red), 1u);
	EXPECT_EQ(countOf(stats, WireColor::Green), 1u);
	EXPECT_EQ(countOf(stats, WireColor::Black), 0u); // Border lines are not wires.
	EXPECT_EQ(stats.voltageCounts.at("PE"), 1u);
	EXPECT_DOUBLE_EQ(stats.minWireLength, 40.0);
	EXPECT_DOUBLE_EQ(stats.maxWireLength, 60.0);
	EXPECT_DOUBLE_EQ(averageWireLength(stats), 50.0);
	EXPECT_EQ(stats.pathCount, 2u);
}

TEST(WireStatistics, Merge_IsCommutative) {
	WireStatistics ab{};
	merge(ab, makeStatsA());
	merge(ab, makeStatsB());

	WireStatistics ba{};
	merge(ba, makeStatsB());
	merge(ba, makeStatsA());

	expectEqual(ab, ba);
	EXPECT_EQ(ab.pageCount, 2u);
	EXPECT_EQ(ab.wireCount, 3u);
	EXPECT_DOUBLE_EQ(ab.minWireLength, 40.0);
	EXPECT_DOUBLE_EQ(ab.maxWireLength, 300.0);
	EXPECT_DOUBLE_EQ(averageWireLength(ab), 400.0 / 3.0);
	EXPECT_EQ(ab.voltageCounts.at("24VDC"), 2u);
	EXPECT_EQ(ab.junctionCount, 1u);
}

TEST(WireStatistics, Merge_EmptyPageKeepsExtremes) {
	WireStatistics merged = makeStatsB();
	merge(merged, computeStatistics(Buckets{}, {}, {}));

	EXPECT_EQ(merged.pageCount, 2u);
	EXPECT_DOUBLE_EQ(merged.minWireLength, 300.0);
	EXPECT_DOUBLE_EQ(merged.maxWireLength, 300.0);
}

TEST(WireStatistics, Print) {
	std::ostringstream os;
	printStatistics(os, makeStatsA());
	const std::string report = os.str();
	EXPECT_NE(report.find("Wires:     2"), std::string::npos);
	EXPECT_NE(report.find("red"), std::string::npos);
	EXPECT_NE(report.find("PE"), std::string::npos);
}

} // namespace gtest
} // namespace wirescan::detection
