#include "detection/fileStorageDocument.hpp"
#include "detection/documentAnalysis.hpp"
#include "detection/pagePipeline.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

namespace wirescan::detection {
namespace gtest {

using namespace core;

static std::filesystem::path testFile(const std::string& name) {
	return std::filesystem::path(PATH_TEST_DATA) / name;
}

TEST(FileStorageDocument, LoadYaml) {
	const auto document = FileStorageDocument::load(testFile("schematic.yml"));
	ASSERT_TRUE(document.has_value());
	ASSERT_EQ(document->pageCount(), 2u);

	const auto size = document->pageSize(0u);
	ASSERT_TRUE(size.has_value());
	EXPECT_DOUBLE_EQ(size->width, 800.0);
	EXPECT_DOUBLE_EQ(size->height, 600.0);

	const auto drawings = document->drawings(0u);
	ASSERT_EQ(drawings.size(), 4u);

	ASSERT_TRUE(drawings[1].stroke.has_value());
	EXPECT_DOUBLE_EQ((*drawings[1].stroke)[0], 1.0);
	EXPECT_FALSE(drawings[1].fill.has_value());
	ASSERT_EQ(drawings[1].items.size(), 4u);
	EXPECT_EQ(drawings[1].items[0].command, PathCommand::Move);
	EXPECT_EQ(drawings[1].items[1].command, PathCommand::Line);
	ASSERT_EQ(drawings[1].items[1].points.size(), 2u);
	EXPECT_EQ(drawings[1].items[1].points[1], cv::Point2d(220, 300));

	EXPECT_DOUBLE_EQ(drawings[2].width, 0.5);
	EXPECT_TRUE(drawings[2].fill.has_value());

	EXPECT_FALSE(drawings[3].stroke.has_value());
	ASSERT_EQ(drawings[3].items.size(), 1u);
	EXPECT_EQ(drawings[3].items[0].command, PathCommand::Rect);
}

TEST(FileStorageDocument, MalformedItems_AreUnsupported) {
	const auto document = FileStorageDocument::load(testFile("schematic.yml"));
	ASSERT_TRUE(document.has_value());

	const auto drawings = document->drawings(1u);
	ASSERT_EQ(drawings.size(), 1u);
	const auto& items = drawings[0].items;
	ASSERT_EQ(items.size(), 5u);
	EXPECT_EQ(items[0].command, PathCommand::Line);
	EXPECT_EQ(items[1].command, PathCommand::Curve);
	EXPECT_EQ(items[1].points.size(), 4u);
	EXPECT_EQ(items[2].command, PathCommand::Unsupported); // Non-numeric coordinate.
	EXPECT_EQ(items[3].command, PathCommand::Unsupported); // Unknown command.
	EXPECT_EQ(items[4].command, PathCommand::Unsupported); // No command.

	// Only the single straight line survives extraction.
	const auto segments = extractSegments(*document, 1u);
	ASSERT_EQ(segments.size(), 1u);
	EXPECT_EQ(segments[0].color, WireColor::Green);
	EXPECT_EQ(voltageType(segments[0]), "PE");
}

TEST(FileStorageDocument, InvalidPage) {
	const auto document = FileStorageDocument::load(testFile("schematic.yml"));
	ASSERT_TRUE(document.has_value());
	EXPECT_FALSE(document->pageSize(2u).has_value());
	EXPECT_TRUE(document->drawings(2u).empty());
}

TEST(FileStorageDocument, LoadJson) {
	const auto document = FileStorageDocument::load(testFile("schematic.json"));
	ASSERT_TRUE(document.has_value());
	ASSERT_EQ(document->pageCount(), 1u);

	const PageResult result = analysePage(*document, 0u);
	ASSERT_TRUE(result.success);
	EXPECT_EQ(linesOf(result.lines, LineType::Wire).size(), 2u);
	ASSERT_EQ(result.paths.size(), 1u);
	EXPECT_EQ(voltageType(result.paths[0]), "0V");
	EXPECT_TRUE(result.junctions.empty());
}

TEST(FileStorageDocument, FromString) {
	const std::string yaml = "%YAML:1.0\n"
	                         "---\n"
	                         "pages:\n"
	                         "   - { width: 400, height: 300, drawings: [ { stroke: [ 1, 0, 0 ], items: [ { cmd: l, points: [ 50, 150, 250, 150 ] } ] } ] }\n";

	const auto document = FileStorageDocument::fromString(yaml);
	ASSERT_TRUE(document.has_value());
	ASSERT_EQ(document->pageCount(), 1u);

	const auto drawings = document->drawings(0u);
	ASSERT_EQ(drawings.size(), 1u);
	EXPECT_DOUBLE_EQ(drawings[0].width, 1.0); // Default stroke width.
	EXPECT_EQ(detectWiresOnly(*document, 0u).size(), 1u);
}

TEST(FileStorageDocument, AnalyseWholeDocument) {
	const auto document = FileStorageDocument::load(testFile("schematic.yml"));
	ASSERT_TRUE(document.has_value());

	const DocumentResult result = analyseDocument(*document, PipelineConfig{}, 2u);
	ASSERT_TRUE(result.success);
	EXPECT_EQ(result.statistics.pageCount, 2u);
	EXPECT_EQ(result.statistics.wireCount, 5u);
	EXPECT_EQ(countOf(result.statistics, LineType::Border), 1u);
	EXPECT_EQ(result.statistics.junctionCount, 1u);
	EXPECT_EQ(result.statistics.voltageCounts.at("PE"), 1u);
}

TEST(FileStorageDocument, MissingFile) {
	EXPECT_FALSE(FileStorageDocument::load(testFile("does_not_exist.yml")).has_value());
}

TEST(FileStorageDocument, NoPageList) {
	EXPECT_FALSE(FileStorageDocument::load(testFile("no_pages.yml")).has_value());
}

} // namespace gtest
} // namespace wirescan::detection
