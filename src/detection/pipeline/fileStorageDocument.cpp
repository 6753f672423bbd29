#include "detection/fileStorageDocument.hpp"

#include <iostream>
#include <string_view>

#include <opencv2/core.hpp>
#include <opencv2/core/persistence.hpp>

namespace wirescan::detection {

namespace {

static bool isNumber(const cv::FileNode& node) {
	return node.isReal() || node.isInt();
}

static PathCommand parseCommand(const std::string_view cmd) {
	if (cmd == "l")
		return PathCommand::Line;
	if (cmd == "m")
		return PathCommand::Move;
	if (cmd == "c")
		return PathCommand::Curve;
	if (cmd == "re")
		return PathCommand::Rect;
	if (cmd == "qu")
		return PathCommand::Quad;
	return PathCommand::Unsupported;
}

//! Flat number sequence (x0, y0, x1, y1, ...) to points. Nullopt if odd or not numeric.
static std::optional<std::vector<cv::Point2d>> parsePoints(const cv::FileNode& node) {
	if (!node.isSeq() || node.size() % 2u != 0u) {
		return std::nullopt;
	}

	std::vector<cv::Point2d> points;
	points.reserve(node.size() / 2u);
	for (std::size_t i = 0; i + 1u < node.size(); i += 2u) {
		const cv::FileNode x = node[static_cast<int>(i)];
		const cv::FileNode y = node[static_cast<int>(i + 1u)];
		if (!isNumber(x) || !isNumber(y)) {
			return std::nullopt;
		}
		points.emplace_back(x.real(), y.real());
	}
	return points;
}

//! RGB triple. Nullopt if missing or malformed.
static std::optional<core::ColorSample> parseColor(const cv::FileNode& node) {
	if (!node.isSeq() || node.size() != 3u) {
		return std::nullopt;
	}
	core::ColorSample color;
	for (int c = 0; c < 3; ++c) {
		if (!isNumber(node[c])) {
			return std::nullopt;
		}
		color[c] = node[c].real();
	}
	return color;
}

static PathItem parseItem(const cv::FileNode& node) {
	PathItem item{};
	if (!node.isMap() || !node["cmd"].isString()) {
		return item;
	}

	const auto points = parsePoints(node["points"]);
	if (!points.has_value()) {
		return item;
	}
	item.command = parseCommand(node["cmd"].string());
	item.points  = *points;
	return item;
}

static Drawing parseDrawing(const cv::FileNode& node) {
	Drawing drawing{};
	drawing.stroke = parseColor(node["stroke"]);
	drawing.fill   = parseColor(node["fill"]);
	if (isNumber(node["width"])) {
		drawing.width = node["width"].real();
	}

	const cv::FileNode items = node["items"];
	if (items.isSeq()) {
		for (auto it = items.begin(); it != items.end(); ++it) {
			drawing.items.push_back(parseItem(*it));
		}
	}
	return drawing;
}

} // namespace

std::optional<FileStorageDocument> FileStorageDocument::load(const std::filesystem::path& path) {
	try {
		cv::FileStorage fs(path.string(), cv::FileStorage::READ);
		if (!fs.isOpened()) {
			std::cerr << "[Error] Could not open document " << path << "\n";
			return std::nullopt;
		}
		return parse(fs.root(), path.string());
	} catch (const cv::Exception& e) {
		std::cerr << "[Error] Could not parse document " << path << ": " << e.what() << "\n";
		return std::nullopt;
	}
}

std::optional<FileStorageDocument> FileStorageDocument::fromString(const std::string& content) {
	try {
		cv::FileStorage fs(content, cv::FileStorage::READ | cv::FileStorage::MEMORY);
		if (!fs.isOpened()) {
			std::cerr << "[Error] Could not read in-memory document\n";
			return std::nullopt;
		}
		return parse(fs.root(), "<memory>");
	} catch (const cv::Exception& e) {
		std::cerr << "[Error] Could not parse in-memory document: " << e.what() << "\n";
		return std::nullopt;
	}
}

std::optional<FileStorageDocument> FileStorageDocument::parse(const cv::FileNode& root, const std::string& source) {
	const cv::FileNode pages = root["pages"];
	if (!pages.isSeq()) {
		std::cerr << "[Error] Document " << source << " has no page list\n";
		return std::nullopt;
	}

	FileStorageDocument document;
	for (auto it = pages.begin(); it != pages.end(); ++it) {
		const cv::FileNode node = *it;
		if (!isNumber(node["width"]) || !isNumber(node["height"])) {
			std::cerr << "[Error] Document " << source << ": page " << document.m_pages.size() << " has no valid size\n";
			return std::nullopt;
		}

		Page page{};
		page.size = PageSize{node["width"].real(), node["height"].real()};

		const cv::FileNode drawings = node["drawings"];
		if (drawings.isSeq()) {
			for (auto d = drawings.begin(); d != drawings.end(); ++d) {
				page.drawings.push_back(parseDrawing(*d));
			}
		}
		document.m_pages.push_back(std::move(page));
	}
	return document;
}

std::size_t FileStorageDocument::pageCount() const {
	return m_pages.size();
}

std::optional<PageSize> FileStorageDocument::pageSize(const std::size_t page) const {
	if (page >= m_pages.size()) {
		return std::nullopt;
	}
	return m_pages[page].size;
}

std::vector<Drawing> FileStorageDocument::drawings(const std::size_t page) const {
	if (page >= m_pages.size()) {
		return {};
	}
	return m_pages[page].drawings;
}

} // namespace wirescan::detection
