#pragma once

#include "detection/document.hpp"

#include <initializer_list>
#include <utility>
#include <vector>

namespace wirescan::detection::gtest {

//! In-memory document for the pipeline tests.
class TestDocument : public Document {
public:
	struct Page {
		PageSize size{};
		std::vector<Drawing> drawings{};
	};

	void addPage(const PageSize size, std::vector<Drawing> drawings = {}) {
		m_pages.push_back(Page{size, std::move(drawings)});
	}

	std::size_t pageCount() const override {
		return m_pages.size();
	}
	std::optional<PageSize> pageSize(const std::size_t page) const override {
		if (page >= m_pages.size()) {
			return std::nullopt;
		}
		return m_pages[page].size;
	}
	std::vector<Drawing> drawings(const std::size_t page) const override {
		if (page >= m_pages.size()) {
			return {};
		}
		return m_pages[page].drawings;
	}

private:
	std::vector<Page> m_pages{};
};

//! Stroked drawing made of straight lines.
inline Drawing strokedLines(const core::ColorSample& stroke, std::initializer_list<std::pair<cv::Point2d, cv::Point2d>> lines, double width = 1.0) {
	Drawing drawing{};
	drawing.stroke = stroke;
	drawing.width  = width;
	for (const auto& [start, end]: lines) {
		drawing.items.push_back(PathItem{PathCommand::Line, {start, end}});
	}
	return drawing;
}

} // namespace wirescan::detection::gtest
