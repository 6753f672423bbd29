#include "detection/core/debugVisualizer.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

namespace wirescan::detection::core {

namespace {

static constexpr int TILE_SIZE     = 420; //!< Square tile per debug image.
static constexpr int ROW_LABEL_W   = 180; //!< Stage name column.
static constexpr int TILE_LABEL_H  = 26;
static constexpr int TILE_PAD      = 4;
static constexpr int MAX_MOSAIC_W  = 2400;

static const cv::Scalar BG(30, 30, 30);
static const cv::Scalar LABEL_BG(0, 0, 0);
static const cv::Scalar LABEL_FG(255, 255, 255);

//! Scale an image into a cell, keeping the aspect ratio, centered below the label bar.
static void placeInCell(const cv::Mat& image, cv::Mat& cell) {
	const int availW = std::max(1, cell.cols - 2 * TILE_PAD);
	const int availH = std::max(1, cell.rows - TILE_LABEL_H - 2 * TILE_PAD);

	const double scale = std::min(static_cast<double>(availW) / image.cols, static_cast<double>(availH) / image.rows);
	const int w        = std::clamp(static_cast<int>(std::lround(image.cols * scale)), 1, availW);
	const int h        = std::clamp(static_cast<int>(std::lround(image.rows * scale)), 1, availH);

	cv::Mat resized;
	cv::resize(image, resized, cv::Size(w, h), 0.0, 0.0, scale < 1.0 ? cv::INTER_AREA : cv::INTER_LINEAR);

	const int x0 = TILE_PAD + (availW - w) / 2;
	const int y0 = TILE_LABEL_H + TILE_PAD + (availH - h) / 2;
	resized.copyTo(cell(cv::Rect(x0, y0, w, h)));
}

} // namespace

void DebugVisualizer::beginStage(std::string name) {
	if (m_hasActiveStage) {
		endStage();
	}
	m_hasActiveStage    = true;
	m_currentStage.name = std::move(name);
}

void DebugVisualizer::endStage() {
	if (!m_hasActiveStage) {
		return;
	}

	m_stages.emplace_back(std::move(m_currentStage));
	m_currentStage   = DebugStage{};
	m_hasActiveStage = false;
}

void DebugVisualizer::add(std::string name, const cv::Mat& img) {
	if (!m_hasActiveStage) {
		std::cerr << "[Warning] DebugVisualizer::add(\"" << name << "\") without an active stage.\n";
		return;
	}
	m_currentStage.images.push_back(DebugStep{std::move(name), img.clone()});
}

const std::vector<DebugStage>& DebugVisualizer::stages() const {
	return m_stages;
}

std::size_t DebugVisualizer::stageCount() const {
	return m_stages.size();
}

void DebugVisualizer::clear() {
	m_stages.clear();
	m_currentStage   = DebugStage{};
	m_hasActiveStage = false;
}

cv::Mat DebugVisualizer::buildMosaic() {
	if (m_hasActiveStage) {
		endStage();
	}

	std::vector<const DebugStage*> all;
	all.reserve(m_stages.size());
	for (const auto& stage: m_stages) {
		all.push_back(&stage);
	}
	return buildRows(all);
}

cv::Mat DebugVisualizer::buildStageMosaic(const std::size_t stageIndex) const {
	if (stageIndex >= m_stages.size()) {
		return {};
	}
	return buildRows({&m_stages[stageIndex]});
}

//! One row per stage: stage label on the left, then one labelled tile per step.
cv::Mat DebugVisualizer::buildRows(const std::vector<const DebugStage*>& stages) {
	std::size_t maxSteps = 0;
	for (const auto* stage: stages) {
		maxSteps = std::max(maxSteps, stage->images.size());
	}
	if (maxSteps == 0) {
		return {};
	}

	const int cols  = static_cast<int>(maxSteps);
	const int tileW = std::max(64, std::min(TILE_SIZE, (MAX_MOSAIC_W - ROW_LABEL_W) / cols));
	const int tileH = tileW;
	const int rows  = static_cast<int>(stages.size());

	cv::Mat mosaic(rows * tileH, ROW_LABEL_W + cols * tileW, CV_8UC3, BG);

	for (int r = 0; r < rows; ++r) {
		const DebugStage& stage = *stages[static_cast<std::size_t>(r)];
		const int y             = r * tileH;

		cv::Mat label = mosaic(cv::Rect(0, y, ROW_LABEL_W, tileH));
		label.setTo(LABEL_BG);
		const std::string text = stage.name.empty() ? "Stage " + std::to_string(r + 1) : stage.name;
		cv::putText(label, text, cv::Point(8, tileH / 2), cv::FONT_HERSHEY_SIMPLEX, 0.5, LABEL_FG, 1, cv::LINE_AA);

		for (std::size_t c = 0; c < stage.images.size(); ++c) {
			const DebugStep& step = stage.images[c];
			cv::Mat cell          = mosaic(cv::Rect(ROW_LABEL_W + static_cast<int>(c) * tileW, y, tileW, tileH));

			cv::rectangle(cell, cv::Rect(0, 0, cell.cols, TILE_LABEL_H), LABEL_BG, cv::FILLED);
			cv::putText(cell, step.name, cv::Point(TILE_PAD, 18), cv::FONT_HERSHEY_SIMPLEX, 0.5, LABEL_FG, 1, cv::LINE_AA);

			if (step.image.empty()) {
				continue;
			}
			placeInCell(toBgr8U(step.image), cell);
		}
	}

	return mosaic;
}

cv::Mat DebugVisualizer::toBgr8U(const cv::Mat& in) {
	cv::Mat out;

	// normalize depth to 8U for visualization
	if (in.depth() != CV_8U) {
		cv::normalize(in, out, 0.0, 255.0, cv::NORM_MINMAX, CV_8U);
	} else {
		out = in;
	}

	if (out.channels() == 1) {
		cv::cvtColor(out, out, cv::COLOR_GRAY2BGR);
	} else if (out.channels() == 4) {
		cv::cvtColor(out, out, cv::COLOR_BGRA2BGR);
	}
	return out;
}

} // namespace wirescan::detection::core
