#pragma once

#include <opencv2/core/mat.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace wirescan::detection::core {

//! Each step in the algorithm.
struct DebugStep {
	std::string name; //!< Some name.
	cv::Mat image;    //!< Image produced by the step.
};

//! Our wire detection runs in stages (extraction, classification, tracing). We collect the images per stage.
struct DebugStage {
	std::string name;                //!< Name of the stage.
	std::vector<DebugStep> images{}; //!< Image name pair for every step that was added.
};

//! Can be passed to the detection functions to get intermediate images for debugging purposes.
//! \note Not thread safe. Use one visualizer per page run.
class DebugVisualizer {
public:
	void beginStage(std::string name);              //!< New stage in the algorithm starts. Ends the active one.
	void add(std::string name, const cv::Mat& img); //!< Add an image to the active stage. Ignored if no stage is active.
	void endStage();

	const std::vector<DebugStage>& stages() const; //!< Completed stages.
	std::size_t stageCount() const;

	//! Mosaic of all debug images, one row per stage. Ends the active stage. Empty if nothing was recorded.
	cv::Mat buildMosaic();

	//! Mosaic of a single completed stage. Empty for an invalid index.
	cv::Mat buildStageMosaic(std::size_t stageIndex) const;

	void clear();

private:
	static cv::Mat toBgr8U(const cv::Mat& in);
	static cv::Mat buildRows(const std::vector<const DebugStage*>& stages);

private:
	DebugStage m_currentStage{};        //!< Currently active stage.
	bool m_hasActiveStage{false};       //!< A stage is active.
	std::vector<DebugStage> m_stages{}; //!< Collection of debug info for all stages.
};

} // namespace wirescan::detection::core
