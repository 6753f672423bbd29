#pragma once

#include "pipelineStep.hpp"

#include <QImage>
#include <QMainWindow>
#include <QWidget>

#include <opencv2/core/mat.hpp>

#include <cstddef>
#include <functional>

class QComboBox;

namespace wirescan {

//! Shows a BGR debug mosaic (CV_8UC3) scaled to the widget.
class MosaicView : public QWidget {
public:
	explicit MosaicView(QWidget* parent = nullptr);
	void setMosaic(const cv::Mat& mosaic);

protected:
	void paintEvent(QPaintEvent* event) override;

private:
	QImage m_image{};
};

//! Page and pipeline stage selection with the debug mosaic of the selection below.
class MainWindow : public QMainWindow {
public:
	using SelectionChangedCallback = std::function<void(std::size_t page, PipelineStep step)>;

	explicit MainWindow(std::size_t pageCount, QWidget* parent = nullptr);
	~MainWindow() override;

	void setImage(const cv::Mat& image);
	void setSelectionChangedCallback(SelectionChangedCallback callback);

	std::size_t selectedPage() const;
	PipelineStep selectedPipelineStep() const;

private:
	void buildLayout(std::size_t pageCount);
	void notifySelectionChanged();

private:
	MosaicView* m_mosaicView{nullptr};
	QComboBox* m_pageCombo{nullptr};
	QComboBox* m_stepCombo{nullptr};
	SelectionChangedCallback m_selectionChangedCallback{};
};

} // namespace wirescan
