#include "mainWindow.hpp"

#include <QComboBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QPainter>
#include <QVBoxLayout>

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <string>
#include <utility>

namespace wirescan {

MosaicView::MosaicView(QWidget* parent) : QWidget(parent) {
}

void MosaicView::setMosaic(const cv::Mat& mosaic) {
	m_image = QImage{};
	if (!mosaic.empty() && mosaic.type() == CV_8UC3) {
		cv::Mat rgb;
		cv::cvtColor(mosaic, rgb, cv::COLOR_BGR2RGB);
		m_image = QImage(rgb.data, rgb.cols, rgb.rows, static_cast<int>(rgb.step), QImage::Format_RGB888).copy();
	}
	update();
}

void MosaicView::paintEvent(QPaintEvent* event) {
	QWidget::paintEvent(event);

	QPainter painter(this);
	painter.fillRect(rect(), Qt::white);
	if (m_image.isNull()) {
		painter.drawText(rect(), Qt::AlignCenter, "No debug output for this page");
		return;
	}

	// Centered, aspect kept.
	const QImage scaled = m_image.scaled(size(), Qt::KeepAspectRatio, Qt::SmoothTransformation);
	painter.drawImage(QPoint((width() - scaled.width()) / 2, (height() - scaled.height()) / 2), scaled);
}

MainWindow::MainWindow(const std::size_t pageCount, QWidget* parent) : QMainWindow(parent) {
	setWindowTitle("Wire Inspector");
	buildLayout(pageCount);
}

MainWindow::~MainWindow() = default;

void MainWindow::setImage(const cv::Mat& image) {
	if (m_mosaicView != nullptr) {
		m_mosaicView->setMosaic(image);
	}
}

void MainWindow::setSelectionChangedCallback(SelectionChangedCallback callback) {
	m_selectionChangedCallback = std::move(callback);
}

std::size_t MainWindow::selectedPage() const {
	return m_pageCombo != nullptr ? static_cast<std::size_t>(std::max(0, m_pageCombo->currentIndex())) : 0u;
}

PipelineStep MainWindow::selectedPipelineStep() const {
	if (m_stepCombo == nullptr) {
		return PipelineStep::All;
	}
	return static_cast<PipelineStep>(m_stepCombo->currentData().toInt());
}

void MainWindow::notifySelectionChanged() {
	if (m_selectionChangedCallback) {
		m_selectionChangedCallback(selectedPage(), selectedPipelineStep());
	}
}

void MainWindow::buildLayout(const std::size_t pageCount) {
	auto* rootWidget = new QWidget(this);
	auto* rootLayout = new QVBoxLayout(rootWidget);
	auto* selectRow  = new QHBoxLayout();
	auto* pageLabel  = new QLabel("Page:", rootWidget);
	auto* stepLabel  = new QLabel("Stage:", rootWidget);

	m_pageCombo = new QComboBox(rootWidget);
	for (std::size_t page = 0; page < pageCount; ++page) {
		m_pageCombo->addItem(QString::fromStdString(std::to_string(page + 1)));
	}
	m_pageCombo->setCurrentIndex(pageCount > 0u ? 0 : -1);

	m_stepCombo = new QComboBox(rootWidget);
	m_stepCombo->addItem("All", static_cast<int>(PipelineStep::All));
	m_stepCombo->addItem("Extraction", static_cast<int>(PipelineStep::Extraction));
	m_stepCombo->addItem("Classification", static_cast<int>(PipelineStep::Classification));
	m_stepCombo->addItem("Tracing", static_cast<int>(PipelineStep::Tracing));
	m_stepCombo->setCurrentIndex(0);

	connect(m_pageCombo, &QComboBox::currentIndexChanged, this, [this](int) { notifySelectionChanged(); });
	connect(m_stepCombo, &QComboBox::currentIndexChanged, this, [this](int) { notifySelectionChanged(); });

	selectRow->addWidget(pageLabel);
	selectRow->addWidget(m_pageCombo);
	selectRow->addWidget(stepLabel);
	selectRow->addWidget(m_stepCombo);
	selectRow->addStretch(1);

	m_mosaicView = new MosaicView(rootWidget);

	rootLayout->addLayout(selectRow);
	rootLayout->addWidget(m_mosaicView, 1);

	setCentralWidget(rootWidget);
}

} // namespace wirescan
