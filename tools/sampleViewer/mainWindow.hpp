#pragma once

#include "sampling/batch.hpp"
#include "sampling/core/regionPlot.hpp"

#include <QImage>
#include <QMainWindow>
#include <QWidget>

#include <opencv2/core/mat.hpp>

#include <string>

class QComboBox;
class QLabel;
class QTableWidget;

namespace boothsampler {

//! Paints a BGR plot scaled to the widget, keeping its aspect ratio.
class PlotView : public QWidget {
public:
	explicit PlotView(QWidget* parent = nullptr);
	void setPlot(const cv::Mat& plot);

protected:
	void paintEvent(QPaintEvent* event) override;

private:
	QImage m_image{};
};

//! Shows the outcome of one run. Entry 0 of the region selector is the overview of all regions.
class MainWindow : public QMainWindow {
public:
	explicit MainWindow(QWidget* parent = nullptr);
	~MainWindow() override;

	//! Replace the displayed run. Renders every region plot once.
	void setRun(const sampling::BatchResult& batch, const std::string& title);

private:
	void buildLayout();
	void showEntry(int index);
	void showOverview();
	void showRegion(std::size_t region);

private:
	sampling::BatchResult m_batch{};
	sampling::core::RegionPlotter m_plotter{};
	cv::Mat m_overview{};

	PlotView* m_plotView{nullptr};
	QComboBox* m_regionCombo{nullptr};
	QLabel* m_summaryLabel{nullptr};
	QTableWidget* m_boothTable{nullptr};
};

} // namespace boothsampler
