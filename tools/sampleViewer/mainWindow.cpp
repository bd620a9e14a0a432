#include "mainWindow.hpp"

#include <QComboBox>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QLabel>
#include <QPainter>
#include <QSignalBlocker>
#include <QSplitter>
#include <QString>
#include <QTableWidget>
#include <QVBoxLayout>

#include <opencv2/imgproc.hpp>

#include <format>

namespace boothsampler {

namespace {

static QString toQString(const std::string& text) {
	return QString::fromStdString(text);
}

} // namespace

PlotView::PlotView(QWidget* parent) : QWidget(parent) {
	setMinimumSize(320, 320);
}

void PlotView::setPlot(const cv::Mat& plot) {
	m_image = QImage{};
	if (!plot.empty() && plot.type() == CV_8UC3) {
		cv::Mat rgb;
		cv::cvtColor(plot, rgb, cv::COLOR_BGR2RGB);
		m_image = QImage(rgb.data, rgb.cols, rgb.rows, static_cast<int>(rgb.step), QImage::Format_RGB888).copy();
	}
	update();
}

void PlotView::paintEvent(QPaintEvent* event) {
	QWidget::paintEvent(event);

	QPainter painter(this);
	painter.fillRect(rect(), palette().window());
	if (m_image.isNull()) {
		painter.drawText(rect(), Qt::AlignCenter, "No plot");
		return;
	}

	const QImage scaled = m_image.scaled(size(), Qt::KeepAspectRatio, Qt::SmoothTransformation);
	painter.drawImage(QPoint((width() - scaled.width()) / 2, (height() - scaled.height()) / 2), scaled);
}

MainWindow::MainWindow(QWidget* parent) : QMainWindow(parent) {
	setWindowTitle("Booth Sample Viewer");
	buildLayout();
}

MainWindow::~MainWindow() = default;

void MainWindow::setRun(const sampling::BatchResult& batch, const std::string& title) {
	m_batch = batch;
	m_plotter.clear();
	for (const auto& region: m_batch.regions) {
		m_plotter.add(region);
	}
	m_overview = m_plotter.buildMosaic();
	setWindowTitle(toQString("Booth Sample Viewer - " + title));

	{
		const QSignalBlocker blocker(m_regionCombo);
		m_regionCombo->clear();
		m_regionCombo->addItem("All regions");
		for (const auto& region: m_batch.regions) {
			const std::string mark = region.complete ? "" : "  (incomplete)";
			m_regionCombo->addItem(toQString(region.regionCode + " " + region.regionName + mark));
		}
		m_regionCombo->setCurrentIndex(0);
	}
	showEntry(0);
}

void MainWindow::buildLayout() {
	auto* root       = new QWidget(this);
	auto* rootLayout = new QVBoxLayout(root);
	auto* selectRow  = new QHBoxLayout();

	m_regionCombo = new QComboBox(root);
	m_regionCombo->setMinimumContentsLength(24);
	QObject::connect(m_regionCombo, &QComboBox::currentIndexChanged, this, [this](int index) { showEntry(index); });

	m_summaryLabel = new QLabel(root);
	m_summaryLabel->setTextInteractionFlags(Qt::TextSelectableByMouse);

	selectRow->addWidget(new QLabel("Region:", root));
	selectRow->addWidget(m_regionCombo);
	selectRow->addWidget(m_summaryLabel, 1);

	m_plotView   = new PlotView(root);
	m_boothTable = new QTableWidget(root);
	m_boothTable->setColumnCount(5);
	m_boothTable->setHorizontalHeaderLabels({"Booth", "Name", "Cluster", "Latitude", "Longitude"});
	m_boothTable->horizontalHeader()->setStretchLastSection(true);
	m_boothTable->setEditTriggers(QAbstractItemView::NoEditTriggers);
	m_boothTable->setSelectionBehavior(QAbstractItemView::SelectRows);

	auto* splitter = new QSplitter(Qt::Horizontal, root);
	splitter->addWidget(m_plotView);
	splitter->addWidget(m_boothTable);
	splitter->setStretchFactor(0, 3);
	splitter->setStretchFactor(1, 1);

	rootLayout->addLayout(selectRow);
	rootLayout->addWidget(splitter, 1);
	setCentralWidget(root);
}

void MainWindow::showEntry(const int index) {
	if (index <= 0) {
		showOverview();
	} else if (static_cast<std::size_t>(index) <= m_batch.regions.size()) {
		showRegion(static_cast<std::size_t>(index - 1));
	}
}

void MainWindow::showOverview() {
	const auto& t = m_batch.totals;
	m_summaryLabel->setText(toQString(std::format("{} regions, {} with booths, {} completed. Selected {} of {} booths.", t.regions, t.withBooths,
	                                              t.completed, t.totalSelected, t.totalBooths)));
	m_boothTable->setRowCount(0);
	m_plotView->setPlot(m_overview);
}

void MainWindow::showRegion(const std::size_t region) {
	const sampling::core::SelectionResult& result = m_batch.regions[region];

	std::string summary = std::format("{} booths, {}/{} clusters, {}/{} selected, {}. ", result.totalBooths, result.clusterCount, result.requestedClusters,
	                                  result.selectedBooths.size(), result.targetBooths, sampling::core::referenceLabel(result.reference));
	summary += result.complete ? "Completed" : "Not completed: " + result.reason;
	m_summaryLabel->setText(toQString(summary));

	m_boothTable->setRowCount(static_cast<int>(result.selectedBooths.size()));
	for (std::size_t i = 0; i < result.selectedBooths.size(); ++i) {
		const auto& selected = result.selectedBooths[i];
		const int row        = static_cast<int>(i);
		m_boothTable->setItem(row, 0, new QTableWidgetItem(toQString(selected.booth.code)));
		m_boothTable->setItem(row, 1, new QTableWidgetItem(toQString(sampling::core::attributeValue(selected.booth.attributes, sampling::core::Field::BoothName))));
		m_boothTable->setItem(row, 2, new QTableWidgetItem(QString::number(selected.cluster)));
		m_boothTable->setItem(row, 3, new QTableWidgetItem(QString::number(selected.booth.geographic.y, 'f', 6)));
		m_boothTable->setItem(row, 4, new QTableWidgetItem(QString::number(selected.booth.geographic.x, 'f', 6)));
	}

	m_plotView->setPlot(m_plotter.plots()[region]);
}

} // namespace boothsampler
