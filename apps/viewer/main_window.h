#pragma once

#include "trace_chart_view.h"

#include "pulsescope/logic_analyzer.h"

#include <QFutureWatcher>
#include <QMainWindow>
#include <QtCharts/QLineSeries>
#include <QtCharts/QValueAxis>
#include <QtWidgets>

#include <array>
#include <atomic>
#include <functional>
#include <vector>

class MainWindow : public QMainWindow {
    Q_OBJECT
public:
    explicit MainWindow(pulsescope::LogicAnalyzer& analyzer);
    ~MainWindow() override;

private slots:
    void startCapture();
    void requestStop();
    void measureFrequency();
    void measureDutyCycle();
    void readStates();
    void onJobFinished();
    void setTimeRange(double mn, double mx);
    void resetZoom();
    void addMarker(int plot, double x, int edge);
    void clearMarkers();

private:
    // Everything a device job hands back to the GUI thread.
    struct Outcome {
        bool hasCapture = false;
        pulsescope::CaptureResult capture;
        std::vector<pulsescope::Waveform> waveforms;
        QString text;
        QString error;
    };

    struct TracePlot {
        QChart* chart;
        QLineSeries* series;
        QValueAxis* axisX;
        QValueAxis* axisY;
        TraceChartView* view;
    };

    struct Marker {
        int id;
        double x;
    };

    void setupUI();
    void runOnDevice(const QString& what, std::function<Outcome()> job);
    void plotCapture(const Outcome& o);
    pulsescope::Channel measureChannel() const;
    void setControlsBusy(bool busy);

    pulsescope::LogicAnalyzer& la;

    QSpinBox* channelsSpin;
    QSpinBox* eventsSpin;
    std::array<QComboBox*, pulsescope::CHANNEL_COUNT> modeCombos;
    QComboBox* trigChannelCombo;
    QComboBox* trigDirectionCombo;
    QDoubleSpinBox* e2eSpin;
    QDoubleSpinBox* timeoutSpin;
    QPushButton* captureBtn;
    QPushButton* stopBtn;
    QComboBox* measureChannelCombo;
    QCheckBox* simultaneousChk;
    QPushButton* freqBtn;
    QPushButton* dutyBtn;
    QPushButton* statesBtn;
    QLabel* resultLbl;
    QLabel* cursorLabel;
    QVBoxLayout* markerLayout;

    std::vector<TracePlot> plots;
    std::vector<Marker> markers;
    int nextMarkerId = 1;
    double fullXMin = 0.0;
    double fullXMax = 100.0;

    QFutureWatcher<Outcome>* watcher = nullptr;
    std::atomic<bool> busy{false};
    std::atomic<bool> stopRequested{false};
};
