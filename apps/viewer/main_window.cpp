#include "main_window.h"

#include "pulsescope/errors.h"
#include "pulsescope/poller.h"

#include <QtCharts/QScatterSeries>
#include <QtConcurrent/QtConcurrent>

#include <algorithm>
#include <cmath>

using namespace pulsescope;

namespace {

constexpr EdgeMode MODES[] = {EdgeMode::Any, EdgeMode::Rising, EdgeMode::Falling, EdgeMode::FourRising, EdgeMode::SixteenRising};
constexpr TriggerDirection DIRECTIONS[] = {TriggerDirection::Disabled, TriggerDirection::Rising, TriggerDirection::Falling};

} // namespace

MainWindow::MainWindow(LogicAnalyzer& analyzer) : la(analyzer) {
    setupUI();
    watcher = new QFutureWatcher<Outcome>(this);
    connect(watcher, &QFutureWatcher<Outcome>::finished, this, &MainWindow::onJobFinished);
    statusBar()->showMessage("Ready - drag to zoom the time axis, double-click to reset, right-click to mark an edge");
}

MainWindow::~MainWindow() {
    stopRequested.store(true);
    watcher->waitForFinished();
}

void MainWindow::setupUI() {
    auto* cw = new QWidget;
    auto* v = new QVBoxLayout(cw);
    setCentralWidget(cw);
    setWindowTitle("pulsescope - Logic Analyzer");

    auto* hCap = new QHBoxLayout;
    channelsSpin = new QSpinBox;
    channelsSpin->setRange(1, CHANNEL_COUNT);
    channelsSpin->setValue(1);
    eventsSpin = new QSpinBox;
    eventsSpin->setRange(1, MAX_EVENTS);
    eventsSpin->setValue(100);
    hCap->addWidget(new QLabel("Channels:"));
    hCap->addWidget(channelsSpin);
    hCap->addWidget(new QLabel("Events:"));
    hCap->addWidget(eventsSpin);
    for (int i = 0; i < CHANNEL_COUNT; ++i) {
        modeCombos[i] = new QComboBox;
        for (EdgeMode m : MODES) {
            modeCombos[i]->addItem(edgeModeName(m));
        }
        hCap->addWidget(new QLabel(channelName(ALL_CHANNELS[i]) + ":"));
        hCap->addWidget(modeCombos[i]);
    }
    hCap->addStretch();
    v->addLayout(hCap);

    auto* hTrig = new QHBoxLayout;
    trigChannelCombo = new QComboBox;
    for (Channel c : ALL_CHANNELS) {
        trigChannelCombo->addItem(channelName(c));
    }
    trigDirectionCombo = new QComboBox;
    for (TriggerDirection d : DIRECTIONS) {
        trigDirectionCombo->addItem(triggerDirectionName(d));
    }
    e2eSpin = new QDoubleSpinBox;
    e2eSpin->setRange(0.0, 1000.0);
    e2eSpin->setDecimals(3);
    e2eSpin->setSuffix(" ms");
    timeoutSpin = new QDoubleSpinBox;
    timeoutSpin->setRange(0.01, 60.0);
    timeoutSpin->setValue(1.0);
    timeoutSpin->setSuffix(" s");
    captureBtn = new QPushButton("Capture");
    stopBtn = new QPushButton("Stop");
    stopBtn->setEnabled(false);
    hTrig->addWidget(new QLabel("Trigger:"));
    hTrig->addWidget(trigChannelCombo);
    hTrig->addWidget(trigDirectionCombo);
    hTrig->addSpacing(15);
    hTrig->addWidget(new QLabel("Event spacing:"));
    hTrig->addWidget(e2eSpin);
    hTrig->addWidget(new QLabel("Timeout:"));
    hTrig->addWidget(timeoutSpin);
    hTrig->addSpacing(15);
    hTrig->addWidget(captureBtn);
    hTrig->addWidget(stopBtn);
    hTrig->addStretch();
    v->addLayout(hTrig);

    auto* hMeas = new QHBoxLayout;
    measureChannelCombo = new QComboBox;
    for (Channel c : ALL_CHANNELS) {
        measureChannelCombo->addItem(channelName(c));
    }
    simultaneousChk = new QCheckBox("Edge counter");
    freqBtn = new QPushButton("Frequency");
    dutyBtn = new QPushButton("Duty cycle");
    statesBtn = new QPushButton("States");
    resultLbl = new QLabel("–");
    resultLbl->setStyleSheet("QLabel { color: #00897B; font-weight: bold; }");
    cursorLabel = new QLabel("");
    cursorLabel->setStyleSheet("QLabel { color: blue; font-weight: bold; }");
    hMeas->addWidget(new QLabel("Measure:"));
    hMeas->addWidget(measureChannelCombo);
    hMeas->addWidget(freqBtn);
    hMeas->addWidget(simultaneousChk);
    hMeas->addWidget(dutyBtn);
    hMeas->addWidget(statesBtn);
    hMeas->addSpacing(15);
    hMeas->addWidget(resultLbl);
    hMeas->addStretch();
    hMeas->addWidget(cursorLabel);
    v->addLayout(hMeas);

    auto* hView = new QHBoxLayout;
    auto* resetBtn = new QPushButton("⌂ Reset View");
    auto* clearMarkersBtn = new QPushButton("Clear All Markers");
    hView->addWidget(resetBtn);
    hView->addWidget(clearMarkersBtn);
    hView->addWidget(new QLabel("(Drag to zoom, double-click to reset, right-click marks the nearest edge)"));
    hView->addStretch();
    v->addLayout(hView);

    auto* markerScrollArea = new QScrollArea;
    auto* markerWidget = new QWidget;
    markerLayout = new QVBoxLayout(markerWidget);
    markerScrollArea->setWidget(markerWidget);
    markerScrollArea->setMaximumHeight(80);
    markerScrollArea->setWidgetResizable(true);
    v->addWidget(markerScrollArea);

    auto* plotWidget = new QWidget;
    auto* grid = new QGridLayout(plotWidget);
    grid->setContentsMargins(0, 0, 0, 0);
    for (int p = 0; p < CHANNEL_COUNT; ++p) {
        TracePlot tp;
        tp.chart = new QChart;
        tp.chart->legend()->hide();
        tp.chart->setAnimationOptions(QChart::NoAnimation);
        tp.series = new QLineSeries;
        tp.chart->addSeries(tp.series);
        tp.axisX = new QValueAxis;
        tp.axisY = new QValueAxis;
        tp.chart->addAxis(tp.axisX, Qt::AlignBottom);
        tp.chart->addAxis(tp.axisY, Qt::AlignLeft);
        tp.series->attachAxis(tp.axisX);
        tp.series->attachAxis(tp.axisY);
        tp.axisX->setTitleText("Time (µs)");
        tp.axisX->setRange(fullXMin, fullXMax);
        tp.axisX->setMinorTickCount(0);
        tp.axisY->setRange(-0.2, 1.2);
        tp.axisY->setTickCount(2);
        tp.axisY->setLabelFormat("%.0f");
        tp.view = new TraceChartView(tp.chart, tp.axisX);
        connect(tp.view, &TraceChartView::timeWindowSelected, this, &MainWindow::setTimeRange);
        connect(tp.view, &TraceChartView::zoomResetRequested, this, &MainWindow::resetZoom);
        connect(tp.view, &TraceChartView::edgeMarked, this, [this, p](double t, int edge) {
            addMarker(p, t, edge);
        });
        connect(tp.view, &TraceChartView::cursorMoved, cursorLabel, &QLabel::setText);
        grid->addWidget(tp.view, p / 2, p % 2);
        plots.push_back(tp);
    }
    v->addWidget(plotWidget, 1);

    connect(captureBtn, &QPushButton::clicked, this, &MainWindow::startCapture);
    connect(stopBtn, &QPushButton::clicked, this, &MainWindow::requestStop);
    connect(freqBtn, &QPushButton::clicked, this, &MainWindow::measureFrequency);
    connect(dutyBtn, &QPushButton::clicked, this, &MainWindow::measureDutyCycle);
    connect(statesBtn, &QPushButton::clicked, this, &MainWindow::readStates);
    connect(resetBtn, &QPushButton::clicked, this, &MainWindow::resetZoom);
    connect(clearMarkersBtn, &QPushButton::clicked, this, &MainWindow::clearMarkers);
}

void MainWindow::setControlsBusy(bool b) {
    for (QWidget* w : std::initializer_list<QWidget*>{captureBtn, freqBtn, dutyBtn, statesBtn}) {
        w->setEnabled(!b);
    }
}

void MainWindow::runOnDevice(const QString& what, std::function<Outcome()> job) {
    if (busy.exchange(true)) {
        statusBar()->showMessage("Instrument busy, wait for the running operation");
        return;
    }
    setControlsBusy(true);
    statusBar()->showMessage(what + " …");
    watcher->setFuture(QtConcurrent::run([job] {
        try {
            return job();
        } catch (const Error& e) {
            Outcome o;
            o.error = QString::fromStdString(e.what());
            return o;
        }
    }));
}

void MainWindow::startCapture() {
    const int n = channelsSpin->value();
    const int events = eventsSpin->value();
    CaptureOptions options;
    for (int i = 0; i < n; ++i) {
        options.modes.push_back(MODES[modeCombos[i]->currentIndex()]);
    }
    options.e2eTime = e2eSpin->value() / 1000.0;
    options.timeout = timeoutSpin->value();
    options.block = false;
    const Channel trigChannel = ALL_CHANNELS[trigChannelCombo->currentIndex()];
    const TriggerDirection trigDirection = DIRECTIONS[trigDirectionCombo->currentIndex()];

    stopRequested.store(false);
    stopBtn->setEnabled(true);
    runOnDevice("Capturing", [this, n, events, options, trigChannel, trigDirection] {
        la.configureTrigger(trigChannel, trigDirection);
        la.capture(n, events, options);
        Poller poller(options.timeout, 5, 50);
        const bool complete = poller.wait([this, events] {
            return stopRequested.load() || la.getProgress() >= events;
        });
        Outcome o;
        o.hasCapture = true;
        if (complete && !stopRequested.load()) {
            o.capture = la.fetchData();
            o.text = QString("Captured %1 events per channel").arg(events);
        } else {
            o.capture = la.stop();
            o.text = QString("Stopped with %1 of %2 events").arg(o.capture.size() ? int(o.capture[0].size()) : 0).arg(events);
        }
        o.waveforms = la.getXY(o.capture);
        return o;
    });
}

void MainWindow::requestStop() {
    stopRequested.store(true);
}

Channel MainWindow::measureChannel() const {
    return ALL_CHANNELS[measureChannelCombo->currentIndex()];
}

void MainWindow::measureFrequency() {
    const Channel c = measureChannel();
    const bool simultaneous = simultaneousChk->isChecked();
    const double timeout = timeoutSpin->value();
    runOnDevice("Measuring frequency", [this, c, simultaneous, timeout] {
        Outcome o;
        const double f = la.measureFrequency(c, timeout, simultaneous);
        o.text = QString("%1: %2 Hz").arg(channelName(c)).arg(f, 0, 'f', 3);
        return o;
    });
}

void MainWindow::measureDutyCycle() {
    const Channel c = measureChannel();
    const double timeout = timeoutSpin->value();
    runOnDevice("Measuring duty cycle", [this, c, timeout] {
        Outcome o;
        const DutyCycle d = la.measureDutyCycle(c, timeout);
        o.text = QString("%1: period %2 µs, duty %3 %").arg(channelName(c)).arg(d.period, 0, 'f', 3).arg(d.dutyCycle * 100.0, 0, 'f', 2);
        return o;
    });
}

void MainWindow::readStates() {
    runOnDevice("Reading states", [this] {
        Outcome o;
        QStringList parts;
        for (const auto& s : la.getStates()) {
            parts << QString("%1 %2").arg(channelName(s.first), s.second ? "high" : "low");
        }
        o.text = parts.join(", ");
        return o;
    });
}

void MainWindow::onJobFinished() {
    const Outcome o = watcher->result();
    busy.store(false);
    setControlsBusy(false);
    stopBtn->setEnabled(false);
    if (!o.error.isEmpty()) {
        qWarning() << "Device operation failed:" << o.error;
        statusBar()->showMessage("Failed: " + o.error);
        QMessageBox::warning(this, "Instrument error", o.error);
        return;
    }
    statusBar()->showMessage(o.text);
    if (o.hasCapture) {
        plotCapture(o);
    } else {
        resultLbl->setText(o.text);
    }
}

void MainWindow::plotCapture(const Outcome& o) {
    clearMarkers();
    double last = 0.0;
    for (size_t p = 0; p < plots.size(); ++p) {
        TracePlot& tp = plots[p];
        if (p >= o.waveforms.size()) {
            tp.series->clear();
            tp.chart->setTitle("");
            tp.view->clearTrace();
            continue;
        }
        const Trace& trace = o.capture.traces[p];
        const Waveform& w = o.waveforms[p];
        tp.chart->setTitle(QString("%1 (%2)").arg(channelName(trace.channel), edgeModeName(trace.mode)));
        tp.view->setTrace(channelName(trace.channel), trace.mode, w);
        QVector<QPointF> pts;
        if (trace.mode == EdgeMode::Any) {
            // Step trace: y[i] is the level before edge i.
            pts.reserve(int(2 * w.x.size() + 1));
            if (!w.y.empty()) {
                pts.append(QPointF(0.0, w.y[0] ? 1.0 : 0.0));
            }
            for (size_t i = 0; i < w.x.size(); ++i) {
                pts.append(QPointF(w.x[i], w.y[i] ? 1.0 : 0.0));
                pts.append(QPointF(w.x[i], w.y[i] ? 0.0 : 1.0));
            }
        } else {
            // Counted edges are drawn as pulses away from the idle level.
            pts.reserve(int(3 * w.x.size()));
            for (size_t i = 0; i < w.x.size(); ++i) {
                const double idle = w.y[i] ? 0.0 : 1.0;
                pts.append(QPointF(w.x[i], idle));
                pts.append(QPointF(w.x[i], 1.0 - idle));
                pts.append(QPointF(w.x[i], idle));
            }
        }
        tp.series->replace(pts);
        if (!w.x.empty()) {
            last = std::max(last, w.x.back());
        }
    }
    fullXMin = 0.0;
    fullXMax = last > 0.0 ? last * 1.05 : 100.0;
    setTimeRange(fullXMin, fullXMax);
}

void MainWindow::setTimeRange(double mn, double mx) {
    if (mx <= mn) {
        mx = mn + 1e-3;
    }
    for (TracePlot& tp : plots) {
        tp.axisX->setRange(mn, mx);
    }
}

void MainWindow::resetZoom() {
    setTimeRange(fullXMin, fullXMax);
}

void MainWindow::addMarker(int plot, double x, int edge) {
    const int markerId = nextMarkerId++;
    auto* series = new QScatterSeries();
    series->setName(QString("Marker %1").arg(markerId));
    series->setMarkerSize(10);
    series->setColor(QColor::fromHsv((markerId * 60) % 360, 255, 255));
    series->append(x, 0.5);
    TracePlot& tp = plots[plot];
    tp.chart->addSeries(series);
    series->attachAxis(tp.axisX);
    series->attachAxis(tp.axisY);

    QString text = QString("M%1: %2 edge %3 @ %4 µs").arg(markerId).arg(tp.chart->title()).arg(edge).arg(x, 0, 'f', 3);
    if (!markers.empty()) {
        const double dt = x - markers.back().x;
        text += QString("  (Δ M%1: %2 µs").arg(markers.back().id).arg(dt, 0, 'f', 3);
        if (dt != 0.0) {
            text += QString(", %1 Hz").arg(1e6 / std::abs(dt), 0, 'f', 1);
        }
        text += ")";
    }
    auto* label = new QLabel(text);
    label->setStyleSheet("QLabel { color: " + series->color().name() + "; font-weight: bold; }");
    markerLayout->addWidget(label);
    markers.push_back(Marker{markerId, x});
}

void MainWindow::clearMarkers() {
    QLayoutItem* child;
    while ((child = markerLayout->takeAt(0)) != nullptr) {
        if (auto* w = child->widget()) {
            w->deleteLater();
        }
        delete child;
    }
    markers.clear();
    for (TracePlot& tp : plots) {
        QList<QAbstractSeries*> toRemove;
        for (auto* s : tp.chart->series()) {
            if (qobject_cast<QScatterSeries*>(s)) {
                toRemove.push_back(s);
            }
        }
        for (auto* s : toRemove) {
            tp.chart->removeSeries(s);
            delete s;
        }
    }
}
