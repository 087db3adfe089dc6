#pragma once

#include "pulsescope/edge_mode.h"
#include "pulsescope/waveform.h"

#include <QtCharts/QChartView>
#include <QtCharts/QValueAxis>
#include <QtWidgets/QRubberBand>

// Plots one captured trace. A horizontal drag selects a time window, a double
// click asks for the full capture again, a right click marks the edge nearest
// to the pointer and hovering reports time, edge count and level.
class TraceChartView : public QChartView {
    Q_OBJECT
public:
    TraceChartView(QChart* chart, QValueAxis* timeAxis, QWidget* parent = nullptr);

    void setTrace(const QString& channel, pulsescope::EdgeMode mode, const pulsescope::Waveform& waveform);
    void clearTrace();

signals:
    void timeWindowSelected(double fromUs, double toUs);
    void zoomResetRequested();
    void edgeMarked(double timeUs, int edge);
    void cursorMoved(const QString& readout);

protected:
    void mousePressEvent(QMouseEvent* e) override;
    void mouseMoveEvent(QMouseEvent* e) override;
    void mouseReleaseEvent(QMouseEvent* e) override;
    void mouseDoubleClickEvent(QMouseEvent* e) override;
    void keyPressEvent(QKeyEvent* e) override;

private:
    double timeAt(int x) const;
    QRect windowBand(int x0, int x1) const;

    QValueAxis* timeAxis;
    QString channelLabel;
    pulsescope::EdgeMode traceMode = pulsescope::EdgeMode::Any;
    pulsescope::Waveform trace;
    int dragFrom = 0;
    QRubberBand* band = nullptr;
};
