#include "trace_chart_view.h"

#include <QtGui/QKeyEvent>
#include <QtGui/QMouseEvent>

#include <algorithm>

using namespace pulsescope;

namespace {

// Narrower drags are treated as clicks.
constexpr int MIN_WINDOW_PX = 4;

} // namespace

TraceChartView::TraceChartView(QChart* chart, QValueAxis* timeAxis, QWidget* parent)
    : QChartView(chart, parent), timeAxis(timeAxis) {
    setRenderHint(QPainter::Antialiasing, false);
    setRubberBand(QChartView::NoRubberBand);
    setMouseTracking(true);
}

void TraceChartView::setTrace(const QString& channel, EdgeMode mode, const Waveform& waveform) {
    channelLabel = channel;
    traceMode = mode;
    trace = waveform;
}

void TraceChartView::clearTrace() {
    channelLabel.clear();
    trace = Waveform{};
}

double TraceChartView::timeAt(int x) const {
    const QRectF area = chart()->plotArea();
    const double f = std::clamp((x - area.left()) / area.width(), 0.0, 1.0);
    return timeAxis->min() + f * (timeAxis->max() - timeAxis->min());
}

// The selection always spans the full plot height: only time is zoomed.
QRect TraceChartView::windowBand(int x0, int x1) const {
    const QRect area = chart()->plotArea().toRect();
    const int l = std::clamp(std::min(x0, x1), area.left(), area.right());
    const int r = std::clamp(std::max(x0, x1), area.left(), area.right());
    return QRect(QPoint(l, area.top()), QPoint(r, area.bottom()));
}

void TraceChartView::mousePressEvent(QMouseEvent* e) {
    if (e->button() == Qt::LeftButton) {
        dragFrom = e->pos().x();
        if (!band) {
            band = new QRubberBand(QRubberBand::Rectangle, this);
        }
        band->setGeometry(windowBand(dragFrom, dragFrom));
        band->show();
    } else if (e->button() == Qt::RightButton) {
        const std::optional<size_t> i = nearestEdge(trace, timeAt(e->pos().x()));
        if (i) {
            emit edgeMarked(trace.x[*i], int(*i));
        }
    }
    QChartView::mousePressEvent(e);
}

void TraceChartView::mouseMoveEvent(QMouseEvent* e) {
    if (band && band->isVisible()) {
        band->setGeometry(windowBand(dragFrom, e->pos().x()));
    }
    const double t = timeAt(e->pos().x());
    QString readout = QString("%1 %2 µs").arg(channelLabel).arg(t, 0, 'f', 3);
    if (!trace.x.empty()) {
        const size_t n = edgesBefore(trace, t);
        if (traceMode == EdgeMode::Any) {
            readout += QString(", after edge %1, %2").arg(n).arg(*levelAt(trace, t) ? "high" : "low");
        } else {
            readout += QString(", %1 of %2 %3 events").arg(n).arg(trace.x.size()).arg(edgeModeName(traceMode));
        }
    }
    emit cursorMoved(readout);
    QChartView::mouseMoveEvent(e);
}

void TraceChartView::mouseReleaseEvent(QMouseEvent* e) {
    if (band && band->isVisible() && e->button() == Qt::LeftButton) {
        band->hide();
        const QRect w = windowBand(dragFrom, e->pos().x());
        if (w.width() > MIN_WINDOW_PX) {
            emit timeWindowSelected(timeAt(w.left()), timeAt(w.right()));
        }
    }
    QChartView::mouseReleaseEvent(e);
}

void TraceChartView::mouseDoubleClickEvent(QMouseEvent* e) {
    if (e->button() == Qt::LeftButton) {
        emit zoomResetRequested();
    }
    QChartView::mouseDoubleClickEvent(e);
}

void TraceChartView::keyPressEvent(QKeyEvent* e) {
    if (e->key() == Qt::Key_Escape && band && band->isVisible()) {
        band->hide();
    }
    QChartView::keyPressEvent(e);
}
