#include "ViewTransform.h"

#include <QtMath>
#include <QtGlobal>

namespace Colorbook {

namespace
{
constexpr qreal kWheelZoomOut = 0.95;
constexpr qreal kWheelZoomIn = 1.05;
}

constexpr qreal ViewTransform::kMinZoom;
constexpr qreal ViewTransform::kMaxZoom;
constexpr qreal ViewTransform::kZoomStep;

ViewTransform::ViewTransform()
    : ViewTransform(kMaxZoom, kZoomStep)
{
}

ViewTransform::ViewTransform(qreal maxZoom, qreal zoomStep)
    : m_maxZoom(qBound(kMinZoom, maxZoom, kMaxZoom))
    , m_zoomStep(qMax<qreal>(zoomStep, 1.01))
    , m_zoom(kMinZoom)
    , m_pinchBaseline(kMinZoom)
    , m_pan(0.0, 0.0)
{
}

qreal ViewTransform::clampZoom(qreal zoom) const
{
    const qreal clamped = qBound(kMinZoom, zoom, m_maxZoom);
    // Snap rounding drift from repeated in/out steps back onto the limits.
    if (qFuzzyCompare(clamped, kMinZoom)) {
        return kMinZoom;
    }
    if (qFuzzyCompare(clamped, m_maxZoom)) {
        return m_maxZoom;
    }
    return clamped;
}

void ViewTransform::enforceFitInvariant()
{
    if (isFitted()) {
        m_pan = QPointF(0.0, 0.0);
    }
}

void ViewTransform::setZoom(qreal zoom)
{
    m_zoom = clampZoom(zoom);
    enforceFitInvariant();
}

void ViewTransform::zoomIn()
{
    setZoom(m_zoom * m_zoomStep);
}

void ViewTransform::zoomOut()
{
    setZoom(m_zoom / m_zoomStep);
}

void ViewTransform::zoomByWheel(qreal deltaY)
{
    setZoom(m_zoom * (deltaY > 0 ? kWheelZoomOut : kWheelZoomIn));
}

void ViewTransform::cycleZoom()
{
    if (qFuzzyCompare(m_zoom, 1.0)) {
        setZoom(1.5);
    } else if (qFuzzyCompare(m_zoom, 1.5)) {
        setZoom(2.0);
    } else {
        setZoom(1.0);
    }
}

void ViewTransform::beginPinch()
{
    m_pinchBaseline = m_zoom;
}

void ViewTransform::setZoomFromPinch(qreal distanceRatio)
{
    if (!(distanceRatio > 0.0)) {
        return;
    }
    setZoom(m_pinchBaseline * distanceRatio);
}

bool ViewTransform::panBy(qreal dx, qreal dy)
{
    return setPan(m_pan + QPointF(dx, dy));
}

bool ViewTransform::setPan(const QPointF& pan)
{
    if (isFitted()) {
        m_pan = QPointF(0.0, 0.0);
        return false;
    }

    if (m_pan == pan) {
        return false;
    }

    m_pan = pan;
    return true;
}

void ViewTransform::resetView()
{
    m_zoom = kMinZoom;
    m_pan = QPointF(0.0, 0.0);
}

void ViewTransform::centerView()
{
    m_pan = QPointF(0.0, 0.0);
}

QRectF ViewTransform::canvasRectInViewport(const QSizeF& viewportSize, const QSize& canvasSize) const
{
    if (canvasSize.isEmpty() || viewportSize.isEmpty()) {
        return QRectF();
    }

    const qreal fit = qMin(viewportSize.width() / canvasSize.width(),
        viewportSize.height() / canvasSize.height());
    const qreal scale = fit * m_zoom;
    const qreal widthScaled = canvasSize.width() * scale;
    const qreal heightScaled = canvasSize.height() * scale;

    // Zoom scales about the viewport center, pan is applied afterwards.
    const qreal x = (viewportSize.width() - widthScaled) / 2.0 + m_pan.x();
    const qreal y = (viewportSize.height() - heightScaled) / 2.0 + m_pan.y();
    return QRectF(x, y, widthScaled, heightScaled);
}

QPoint ViewTransform::mapToCanvas(const QPointF& viewportPos, const QSizeF& viewportSize, const QSize& canvasSize) const
{
    const QRectF canvasRect = canvasRectInViewport(viewportSize, canvasSize);
    if (canvasRect.isEmpty()) {
        return QPoint(-1, -1);
    }

    const qreal scaleX = canvasSize.width() / canvasRect.width();
    const qreal scaleY = canvasSize.height() / canvasRect.height();
    const QPointF delta = viewportPos - canvasRect.topLeft();
    return QPoint(qFloor(delta.x() * scaleX), qFloor(delta.y() * scaleY));
}

QPointF ViewTransform::mapFromCanvas(const QPointF& canvasPos, const QSizeF& viewportSize, const QSize& canvasSize) const
{
    const QRectF canvasRect = canvasRectInViewport(viewportSize, canvasSize);
    if (canvasRect.isEmpty()) {
        return QPointF();
    }

    return QPointF(canvasRect.left() + canvasPos.x() * canvasRect.width() / canvasSize.width(),
        canvasRect.top() + canvasPos.y() * canvasRect.height() / canvasSize.height());
}

} // namespace Colorbook
