#pragma once

#include <QPoint>
#include <QPointF>
#include <QRectF>
#include <QSize>
#include <QSizeF>

namespace Colorbook {

// Zoom/pan placement of the canvas inside a viewport. Never touches pixels.
class ViewTransform
{
public:
    static constexpr qreal kMinZoom = 1.0;
    static constexpr qreal kMaxZoom = 5.0;
    static constexpr qreal kZoomStep = 1.1;

    ViewTransform();
    // Zoom 1 is the fitted view; maxZoom is held within [kMinZoom, kMaxZoom].
    ViewTransform(qreal maxZoom, qreal zoomStep);

    qreal zoom() const { return m_zoom; }
    QPointF pan() const { return m_pan; }
    qreal minZoom() const { return kMinZoom; }
    qreal maxZoom() const { return m_maxZoom; }
    qreal zoomStep() const { return m_zoomStep; }
    bool isFitted() const { return m_zoom <= kMinZoom; }

    void setZoom(qreal zoom);
    void zoomIn();
    void zoomOut();
    void zoomByWheel(qreal deltaY);
    void cycleZoom();

    // Pinch scales the zoom captured when the pinch began.
    void beginPinch();
    void setZoomFromPinch(qreal distanceRatio);
    qreal pinchBaseline() const { return m_pinchBaseline; }

    // Ignored while fitted; returns whether the offset changed.
    bool panBy(qreal dx, qreal dy);
    bool setPan(const QPointF& pan);

    void resetView();
    void centerView();

    QRectF canvasRectInViewport(const QSizeF& viewportSize, const QSize& canvasSize) const;
    QPoint mapToCanvas(const QPointF& viewportPos, const QSizeF& viewportSize, const QSize& canvasSize) const;
    QPointF mapFromCanvas(const QPointF& canvasPos, const QSizeF& viewportSize, const QSize& canvasSize) const;

private:
    qreal clampZoom(qreal zoom) const;
    void enforceFitInvariant();

    qreal m_maxZoom;
    qreal m_zoomStep;
    qreal m_zoom;
    qreal m_pinchBaseline;
    QPointF m_pan;
};

} // namespace Colorbook
