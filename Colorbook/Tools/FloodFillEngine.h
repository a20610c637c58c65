#pragma once

#include <QImage>
#include <QPoint>
#include <QRect>
#include <QRgb>
#include <QVector>

#include "../Common/ColorbookTypes.h"

namespace Colorbook {

class ReferenceImage;

// Pixels reachable from a seed, as row-major indices in visit order.
struct FillRegion
{
    QVector<int> indices;
    QRect bounds;

    bool isEmpty() const { return indices.isEmpty(); }
};

class FloodFillEngine
{
public:
    explicit FloodFillEngine(const ReferenceImage* reference = nullptr);

    void setReference(const ReferenceImage* reference) { m_reference = reference; }
    const ReferenceImage* reference() const { return m_reference; }

    bool isFillable(const QPoint& point) const;

    // 4-connected breadth-first traversal bounded by reference boundary pixels.
    FillRegion collectRegion(const QPoint& seed) const;

    FillResult fill(QImage& canvas, const QPoint& seed, const FillSpec& spec) const;

    // One opaque color per row for rows [0, height), ramping from the first stop
    // at minY to the last stop at maxY.
    static QVector<QRgb> renderGradientRamp(const QVector<QColor>& stops, int height, int minY, int maxY);

private:
    void paintSolid(QImage& canvas, const FillRegion& region, const QColor& color) const;
    void paintGradient(QImage& canvas, const FillRegion& region, const QVector<QColor>& stops) const;

    const ReferenceImage* m_reference;
};

} // namespace Colorbook
