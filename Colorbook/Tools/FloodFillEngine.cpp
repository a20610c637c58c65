#include "FloodFillEngine.h"

#include "../Raster/ReferenceImage.h"

#include <QBitArray>
#include <QDebug>
#include <QLinearGradient>
#include <QPainter>
#include <QtGlobal>

namespace Colorbook {

namespace
{
QRgb opaque(QRgb rgb)
{
    return qRgba(qRed(rgb), qGreen(rgb), qBlue(rgb), 255);
}

bool sameRgb(QRgb a, QRgb b)
{
    return qRed(a) == qRed(b) && qGreen(a) == qGreen(b) && qBlue(a) == qBlue(b);
}
}

FloodFillEngine::FloodFillEngine(const ReferenceImage* reference)
    : m_reference(reference)
{
}

bool FloodFillEngine::isFillable(const QPoint& point) const
{
    if (!m_reference || m_reference->isNull() || !m_reference->contains(point)) {
        return false;
    }
    return !m_reference->isBoundary(point.x(), point.y());
}

FillRegion FloodFillEngine::collectRegion(const QPoint& seed) const
{
    FillRegion region;
    if (!isFillable(seed)) {
        return region;
    }

    const int width = m_reference->width();
    const int height = m_reference->height();

    QBitArray visited(width * height);
    const int seedIndex = seed.y() * width + seed.x();
    visited.setBit(seedIndex);
    region.indices.append(seedIndex);

    int minX = seed.x();
    int maxX = seed.x();
    int minY = seed.y();
    int maxY = seed.y();

    // The index list doubles as the queue: everything before head is dequeued.
    for (int head = 0; head < region.indices.size(); ++head) {
        const int index = region.indices.at(head);
        const int x = index % width;
        const int y = index / width;

        minX = qMin(minX, x);
        maxX = qMax(maxX, x);
        minY = qMin(minY, y);
        maxY = qMax(maxY, y);

        const QPoint neighbors[4] = {
            QPoint(x - 1, y),
            QPoint(x + 1, y),
            QPoint(x, y - 1),
            QPoint(x, y + 1)
        };

        for (const QPoint& neighbor : neighbors) {
            if (neighbor.x() < 0 || neighbor.x() >= width || neighbor.y() < 0 || neighbor.y() >= height) {
                continue;
            }

            const int neighborIndex = neighbor.y() * width + neighbor.x();
            if (visited.testBit(neighborIndex)) {
                continue;
            }

            if (m_reference->isBoundary(neighbor.x(), neighbor.y())) {
                continue;
            }

            visited.setBit(neighborIndex);
            region.indices.append(neighborIndex);
        }
    }

    region.bounds = QRect(QPoint(minX, minY), QPoint(maxX, maxY));
    return region;
}

FillResult FloodFillEngine::fill(QImage& canvas, const QPoint& seed, const FillSpec& spec) const
{
    FillResult result;

    QString error;
    if (!spec.validate(&error)) {
        qWarning() << "FloodFill: Rejected fill spec:" << error;
        result.outcome = FillOutcome::InvalidSpec;
        return result;
    }

    if (!m_reference || m_reference->isNull()) {
        return result;
    }

    if (canvas.size() != m_reference->size() || canvas.format() != QImage::Format_ARGB32) {
        qWarning() << "FloodFill: Canvas does not match reference" << canvas.size() << m_reference->size();
        return result;
    }

    if (!isFillable(seed)) {
        return result;
    }

    if (!spec.isGradient()) {
        const QRgb current = canvas.pixel(seed);
        if (sameRgb(current, spec.color().rgb())) {
            return result;
        }
    }

    const FillRegion region = collectRegion(seed);
    if (region.isEmpty()) {
        return result;
    }

    if (spec.isGradient()) {
        paintGradient(canvas, region, spec.stops());
    } else {
        paintSolid(canvas, region, spec.color());
    }

    result.outcome = FillOutcome::Filled;
    result.pixelCount = region.indices.size();
    result.dirtyRect = region.bounds;

    qDebug() << "FloodFill: Filled" << result.pixelCount << "pixels in" << result.dirtyRect;
    return result;
}

QVector<QRgb> FloodFillEngine::renderGradientRamp(const QVector<QColor>& stops, int height, int minY, int maxY)
{
    QVector<QRgb> ramp;
    if (height <= 0 || stops.isEmpty()) {
        return ramp;
    }

    if (stops.size() == 1 || minY >= maxY) {
        ramp.fill(opaque(stops.first().rgb()), height);
        return ramp;
    }

    QGradientStops gradientStops;
    const int last = stops.size() - 1;
    for (int i = 0; i <= last; ++i) {
        QColor color = stops.at(i);
        color.setAlpha(255);
        gradientStops << QGradientStop(static_cast<qreal>(i) / last, color);
    }

    QLinearGradient gradient(0.0, minY, 0.0, maxY);
    gradient.setStops(gradientStops);
    gradient.setSpread(QGradient::PadSpread);

    QImage column(1, height, QImage::Format_ARGB32);
    column.fill(Qt::transparent);

    QPainter painter(&column);
    painter.setCompositionMode(QPainter::CompositionMode_Source);
    painter.fillRect(column.rect(), gradient);
    painter.end();

    ramp.resize(height);
    for (int y = 0; y < height; ++y) {
        ramp[y] = opaque(column.pixel(0, y));
    }
    return ramp;
}

void FloodFillEngine::paintSolid(QImage& canvas, const FillRegion& region, const QColor& color) const
{
    const int width = canvas.width();
    const QRgb value = opaque(color.rgb());
    for (int index : region.indices) {
        QRgb* line = reinterpret_cast<QRgb*>(canvas.scanLine(index / width));
        line[index % width] = value;
    }
}

void FloodFillEngine::paintGradient(QImage& canvas, const FillRegion& region, const QVector<QColor>& stops) const
{
    const int width = canvas.width();
    const QVector<QRgb> ramp = renderGradientRamp(stops, canvas.height(),
        region.bounds.top(), region.bounds.bottom());

    for (int index : region.indices) {
        const int y = index / width;
        QRgb* line = reinterpret_cast<QRgb*>(canvas.scanLine(y));
        line[index % width] = ramp.at(y);
    }
}

} // namespace Colorbook
