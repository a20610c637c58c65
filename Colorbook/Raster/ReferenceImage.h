#pragma once

#include <QImage>
#include <QPoint>
#include <QRgb>
#include <QSize>

namespace Colorbook {

// Immutable copy of the original line art. All boundary classification is
// read from here, never from the painted canvas.
class ReferenceImage
{
public:
    static constexpr double kBoundaryBrightness = 100.0;
    static constexpr double kLineHaloBrightness = 250.0;

    ReferenceImage();
    explicit ReferenceImage(const QImage& image);

    bool isNull() const { return m_image.isNull(); }
    int width() const { return m_image.width(); }
    int height() const { return m_image.height(); }
    QSize size() const { return m_image.size(); }
    bool contains(const QPoint& point) const;

    const QImage& image() const { return m_image; }

    QRgb pixel(int x, int y) const
    {
        return reinterpret_cast<const QRgb*>(m_image.constScanLine(y))[x];
    }

    double brightness(int x, int y) const { return brightnessOf(pixel(x, y)); }

    // Dark enough to stop a flood fill.
    bool isBoundary(int x, int y) const { return brightness(x, y) < kBoundaryBrightness; }

    // Dark enough to be re-tinted by the outline pass; includes anti-aliased edges.
    bool isLineHalo(int x, int y) const { return brightness(x, y) < kLineHaloBrightness; }

    static double brightnessOf(QRgb rgb)
    {
        return (qRed(rgb) + qGreen(rgb) + qBlue(rgb)) / 3.0;
    }

private:
    QImage m_image;
};

} // namespace Colorbook
