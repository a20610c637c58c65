#include "OutlineRenderer.h"

#include "../Raster/ReferenceImage.h"

#include <QDebug>
#include <QtGlobal>

#include <cmath>

namespace Colorbook {

namespace
{
constexpr double kPaper = 255.0;

// Halves round to even, the way clamped 8-bit pixel buffers store them.
int toChannel(double value)
{
    return qBound(0, static_cast<int>(std::nearbyint(value)), 255);
}
}

OutlineRenderer::OutlineRenderer(const ReferenceImage* reference)
    : m_reference(reference)
{
}

QRgb OutlineRenderer::tintedPixel(double brightness, const OutlineStyle& style)
{
    double targetR = kPaper;
    double targetG = kPaper;
    double targetB = kPaper;

    if (style.visible) {
        // Black maps to the tint, white stays paper, greys mix linearly.
        const double ratio = brightness / 255.0;
        targetR = kPaper * ratio + style.tintColor.red() * (1.0 - ratio);
        targetG = kPaper * ratio + style.tintColor.green() * (1.0 - ratio);
        targetB = kPaper * ratio + style.tintColor.blue() * (1.0 - ratio);
    }

    const double opacity = qBound(0, style.opacity, 100) / 100.0;
    const double r = targetR * opacity + kPaper * (1.0 - opacity);
    const double g = targetG * opacity + kPaper * (1.0 - opacity);
    const double b = targetB * opacity + kPaper * (1.0 - opacity);

    return qRgba(toChannel(r), toChannel(g), toChannel(b), 255);
}

int OutlineRenderer::apply(QImage& canvas, const OutlineStyle& style) const
{
    if (!m_reference || m_reference->isNull()) {
        return 0;
    }

    if (canvas.size() != m_reference->size() || canvas.format() != QImage::Format_ARGB32) {
        qWarning() << "OutlineRenderer: Canvas does not match reference" << canvas.size() << m_reference->size();
        return 0;
    }

    int rewritten = 0;
    for (int y = 0; y < canvas.height(); ++y) {
        QRgb* line = nullptr;
        for (int x = 0; x < canvas.width(); ++x) {
            const double brightness = m_reference->brightness(x, y);
            if (brightness >= ReferenceImage::kLineHaloBrightness) {
                continue;
            }

            if (!line) {
                line = reinterpret_cast<QRgb*>(canvas.scanLine(y));
            }
            line[x] = tintedPixel(brightness, style);
            ++rewritten;
        }
    }

    return rewritten;
}

} // namespace Colorbook
