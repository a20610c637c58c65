#include "ReferenceImage.h"

namespace Colorbook {

constexpr double ReferenceImage::kBoundaryBrightness;
constexpr double ReferenceImage::kLineHaloBrightness;

ReferenceImage::ReferenceImage()
    : m_image()
{
}

ReferenceImage::ReferenceImage(const QImage& image)
    : m_image()
{
    if (image.isNull()) {
        return;
    }

    // Deep copy so later writes to the source cannot reach the reference.
    m_image = image.convertToFormat(QImage::Format_ARGB32).copy();
}

bool ReferenceImage::contains(const QPoint& point) const
{
    return point.x() >= 0 && point.y() >= 0 && point.x() < m_image.width() && point.y() < m_image.height();
}

} // namespace Colorbook
