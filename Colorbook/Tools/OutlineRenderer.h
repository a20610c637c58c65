#pragma once

#include <QImage>
#include <QRgb>

#include "../Common/ColorbookTypes.h"

namespace Colorbook {

class ReferenceImage;

// Re-tints line-art pixels of the canvas. Pixels outside the reference line
// halo are never touched, so fills survive any number of invocations.
class OutlineRenderer
{
public:
    explicit OutlineRenderer(const ReferenceImage* reference = nullptr);

    void setReference(const ReferenceImage* reference) { m_reference = reference; }

    // Returns the number of pixels rewritten.
    int apply(QImage& canvas, const OutlineStyle& style) const;

    static QRgb tintedPixel(double brightness, const OutlineStyle& style);

private:
    const ReferenceImage* m_reference;
};

} // namespace Colorbook
