#include "ColoringDocument.h"

#include <QDebug>
#include <QPainter>

namespace Colorbook {

constexpr int ColoringDocument::kDefaultWorkingWidth;

ColoringDocument::ColoringDocument(QObject* parent)
    : QObject(parent)
    , m_reference()
    , m_canvas()
    , m_imageId()
{
}

QImage ColoringDocument::prepareWorkingImage(const QImage& source, int workingWidth)
{
    if (source.isNull() || workingWidth <= 0 || source.height() <= 0) {
        return QImage();
    }

    const qreal aspect = static_cast<qreal>(source.width()) / source.height();
    const int height = qMax(1, qRound(workingWidth / aspect));

    QImage working(workingWidth, height, QImage::Format_ARGB32);
    working.fill(Qt::white);

    // Line art is drawn onto white paper so transparent areas become fillable.
    QPainter painter(&working);
    painter.setRenderHint(QPainter::SmoothPixmapTransform, true);
    painter.drawImage(QRect(0, 0, workingWidth, height), source);
    painter.end();

    return working;
}

bool ColoringDocument::load(const QImage& source, const QString& imageId, int workingWidth)
{
    const QImage working = prepareWorkingImage(source, workingWidth);
    if (working.isNull()) {
        qWarning() << "ColoringDocument: Cannot prepare working image for" << imageId;
        return false;
    }
    return loadPrepared(working, imageId);
}

bool ColoringDocument::loadPrepared(const QImage& image, const QString& imageId)
{
    if (image.isNull()) {
        return false;
    }

    m_reference = ReferenceImage(image);
    m_canvas = m_reference.image().copy();
    m_imageId = imageId;

    qDebug() << "ColoringDocument: Loaded" << imageId << m_canvas.size();

    emit documentReset();
    emit canvasChanged(bounds());
    return true;
}

bool ColoringDocument::setCanvas(const QImage& image)
{
    if (image.isNull() || image.size() != m_reference.size()) {
        return false;
    }

    m_canvas = image.format() == QImage::Format_ARGB32
        ? image
        : image.convertToFormat(QImage::Format_ARGB32);
    emit canvasChanged(bounds());
    return true;
}

void ColoringDocument::resetCanvas()
{
    if (m_reference.isNull()) {
        return;
    }

    m_canvas = m_reference.image().copy();
    emit canvasChanged(bounds());
}

void ColoringDocument::notifyCanvasChanged(const QRect& rect)
{
    emit canvasChanged(rect.isNull() ? bounds() : rect.intersected(bounds()));
}

} // namespace Colorbook
