#pragma once

#include <QObject>
#include <QImage>
#include <QRect>
#include <QString>

#include "ReferenceImage.h"

namespace Colorbook {

// Reference line art plus the mutable canvas the user paints on.
class ColoringDocument : public QObject
{
    Q_OBJECT

public:
    static constexpr int kDefaultWorkingWidth = 800;

    explicit ColoringDocument(QObject* parent = nullptr);

    static QImage prepareWorkingImage(const QImage& source, int workingWidth = kDefaultWorkingWidth);

    bool load(const QImage& source, const QString& imageId, int workingWidth = kDefaultWorkingWidth);
    bool loadPrepared(const QImage& image, const QString& imageId);

    bool isNull() const { return m_reference.isNull(); }
    QString imageId() const { return m_imageId; }
    QSize canvasSize() const { return m_canvas.size(); }
    QRect bounds() const { return QRect(QPoint(0, 0), m_canvas.size()); }

    const ReferenceImage& reference() const { return m_reference; }

    QImage& canvas() { return m_canvas; }
    const QImage& canvas() const { return m_canvas; }

    bool setCanvas(const QImage& image);
    void resetCanvas();

    void notifyCanvasChanged(const QRect& rect = QRect());

signals:
    void documentReset();
    void canvasChanged(const QRect& rect);

private:
    ReferenceImage m_reference;
    QImage m_canvas;
    QString m_imageId;
};

} // namespace Colorbook
