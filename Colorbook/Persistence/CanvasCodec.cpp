#include "CanvasCodec.h"

#include <QBuffer>
#include <QImageReader>
#include <QImageWriter>
#include <QObject>
#include <QSaveFile>
#include <QtGlobal>

namespace Colorbook {

namespace CanvasCodec {

namespace
{
QImage prepareForFormat(const QImage& image, const QByteArray& format)
{
    const QByteArray lower = format.toLower();
    if (lower == "jpg" || lower == "jpeg") {
        // No alpha channel in JPEG.
        return image.convertToFormat(QImage::Format_RGB32);
    }
    return image;
}

void configureWriter(QImageWriter& writer, int quality)
{
    if (quality >= 0) {
        writer.setQuality(qBound(0, quality, 100));
    }
}
}

QByteArray encode(const QImage& image, const QByteArray& format, int quality, QString* error)
{
    if (image.isNull()) {
        if (error) {
            *error = QObject::tr("Cannot encode an empty image");
        }
        return QByteArray();
    }

    QByteArray bytes;
    QBuffer buffer(&bytes);
    if (!buffer.open(QIODevice::WriteOnly)) {
        if (error) {
            *error = QObject::tr("Unable to open encode buffer");
        }
        return QByteArray();
    }

    QImageWriter writer(&buffer, format);
    configureWriter(writer, quality);
    if (!writer.write(prepareForFormat(image, format))) {
        if (error) {
            *error = QObject::tr("Unable to encode image as %1: %2")
                .arg(QString::fromLatin1(format), writer.errorString());
        }
        return QByteArray();
    }

    buffer.close();
    return bytes;
}

QImage decode(const QByteArray& data, QString* error)
{
    if (data.isEmpty()) {
        if (error) {
            *error = QObject::tr("No image data");
        }
        return QImage();
    }

    QBuffer buffer;
    buffer.setData(data);
    if (!buffer.open(QIODevice::ReadOnly)) {
        if (error) {
            *error = QObject::tr("Unable to open decode buffer");
        }
        return QImage();
    }

    QImageReader reader(&buffer);
    QImage image = reader.read();
    if (image.isNull()) {
        if (error) {
            *error = QObject::tr("Unable to decode image: %1").arg(reader.errorString());
        }
        return QImage();
    }

    return image.convertToFormat(QImage::Format_ARGB32);
}

bool writeFile(const QImage& image, const QString& filePath, const QByteArray& format, int quality, QString* error)
{
    const QByteArray bytes = encode(image, format, quality, error);
    if (bytes.isEmpty()) {
        return false;
    }

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        if (error) {
            *error = QObject::tr("Unable to open %1 for writing: %2").arg(filePath, file.errorString());
        }
        return false;
    }

    if (file.write(bytes) != bytes.size() || !file.commit()) {
        if (error) {
            *error = QObject::tr("Unable to write %1: %2").arg(filePath, file.errorString());
        }
        return false;
    }

    return true;
}

} // namespace CanvasCodec

} // namespace Colorbook
