#pragma once

#include <QByteArray>
#include <QImage>
#include <QString>

namespace Colorbook {

namespace CanvasCodec {

// format is a Qt image format name ("PNG", "JPG"); quality -1 keeps the
// writer's default, otherwise 0..100.
QByteArray encode(const QImage& image, const QByteArray& format, int quality = -1, QString* error = nullptr);
QImage decode(const QByteArray& data, QString* error = nullptr);

bool writeFile(const QImage& image, const QString& filePath, const QByteArray& format, int quality, QString* error = nullptr);

} // namespace CanvasCodec

} // namespace Colorbook
