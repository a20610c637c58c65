#pragma once

#include <QByteArray>
#include <QString>

#include "../Common/ColorbookTypes.h"

class QSettings;

namespace Colorbook {

struct ColorbookSettings
{
    // Canvas states kept, the loaded page included.
    int historyLimit = 20;

    int autosaveDelayMs = 500;
    QByteArray autosaveFormat = "JPG";
    int autosaveQuality = 70;
    QString storageKeyPrefix = QStringLiteral("coloring-canvas-");

    int workingWidth = 800;

    // The fitted view is always zoom 1; only the ceiling is configurable.
    double maxZoom = 5.0;
    double zoomStep = 1.1;

    OutlineStyle outline;

    static ColorbookSettings load(const QSettings& settings);
    void save(QSettings& settings) const;
};

} // namespace Colorbook
