#include "ColorbookSettings.h"

#include "../Viewport/ViewTransform.h"

#include <QSettings>
#include <QtGlobal>

namespace Colorbook {

ColorbookSettings ColorbookSettings::load(const QSettings& settings)
{
    const ColorbookSettings defaults;
    ColorbookSettings result;

    result.historyLimit = qMax(2, settings.value("history/limit", defaults.historyLimit).toInt());

    result.autosaveDelayMs = qMax(0, settings.value("autosave/delayMs", defaults.autosaveDelayMs).toInt());
    result.autosaveFormat = settings.value("autosave/format", QString::fromLatin1(defaults.autosaveFormat))
        .toString().toLatin1();
    if (result.autosaveFormat.isEmpty()) {
        result.autosaveFormat = defaults.autosaveFormat;
    }
    result.autosaveQuality = qBound(-1, settings.value("autosave/quality", defaults.autosaveQuality).toInt(), 100);
    result.storageKeyPrefix = settings.value("autosave/keyPrefix", defaults.storageKeyPrefix).toString();
    if (result.storageKeyPrefix.isEmpty()) {
        result.storageKeyPrefix = defaults.storageKeyPrefix;
    }

    result.workingWidth = qMax(1, settings.value("canvas/workingWidth", defaults.workingWidth).toInt());

    result.maxZoom = qBound(ViewTransform::kMinZoom, settings.value("view/maxZoom", defaults.maxZoom).toDouble(),
        ViewTransform::kMaxZoom);
    result.zoomStep = qMax(1.01, settings.value("view/zoomStep", defaults.zoomStep).toDouble());

    result.outline.visible = settings.value("outline/visible", defaults.outline.visible).toBool();
    const QColor tint(settings.value("outline/color", defaults.outline.tintColor.name()).toString());
    result.outline.tintColor = tint.isValid() ? tint : defaults.outline.tintColor;
    result.outline.opacity = qBound(0, settings.value("outline/opacity", defaults.outline.opacity).toInt(), 100);

    return result;
}

void ColorbookSettings::save(QSettings& settings) const
{
    settings.setValue("history/limit", historyLimit);
    settings.setValue("autosave/delayMs", autosaveDelayMs);
    settings.setValue("autosave/format", QString::fromLatin1(autosaveFormat));
    settings.setValue("autosave/quality", autosaveQuality);
    settings.setValue("autosave/keyPrefix", storageKeyPrefix);
    settings.setValue("canvas/workingWidth", workingWidth);
    settings.setValue("view/maxZoom", maxZoom);
    settings.setValue("view/zoomStep", zoomStep);
    settings.setValue("outline/visible", outline.visible);
    settings.setValue("outline/color", outline.tintColor.name());
    settings.setValue("outline/opacity", outline.opacity);
}

} // namespace Colorbook
