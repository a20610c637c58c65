#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QFileInfo>
#include <QImage>
#include <QSettings>
#include <QStandardPaths>
#include <QStringList>

#include "Persistence/DirectoryKeyValueStore.h"
#include "Session/ColoringSession.h"
#include "Settings/ColorbookSettings.h"

using namespace Colorbook;

class ColorbookApplication : public QCoreApplication
{

public:
    ColorbookApplication(int& argc, char** argv)
        : QCoreApplication(argc, argv)
    {
        setApplicationName("Colorbook");
        setApplicationVersion("1.0.0");
        setOrganizationName("Colorbook");
        setOrganizationDomain("colorbook.app");
    }

    QString defaultStorePath() const
    {
        return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation) + "/canvases";
    }
};

namespace
{
bool parsePoint(const QStringList& parts, QPoint* point)
{
    if (parts.size() < 2) {
        return false;
    }

    bool okX = false;
    bool okY = false;
    const int x = parts.at(0).trimmed().toInt(&okX);
    const int y = parts.at(1).trimmed().toInt(&okY);
    if (!okX || !okY) {
        return false;
    }

    *point = QPoint(x, y);
    return true;
}

// "x,y,#rrggbb" for solid fills, "x,y,#c1,#c2[,...]" for gradients.
bool parseFillIntent(const QString& text, bool gradient, QPoint* seed, FillSpec* spec)
{
    const QStringList parts = text.split(QLatin1Char(','));
    if (!parsePoint(parts, seed)) {
        return false;
    }

    QVector<QColor> colors;
    for (int i = 2; i < parts.size(); ++i) {
        colors.append(QColor(parts.at(i).trimmed()));
    }

    if (gradient) {
        *spec = FillSpec::gradient(colors);
    } else {
        if (colors.size() != 1) {
            return false;
        }
        *spec = FillSpec::solid(colors.first());
    }
    return true;
}

const char* outcomeName(FillOutcome outcome)
{
    switch (outcome) {
    case FillOutcome::Filled:
        return "filled";
    case FillOutcome::NoOp:
        return "no-op";
    case FillOutcome::Busy:
        return "busy";
    case FillOutcome::InvalidSpec:
        return "invalid";
    }
    return "unknown";
}
}

int main(int argc, char* argv[])
{
    ColorbookApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QCoreApplication::translate("main", "Recolor black-and-white line art by region."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("image", QCoreApplication::translate("main", "Line-art image to color."));

    const QCommandLineOption idOption("id", QCoreApplication::translate("main", "Image identity used as the storage key."), "id");
    const QCommandLineOption fillOption("fill", QCoreApplication::translate("main", "Solid fill intent x,y,#rrggbb (repeatable)."), "intent");
    const QCommandLineOption gradientOption("gradient", QCoreApplication::translate("main", "Gradient fill intent x,y,#top,#bottom[,...] (repeatable)."), "intent");
    const QCommandLineOption clearOption("clear", QCoreApplication::translate("main", "Discard saved progress before applying fills."));
    const QCommandLineOption undoOption("undo", QCoreApplication::translate("main", "Undo the last N steps after filling."), "count", "0");
    const QCommandLineOption outlineColorOption("outline-color", QCoreApplication::translate("main", "Outline tint color."), "color");
    const QCommandLineOption outlineOpacityOption("outline-opacity", QCoreApplication::translate("main", "Outline opacity 0-100."), "percent");
    const QCommandLineOption hideOutlinesOption("hide-outlines", QCoreApplication::translate("main", "Render outlines as white paper."));
    const QCommandLineOption storeOption("store", QCoreApplication::translate("main", "Directory holding saved progress."), "dir");
    const QCommandLineOption outputOption(QStringList() << "o" << "output", QCoreApplication::translate("main", "Export the colored page to this file."), "file");
    const QCommandLineOption formatOption("format", QCoreApplication::translate("main", "Export format (PNG or JPG)."), "format", "PNG");
    const QCommandLineOption qualityOption("quality", QCoreApplication::translate("main", "Export quality 0-100."), "quality", "100");

    parser.addOptions({ idOption, fillOption, gradientOption, clearOption, undoOption,
        outlineColorOption, outlineOpacityOption, hideOutlinesOption,
        storeOption, outputOption, formatOption, qualityOption });
    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        parser.showHelp(1);
    }

    const QString imagePath = positional.first();
    QImage source(imagePath);
    if (source.isNull()) {
        qCritical() << "Colorbook: Unable to read image" << imagePath;
        return 1;
    }

    QSettings settings;
    ColorbookSettings config = ColorbookSettings::load(settings);

    if (parser.isSet(outlineColorOption)) {
        const QColor tint(parser.value(outlineColorOption));
        if (!tint.isValid()) {
            qCritical() << "Colorbook: Invalid outline color" << parser.value(outlineColorOption);
            return 1;
        }
        config.outline.tintColor = tint;
    }
    if (parser.isSet(outlineOpacityOption)) {
        config.outline.opacity = qBound(0, parser.value(outlineOpacityOption).toInt(), 100);
    }
    if (parser.isSet(hideOutlinesOption)) {
        config.outline.visible = false;
    }

    const QString storePath = parser.isSet(storeOption) ? parser.value(storeOption) : app.defaultStorePath();
    DirectoryKeyValueStore store(storePath);
    if (!store.isOpen()) {
        qCritical() << "Colorbook: Unable to open store" << storePath;
        return 1;
    }

    ColoringSession session(&store, config);
    const QString imageId = parser.isSet(idOption) ? parser.value(idOption) : QFileInfo(imagePath).fileName();
    if (!session.loadImage(source, imageId)) {
        return 1;
    }

    if (parser.isSet(clearOption)) {
        session.clear();
    }

    int failures = 0;
    const auto applyIntents = [&](const QCommandLineOption& option, bool gradient) {
        for (const QString& intent : parser.values(option)) {
            QPoint seed;
            FillSpec spec;
            if (!parseFillIntent(intent, gradient, &seed, &spec)) {
                qCritical() << "Colorbook: Malformed fill intent" << intent;
                ++failures;
                continue;
            }

            const FillResult result = session.fill(seed, spec);
            qInfo().noquote() << QStringLiteral("%1 at (%2,%3): %4, %5 pixels")
                .arg(intent.section(QLatin1Char(','), 2))
                .arg(seed.x()).arg(seed.y())
                .arg(QString::fromLatin1(outcomeName(result.outcome)))
                .arg(result.pixelCount);
            if (result.outcome == FillOutcome::InvalidSpec) {
                ++failures;
            }
        }
    };
    applyIntents(fillOption, false);
    applyIntents(gradientOption, true);

    const int undoCount = qMax(0, parser.value(undoOption).toInt());
    int undone = 0;
    while (undone < undoCount && session.undo()) {
        ++undone;
    }

    if (!session.flushPendingSave()) {
        qWarning() << "Colorbook: Progress could not be saved to" << store.directory();
    }

    if (parser.isSet(outputOption)) {
        QString error;
        if (!session.exportToFile(parser.value(outputOption), parser.value(formatOption).toLatin1(),
                parser.value(qualityOption).toInt(), &error)) {
            qCritical() << "Colorbook:" << error;
            return 1;
        }
    }

    return failures == 0 ? 0 : 2;
}
