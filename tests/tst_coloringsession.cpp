#include <QObject>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QTest>

#include "Commands/CanvasCommands.h"
#include "Persistence/CanvasCodec.h"
#include "Persistence/MemoryKeyValueStore.h"
#include "Session/ColoringSession.h"
#include "TestImages.h"

using namespace Colorbook;

namespace
{
const QString kPageId = QStringLiteral("pages/ring.png");
const QRgb kRed = qRgb(255, 0, 0);
const QRgb kBlue = qRgb(0, 0, 255);
const QRgb kWhite = qRgb(255, 255, 255);

ColorbookSettings testSettings()
{
    ColorbookSettings settings;
    settings.autosaveDelayMs = 20;
    settings.autosaveFormat = "PNG";
    settings.autosaveQuality = -1;
    return settings;
}
}

class ColoringSessionTests : public QObject
{
    Q_OBJECT

private slots:
    void loadSeedsHistory()
    {
        MemoryKeyValueStore store;
        ColoringSession session(&store, testSettings());
        QVERIFY(!session.isLoaded());

        QVERIFY(session.loadPreparedImage(TestImages::ringImage(), kPageId));
        QVERIFY(session.isLoaded());
        QCOMPARE(session.canvasSize(), QSize(20, 20));
        QCOMPARE(session.undoStack().count(), 0);
        QVERIFY(!session.canUndo());
        QCOMPARE(session.autosave().storageKey(), QStringLiteral("coloring-canvas-ring.png"));
    }

    void loadImageScalesToWorkingWidth()
    {
        ColorbookSettings settings = testSettings();
        settings.workingWidth = 40;
        ColoringSession session(nullptr, settings);

        QImage source(20, 10, QImage::Format_ARGB32);
        source.fill(Qt::transparent);
        QVERIFY(session.loadImage(source, "wide"));
        QCOMPARE(session.canvasSize(), QSize(40, 20));
        // Transparent art sits on white paper.
        QCOMPARE(session.canvas().pixel(5, 5), kWhite);

        QVERIFY(!session.loadImage(QImage(), "empty"));
    }

    void fillCommitsSnapshot()
    {
        MemoryKeyValueStore store;
        ColoringSession session(&store, testSettings());
        QVERIFY(session.loadPreparedImage(TestImages::ringImage(), kPageId));

        QSignalSpy filledSpy(&session, &ColoringSession::filled);
        const FillResult result = session.fill(QPoint(10, 10), FillSpec::solid(Qt::red));
        QCOMPARE(result.outcome, FillOutcome::Filled);
        QCOMPARE(filledSpy.count(), 1);
        QCOMPARE(filledSpy.at(0).at(0).toRect(), result.dirtyRect);

        QCOMPARE(session.canvas().pixel(10, 10), kRed);
        QCOMPARE(session.undoStack().count(), 1);
        QCOMPARE(session.undoStack().index(), 1);
        const auto* command = static_cast<const CanvasSnapshotCommand*>(session.undoStack().command(0));
        QCOMPARE(command->after(), session.canvas());
        QCOMPARE(command->before(), TestImages::ringImage());
        QCOMPARE(session.saveStatus(), SaveStatus::Saving);
    }

    void noOpFillsLeaveHistoryAlone()
    {
        ColoringSession session(nullptr, testSettings());
        QCOMPARE(session.fill(QPoint(10, 10), FillSpec::solid(Qt::red)).outcome, FillOutcome::NoOp);

        QVERIFY(session.loadPreparedImage(TestImages::ringImage(), kPageId));
        QSignalSpy filledSpy(&session, &ColoringSession::filled);

        QCOMPARE(session.fill(QPoint(10, 4), FillSpec::solid(Qt::red)).outcome, FillOutcome::NoOp);
        QCOMPARE(session.fill(QPoint(-3, 4), FillSpec::solid(Qt::red)).outcome, FillOutcome::NoOp);
        QCOMPARE(session.fill(QPoint(10, 10), FillSpec::gradient({ QColor(Qt::red) })).outcome,
            FillOutcome::InvalidSpec);

        QCOMPARE(session.undoStack().count(), 0);
        QCOMPARE(filledSpy.count(), 0);
    }

    void repeatingSolidFillKeepsHistory()
    {
        ColoringSession session(nullptr, testSettings());
        QVERIFY(session.loadPreparedImage(TestImages::ringImage(), kPageId));
        QCOMPARE(session.fill(QPoint(10, 10), FillSpec::solid(Qt::red)).outcome, FillOutcome::Filled);
        const QImage filled = session.canvas().copy();

        QCOMPARE(session.fill(QPoint(12, 9), FillSpec::solid(Qt::red)).outcome, FillOutcome::NoOp);
        QCOMPARE(session.canvas(), filled);
        QCOMPARE(session.undoStack().count(), 1);
        QCOMPARE(session.undoStack().index(), 1);
    }

    void undoRedoRestoreCanvas()
    {
        ColoringSession session(nullptr, testSettings());
        QVERIFY(session.loadPreparedImage(TestImages::ringImage(), kPageId));
        const QImage baseline = session.canvas().copy();

        QCOMPARE(session.fill(QPoint(10, 10), FillSpec::solid(Qt::red)).outcome, FillOutcome::Filled);
        QCOMPARE(session.fill(QPoint(0, 0), FillSpec::solid(Qt::blue)).outcome, FillOutcome::Filled);

        QSignalSpy undoSpy(&session, &ColoringSession::undone);
        QSignalSpy redoSpy(&session, &ColoringSession::redone);

        QVERIFY(session.undo());
        QCOMPARE(session.canvas().pixel(0, 0), kWhite);
        QCOMPARE(session.canvas().pixel(10, 10), kRed);
        QVERIFY(session.undo());
        QCOMPARE(session.canvas(), baseline);
        QVERIFY(!session.undo());
        QCOMPARE(undoSpy.count(), 2);

        QVERIFY(session.redo());
        QVERIFY(session.redo());
        QCOMPARE(session.canvas().pixel(0, 0), kBlue);
        QVERIFY(!session.redo());
        QCOMPARE(redoSpy.count(), 2);
    }

    void fillAfterUndoDropsRedo()
    {
        ColoringSession session(nullptr, testSettings());
        QVERIFY(session.loadPreparedImage(TestImages::ringImage(), kPageId));

        session.fill(QPoint(10, 10), FillSpec::solid(Qt::red));
        QVERIFY(session.undo());
        QVERIFY(session.canRedo());

        session.fill(QPoint(10, 10), FillSpec::solid(Qt::blue));
        QVERIFY(!session.canRedo());
        QCOMPARE(session.canvas().pixel(10, 10), kBlue);
    }

    void clearIsUndoable()
    {
        ColoringSession session(nullptr, testSettings());
        QVERIFY(session.loadPreparedImage(TestImages::ringImage(), kPageId));
        session.fill(QPoint(10, 10), FillSpec::solid(Qt::red));

        QSignalSpy clearedSpy(&session, &ColoringSession::cleared);
        session.clear();
        QCOMPARE(clearedSpy.count(), 1);
        QCOMPARE(session.canvas().pixel(10, 10), kWhite);
        QCOMPARE(session.undoStack().count(), 2);

        QVERIFY(session.undo());
        QCOMPARE(session.canvas().pixel(10, 10), kRed);
    }

    void outlineStyleIsNotAHistoryStep()
    {
        ColoringSession session(nullptr, testSettings());
        QVERIFY(session.loadPreparedImage(TestImages::ringImage(), kPageId));
        session.fill(QPoint(10, 10), FillSpec::solid(Qt::red));

        OutlineStyle hidden;
        hidden.visible = false;
        session.setOutlineStyle(hidden);
        QCOMPARE(session.canvas().pixel(10, 4), kWhite);
        QCOMPARE(session.canvas().pixel(10, 10), kRed);
        QCOMPARE(session.undoStack().count(), 1);

        // Undo re-applies the current style to the restored snapshot.
        QVERIFY(session.undo());
        QCOMPARE(session.canvas().pixel(10, 4), kWhite);
        QCOMPARE(session.canvas().pixel(10, 10), kWhite);

        OutlineStyle tinted;
        tinted.tintColor = QColor(Qt::blue);
        tinted.opacity = 400;
        session.setOutlineStyle(tinted);
        QCOMPARE(session.outlineStyle().opacity, 100);
        QCOMPARE(session.canvas().pixel(10, 4), kBlue);
    }

    void reentrantFillIsBusy()
    {
        ColoringSession session(nullptr, testSettings());
        QVERIFY(session.loadPreparedImage(TestImages::ringImage(), kPageId));

        QVector<FillOutcome> nested;
        connect(&session, &ColoringSession::canvasChanged, this, [&]() {
            if (session.isFillInProgress()) {
                nested.append(session.fill(QPoint(0, 0), FillSpec::solid(Qt::blue)).outcome);
            }
        });

        QCOMPARE(session.fill(QPoint(10, 10), FillSpec::solid(Qt::red)).outcome, FillOutcome::Filled);
        QVERIFY(!nested.isEmpty());
        for (FillOutcome outcome : nested) {
            QCOMPARE(outcome, FillOutcome::Busy);
        }
        QVERIFY(!session.isFillInProgress());
        QCOMPARE(session.canvas().pixel(0, 0), kWhite);
        QCOMPARE(session.undoStack().count(), 1);
    }

    void restoredProgressIsBaseline()
    {
        MemoryKeyValueStore store;
        {
            ColoringSession first(&store, testSettings());
            QVERIFY(first.loadPreparedImage(TestImages::ringImage(), kPageId));
            first.fill(QPoint(10, 10), FillSpec::solid(Qt::red));
            QVERIFY(first.flushPendingSave());
        }

        ColoringSession second(&store, testSettings());
        QVERIFY(second.loadPreparedImage(TestImages::ringImage(), kPageId));
        QCOMPARE(second.canvas().pixel(10, 10), kRed);
        QCOMPARE(second.undoStack().count(), 0);
        QVERIFY(!second.canUndo());
    }

    void mismatchedSavedProgressIgnored()
    {
        MemoryKeyValueStore store;
        const QByteArray small = CanvasCodec::encode(TestImages::blankImage(4, 4), "PNG");
        QVERIFY(!small.isEmpty());
        store.setValue(QStringLiteral("coloring-canvas-ring.png"), small);

        ColoringSession session(&store, testSettings());
        QVERIFY(session.loadPreparedImage(TestImages::ringImage(), kPageId));
        QCOMPARE(session.canvas(), TestImages::ringImage());
    }

    void switchingPagesFlushesPreviousPage()
    {
        MemoryKeyValueStore store;
        ColoringSession session(&store, testSettings());
        QVERIFY(session.loadPreparedImage(TestImages::ringImage(), kPageId));
        session.fill(QPoint(10, 10), FillSpec::solid(Qt::red));

        QVERIFY(session.loadPreparedImage(TestImages::ringImage(), QStringLiteral("other.png")));
        const std::optional<QByteArray> saved = store.value(QStringLiteral("coloring-canvas-ring.png"));
        QVERIFY(saved.has_value());
        QCOMPARE(CanvasCodec::decode(*saved).pixel(10, 10), kRed);
        QCOMPARE(session.canvas().pixel(10, 10), kWhite);
    }

    void fillWithoutStoreStaysIdle()
    {
        ColoringSession session(nullptr, testSettings());
        QSignalSpy statusSpy(&session, &ColoringSession::saveStatusChanged);
        QVERIFY(session.loadPreparedImage(TestImages::ringImage(), kPageId));

        QCOMPARE(session.fill(QPoint(10, 10), FillSpec::solid(Qt::red)).outcome, FillOutcome::Filled);
        QVERIFY(session.undo());
        session.clear();
        QCOMPARE(session.saveStatus(), SaveStatus::Idle);
        QVERIFY(!session.autosave().isPending());
        QTest::qWait(60);
        QCOMPARE(session.saveStatus(), SaveStatus::Idle);
        QCOMPARE(statusSpy.count(), 0);
    }

    void autosaveSettlesAfterFills()
    {
        MemoryKeyValueStore store;
        ColoringSession session(&store, testSettings());
        QSignalSpy statusSpy(&session, &ColoringSession::saveStatusChanged);
        QVERIFY(session.loadPreparedImage(TestImages::ringImage(), kPageId));

        session.fill(QPoint(10, 10), FillSpec::solid(Qt::red));
        session.fill(QPoint(0, 0), FillSpec::solid(Qt::blue));
        QTRY_COMPARE(session.saveStatus(), SaveStatus::Saved);
        QCOMPARE(statusSpy.count(), 2);

        const std::optional<QImage> restored = session.autosave().restore(QStringLiteral("coloring-canvas-ring.png"));
        QVERIFY(restored.has_value());
        QCOMPARE(*restored, session.canvas());
    }

    void tapFillsUnderPointer()
    {
        ColoringSession session(nullptr, testSettings());
        QVERIFY(session.loadPreparedImage(TestImages::ringImage(), kPageId));
        session.setViewportSize(QSizeF(40, 40));
        session.setActiveFill(FillSpec::solid(Qt::blue));

        session.pointerPressed(1, QPointF(21, 21));
        session.pointerReleased(1, QPointF(21, 21));
        QCOMPARE(session.canvas().pixel(10, 10), kBlue);
        QCOMPARE(session.undoStack().count(), 1);
    }

    void viewportPointOutsideCanvasIsNoOp()
    {
        ColoringSession session(nullptr, testSettings());
        QVERIFY(session.loadPreparedImage(TestImages::ringImage(), kPageId));
        session.setViewportSize(QSizeF(40, 20));

        QCOMPARE(session.fillAtViewportPoint(QPointF(2, 10), FillSpec::solid(Qt::red)).outcome, FillOutcome::NoOp);
        QCOMPARE(session.fillAtViewportPoint(QPointF(20.5, 10.5), FillSpec::solid(Qt::red)).outcome,
            FillOutcome::Filled);
        QCOMPARE(session.canvas().pixel(10, 10), kRed);
    }

    void dragPansInsteadOfFilling()
    {
        ColoringSession session(nullptr, testSettings());
        QVERIFY(session.loadPreparedImage(TestImages::ringImage(), kPageId));
        session.setViewportSize(QSizeF(40, 40));

        QSignalSpy viewSpy(&session, &ColoringSession::viewChanged);
        session.wheelZoom(-120);
        QCOMPARE(viewSpy.count(), 1);
        session.view().setZoom(2.0);

        session.pointerPressed(1, QPointF(20, 20));
        session.pointerMoved(1, QPointF(30, 20));
        session.pointerReleased(1, QPointF(30, 20));
        QCOMPARE(viewSpy.count(), 2);
        QCOMPARE(session.view().pan(), QPointF(10, 0));
        QCOMPARE(session.undoStack().count(), 0);
    }

    void hoverReportsFillableRegions()
    {
        ColoringSession session(nullptr, testSettings());
        QVERIFY(!session.isFillableAt(QPoint(10, 10)));
        QVERIFY(session.loadPreparedImage(TestImages::ringImage(), kPageId));
        QVERIFY(session.isFillableAt(QPoint(10, 10)));
        QVERIFY(!session.isFillableAt(QPoint(10, 4)));
        QVERIFY(!session.isFillableAt(QPoint(25, 4)));
    }

    void exportMatchesCanvas()
    {
        ColoringSession session(nullptr, testSettings());
        QVERIFY(session.loadPreparedImage(TestImages::ringImage(), kPageId));
        session.fill(QPoint(10, 10), FillSpec::solid(Qt::red));

        QString error;
        const QByteArray png = session.exportImage("PNG", -1, &error);
        QVERIFY2(!png.isEmpty(), qPrintable(error));
        QCOMPARE(CanvasCodec::decode(png), session.canvas());

        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath("page.png");
        QVERIFY2(session.exportToFile(path, "PNG", -1, &error), qPrintable(error));
        QCOMPARE(QImage(path).pixel(10, 10), kRed);

        QVERIFY(!session.exportToFile(dir.filePath("missing/dir/page.png"), "PNG", -1, &error));
        QVERIFY(!error.isEmpty());
    }
};

QTEST_GUILESS_MAIN(ColoringSessionTests)
#include "tst_coloringsession.moc"
