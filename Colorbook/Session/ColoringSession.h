#pragma once

#include <QByteArray>
#include <QImage>
#include <QObject>
#include <QPointF>
#include <QSizeF>
#include <QString>
#include <QUndoStack>

#include "../Common/ColorbookTypes.h"
#include "../Persistence/AutosaveController.h"
#include "../Raster/ColoringDocument.h"
#include "../Settings/ColorbookSettings.h"
#include "../Tools/FloodFillEngine.h"
#include "../Tools/OutlineRenderer.h"
#include "../Viewport/GestureTracker.h"
#include "../Viewport/ViewTransform.h"

namespace Colorbook {

class KeyValueStore;

// Owns the canvas, its history and view state for one coloring page.
class ColoringSession : public QObject
{
    Q_OBJECT

public:
    explicit ColoringSession(KeyValueStore* store = nullptr,
        const ColorbookSettings& settings = ColorbookSettings(),
        QObject* parent = nullptr);

    bool loadImage(const QImage& source, const QString& imageId);
    bool loadPreparedImage(const QImage& image, const QString& imageId);
    bool isLoaded() const { return !m_document.isNull(); }

    const ColoringDocument& document() const { return m_document; }
    const QImage& canvas() const { return m_document.canvas(); }
    QSize canvasSize() const { return m_document.canvasSize(); }

    FillResult fill(const QPoint& seed, const FillSpec& spec);
    FillResult fillAtViewportPoint(const QPointF& viewportPos, const FillSpec& spec);
    bool isFillableAt(const QPoint& point) const;
    bool isFillInProgress() const { return m_fillInProgress; }

    void setActiveFill(const FillSpec& spec) { m_activeFill = spec; }
    const FillSpec& activeFill() const { return m_activeFill; }

    bool undo();
    bool redo();
    bool canUndo() const { return m_undoStack.canUndo(); }
    bool canRedo() const { return m_undoStack.canRedo(); }
    void clear();

    // One command per fill or clear; the loaded canvas is the base state.
    const QUndoStack& undoStack() const { return m_undoStack; }

    void setOutlineStyle(const OutlineStyle& style);
    const OutlineStyle& outlineStyle() const { return m_outlineStyle; }

    ViewTransform& view() { return m_view; }
    const ViewTransform& view() const { return m_view; }
    void setViewportSize(const QSizeF& size) { m_viewportSize = size; }
    QSizeF viewportSize() const { return m_viewportSize; }

    // Pointer input; a tap becomes a fill with the active fill spec.
    void pointerPressed(int pointerId, const QPointF& position);
    void pointerMoved(int pointerId, const QPointF& position);
    void pointerReleased(int pointerId, const QPointF& position);
    void wheelZoom(qreal deltaY);

    AutosaveController& autosave() { return m_autosave; }
    SaveStatus saveStatus() const { return m_autosave.status(); }
    bool flushPendingSave() { return m_autosave.flush(); }

    QByteArray exportImage(const QByteArray& format = "PNG", int quality = -1, QString* error = nullptr) const;
    bool exportToFile(const QString& filePath, const QByteArray& format, int quality, QString* error = nullptr) const;

signals:
    void filled(const QRect& rect);
    void undone();
    void redone();
    void cleared();
    void canvasChanged(const QRect& rect);
    void viewChanged();
    void saveStatusChanged(Colorbook::SaveStatus status);

private:
    friend class CanvasSnapshotCommand;

    bool restoreCanvas(const QImage& image);
    void renderOutlines();
    void commitSnapshot(const QImage& before, const QString& text);

    ColorbookSettings m_settings;
    ColoringDocument m_document;
    FloodFillEngine m_fillEngine;
    OutlineRenderer m_outlineRenderer;
    QUndoStack m_undoStack;
    ViewTransform m_view;
    GestureTracker m_gestures;
    AutosaveController m_autosave;
    OutlineStyle m_outlineStyle;
    FillSpec m_activeFill;
    QSizeF m_viewportSize;
    bool m_fillInProgress;
};

} // namespace Colorbook
