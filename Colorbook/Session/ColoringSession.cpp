#include "ColoringSession.h"

#include "../Commands/CanvasCommands.h"
#include "../Persistence/CanvasCodec.h"
#include "../Persistence/KeyValueStore.h"

#include <QDebug>
#include <QtGlobal>

namespace Colorbook {

namespace
{
// Holds the busy flag for the duration of one fill.
class FillGuard
{
public:
    explicit FillGuard(bool& flag)
        : m_flag(flag)
    {
        m_flag = true;
    }
    ~FillGuard() { m_flag = false; }

    FillGuard(const FillGuard&) = delete;
    FillGuard& operator=(const FillGuard&) = delete;

private:
    bool& m_flag;
};
}

ColoringSession::ColoringSession(KeyValueStore* store, const ColorbookSettings& settings, QObject* parent)
    : QObject(parent)
    , m_settings(settings)
    , m_document()
    , m_fillEngine(&m_document.reference())
    , m_outlineRenderer(&m_document.reference())
    , m_undoStack()
    , m_view(settings.maxZoom, settings.zoomStep)
    , m_gestures(&m_view)
    , m_autosave(store)
    , m_outlineStyle(settings.outline)
    , m_activeFill(FillSpec::solid(Qt::red))
    , m_viewportSize()
    , m_fillInProgress(false)
{
    // The base state counts towards the limit but is not a command.
    m_undoStack.setUndoLimit(qMax(1, settings.historyLimit - 1));

    m_autosave.setDelay(settings.autosaveDelayMs);
    m_autosave.setEncoding(settings.autosaveFormat, settings.autosaveQuality);
    m_autosave.setKeyPrefix(settings.storageKeyPrefix);
    m_autosave.setCanvasProvider([this]() { return m_document.canvas(); });

    connect(&m_document, &ColoringDocument::canvasChanged, this, &ColoringSession::canvasChanged);
    connect(&m_autosave, &AutosaveController::statusChanged, this, &ColoringSession::saveStatusChanged);
}

bool ColoringSession::loadImage(const QImage& source, const QString& imageId)
{
    const QImage working = ColoringDocument::prepareWorkingImage(source, m_settings.workingWidth);
    if (working.isNull()) {
        qWarning() << "ColoringSession: Cannot load image" << imageId;
        return false;
    }
    return loadPreparedImage(working, imageId);
}

bool ColoringSession::loadPreparedImage(const QImage& image, const QString& imageId)
{
    // Progress on the previous page goes out under its own key.
    if (isLoaded() && !m_autosave.flush()) {
        qWarning() << "ColoringSession: Pending save for" << m_document.imageId() << "failed";
    }

    if (!m_document.loadPrepared(image, imageId)) {
        return false;
    }

    const QString key = m_autosave.storageKeyFor(imageId);
    m_autosave.setStorageKey(key);

    if (const std::optional<QImage> restored = m_autosave.restore(key)) {
        if (!m_document.setCanvas(*restored)) {
            qWarning() << "ColoringSession: Ignoring saved progress with size" << restored->size()
                       << "for canvas" << m_document.canvasSize();
        }
    }

    m_view.resetView();
    m_gestures.cancel();
    emit viewChanged();

    renderOutlines();
    m_undoStack.clear();
    m_autosave.scheduleSave();
    return true;
}

FillResult ColoringSession::fill(const QPoint& seed, const FillSpec& spec)
{
    FillResult result;

    QString error;
    if (!spec.validate(&error)) {
        qWarning() << "ColoringSession: Invalid fill:" << error;
        result.outcome = FillOutcome::InvalidSpec;
        return result;
    }

    if (m_fillInProgress) {
        result.outcome = FillOutcome::Busy;
        return result;
    }

    if (!isLoaded()) {
        return result;
    }

    {
        FillGuard guard(m_fillInProgress);
        const QImage before = m_document.canvas();
        result = m_fillEngine.fill(m_document.canvas(), seed, spec);
        if (result.outcome != FillOutcome::Filled) {
            return result;
        }
        m_document.notifyCanvasChanged(result.dirtyRect);

        // Anti-aliased edge pixels reachable by the fill get their outline tint back.
        renderOutlines();
        commitSnapshot(before, spec.isGradient() ? tr("Gradient fill") : tr("Fill"));
    }

    emit filled(result.dirtyRect);
    return result;
}

FillResult ColoringSession::fillAtViewportPoint(const QPointF& viewportPos, const FillSpec& spec)
{
    const QPoint seed = m_view.mapToCanvas(viewportPos, m_viewportSize, m_document.canvasSize());
    if (!m_document.bounds().contains(seed)) {
        return FillResult();
    }
    return fill(seed, spec);
}

bool ColoringSession::isFillableAt(const QPoint& point) const
{
    return m_fillEngine.isFillable(point);
}

bool ColoringSession::undo()
{
    if (!m_undoStack.canUndo()) {
        return false;
    }

    m_undoStack.undo();
    emit undone();
    m_autosave.scheduleSave();
    return true;
}

bool ColoringSession::redo()
{
    if (!m_undoStack.canRedo()) {
        return false;
    }

    m_undoStack.redo();
    emit redone();
    m_autosave.scheduleSave();
    return true;
}

void ColoringSession::clear()
{
    if (!isLoaded()) {
        return;
    }

    const QImage before = m_document.canvas();
    m_document.resetCanvas();
    renderOutlines();
    commitSnapshot(before, tr("Clear"));
    emit cleared();
}

void ColoringSession::setOutlineStyle(const OutlineStyle& style)
{
    OutlineStyle clamped = style;
    clamped.opacity = qBound(0, style.opacity, 100);
    m_outlineStyle = clamped;

    if (!isLoaded()) {
        return;
    }

    renderOutlines();
    m_autosave.scheduleSave();
}

void ColoringSession::pointerPressed(int pointerId, const QPointF& position)
{
    m_gestures.pointerPressed(pointerId, position);
}

void ColoringSession::pointerMoved(int pointerId, const QPointF& position)
{
    const GestureTracker::Result result = m_gestures.pointerMoved(pointerId, position);
    if (result.viewChanged) {
        emit viewChanged();
    }
}

void ColoringSession::pointerReleased(int pointerId, const QPointF& position)
{
    const GestureTracker::Result result = m_gestures.pointerReleased(pointerId, position);
    if (result.tap) {
        fillAtViewportPoint(result.tapPosition, m_activeFill);
    }
}

void ColoringSession::wheelZoom(qreal deltaY)
{
    m_view.zoomByWheel(deltaY);
    emit viewChanged();
}

QByteArray ColoringSession::exportImage(const QByteArray& format, int quality, QString* error) const
{
    return CanvasCodec::encode(m_document.canvas(), format, quality, error);
}

bool ColoringSession::exportToFile(const QString& filePath, const QByteArray& format, int quality, QString* error) const
{
    return CanvasCodec::writeFile(m_document.canvas(), filePath, format, quality, error);
}

bool ColoringSession::restoreCanvas(const QImage& image)
{
    if (!m_document.setCanvas(image)) {
        return false;
    }
    renderOutlines();
    return true;
}

void ColoringSession::renderOutlines()
{
    if (m_outlineRenderer.apply(m_document.canvas(), m_outlineStyle) > 0) {
        m_document.notifyCanvasChanged();
    }
}

void ColoringSession::commitSnapshot(const QImage& before, const QString& text)
{
    m_undoStack.push(new CanvasSnapshotCommand(this, before, m_document.canvas(), text));
    m_autosave.scheduleSave();
}

} // namespace Colorbook
