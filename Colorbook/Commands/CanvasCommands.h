// Commands/CanvasCommands.h - Undo commands for canvas edits
#ifndef COLORBOOK_CANVASCOMMANDS_H
#define COLORBOOK_CANVASCOMMANDS_H

#include <QImage>
#include <QString>
#include <QUndoCommand>

namespace Colorbook {

class ColoringSession;

// Whole-canvas before/after pair for one fill or clear. QImage is implicitly
// shared, so holding both states costs nothing until the canvas is written.
class CanvasSnapshotCommand : public QUndoCommand
{
public:
    CanvasSnapshotCommand(ColoringSession* session, const QImage& before, const QImage& after,
        const QString& text, QUndoCommand* parent = nullptr);

    void undo() override;
    void redo() override;

    const QImage& before() const { return m_before; }
    const QImage& after() const { return m_after; }

private:
    void restore(const QImage& image);

    ColoringSession* m_session;
    QImage m_before;
    QImage m_after;
    bool m_firstTime;
};

} // namespace Colorbook

#endif // COLORBOOK_CANVASCOMMANDS_H
