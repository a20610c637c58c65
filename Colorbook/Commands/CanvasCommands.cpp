// Commands/CanvasCommands.cpp
#include "CanvasCommands.h"

#include "../Session/ColoringSession.h"

#include <QDebug>

namespace Colorbook {

CanvasSnapshotCommand::CanvasSnapshotCommand(ColoringSession* session, const QImage& before,
    const QImage& after, const QString& text, QUndoCommand* parent)
    : QUndoCommand(text, parent)
    , m_session(session)
    , m_before(before)
    , m_after(after)
    , m_firstTime(true)
{
}

void CanvasSnapshotCommand::undo()
{
    restore(m_before);
}

void CanvasSnapshotCommand::redo()
{
    if (m_firstTime) {
        m_firstTime = false;
        return; // The edit is already on the canvas when the command is pushed
    }
    restore(m_after);
}

void CanvasSnapshotCommand::restore(const QImage& image)
{
    if (!m_session) {
        return;
    }

    if (!m_session->restoreCanvas(image)) {
        qWarning() << "CanvasSnapshotCommand: Snapshot for" << text() << "does not match the canvas";
    }
}

} // namespace Colorbook
