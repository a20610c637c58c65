#pragma once

#include <QHash>
#include <QPointF>

namespace Colorbook {

class ViewTransform;

// Turns raw pointer events into pan, pinch and tap intents. One interaction
// runs from the first press to the last release and is either a single-pointer
// drag/tap or a pinch, never both.
class GestureTracker
{
public:
    enum class Mode {
        Idle,
        Pressed,   // one pointer down, not yet moved past the tap slop
        Panning,
        Pinching
    };

    struct Result
    {
        bool viewChanged = false;
        bool tap = false;
        QPointF tapPosition;
    };

    static constexpr qreal kTapSlop = 4.0;

    explicit GestureTracker(ViewTransform* view);

    Mode mode() const { return m_mode; }
    int activePointerCount() const { return m_pointers.size(); }

    Result pointerPressed(int pointerId, const QPointF& position);
    Result pointerMoved(int pointerId, const QPointF& position);
    Result pointerReleased(int pointerId, const QPointF& position);
    void cancel();

private:
    qreal pinchDistance() const;

    ViewTransform* m_view;
    Mode m_mode;
    QHash<int, QPointF> m_pointers;
    int m_firstId;
    int m_secondId;
    QPointF m_pressPosition;
    qreal m_initialPinchDistance;
};

} // namespace Colorbook
