#include "GestureTracker.h"

#include "ViewTransform.h"

#include <QLineF>
#include <QtGlobal>

namespace Colorbook {

namespace
{
constexpr int kNoPointer = -1;
}

constexpr qreal GestureTracker::kTapSlop;

GestureTracker::GestureTracker(ViewTransform* view)
    : m_view(view)
    , m_mode(Mode::Idle)
    , m_pointers()
    , m_firstId(kNoPointer)
    , m_secondId(kNoPointer)
    , m_pressPosition()
    , m_initialPinchDistance(0.0)
{
}

GestureTracker::Result GestureTracker::pointerPressed(int pointerId, const QPointF& position)
{
    Result result;
    if (m_pointers.contains(pointerId)) {
        return result;
    }

    if (m_pointers.isEmpty()) {
        m_pointers.insert(pointerId, position);
        m_firstId = pointerId;
        m_secondId = kNoPointer;
        m_pressPosition = position;
        m_mode = Mode::Pressed;
        return result;
    }

    if (m_secondId != kNoPointer) {
        // Third and later pointers take no part in the gesture.
        return result;
    }

    m_pointers.insert(pointerId, position);
    m_secondId = pointerId;

    if (m_mode == Mode::Pinching) {
        // A lifted finger came back; keep scaling from the original baseline.
        return result;
    }

    m_mode = Mode::Pinching;
    m_initialPinchDistance = pinchDistance();
    if (m_view) {
        m_view->beginPinch();
    }
    return result;
}

GestureTracker::Result GestureTracker::pointerMoved(int pointerId, const QPointF& position)
{
    Result result;
    auto it = m_pointers.find(pointerId);
    if (it == m_pointers.end()) {
        return result;
    }

    const QPointF previous = it.value();
    it.value() = position;

    switch (m_mode) {
    case Mode::Idle:
        break;
    case Mode::Pressed:
        if (QLineF(m_pressPosition, position).length() <= kTapSlop) {
            break;
        }
        m_mode = Mode::Panning;
        if (m_view) {
            const QPointF delta = position - m_pressPosition;
            result.viewChanged = m_view->panBy(delta.x(), delta.y());
        }
        break;
    case Mode::Panning:
        if (m_view) {
            const QPointF delta = position - previous;
            result.viewChanged = m_view->panBy(delta.x(), delta.y());
        }
        break;
    case Mode::Pinching:
        if (m_pointers.size() < 2 || !m_view) {
            break;
        }
        if (m_initialPinchDistance <= 0.0) {
            m_initialPinchDistance = pinchDistance();
            break;
        }
        {
            const qreal before = m_view->zoom();
            m_view->setZoomFromPinch(pinchDistance() / m_initialPinchDistance);
            result.viewChanged = !qFuzzyCompare(before, m_view->zoom());
        }
        break;
    }

    return result;
}

GestureTracker::Result GestureTracker::pointerReleased(int pointerId, const QPointF& position)
{
    Result result;
    if (!m_pointers.contains(pointerId)) {
        return result;
    }

    m_pointers.remove(pointerId);

    if (m_mode == Mode::Pressed && m_pointers.isEmpty()
        && QLineF(m_pressPosition, position).length() <= kTapSlop) {
        result.tap = true;
        result.tapPosition = m_pressPosition;
    }

    if (pointerId == m_firstId) {
        m_firstId = m_secondId;
        m_secondId = kNoPointer;
    } else if (pointerId == m_secondId) {
        m_secondId = kNoPointer;
    }

    if (m_pointers.isEmpty()) {
        m_mode = Mode::Idle;
        m_firstId = kNoPointer;
        m_secondId = kNoPointer;
        m_initialPinchDistance = 0.0;
    }

    return result;
}

void GestureTracker::cancel()
{
    m_pointers.clear();
    m_mode = Mode::Idle;
    m_firstId = kNoPointer;
    m_secondId = kNoPointer;
    m_initialPinchDistance = 0.0;
}

qreal GestureTracker::pinchDistance() const
{
    if (m_firstId == kNoPointer || m_secondId == kNoPointer) {
        return 0.0;
    }
    return QLineF(m_pointers.value(m_firstId), m_pointers.value(m_secondId)).length();
}

} // namespace Colorbook
