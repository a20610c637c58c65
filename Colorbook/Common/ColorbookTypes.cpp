#include "ColorbookTypes.h"

#include <QObject>

namespace Colorbook {

FillSpec::FillSpec()
    : m_kind(Kind::Solid)
    , m_stops()
{
}

FillSpec FillSpec::solid(const QColor& color)
{
    FillSpec spec;
    spec.m_kind = Kind::Solid;
    spec.m_stops = { color };
    return spec;
}

FillSpec FillSpec::gradient(const QVector<QColor>& stops)
{
    FillSpec spec;
    spec.m_kind = Kind::Gradient;
    spec.m_stops = stops;
    return spec;
}

QColor FillSpec::color() const
{
    if (m_stops.isEmpty()) {
        return QColor();
    }
    return m_stops.first();
}

bool FillSpec::validate(QString* error) const
{
    if (m_kind == Kind::Solid) {
        if (m_stops.isEmpty() || !m_stops.first().isValid()) {
            if (error) {
                *error = QObject::tr("Solid fill requires a valid color");
            }
            return false;
        }
        return true;
    }

    if (m_stops.size() < 2) {
        if (error) {
            *error = QObject::tr("Gradient fill requires at least 2 color stops, got %1")
                .arg(m_stops.size());
        }
        return false;
    }

    for (int i = 0; i < m_stops.size(); ++i) {
        if (!m_stops.at(i).isValid()) {
            if (error) {
                *error = QObject::tr("Gradient stop %1 is not a valid color").arg(i);
            }
            return false;
        }
    }

    return true;
}

QString saveStatusName(SaveStatus status)
{
    switch (status) {
    case SaveStatus::Idle:
        return QStringLiteral("idle");
    case SaveStatus::Saving:
        return QStringLiteral("saving");
    case SaveStatus::Saved:
        return QStringLiteral("saved");
    case SaveStatus::Error:
        return QStringLiteral("error");
    }
    return QString();
}

} // namespace Colorbook
