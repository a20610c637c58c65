#ifndef COLORBOOK_COLORBOOKTYPES_H
#define COLORBOOK_COLORBOOKTYPES_H

#include <QColor>
#include <QMetaType>
#include <QRect>
#include <QString>
#include <QVector>

namespace Colorbook {

// Fill request: a single color or a vertical gradient across the region
class FillSpec
{
public:
    enum class Kind {
        Solid,
        Gradient
    };

    FillSpec();

    static FillSpec solid(const QColor& color);
    static FillSpec gradient(const QVector<QColor>& stops);

    Kind kind() const { return m_kind; }
    bool isGradient() const { return m_kind == Kind::Gradient; }

    QColor color() const;
    const QVector<QColor>& stops() const { return m_stops; }

    bool validate(QString* error = nullptr) const;

private:
    Kind m_kind;
    QVector<QColor> m_stops;
};

struct OutlineStyle {
    bool visible = true;
    QColor tintColor = QColor(0, 0, 0);
    int opacity = 100;  // 0..100

    bool operator==(const OutlineStyle& other) const
    {
        return visible == other.visible && tintColor.rgb() == other.tintColor.rgb()
            && opacity == other.opacity;
    }
    bool operator!=(const OutlineStyle& other) const { return !(*this == other); }
};

enum class FillOutcome {
    Filled,
    NoOp,         // seed on a boundary, out of bounds, or already that color
    Busy,         // another fill is running on the same canvas
    InvalidSpec   // rejected before traversal
};

struct FillResult {
    FillOutcome outcome = FillOutcome::NoOp;
    int pixelCount = 0;
    QRect dirtyRect;
};

enum class SaveStatus {
    Idle,
    Saving,
    Saved,
    Error
};

QString saveStatusName(SaveStatus status);

} // namespace Colorbook

Q_DECLARE_METATYPE(Colorbook::SaveStatus)

#endif // COLORBOOK_COLORBOOKTYPES_H
