#ifndef COLORBOOK_KEYVALUESTORE_H
#define COLORBOOK_KEYVALUESTORE_H

#include <QByteArray>
#include <QString>
#include <QStringList>

#include <optional>

namespace Colorbook {

// Byte store supplied by the host environment.
class KeyValueStore
{
public:
    enum class WriteResult {
        Ok,
        QuotaExceeded,
        Failed
    };

    virtual ~KeyValueStore() = default;

    virtual std::optional<QByteArray> value(const QString& key) const = 0;
    virtual WriteResult setValue(const QString& key, const QByteArray& data) = 0;
    virtual void remove(const QString& key) = 0;
    virtual QStringList keys(const QString& prefix = QString()) const = 0;
};

} // namespace Colorbook

#endif // COLORBOOK_KEYVALUESTORE_H
