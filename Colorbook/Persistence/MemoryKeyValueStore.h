#ifndef COLORBOOK_MEMORYKEYVALUESTORE_H
#define COLORBOOK_MEMORYKEYVALUESTORE_H

#include "KeyValueStore.h"

#include <QMap>

namespace Colorbook {

// In-process store with an optional byte quota over all stored values.
class MemoryKeyValueStore : public KeyValueStore
{
public:
    explicit MemoryKeyValueStore(qint64 quotaBytes = 0);

    qint64 quotaBytes() const { return m_quotaBytes; }
    void setQuotaBytes(qint64 quotaBytes);
    qint64 usedBytes() const;

    std::optional<QByteArray> value(const QString& key) const override;
    WriteResult setValue(const QString& key, const QByteArray& data) override;
    void remove(const QString& key) override;
    QStringList keys(const QString& prefix = QString()) const override;

private:
    QMap<QString, QByteArray> m_values;
    qint64 m_quotaBytes;
};

} // namespace Colorbook

#endif // COLORBOOK_MEMORYKEYVALUESTORE_H
