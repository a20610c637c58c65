#include "MemoryKeyValueStore.h"

#include <QtGlobal>

namespace Colorbook {

MemoryKeyValueStore::MemoryKeyValueStore(qint64 quotaBytes)
    : m_values()
    , m_quotaBytes(qMax<qint64>(0, quotaBytes))
{
}

void MemoryKeyValueStore::setQuotaBytes(qint64 quotaBytes)
{
    m_quotaBytes = qMax<qint64>(0, quotaBytes);
}

qint64 MemoryKeyValueStore::usedBytes() const
{
    qint64 total = 0;
    for (auto it = m_values.cbegin(); it != m_values.cend(); ++it) {
        total += it.key().size() + it.value().size();
    }
    return total;
}

std::optional<QByteArray> MemoryKeyValueStore::value(const QString& key) const
{
    auto it = m_values.constFind(key);
    if (it == m_values.cend()) {
        return std::nullopt;
    }
    return it.value();
}

KeyValueStore::WriteResult MemoryKeyValueStore::setValue(const QString& key, const QByteArray& data)
{
    if (key.isEmpty()) {
        return WriteResult::Failed;
    }

    if (m_quotaBytes > 0) {
        qint64 projected = usedBytes() + key.size() + data.size();
        auto it = m_values.constFind(key);
        if (it != m_values.cend()) {
            projected -= key.size() + it.value().size();
        }
        if (projected > m_quotaBytes) {
            return WriteResult::QuotaExceeded;
        }
    }

    m_values.insert(key, data);
    return WriteResult::Ok;
}

void MemoryKeyValueStore::remove(const QString& key)
{
    m_values.remove(key);
}

QStringList MemoryKeyValueStore::keys(const QString& prefix) const
{
    QStringList result;
    for (auto it = m_values.cbegin(); it != m_values.cend(); ++it) {
        if (prefix.isEmpty() || it.key().startsWith(prefix)) {
            result.append(it.key());
        }
    }
    return result;
}

} // namespace Colorbook
