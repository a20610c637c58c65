#ifndef COLORBOOK_DIRECTORYKEYVALUESTORE_H
#define COLORBOOK_DIRECTORYKEYVALUESTORE_H

#include "KeyValueStore.h"

#include <QDir>

namespace Colorbook {

// One file per key under a directory. Values are written atomically.
class DirectoryKeyValueStore : public KeyValueStore
{
public:
    explicit DirectoryKeyValueStore(const QString& directory, qint64 quotaBytes = 0);

    bool isOpen() const { return m_open; }
    QString directory() const { return m_dir.absolutePath(); }

    qint64 quotaBytes() const { return m_quotaBytes; }
    void setQuotaBytes(qint64 quotaBytes);
    qint64 usedBytes() const;

    std::optional<QByteArray> value(const QString& key) const override;
    WriteResult setValue(const QString& key, const QByteArray& data) override;
    void remove(const QString& key) override;
    QStringList keys(const QString& prefix = QString()) const override;

private:
    QString filePathForKey(const QString& key) const;
    static QString fileNameForKey(const QString& key);
    static QString keyForFileName(const QString& fileName);

    QDir m_dir;
    qint64 m_quotaBytes;
    bool m_open;
};

} // namespace Colorbook

#endif // COLORBOOK_DIRECTORYKEYVALUESTORE_H
