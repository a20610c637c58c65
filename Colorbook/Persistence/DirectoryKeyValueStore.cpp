#include "DirectoryKeyValueStore.h"

#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QUrl>

namespace Colorbook {

namespace
{
const QString kValueSuffix = QStringLiteral(".kv");
}

DirectoryKeyValueStore::DirectoryKeyValueStore(const QString& directory, qint64 quotaBytes)
    : m_dir(directory)
    , m_quotaBytes(qMax<qint64>(0, quotaBytes))
    , m_open(false)
{
    if (!m_dir.exists() && !QDir().mkpath(m_dir.absolutePath())) {
        qWarning() << "KeyValueStore: Unable to create store directory" << m_dir.absolutePath();
        return;
    }
    m_open = true;
}

void DirectoryKeyValueStore::setQuotaBytes(qint64 quotaBytes)
{
    m_quotaBytes = qMax<qint64>(0, quotaBytes);
}

qint64 DirectoryKeyValueStore::usedBytes() const
{
    qint64 total = 0;
    const QFileInfoList entries = m_dir.entryInfoList(QStringList() << (QStringLiteral("*") + kValueSuffix), QDir::Files);
    for (const QFileInfo& info : entries) {
        total += info.size();
    }
    return total;
}

std::optional<QByteArray> DirectoryKeyValueStore::value(const QString& key) const
{
    if (!m_open || key.isEmpty()) {
        return std::nullopt;
    }

    QFile file(filePathForKey(key));
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "KeyValueStore: Unable to read" << key << file.errorString();
        return std::nullopt;
    }

    return file.readAll();
}

KeyValueStore::WriteResult DirectoryKeyValueStore::setValue(const QString& key, const QByteArray& data)
{
    if (!m_open || key.isEmpty()) {
        return WriteResult::Failed;
    }

    const QString path = filePathForKey(key);

    if (m_quotaBytes > 0) {
        qint64 projected = usedBytes() + data.size();
        const QFileInfo existing(path);
        if (existing.exists()) {
            projected -= existing.size();
        }
        if (projected > m_quotaBytes) {
            return WriteResult::QuotaExceeded;
        }
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "KeyValueStore: Unable to open" << path << file.errorString();
        return WriteResult::Failed;
    }

    if (file.write(data) != data.size()) {
        const bool diskFull = file.error() == QFileDevice::ResourceError;
        qWarning() << "KeyValueStore: Short write for" << key << file.errorString();
        file.cancelWriting();
        return diskFull ? WriteResult::QuotaExceeded : WriteResult::Failed;
    }

    if (!file.commit()) {
        const bool diskFull = file.error() == QFileDevice::ResourceError;
        qWarning() << "KeyValueStore: Commit failed for" << key << file.errorString();
        return diskFull ? WriteResult::QuotaExceeded : WriteResult::Failed;
    }

    return WriteResult::Ok;
}

void DirectoryKeyValueStore::remove(const QString& key)
{
    if (!m_open || key.isEmpty()) {
        return;
    }

    const QString path = filePathForKey(key);
    if (QFile::exists(path) && !QFile::remove(path)) {
        qWarning() << "KeyValueStore: Unable to remove" << path;
    }
}

QStringList DirectoryKeyValueStore::keys(const QString& prefix) const
{
    QStringList result;
    if (!m_open) {
        return result;
    }

    const QStringList files = m_dir.entryList(QStringList() << (QStringLiteral("*") + kValueSuffix), QDir::Files, QDir::Name);
    for (const QString& fileName : files) {
        const QString key = keyForFileName(fileName);
        if (prefix.isEmpty() || key.startsWith(prefix)) {
            result.append(key);
        }
    }
    return result;
}

QString DirectoryKeyValueStore::filePathForKey(const QString& key) const
{
    return m_dir.filePath(fileNameForKey(key));
}

QString DirectoryKeyValueStore::fileNameForKey(const QString& key)
{
    return QString::fromLatin1(QUrl::toPercentEncoding(key)) + kValueSuffix;
}

QString DirectoryKeyValueStore::keyForFileName(const QString& fileName)
{
    const QString encoded = fileName.left(fileName.size() - kValueSuffix.size());
    return QString::fromUtf8(QByteArray::fromPercentEncoding(encoded.toLatin1()));
}

} // namespace Colorbook
