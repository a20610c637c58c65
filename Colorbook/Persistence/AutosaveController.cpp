#include "AutosaveController.h"

#include "CanvasCodec.h"

#include <QDebug>
#include <QtGlobal>

namespace Colorbook {

namespace
{
const QString kTimestampSuffix = QStringLiteral("-timestamp");
constexpr int kDefaultQuality = 70;
}

constexpr int AutosaveController::kDefaultDelayMs;

AutosaveController::AutosaveController(KeyValueStore* store, QObject* parent)
    : QObject(parent)
    , m_store(store)
    , m_timer()
    , m_format("JPG")
    , m_quality(kDefaultQuality)
    , m_keyPrefix(QStringLiteral("coloring-canvas-"))
    , m_storageKey()
    , m_canvasProvider()
    , m_status(SaveStatus::Idle)
    , m_lastSavedAt()
{
    qRegisterMetaType<Colorbook::SaveStatus>("Colorbook::SaveStatus");

    m_timer.setSingleShot(true);
    m_timer.setInterval(kDefaultDelayMs);
    connect(&m_timer, &QTimer::timeout, this, &AutosaveController::saveNow);
}

void AutosaveController::setDelay(int milliseconds)
{
    m_timer.setInterval(qMax(0, milliseconds));
}

void AutosaveController::setEncoding(const QByteArray& format, int quality)
{
    if (!format.isEmpty()) {
        m_format = format;
    }
    m_quality = qBound(-1, quality, 100);
}

void AutosaveController::setKeyPrefix(const QString& prefix)
{
    if (!prefix.isEmpty()) {
        m_keyPrefix = prefix;
    }
}

QString AutosaveController::storageKeyFor(const QString& imageId) const
{
    return m_keyPrefix + imageId.section(QLatin1Char('/'), -1);
}

QString AutosaveController::timestampKeyFor(const QString& key)
{
    return key + kTimestampSuffix;
}

std::optional<QImage> AutosaveController::restore(const QString& key) const
{
    if (!m_store || key.isEmpty()) {
        return std::nullopt;
    }

    const std::optional<QByteArray> payload = m_store->value(key);
    if (!payload) {
        return std::nullopt;
    }

    QString error;
    const QImage image = CanvasCodec::decode(*payload, &error);
    if (image.isNull()) {
        qWarning() << "Autosave: Failed to restore" << key << error;
        return std::nullopt;
    }

    qDebug() << "Autosave: Restored" << key << image.size();
    return image;
}

std::optional<QDateTime> AutosaveController::savedTimestamp(const QString& key) const
{
    if (!m_store || key.isEmpty()) {
        return std::nullopt;
    }

    const std::optional<QByteArray> raw = m_store->value(timestampKeyFor(key));
    if (!raw) {
        return std::nullopt;
    }

    bool ok = false;
    const qint64 msecs = raw->trimmed().toLongLong(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return QDateTime::fromMSecsSinceEpoch(msecs);
}

void AutosaveController::scheduleSave()
{
    if (!m_store) {
        return; // Nowhere to persist; stay Idle
    }
    setStatus(SaveStatus::Saving);
    m_timer.start();
}

bool AutosaveController::flush()
{
    if (!m_timer.isActive()) {
        return m_status != SaveStatus::Error;
    }
    return saveNow();
}

bool AutosaveController::saveNow()
{
    m_timer.stop();

    if (!m_store || m_storageKey.isEmpty() || !m_canvasProvider) {
        qWarning() << "Autosave: No store or storage key configured";
        setStatus(SaveStatus::Error);
        return false;
    }

    QString error;
    const QByteArray payload = CanvasCodec::encode(m_canvasProvider(), m_format, m_quality, &error);
    if (payload.isEmpty()) {
        qWarning() << "Autosave: Encoding failed:" << error;
        setStatus(SaveStatus::Error);
        return false;
    }

    const qint64 timestamp = QDateTime::currentMSecsSinceEpoch();
    KeyValueStore::WriteResult result = writeEntry(payload, timestamp);

    if (result == KeyValueStore::WriteResult::QuotaExceeded) {
        const int evicted = evictOtherEntries();
        qWarning() << "Autosave: Quota exceeded, evicted" << evicted << "entries and retrying";
        result = writeEntry(payload, timestamp);
    }

    if (result != KeyValueStore::WriteResult::Ok) {
        qWarning() << "Autosave: Failed to save" << m_storageKey;
        setStatus(SaveStatus::Error);
        return false;
    }

    m_lastSavedAt = QDateTime::fromMSecsSinceEpoch(timestamp);
    qDebug() << "Autosave: Saved" << m_storageKey << payload.size() << "bytes";
    setStatus(SaveStatus::Saved);
    return true;
}

void AutosaveController::setStatus(SaveStatus status)
{
    if (m_status == status) {
        return;
    }
    m_status = status;
    emit statusChanged(status);
}

KeyValueStore::WriteResult AutosaveController::writeEntry(const QByteArray& payload, qint64 timestamp)
{
    const KeyValueStore::WriteResult result = m_store->setValue(m_storageKey, payload);
    if (result != KeyValueStore::WriteResult::Ok) {
        return result;
    }
    return m_store->setValue(timestampKeyFor(m_storageKey), QByteArray::number(timestamp));
}

int AutosaveController::evictOtherEntries()
{
    const QString timestampKey = timestampKeyFor(m_storageKey);
    int evicted = 0;

    const QStringList keys = m_store->keys(m_keyPrefix);
    for (const QString& key : keys) {
        if (key == m_storageKey || key == timestampKey) {
            continue;
        }
        m_store->remove(key);
        ++evicted;
    }
    return evicted;
}

} // namespace Colorbook
