#pragma once

#include <QByteArray>
#include <QDateTime>
#include <QImage>
#include <QObject>
#include <QString>
#include <QTimer>

#include <functional>
#include <optional>

#include "../Common/ColorbookTypes.h"
#include "KeyValueStore.h"

namespace Colorbook {

// Debounced canvas persistence. Rapid scheduleSave() calls coalesce into one
// write once the delay has elapsed without a new request.
class AutosaveController : public QObject
{
    Q_OBJECT

public:
    using CanvasProvider = std::function<QImage()>;

    static constexpr int kDefaultDelayMs = 500;

    explicit AutosaveController(KeyValueStore* store = nullptr, QObject* parent = nullptr);

    void setStore(KeyValueStore* store) { m_store = store; }
    KeyValueStore* store() const { return m_store; }

    void setDelay(int milliseconds);
    int delay() const { return m_timer.interval(); }

    void setEncoding(const QByteArray& format, int quality);
    QByteArray format() const { return m_format; }
    int quality() const { return m_quality; }

    void setKeyPrefix(const QString& prefix);
    QString keyPrefix() const { return m_keyPrefix; }

    QString storageKeyFor(const QString& imageId) const;
    static QString timestampKeyFor(const QString& key);

    void setStorageKey(const QString& key) { m_storageKey = key; }
    QString storageKey() const { return m_storageKey; }

    void setCanvasProvider(CanvasProvider provider) { m_canvasProvider = std::move(provider); }

    SaveStatus status() const { return m_status; }
    bool isPending() const { return m_timer.isActive(); }
    QDateTime lastSavedAt() const { return m_lastSavedAt; }

    std::optional<QImage> restore(const QString& key) const;
    std::optional<QDateTime> savedTimestamp(const QString& key) const;

public slots:
    void scheduleSave();
    bool flush();
    bool saveNow();

signals:
    void statusChanged(Colorbook::SaveStatus status);

private:
    void setStatus(SaveStatus status);
    KeyValueStore::WriteResult writeEntry(const QByteArray& payload, qint64 timestamp);
    int evictOtherEntries();

    KeyValueStore* m_store;
    QTimer m_timer;
    QByteArray m_format;
    int m_quality;
    QString m_keyPrefix;
    QString m_storageKey;
    CanvasProvider m_canvasProvider;
    SaveStatus m_status;
    QDateTime m_lastSavedAt;
};

} // namespace Colorbook
