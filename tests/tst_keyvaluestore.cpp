#include <QDir>
#include <QFile>
#include <QObject>
#include <QTemporaryDir>
#include <QTest>

#include "Persistence/DirectoryKeyValueStore.h"
#include "Persistence/MemoryKeyValueStore.h"

using namespace Colorbook;

class KeyValueStoreTests : public QObject
{
    Q_OBJECT

private slots:
    void memoryStoreRoundTrip()
    {
        MemoryKeyValueStore store;
        QVERIFY(!store.value("missing").has_value());

        QCOMPARE(store.setValue("page", QByteArray("abc")), KeyValueStore::WriteResult::Ok);
        QCOMPARE(store.value("page").value(), QByteArray("abc"));

        store.remove("page");
        QVERIFY(!store.value("page").has_value());
        store.remove("page");
    }

    void memoryStoreRejectsEmptyKey()
    {
        MemoryKeyValueStore store;
        QCOMPARE(store.setValue(QString(), QByteArray("x")), KeyValueStore::WriteResult::Failed);
        QVERIFY(store.keys().isEmpty());
    }

    void memoryStoreQuota()
    {
        MemoryKeyValueStore store(20);
        QCOMPARE(store.setValue("a", QByteArray(10, 'x')), KeyValueStore::WriteResult::Ok);
        QCOMPARE(store.usedBytes(), qint64(11));

        QCOMPARE(store.setValue("b", QByteArray(10, 'y')), KeyValueStore::WriteResult::QuotaExceeded);
        QVERIFY(!store.value("b").has_value());
        QCOMPARE(store.usedBytes(), qint64(11));

        // Replacing a value only counts the difference.
        QCOMPARE(store.setValue("a", QByteArray(15, 'z')), KeyValueStore::WriteResult::Ok);
        QCOMPARE(store.value("a").value(), QByteArray(15, 'z'));
    }

    void memoryStoreKeysByPrefix()
    {
        MemoryKeyValueStore store;
        store.setValue("coloring-canvas-a", "1");
        store.setValue("coloring-canvas-b", "2");
        store.setValue("settings", "3");

        QStringList keys = store.keys("coloring-canvas-");
        keys.sort();
        QCOMPARE(keys, QStringList() << "coloring-canvas-a" << "coloring-canvas-b");
        QCOMPARE(store.keys().size(), 3);
    }

    void directoryStoreRoundTrip()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());

        DirectoryKeyValueStore store(dir.path());
        QVERIFY(store.isOpen());
        QVERIFY(!store.value("page").has_value());

        QCOMPARE(store.setValue("page", QByteArray("pixels")), KeyValueStore::WriteResult::Ok);
        QCOMPARE(store.value("page").value(), QByteArray("pixels"));

        QCOMPARE(store.setValue("page", QByteArray("more pixels")), KeyValueStore::WriteResult::Ok);
        QCOMPARE(store.value("page").value(), QByteArray("more pixels"));

        store.remove("page");
        QVERIFY(!store.value("page").has_value());
    }

    void directoryStoreCreatesMissingDirectory()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString nested = dir.filePath("a/b/canvases");

        DirectoryKeyValueStore store(nested);
        QVERIFY(store.isOpen());
        QVERIFY(QDir(nested).exists());
    }

    void directoryStoreEncodesKeys()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        DirectoryKeyValueStore store(dir.path());

        const QString key = QStringLiteral("coloring-canvas-my page/1.png");
        QCOMPARE(store.setValue(key, QByteArray("data")), KeyValueStore::WriteResult::Ok);
        QCOMPARE(store.keys("coloring-canvas-"), QStringList() << key);
        QCOMPARE(store.value(key).value(), QByteArray("data"));

        // Exactly one file, no nested directory from the slash.
        const QStringList files = QDir(dir.path()).entryList(QDir::Files | QDir::Dirs | QDir::NoDotAndDotDot);
        QCOMPARE(files.size(), 1);
        QVERIFY(files.first().endsWith(".kv"));
    }

    void directoryStoreQuota()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        DirectoryKeyValueStore store(dir.path(), 100);

        QCOMPARE(store.setValue("k1", QByteArray(60, 'a')), KeyValueStore::WriteResult::Ok);
        QCOMPARE(store.setValue("k2", QByteArray(60, 'b')), KeyValueStore::WriteResult::QuotaExceeded);
        QVERIFY(!store.value("k2").has_value());

        QCOMPARE(store.setValue("k1", QByteArray(90, 'c')), KeyValueStore::WriteResult::Ok);
        QCOMPARE(store.usedBytes(), qint64(90));

        store.remove("k1");
        QCOMPARE(store.setValue("k2", QByteArray(60, 'b')), KeyValueStore::WriteResult::Ok);
    }

    void directoryStoreIgnoresForeignFiles()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());

        QFile foreign(dir.filePath("notes.txt"));
        QVERIFY(foreign.open(QIODevice::WriteOnly));
        foreign.write("hello");
        foreign.close();

        DirectoryKeyValueStore store(dir.path());
        QVERIFY(store.keys().isEmpty());
        QCOMPARE(store.usedBytes(), qint64(0));
    }
};

QTEST_GUILESS_MAIN(KeyValueStoreTests)
#include "tst_keyvaluestore.moc"
