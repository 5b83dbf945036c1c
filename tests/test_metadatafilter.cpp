#include <QTest>
#include <QTemporaryDir>
#include <QFile>
#include <QDir>
#include "core/metadatafilter.h"

class TestMetadataFilter : public QObject {
    Q_OBJECT

private:
    QTemporaryDir m_tmpDir;
    QString m_profileDir;

    void touch(const QString &relativePath, const QByteArray &content = "x")
    {
        QString path = m_profileDir + "/" + relativePath;
        QDir().mkpath(QFileInfo(path).absolutePath());
        QFile f(path);
        if (!f.open(QIODevice::WriteOnly))
            qFatal("Failed to create %s", qPrintable(path));
        f.write(content);
    }

    // Lays out a profile the way Chromium leaves it after a run
    void createChromiumProfile()
    {
        touch("Default/IndexedDB/https_web.whatsapp.com_0.indexeddb.leveldb/000003.log", "idb");
        touch("Default/Local Storage/leveldb/CURRENT", "MANIFEST-000001");
        touch("Default/Cache/Cache_Data/data_0", "cache");
        touch("Default/Service Worker/CacheStorage/index", "sw");
        touch("Default/Preferences", "{}");
        touch("Default/History", "sqlite");
        touch("Crashpad/reports/dump.dmp", "crash");
        touch("Local State", "{}");
        touch("SingletonCookie", "cookie");
        touch("IndexedDB/top.ldb", "top-idb");
        touch("Local Storage/top.ldb", "top-ls");
        touch("ShaderCache/data", "shader");
    }

    QStringList entries(const QString &relativeDir)
    {
        return QDir(m_profileDir + "/" + relativeDir)
            .entryList(QDir::NoDotAndDotDot | QDir::AllEntries | QDir::Hidden | QDir::System,
                       QDir::Name);
    }

private slots:
    void init()
    {
        static int counter = 0;
        m_profileDir = m_tmpDir.path() + "/profile_" + QString::number(++counter);
        QDir().mkpath(m_profileDir);
    }

    void requiredEntries_fixedSet()
    {
        QStringList required = MetadataFilter::requiredEntries();
        QCOMPARE(required.size(), 3);
        QVERIFY(required.contains("Default"));
        QVERIFY(required.contains("IndexedDB"));
        QVERIFY(required.contains("Local Storage"));
    }

    void apply_keepsOnlyRequiredEntries()
    {
        createChromiumProfile();

        int removed = MetadataFilter::apply(m_profileDir);
        // Crashpad, Local State, SingletonCookie, ShaderCache, Cache, Service Worker, Preferences, History
        QCOMPARE(removed, 8);

        QCOMPARE(entries(""), QStringList({"Default", "IndexedDB", "Local Storage"}));
        QCOMPARE(entries("Default"), QStringList({"IndexedDB", "Local Storage"}));

        // Contents of kept directories are untouched
        QVERIFY(QFile::exists(m_profileDir
            + "/Default/IndexedDB/https_web.whatsapp.com_0.indexeddb.leveldb/000003.log"));
        QVERIFY(QFile::exists(m_profileDir + "/Default/Local Storage/leveldb/CURRENT"));
        QVERIFY(QFile::exists(m_profileDir + "/IndexedDB/top.ldb"));
    }

    void apply_isIdempotent()
    {
        createChromiumProfile();
        MetadataFilter::apply(m_profileDir);
        QStringList before = entries("") + entries("Default");

        QCOMPARE(MetadataFilter::apply(m_profileDir), 0);
        QCOMPARE(entries("") + entries("Default"), before);
    }

    void apply_removesSymlinksWithoutFollowing()
    {
        touch("Default/IndexedDB/keep.ldb");
        QString outside = m_tmpDir.path() + "/outside_" + QFileInfo(m_profileDir).fileName();
        QDir().mkpath(outside);
        QFile marker(outside + "/marker");
        QVERIFY(marker.open(QIODevice::WriteOnly));
        marker.close();

        QVERIFY(QFile::link(outside, m_profileDir + "/SingletonSocket"));
        QVERIFY(QFile::link(m_profileDir + "/does-not-exist", m_profileDir + "/SingletonLock"));

        QCOMPARE(MetadataFilter::apply(m_profileDir), 2);
        QCOMPARE(entries(""), QStringList({"Default"}));
        QVERIFY(QFile::exists(outside + "/marker"));
    }

    void apply_missingDirectory()
    {
        QCOMPARE(MetadataFilter::apply(m_profileDir + "/not-there"), 0);
    }

    void apply_withoutDefaultSubdirectory()
    {
        touch("Local Storage/a");
        touch("GPUCache/b");

        QCOMPARE(MetadataFilter::apply(m_profileDir), 1);
        QCOMPARE(entries(""), QStringList({"Local Storage"}));
    }

    void apply_defaultIsAFile()
    {
        touch("Default", "not a directory");
        touch("Crashpad/x");

        QCOMPARE(MetadataFilter::apply(m_profileDir), 1);
        QCOMPARE(entries(""), QStringList({"Default"}));
    }
};

QTEST_MAIN(TestMetadataFilter)
#include "test_metadatafilter.moc"
