/**
 * @file test_localfilesystem.cpp
 * @brief Tests for LocalFileSystem against a temporary directory.
 */

#include <QtTest>
#include <QTemporaryDir>

#include "services/localfilesystem.h"

class TestLocalFileSystem : public QObject
{
    Q_OBJECT

private:
    QTemporaryDir *dir_ = nullptr;
    LocalFileSystem fs_;

    QString path(const QString &name) const { return dir_->filePath(name); }

    void writeFile(const QString &name, const QByteArray &data)
    {
        QFile file(path(name));
        QVERIFY(file.open(QIODevice::WriteOnly));
        QCOMPARE(file.write(data), qint64(data.size()));
    }

private slots:
    void init()
    {
        dir_ = new QTemporaryDir();
        QVERIFY(dir_->isValid());
    }

    void cleanup()
    {
        delete dir_;
        dir_ = nullptr;
    }

    // === Listing ===

    void listDirectory_SortedWithDirectoriesFlagged()
    {
        writeFile("b.txt", "bb");
        writeFile("a.txt", "a");
        QVERIFY(QDir(dir_->path()).mkdir("sub"));

        bool ok = false;
        const QList<LocalEntry> entries = fs_.listDirectory(dir_->path(), &ok);

        QVERIFY(ok);
        QCOMPARE(entries.size(), 3);
        QCOMPARE(entries.at(0).name, QString("a.txt"));
        QCOMPARE(entries.at(0).size, qint64(1));
        QVERIFY(!entries.at(0).isDirectory);
        QCOMPARE(entries.at(1).name, QString("b.txt"));
        QCOMPARE(entries.at(1).size, qint64(2));
        QCOMPARE(entries.at(2).name, QString("sub"));
        QVERIFY(entries.at(2).isDirectory);
        QCOMPARE(entries.at(2).size, qint64(0));
        QVERIFY(entries.at(0).modified.isValid());
    }

    void listDirectory_Missing()
    {
        bool ok = true;
        const QList<LocalEntry> entries = fs_.listDirectory(path("nowhere"), &ok);

        QVERIFY(!ok);
        QVERIFY(entries.isEmpty());
    }

    // === Reading and Writing ===

    void openForWriting_TruncatesAndFinishes()
    {
        writeFile("out.bin", "old content that is longer");

        QString error;
        std::unique_ptr<QIODevice> file = fs_.openForWriting(path("out.bin"), &error);
        QVERIFY2(file, qPrintable(error));
        QCOMPARE(file->write("new"), qint64(3));
        QVERIFY(fs_.finishWriting(file.get(), &error));
        QVERIFY(!file->isOpen());

        QCOMPARE(fs_.fileSize(path("out.bin")), qint64(3));
        std::unique_ptr<QIODevice> reader = fs_.openForReading(path("out.bin"));
        QVERIFY(reader);
        QCOMPARE(reader->readAll(), QByteArray("new"));
    }

    void openForWriting_MissingDirectory()
    {
        QString error;
        std::unique_ptr<QIODevice> file = fs_.openForWriting(path("missing/out.bin"), &error);

        QVERIFY(!file);
        QVERIFY(!error.isEmpty());
    }

    void openForReading_Missing()
    {
        QString error;
        QVERIFY(!fs_.openForReading(path("ghost.txt"), &error));
        QVERIFY(!error.isEmpty());
    }

    void finishWriting_FullDevice()
    {
#ifdef Q_OS_LINUX
        QFile full("/dev/full");
        if (!full.exists()) {
            QSKIP("/dev/full not available");
        }
        std::unique_ptr<QIODevice> file = fs_.openForWriting("/dev/full");
        QVERIFY(file);
        // Small enough to stay in the write buffer until the final flush
        QCOMPARE(file->write(QByteArray(100, 'x')), qint64(100));

        QString error;
        QVERIFY(!fs_.finishWriting(file.get(), &error));
        QVERIFY(!error.isEmpty());
        QVERIFY(!file->isOpen());
#else
        QSKIP("Needs /dev/full");
#endif
    }

    // === File Management ===

    void remove_FileAndDirectoryTree()
    {
        writeFile("gone.txt", "x");
        QVERIFY(fs_.createDirectory(path("tree/nested")));
        writeFile("tree/nested/leaf.txt", "y");

        QVERIFY(fs_.remove(path("gone.txt")));
        QVERIFY(!QFile::exists(path("gone.txt")));

        QVERIFY(fs_.remove(path("tree")));
        QVERIFY(!fs_.isDirectory(path("tree")));

        QVERIFY(!fs_.remove(path("gone.txt")));
    }

    void createDirectory_MakesParents()
    {
        QVERIFY(fs_.createDirectory(path("a/b/c")));

        QVERIFY(fs_.isDirectory(path("a")));
        QVERIFY(fs_.isDirectory(path("a/b/c")));
        QCOMPARE(fs_.fileSize(path("a/b")), qint64(-1));
    }

    void rename_MovesFile()
    {
        writeFile("from.txt", "moved");

        QVERIFY(fs_.rename(path("from.txt"), path("to.txt")));

        QCOMPARE(fs_.fileSize(path("from.txt")), qint64(-1));
        QCOMPARE(fs_.fileSize(path("to.txt")), qint64(5));
        QVERIFY(!fs_.isDirectory(path("to.txt")));
    }
};

QTEST_MAIN(TestLocalFileSystem)
#include "test_localfilesystem.moc"
