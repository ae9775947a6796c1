/**
 * @file ilocalfilesystem.h
 * @brief Abstract interface to the local filesystem used by transfers.
 *
 * Transfers and folder uploads only touch local files through this
 * interface so tests can substitute an in-memory implementation.
 */

#ifndef ILOCALFILESYSTEM_H
#define ILOCALFILESYSTEM_H

#include <QDateTime>
#include <QIODevice>
#include <QList>
#include <QString>

#include <memory>

/**
 * @brief One child of a local directory.
 */
struct LocalEntry {
    QString name;
    bool isDirectory = false;
    qint64 size = 0;
    QDateTime modified;
};

class ILocalFileSystem
{
public:
    virtual ~ILocalFileSystem() = default;

    /**
     * @brief Lists the children of a directory, sorted by name.
     * @param ok Set to false if the directory cannot be read.
     */
    [[nodiscard]] virtual QList<LocalEntry> listDirectory(const QString &path, bool *ok = nullptr) const = 0;

    /**
     * @brief Opens a file for reading.
     * @param errorString Receives the reason on failure.
     * @return nullptr on failure.
     */
    [[nodiscard]] virtual std::unique_ptr<QIODevice> openForReading(const QString &path,
                                                                    QString *errorString = nullptr) = 0;

    /**
     * @brief Creates or truncates a file for writing.
     * @return nullptr on failure.
     */
    [[nodiscard]] virtual std::unique_ptr<QIODevice> openForWriting(const QString &path,
                                                                    QString *errorString = nullptr) = 0;

    /**
     * @brief Flushes and closes a device returned by openForWriting().
     * @return false if buffered data could not be written out.
     */
    virtual bool finishWriting(QIODevice *file, QString *errorString = nullptr) = 0;

    virtual bool createDirectory(const QString &path) = 0;
    virtual bool remove(const QString &path) = 0;
    virtual bool rename(const QString &oldPath, const QString &newPath) = 0;

    [[nodiscard]] virtual bool isDirectory(const QString &path) const = 0;

    /**
     * @brief Returns the size of a file, -1 if it does not exist.
     */
    [[nodiscard]] virtual qint64 fileSize(const QString &path) const = 0;
};

#endif // ILOCALFILESYSTEM_H
