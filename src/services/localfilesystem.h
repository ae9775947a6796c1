#ifndef LOCALFILESYSTEM_H
#define LOCALFILESYSTEM_H

#include "ilocalfilesystem.h"

/**
 * @brief ILocalFileSystem backed by QDir and QFile.
 */
class LocalFileSystem : public ILocalFileSystem
{
public:
    [[nodiscard]] QList<LocalEntry> listDirectory(const QString &path, bool *ok = nullptr) const override;
    [[nodiscard]] std::unique_ptr<QIODevice> openForReading(const QString &path,
                                                            QString *errorString = nullptr) override;
    [[nodiscard]] std::unique_ptr<QIODevice> openForWriting(const QString &path,
                                                            QString *errorString = nullptr) override;
    bool finishWriting(QIODevice *file, QString *errorString = nullptr) override;
    bool createDirectory(const QString &path) override;
    bool remove(const QString &path) override;
    bool rename(const QString &oldPath, const QString &newPath) override;
    [[nodiscard]] bool isDirectory(const QString &path) const override;
    [[nodiscard]] qint64 fileSize(const QString &path) const override;
};

#endif // LOCALFILESYSTEM_H
