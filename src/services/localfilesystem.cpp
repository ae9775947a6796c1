#include "localfilesystem.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>

QList<LocalEntry> LocalFileSystem::listDirectory(const QString &path, bool *ok) const
{
    QList<LocalEntry> entries;
    const QDir dir(path);
    if (!dir.exists() || !dir.isReadable()) {
        if (ok) {
            *ok = false;
        }
        return entries;
    }

    const QFileInfoList infos = dir.entryInfoList(QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden,
                                                  QDir::Name);
    for (const QFileInfo &info : infos) {
        LocalEntry entry;
        entry.name = info.fileName();
        entry.isDirectory = info.isDir();
        entry.size = info.isDir() ? 0 : info.size();
        entry.modified = info.lastModified();
        entries.append(entry);
    }

    if (ok) {
        *ok = true;
    }
    return entries;
}

std::unique_ptr<QIODevice> LocalFileSystem::openForReading(const QString &path, QString *errorString)
{
    auto file = std::make_unique<QFile>(path);
    if (!file->open(QIODevice::ReadOnly)) {
        if (errorString) {
            *errorString = file->errorString();
        }
        return nullptr;
    }
    return file;
}

std::unique_ptr<QIODevice> LocalFileSystem::openForWriting(const QString &path, QString *errorString)
{
    auto file = std::make_unique<QFile>(path);
    if (!file->open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        if (errorString) {
            *errorString = file->errorString();
        }
        return nullptr;
    }
    return file;
}

bool LocalFileSystem::finishWriting(QIODevice *file, QString *errorString)
{
    auto *device = qobject_cast<QFileDevice *>(file);
    if (!device) {
        file->close();
        return true;
    }

    // close() flushes too but cannot report a failure
    const bool flushed = device->flush();
    const QFileDevice::FileError error = device->error();
    const QString reason = device->errorString();
    device->close();
    if (!flushed || error != QFileDevice::NoError) {
        if (errorString) {
            *errorString = reason;
        }
        return false;
    }
    return true;
}

bool LocalFileSystem::createDirectory(const QString &path)
{
    return QDir().mkpath(path);
}

bool LocalFileSystem::remove(const QString &path)
{
    const QFileInfo info(path);
    if (info.isDir()) {
        return QDir(path).removeRecursively();
    }
    return QFile::remove(path);
}

bool LocalFileSystem::rename(const QString &oldPath, const QString &newPath)
{
    return QFile::rename(oldPath, newPath);
}

bool LocalFileSystem::isDirectory(const QString &path) const
{
    return QFileInfo(path).isDir();
}

qint64 LocalFileSystem::fileSize(const QString &path) const
{
    const QFileInfo info(path);
    if (!info.exists() || info.isDir()) {
        return -1;
    }
    return info.size();
}
