#ifndef REMOTEENTRY_H
#define REMOTEENTRY_H

#include <QDateTime>
#include <QList>
#include <QMetaType>
#include <QString>

/**
 * @brief Represents a single entry in a remote directory listing.
 */
struct RemoteEntry {
    enum class Kind {
        File,            ///< Regular file (also the fallback for unknown types)
        Directory,       ///< Directory
        SymlinkUnknown   ///< Symbolic link whose target type is not known
    };

    QString name;               ///< Entry name, never "." or ".."
    Kind kind = Kind::File;     ///< Entry type
    qint64 size = 0;            ///< Size in bytes (meaningful for files only)
    QDateTime modified;         ///< Last modification time (UTC), invalid if unknown
    QString modifiedText;       ///< Raw timestamp text as sent by the server
    QString permissions;        ///< Unix-style permission string, if listed

    [[nodiscard]] bool isDirectory() const { return kind == Kind::Directory; }
    [[nodiscard]] bool isFile() const { return kind == Kind::File; }
};

Q_DECLARE_METATYPE(RemoteEntry)

#endif // REMOTEENTRY_H
