#include "sessionmanager.h"
#include "ftpcontrolchannel.h"
#include "ilocalfilesystem.h"
#include "models/transferqueue.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>

#include "utils/logging.h"

struct SessionManager::FolderUpload {
    struct Frame {
        QString remoteDir;       ///< Server-confirmed directory of this folder
        QString remoteParent;    ///< Directory to return to when done
        QStringList subdirectories;
        int next = 0;
    };

    QPointer<FtpControlChannel> channel;
    QString localDir;
    QString originalDir;
    QList<Frame> frames;
    FtpError error;
    int queuedFiles = 0;
    bool finished = false;

    void recordError(const FtpError &failure)
    {
        if (!error.isError()) {
            error = failure;
        }
    }
};

SessionManager::SessionManager(ILocalFileSystem *fileSystem, QObject *parent)
    : QObject(parent)
    , fileSystem_(fileSystem)
    , transferQueue_(new TransferQueue(fileSystem, this))
{
    connect(transferQueue_, &TransferQueue::taskQueued, this, &SessionManager::transferQueued);
    connect(transferQueue_, &TransferQueue::progress, this, &SessionManager::transferProgress);
    connect(transferQueue_, &TransferQueue::taskFinished, this, &SessionManager::onTransferFinished);
    connect(transferQueue_, &TransferQueue::allTransfersFinished,
            this, &SessionManager::allTransfersFinished);
}

SessionManager::~SessionManager()
{
    disconnect(transferQueue_, nullptr, this, nullptr);
    if (channel_) {
        disconnect(channel_, nullptr, this, nullptr);
    }
}

void SessionManager::setOptions(const SessionOptions &options)
{
    options_ = options;
    options_.normalize();
}

QString SessionManager::joinRemotePath(const QString &directory, const QString &name)
{
    if (name.startsWith('/') || directory.isEmpty()) {
        return name;
    }
    if (directory.endsWith('/')) {
        return directory + name;
    }
    return directory + '/' + name;
}

QString SessionManager::remoteFolderName(const QString &localDir)
{
    return QFileInfo(QDir::cleanPath(QDir(localDir).absolutePath())).fileName();
}

void SessionManager::setState(ConnectionState state)
{
    if (state_ != state) {
        state_ = state;
        emit stateChanged(state);
    }
}

void SessionManager::connectToServer(const ConnectionProfile &profile)
{
    if (channel_) {
        qDebug() << "Session: Replacing existing session";
        releaseChannel(true);
    }

    profile_ = profile;
    currentDir_.clear();
    greeting_.clear();

    if (!profile_.isValid()) {
        const FtpError error = FtpError::connectError(tr("No host configured"));
        qWarning() << "Session:" << error.toString();
        setState(ConnectionState::Disconnected);
        emit connectionFailed(error);
        return;
    }

    qDebug() << "Session: Connecting to" << profile_.host << ":" << profile_.port
             << (profile_.tls ? "(TLS)" : "") << (profile_.passive ? "passive" : "active");
    setState(ConnectionState::Connecting);

    auto *channel = new FtpControlChannel(this);
    channel_ = channel;

    QPointer<SessionManager> guard(this);
    channel->open(profile_, options_, [guard, channel](const FtpError &error) {
        if (!guard || guard->channel_ != channel) {
            // Superseded by another connect or a disconnect
            return;
        }

        if (error.isError()) {
            qWarning() << "Session: Connection failed:" << error.toString();
            guard->releaseChannel(false);
            guard->setState(ConnectionState::Disconnected);
            emit guard->connectionFailed(error);
            return;
        }

        QObject::connect(channel, &FtpControlChannel::failed,
                         guard.data(), &SessionManager::onChannelFailed);
        guard->currentDir_ = channel->lastKnownDirectory();
        guard->greeting_ = channel->greeting();
        guard->transferQueue_->setConnection(guard->profile_, guard->options_);

        qDebug() << "Session: Connected, working directory" << guard->currentDir_;
        guard->setState(ConnectionState::Connected);
        emit guard->connected();
        if (!guard->currentDir_.isEmpty()) {
            emit guard->directoryChanged(guard->currentDir_);
        }
    });
}

void SessionManager::disconnectFromServer()
{
    transferQueue_->shutdown();

    if (!channel_ && state_ == ConnectionState::Disconnected) {
        return;
    }

    qDebug() << "Session: Disconnecting from" << profile_.host;
    releaseChannel(true);
    currentDir_.clear();
    greeting_.clear();
    setState(ConnectionState::Disconnected);
    emit disconnected();
}

void SessionManager::releaseChannel(bool sendQuit)
{
    FtpControlChannel *channel = channel_;
    channel_ = nullptr;
    if (!channel) {
        return;
    }

    disconnect(channel, nullptr, this, nullptr);
    if (channel->state() == FtpControlChannel::State::Disconnected) {
        channel->deleteLater();
        return;
    }

    connect(channel, &FtpControlChannel::stateChanged, channel,
            [channel](FtpControlChannel::State state) {
        if (state == FtpControlChannel::State::Disconnected) {
            channel->deleteLater();
        }
    });
    if (sendQuit && channel->isReady()) {
        channel->quit();
    } else {
        channel->abortConnection(FtpError::connectError(tr("Session closed")));
    }
}

void SessionManager::onChannelFailed(const FtpError &error)
{
    qWarning() << "Session: Connection lost:" << error.toString();
    releaseChannel(false);
    currentDir_.clear();
    setState(ConnectionState::Disconnected);
    emit connectionFailed(error);
    emit disconnected();
}

void SessionManager::reportFailure(const FtpError &error)
{
    qWarning() << "Session:" << error.toString();
    emit operationFailed(error);
}

bool SessionManager::ensureConnected(const QString &operation)
{
    if (channel_ && state_ == ConnectionState::Connected) {
        return true;
    }
    FtpError error = FtpError::connectError(tr("Not connected to server"));
    error.command = operation;
    reportFailure(error);
    return false;
}

// Browsing

void SessionManager::listDirectory(const QString &path)
{
    if (!ensureConnected(QStringLiteral("LIST"))) {
        return;
    }

    const QString target = path.isEmpty() ? currentDir_ : joinRemotePath(currentDir_, path);
    QPointer<SessionManager> guard(this);
    channel_->listDirectory(path, [guard, target](const QList<RemoteEntry> &entries, const FtpError &error) {
        if (!guard) {
            return;
        }
        if (error.isError()) {
            guard->reportFailure(error);
            return;
        }
        LOG_VERBOSE() << "Session: Listed" << entries.size() << "entries in" << target;
        emit guard->directoryListed(target, entries);
    });
}

void SessionManager::changeDirectory(const QString &path)
{
    if (!ensureConnected(QStringLiteral("CWD"))) {
        return;
    }

    QPointer<SessionManager> guard(this);
    channel_->changeDirectory(path, [guard](const QString &dir, const FtpError &error) {
        if (!guard) {
            return;
        }
        if (error.isError()) {
            guard->reportFailure(error);
            return;
        }
        guard->currentDir_ = dir;
        emit guard->directoryChanged(dir);
    });
}

void SessionManager::refreshWorkingDirectory()
{
    if (!ensureConnected(QStringLiteral("PWD"))) {
        return;
    }

    QPointer<SessionManager> guard(this);
    channel_->printWorkingDirectory([guard](const QString &dir, const FtpError &error) {
        if (!guard) {
            return;
        }
        if (error.isError()) {
            guard->reportFailure(error);
            return;
        }
        guard->currentDir_ = dir;
        emit guard->directoryChanged(dir);
    });
}

void SessionManager::makeDirectory(const QString &path)
{
    if (!ensureConnected(QStringLiteral("MKD"))) {
        return;
    }

    QPointer<SessionManager> guard(this);
    channel_->makeDirectory(path, [guard, path](const FtpError &error) {
        if (!guard) {
            return;
        }
        if (error.isError()) {
            guard->reportFailure(error);
        } else {
            emit guard->directoryCreated(path);
        }
    });
}

void SessionManager::removeDirectory(const QString &path)
{
    if (!ensureConnected(QStringLiteral("RMD"))) {
        return;
    }

    QPointer<SessionManager> guard(this);
    channel_->removeDirectory(path, [guard, path](const FtpError &error) {
        if (!guard) {
            return;
        }
        if (error.isError()) {
            guard->reportFailure(error);
        } else {
            emit guard->directoryRemoved(path);
        }
    });
}

void SessionManager::removeFile(const QString &path)
{
    if (!ensureConnected(QStringLiteral("DELE"))) {
        return;
    }

    QPointer<SessionManager> guard(this);
    channel_->deleteFile(path, [guard, path](const FtpError &error) {
        if (!guard) {
            return;
        }
        if (error.isError()) {
            guard->reportFailure(error);
        } else {
            emit guard->fileRemoved(path);
        }
    });
}

void SessionManager::rename(const QString &oldPath, const QString &newPath)
{
    if (!ensureConnected(QStringLiteral("RNFR"))) {
        return;
    }

    QPointer<SessionManager> guard(this);
    channel_->rename(oldPath, newPath, [guard, oldPath, newPath](const FtpError &error) {
        if (!guard) {
            return;
        }
        if (error.isError()) {
            guard->reportFailure(error);
        } else {
            emit guard->fileRenamed(oldPath, newPath);
        }
    });
}

// Transfers

int SessionManager::uploadFile(const QString &localPath, const QString &remotePath)
{
    if (!ensureConnected(QStringLiteral("STOR"))) {
        return -1;
    }
    const QString target = remotePath.isEmpty() ? QFileInfo(localPath).fileName() : remotePath;
    // Pooled sessions start in the login directory, so paths must be absolute
    return transferQueue_->enqueueUpload(localPath, joinRemotePath(currentDir_, target));
}

int SessionManager::downloadFile(const QString &remotePath, const QString &localPath, qint64 totalBytes)
{
    if (!ensureConnected(QStringLiteral("RETR"))) {
        return -1;
    }
    return transferQueue_->enqueueDownload(joinRemotePath(currentDir_, remotePath), localPath, totalBytes);
}

bool SessionManager::cancelTransfer(int id, TransferEngine::CancelMode mode)
{
    return transferQueue_->cancel(id, mode);
}

void SessionManager::cancelAllTransfers(TransferEngine::CancelMode mode)
{
    transferQueue_->cancelAll(mode);
}

void SessionManager::onTransferFinished(const TransferTask &task)
{
    emit transferFinished(task.id, task.status(), task.error);
}

// Folder upload

void SessionManager::uploadFolder(const QString &localDir)
{
    if (!ensureConnected(QStringLiteral("MKD"))) {
        emit folderUploadFinished(localDir, FtpError::connectError(tr("Not connected to server")));
        return;
    }

    QString reason;
    if (!fileSystem_ || !fileSystem_->isDirectory(localDir)) {
        reason = tr("Not a directory");
    } else if (remoteFolderName(localDir).isEmpty()) {
        reason = tr("Cannot upload a root directory");
    }
    if (!reason.isEmpty()) {
        const FtpError error = FtpError::transferError(FtpError::Phase::Opening,
                                                       FtpError::Cause::LocalFilesystem,
                                                       localDir, reason);
        qWarning() << "Session:" << error.toString();
        emit folderUploadFinished(localDir, error);
        return;
    }

    auto upload = std::make_shared<FolderUpload>();
    upload->channel = channel_;
    upload->localDir = QDir::cleanPath(QDir(localDir).absolutePath());

    qDebug() << "Session: Uploading folder" << localDir;

    QPointer<SessionManager> guard(this);
    QPointer<FtpControlChannel> channel = channel_;
    channel_->enqueue({[guard, channel, upload]() {
        if (!guard) {
            if (channel) {
                channel->completeOperation();
            }
            return;
        }

        upload->originalDir = channel->lastKnownDirectory();
        if (!upload->originalDir.isEmpty()) {
            guard->enterFolder(upload, upload->localDir, upload->originalDir);
            return;
        }

        // Without a known directory there is nothing to return to
        channel->queryWorkingDirectory([guard, channel, upload](const QString &dir, const FtpError &error) {
            if (!guard) {
                return;
            }
            if (error.isError()) {
                upload->recordError(error);
                channel->completeOperation();
                guard->finishFolderUpload(upload);
                return;
            }
            upload->originalDir = dir;
            guard->enterFolder(upload, upload->localDir, dir);
        });
    }, [guard, upload](const FtpError &error) {
        if (guard) {
            upload->recordError(error);
            guard->finishFolderUpload(upload);
        }
    }});
}

void SessionManager::enterFolder(const std::shared_ptr<FolderUpload> &upload, const QString &localDir,
                                 const QString &remoteParent)
{
    const QString name = remoteFolderName(localDir);
    const QString remotePath = joinRemotePath(remoteParent, name);
    QPointer<SessionManager> guard(this);
    QPointer<FtpControlChannel> channel = upload->channel;

    channel->sendCommand("MKD " + name, [guard, channel, upload, localDir, name, remotePath,
                                         remoteParent](const FtpReply &reply) {
        if (!guard || reply.isPreliminary()) {
            return;
        }
        // The directory may already exist; CWD tells
        if (reply.isPositiveCompletion()) {
            emit guard->directoryCreated(remotePath);
        } else {
            LOG_VERBOSE() << "Session: MKD" << name << "refused:" << reply.message();
        }

        channel->sendCommand("CWD " + name, [guard, channel, upload, localDir, remotePath,
                                             remoteParent](const FtpReply &reply) {
            if (!guard || reply.isPreliminary()) {
                return;
            }
            if (!reply.isPositiveCompletion()) {
                const FtpError error = FtpError::remoteOpError("CWD", reply.code, reply.message(), remotePath);
                qWarning() << "Session:" << error.toString();
                upload->recordError(error);
                // Still in the parent directory
                guard->continueFolderUpload(upload);
                return;
            }

            channel->queryWorkingDirectory([guard, upload, localDir, remotePath,
                                            remoteParent](const QString &dir, const FtpError &error) {
                if (!guard) {
                    return;
                }
                if (error.isError()) {
                    LOG_VERBOSE() << "Session: PWD failed, assuming" << remotePath;
                }
                guard->queueFolderContents(upload, localDir, dir.isEmpty() ? remotePath : dir, remoteParent);
            });
        });
    });
}

void SessionManager::queueFolderContents(const std::shared_ptr<FolderUpload> &upload,
                                         const QString &localDir, const QString &remoteDir,
                                         const QString &remoteParent)
{
    if (abandonFolderUpload(upload)) {
        return;
    }

    FolderUpload::Frame frame;
    frame.remoteDir = remoteDir;
    frame.remoteParent = remoteParent;

    bool ok = false;
    const QList<LocalEntry> entries = fileSystem_->listDirectory(localDir, &ok);
    if (!ok) {
        const FtpError error = FtpError::transferError(FtpError::Phase::Opening,
                                                       FtpError::Cause::LocalFilesystem,
                                                       localDir, tr("Cannot read local directory"));
        qWarning() << "Session:" << error.toString();
        upload->recordError(error);
    }

    const QDir dir(localDir);
    for (const LocalEntry &entry : entries) {
        if (entry.isDirectory) {
            frame.subdirectories.append(dir.filePath(entry.name));
        } else {
            transferQueue_->enqueueUpload(dir.filePath(entry.name), joinRemotePath(remoteDir, entry.name));
            ++upload->queuedFiles;
        }
    }

    upload->frames.append(frame);
    continueFolderUpload(upload);
}

void SessionManager::continueFolderUpload(const std::shared_ptr<FolderUpload> &upload)
{
    if (abandonFolderUpload(upload)) {
        return;
    }
    if (upload->frames.isEmpty()) {
        restoreDirectory(upload);
        return;
    }

    FolderUpload::Frame &top = upload->frames.last();
    if (top.next < top.subdirectories.size()) {
        const QString child = top.subdirectories.at(top.next++);
        enterFolder(upload, child, top.remoteDir);
        return;
    }

    const QString parent = top.remoteParent;
    upload->frames.removeLast();
    if (upload->frames.isEmpty()) {
        restoreDirectory(upload);
        return;
    }

    QPointer<SessionManager> guard(this);
    upload->channel->sendCommand("CWD " + parent, [guard, upload, parent](const FtpReply &reply) {
        if (!guard || reply.isPreliminary()) {
            return;
        }
        if (!reply.isPositiveCompletion()) {
            // Relative names would land in the wrong place from here on
            upload->recordError(FtpError::remoteOpError("CWD", reply.code, reply.message(), parent));
            upload->frames.clear();
            guard->restoreDirectory(upload);
            return;
        }
        guard->continueFolderUpload(upload);
    });
}

void SessionManager::restoreDirectory(const std::shared_ptr<FolderUpload> &upload)
{
    QPointer<SessionManager> guard(this);
    QPointer<FtpControlChannel> channel = upload->channel;
    const QString original = upload->originalDir;

    channel->sendCommand("CWD " + original, [guard, channel, upload, original](const FtpReply &reply) {
        if (!guard || reply.isPreliminary()) {
            return;
        }
        if (!reply.isPositiveCompletion()) {
            upload->recordError(FtpError::remoteOpError("CWD", reply.code, reply.message(), original));
        }

        channel->queryWorkingDirectory([guard, channel, upload](const QString &dir, const FtpError &error) {
            if (!guard) {
                return;
            }
            channel->completeOperation();
            if (!error.isError() && guard->channel_ == channel) {
                guard->currentDir_ = dir;
                emit guard->directoryChanged(dir);
            }
            guard->finishFolderUpload(upload);
        });
    });
}

bool SessionManager::abandonFolderUpload(const std::shared_ptr<FolderUpload> &upload)
{
    if (channel_ && channel_ == upload->channel) {
        return false;
    }

    // The session was closed or replaced while the folder was being walked
    upload->recordError(FtpError::connectError(tr("Session closed")));
    upload->frames.clear();
    if (upload->channel) {
        upload->channel->completeOperation();
    }
    finishFolderUpload(upload);
    return true;
}

void SessionManager::finishFolderUpload(const std::shared_ptr<FolderUpload> &upload)
{
    if (upload->finished) {
        return;
    }
    upload->finished = true;

    if (upload->error.isError()) {
        qWarning() << "Session: Folder upload of" << upload->localDir << "incomplete:"
                   << upload->error.toString();
    } else {
        qDebug() << "Session: Folder upload of" << upload->localDir << "queued"
                 << upload->queuedFiles << "files";
    }
    emit folderUploadFinished(upload->localDir, upload->error);
}
