#include "transferengine.h"
#include "ftpcontrolchannel.h"
#include "ftpdatachannel.h"
#include "ilocalfilesystem.h"

#include <QRegularExpression>

#include <algorithm>

#include "utils/logging.h"

TransferEngine::TransferEngine(const TransferTask &task, FtpControlChannel *control,
                               ILocalFileSystem *fileSystem, QObject *parent)
    : QObject(parent)
    , task_(task)
    , control_(control)
    , fileSystem_(fileSystem)
    , chunkSize_(control ? control->options().chunkSize : SessionOptions::DefaultChunkSize)
{
}

TransferEngine::~TransferEngine()
{
    releaseResources(!task_.isTerminal());
}

qint64 TransferEngine::parseSizeFromReply(const QString &text)
{
    static const QRegularExpression rx("\\((\\d+)\\s+bytes\\)", QRegularExpression::CaseInsensitiveOption);
    const auto match = rx.match(text);
    if (!match.hasMatch()) {
        return -1;
    }
    bool ok = false;
    const qint64 size = match.captured(1).toLongLong(&ok);
    return ok ? size : -1;
}

void TransferEngine::setState(TransferTask::State state)
{
    if (task_.state == state) {
        return;
    }
    LOG_VERBOSE() << "FTP: Transfer" << task_.id << TransferTask::stateToString(task_.state)
                  << "->" << TransferTask::stateToString(state);
    task_.state = state;
    emit stateChanged(task_.id, state);
}

FtpError::Phase TransferEngine::currentPhase() const
{
    switch (task_.state) {
    case TransferTask::State::Streaming:
        return FtpError::Phase::Streaming;
    case TransferTask::State::Finalizing:
        return FtpError::Phase::Finalizing;
    default:
        return FtpError::Phase::Opening;
    }
}

FtpError TransferEngine::makeError(FtpError::Cause cause, const QString &detail,
                                   const FtpError &underlying) const
{
    const QString path = cause == FtpError::Cause::LocalFilesystem ? task_.localPath : task_.remotePath;
    FtpError error = FtpError::transferError(currentPhase(), cause, path, detail);
    error.command = underlying.command;
    error.replyCode = underlying.replyCode;
    error.serverMessage = underlying.serverMessage;
    return error;
}

void TransferEngine::start()
{
    if (!control_) {
        fail(makeError(FtpError::Cause::Network, tr("No control connection")));
        return;
    }

    QPointer<TransferEngine> guard(this);
    QPointer<FtpControlChannel> control = control_;
    control_->enqueue({[guard, control]() {
        if (!guard) {
            if (control) {
                control->completeOperation();
            }
            return;
        }
        guard->run();
    }, [guard](const FtpError &error) {
        if (guard) {
            guard->onOperationAborted(error);
        }
    }});
}

void TransferEngine::run()
{
    if (task_.isTerminal()) {
        // Cancelled while waiting for the channel
        control_->completeOperation();
        return;
    }

    leaseHeld_ = true;
    setState(TransferTask::State::Opening);
    qDebug() << "FTP: Starting" << (task_.isUpload() ? "upload" : "download")
             << task_.localPath << (task_.isUpload() ? "->" : "<-") << task_.remotePath;

    QString errorString;
    if (task_.isUpload()) {
        file_ = fileSystem_->openForReading(task_.localPath, &errorString);
    } else {
        file_ = fileSystem_->openForWriting(task_.localPath, &errorString);
        createdLocalFile_ = file_ != nullptr;
    }
    if (!file_) {
        fail(makeError(FtpError::Cause::LocalFilesystem,
                       tr("Cannot open local file: %1").arg(errorString)));
        return;
    }

    QPointer<TransferEngine> guard(this);
    control_->sendCommand("TYPE I", [this, guard](const FtpReply &reply) {
        if (!guard || reply.isPreliminary() || task_.isTerminal()) {
            return;
        }
        if (!reply.isPositiveCompletion()) {
            FtpError underlying = FtpError::remoteOpError("TYPE", reply.code, reply.message());
            fail(makeError(FtpError::Cause::Server, tr("Server refused binary mode"), underlying));
            return;
        }
        if (!task_.isUpload() && task_.totalBytes < 0) {
            querySize();
        } else {
            openDataChannel();
        }
    });
}

void TransferEngine::querySize()
{
    QPointer<TransferEngine> guard(this);
    control_->sendCommand("SIZE " + task_.remotePath, [this, guard](const FtpReply &reply) {
        if (!guard || reply.isPreliminary() || task_.isTerminal()) {
            return;
        }
        // SIZE is optional; servers without it still transfer fine
        if (reply.code == FtpReplyFileStatus) {
            bool ok = false;
            const qint64 size = reply.text().trimmed().toLongLong(&ok);
            if (ok && size >= 0) {
                task_.totalBytes = size;
            }
        }
        openDataChannel();
    });
}

void TransferEngine::openDataChannel()
{
    const FtpDataChannel::Mode mode = control_->isPassive() ? FtpDataChannel::Mode::Passive
                                                            : FtpDataChannel::Mode::Active;
    data_ = new FtpDataChannel(control_, mode, control_->isProtected(), this);
    connect(data_, &FtpDataChannel::connected, this, &TransferEngine::onDataConnected);
    connect(data_, &FtpDataChannel::progress, this, &TransferEngine::onDataProgress);
    connect(data_, &FtpDataChannel::finished, this, &TransferEngine::onDataFinished);
    connect(data_, &FtpDataChannel::failed, this, &TransferEngine::onDataFailed);

    QPointer<TransferEngine> guard(this);
    data_->open([this, guard](const FtpError &error) {
        if (!guard || task_.isTerminal()) {
            return;
        }
        if (error.isError()) {
            fail(makeError(FtpError::Cause::Network, error.detail, error));
            return;
        }
        sendTransferCommand();
    });
}

void TransferEngine::sendTransferCommand()
{
    const QString verb = task_.isUpload() ? QStringLiteral("STOR") : QStringLiteral("RETR");
    QPointer<TransferEngine> guard(this);
    control_->sendCommand(verb + " " + task_.remotePath, [this, guard](const FtpReply &reply) {
        if (guard) {
            onTransferReply(reply);
        }
    });
}

void TransferEngine::onTransferReply(const FtpReply &reply)
{
    if (task_.isTerminal()) {
        return;
    }

    if (reply.isPreliminary()) {
        preliminaryReceived_ = true;
        if (!task_.isUpload() && task_.totalBytes < 0) {
            task_.totalBytes = parseSizeFromReply(reply.text());
        }
        maybeStartStreaming();
        return;
    }

    if (reply.isPositiveCompletion()) {
        finalReplyReceived_ = true;
        if (dataFinished_) {
            succeed();
        } else {
            // Some servers skip the 1xx reply; the data still has to arrive
            preliminaryReceived_ = true;
            maybeStartStreaming();
        }
        return;
    }

    const QString verb = task_.isUpload() ? QStringLiteral("STOR") : QStringLiteral("RETR");
    FtpError underlying = FtpError::remoteOpError(verb, reply.code, reply.message(), task_.remotePath);
    fail(makeError(FtpError::Cause::Server, reply.message(), underlying));
}

void TransferEngine::onDataConnected()
{
    if (task_.isTerminal()) {
        return;
    }
    dataConnected_ = true;
    maybeStartStreaming();
}

void TransferEngine::maybeStartStreaming()
{
    if (task_.state != TransferTask::State::Opening || !preliminaryReceived_ || !dataConnected_) {
        return;
    }

    setState(TransferTask::State::Streaming);
    if (task_.isUpload()) {
        data_->sendStream(file_.get(), chunkSize_);
    } else {
        data_->receiveStream(file_.get(), chunkSize_);
    }
}

void TransferEngine::onDataProgress(qint64 bytes)
{
    if (task_.state != TransferTask::State::Streaming || bytes <= task_.bytesTransferred) {
        return;
    }
    task_.bytesTransferred = bytes;
    emit progress(task_.id, bytes, task_.totalBytes);
}

void TransferEngine::onDataFinished(qint64 total)
{
    if (task_.isTerminal()) {
        return;
    }

    dataFinished_ = true;
    task_.bytesTransferred = std::max(task_.bytesTransferred, total);
    setState(TransferTask::State::Finalizing);

    if (data_) {
        data_->close();
    }
    if (file_ && task_.isUpload()) {
        file_->close();
    } else if (file_) {
        QString errorString;
        if (!fileSystem_->finishWriting(file_.get(), &errorString)) {
            fail(makeError(FtpError::Cause::LocalFilesystem,
                           tr("Cannot write local file: %1").arg(errorString)));
            return;
        }
    }

    if (finalReplyReceived_) {
        succeed();
    } else if (control_) {
        control_->restartReplyTimer();
    }
}

void TransferEngine::onDataFailed(const FtpError &error)
{
    if (task_.isTerminal()) {
        return;
    }
    const FtpError::Cause cause = error.cause == FtpError::Cause::LocalFilesystem
        ? FtpError::Cause::LocalFilesystem : FtpError::Cause::Network;
    fail(makeError(cause, error.detail, error));
}

void TransferEngine::succeed()
{
    qDebug() << "FTP: Transfer" << task_.id << "complete," << task_.bytesTransferred << "bytes";
    releaseResources(false);
    releaseLease();
    setState(TransferTask::State::Succeeded);
    emitFinished();
}

void TransferEngine::fail(const FtpError &error)
{
    if (task_.isTerminal()) {
        return;
    }
    qWarning() << "FTP: Transfer" << task_.id << "failed:" << error.toString();
    task_.error = error;
    endWith(TransferTask::State::Failed);
}

void TransferEngine::cancel(CancelMode mode)
{
    if (task_.isTerminal()) {
        return;
    }
    qDebug() << "FTP: Cancelling transfer" << task_.id
             << (mode == CancelMode::Graceful ? "(graceful)" : "(immediate)");

    if (!leaseHeld_) {
        // Still queued; run() will hand the channel back untouched
        setState(TransferTask::State::Cancelled);
        emitFinished();
        return;
    }

    if (mode == CancelMode::Graceful) {
        endWith(TransferTask::State::Cancelled);
        return;
    }

    releaseResources(true);
    leaseHeld_ = false;
    setState(TransferTask::State::Cancelled);
    if (control_) {
        control_->abortConnection(FtpError::connectError(tr("Transfer cancelled")));
    }
    emitFinished();
}

void TransferEngine::endWith(TransferTask::State state)
{
    releaseResources(true);
    setState(state);

    // The transfer command may still be running on the server
    if (leaseHeld_ && control_ && control_->isCommandOutstanding()) {
        QPointer<TransferEngine> guard(this);
        control_->abortCommand([this, guard](const FtpError &) {
            if (!guard) {
                return;
            }
            releaseLease();
            emitFinished();
        });
        return;
    }

    releaseLease();
    emitFinished();
}

void TransferEngine::onOperationAborted(const FtpError &error)
{
    leaseHeld_ = false;
    if (task_.isTerminal()) {
        // Channel went away while draining
        emitFinished();
        return;
    }

    task_.error = makeError(FtpError::Cause::Network, error.detail, error);
    qWarning() << "FTP: Transfer" << task_.id << "failed:" << task_.error.toString();
    releaseResources(true);
    setState(TransferTask::State::Failed);
    emitFinished();
}

void TransferEngine::releaseResources(bool removePartial)
{
    if (data_) {
        data_->close();
        data_->deleteLater();
        data_ = nullptr;
    }
    if (file_) {
        file_->close();
        file_.reset();
    }
    if (removePartial && createdLocalFile_ && fileSystem_) {
        qDebug() << "FTP: Removing partial download" << task_.localPath;
        fileSystem_->remove(task_.localPath);
        createdLocalFile_ = false;
    }
}

void TransferEngine::releaseLease()
{
    if (!leaseHeld_) {
        return;
    }
    leaseHeld_ = false;
    if (control_) {
        control_->completeOperation();
    }
}

void TransferEngine::emitFinished()
{
    if (finishedEmitted_) {
        return;
    }
    finishedEmitted_ = true;
    emit finished(task_);
}
