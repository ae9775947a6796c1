#include "transferqueue.h"
#include "services/ftpcontrolchannel.h"
#include "services/ilocalfilesystem.h"

#include <QDebug>
#include <QFileInfo>
#include <QTimer>

#include <utility>

#include "utils/logging.h"

TransferQueue::TransferQueue(ILocalFileSystem *fileSystem, QObject *parent)
    : QAbstractListModel(parent)
    , fileSystem_(fileSystem)
{
}

TransferQueue::~TransferQueue()
{
    // Engines and channels are children; keep their last signals away from
    // members that are already gone
    for (const QPointer<TransferEngine> &engine : std::as_const(engines_)) {
        if (engine) {
            disconnect(engine, nullptr, this, nullptr);
        }
    }
    for (const TransferSession &session : std::as_const(sessions_)) {
        if (session.channel) {
            disconnect(session.channel, nullptr, this, nullptr);
        }
    }
}

void TransferQueue::setConnection(const ConnectionProfile &profile, const SessionOptions &options)
{
    profile_ = profile;
    options_ = options;
    options_.normalize();

    qDebug() << "TransferQueue: Using" << profile_.host << "with up to"
             << options_.maxConcurrentTransfers << "sessions";

    QList<FtpControlChannel *> idle;
    for (TransferSession &session : sessions_) {
        session.closing = true;
        if (!session.engine) {
            idle.append(session.channel);
        }
    }
    for (FtpControlChannel *channel : std::as_const(idle)) {
        removeSession(channel);
    }
}

int TransferQueue::enqueueUpload(const QString &localPath, const QString &remotePath)
{
    TransferTask task;
    task.direction = TransferTask::Direction::Upload;
    task.localPath = localPath;
    task.remotePath = remotePath;
    task.totalBytes = fileSystem_ ? fileSystem_->fileSize(localPath) : -1;
    return addTask(task);
}

int TransferQueue::enqueueDownload(const QString &remotePath, const QString &localPath, qint64 totalBytes)
{
    TransferTask task;
    task.direction = TransferTask::Direction::Download;
    task.localPath = localPath;
    task.remotePath = remotePath;
    task.totalBytes = totalBytes;
    return addTask(task);
}

int TransferQueue::addTask(const TransferTask &task)
{
    TransferTask queued = task;
    queued.id = nextId_++;

    beginInsertRows(QModelIndex(), items_.size(), items_.size());
    items_.append(queued);
    endInsertRows();

    pendingIds_.enqueue(queued.id);
    qDebug() << "TransferQueue: Queued" << (queued.isUpload() ? "upload" : "download")
             << queued.id << queued.remotePath;

    emit taskQueued(queued);
    scheduleProcessNext();
    return queued.id;
}

bool TransferQueue::cancel(int id, TransferEngine::CancelMode mode)
{
    if (pendingIds_.removeOne(id)) {
        finishWithoutEngine(id, TransferTask::State::Cancelled);
        return true;
    }

    const QPointer<TransferEngine> engine = engines_.value(id);
    if (!engine || engine->task().isTerminal()) {
        return false;
    }
    engine->cancel(mode);
    return true;
}

void TransferQueue::cancelAll(TransferEngine::CancelMode mode)
{
    qDebug() << "TransferQueue: Cancelling" << pendingIds_.size() << "pending and"
             << engines_.size() << "running transfers";

    // Pending first so nothing gets scheduled onto a freed session
    const QList<int> pending = pendingIds_;
    pendingIds_.clear();
    for (int id : pending) {
        finishWithoutEngine(id, TransferTask::State::Cancelled);
    }

    const QList<QPointer<TransferEngine>> running = engines_.values();
    for (const QPointer<TransferEngine> &engine : running) {
        if (engine) {
            engine->cancel(mode);
        }
    }
}

void TransferQueue::shutdown()
{
    cancelAll(TransferEngine::CancelMode::Immediate);

    QList<FtpControlChannel *> channels;
    for (const TransferSession &session : std::as_const(sessions_)) {
        channels.append(session.channel);
    }
    for (FtpControlChannel *channel : std::as_const(channels)) {
        removeSession(channel);
    }
}

void TransferQueue::removeCompleted()
{
    for (int row = items_.size() - 1; row >= 0; --row) {
        if (items_[row].isTerminal()) {
            beginRemoveRows(QModelIndex(), row, row);
            items_.removeAt(row);
            endRemoveRows();
        }
    }
}

std::optional<TransferTask> TransferQueue::task(int id) const
{
    const int row = findRow(id);
    if (row < 0) {
        return std::nullopt;
    }
    return items_[row];
}

int TransferQueue::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid()) return 0;
    return items_.size();
}

QVariant TransferQueue::data(const QModelIndex &index, int role) const
{
    if (!index.isValid() || index.row() >= items_.size()) {
        return QVariant();
    }

    const TransferTask &item = items_[index.row()];

    switch (role) {
    case Qt::DisplayRole:
    case FileNameRole:
        return QFileInfo(item.isUpload() ? item.localPath : item.remotePath).fileName();
    case LocalPathRole:
        return item.localPath;
    case RemotePathRole:
        return item.remotePath;
    case DirectionRole:
        return static_cast<int>(item.direction);
    case StatusRole:
        return static_cast<int>(item.status());
    case StateRole:
        return static_cast<int>(item.state);
    case ProgressRole:
        if (item.totalBytes > 0) {
            return static_cast<int>((item.bytesTransferred * 100) / item.totalBytes);
        }
        return 0;
    case BytesTransferredRole:
        return item.bytesTransferred;
    case TotalBytesRole:
        return item.totalBytes;
    case ErrorMessageRole:
        return item.error.isError() ? item.error.toString() : QString();
    }

    return QVariant();
}

QHash<int, QByteArray> TransferQueue::roleNames() const
{
    QHash<int, QByteArray> roles;
    roles[LocalPathRole] = "localPath";
    roles[RemotePathRole] = "remotePath";
    roles[DirectionRole] = "direction";
    roles[StatusRole] = "status";
    roles[StateRole] = "state";
    roles[ProgressRole] = "progress";
    roles[BytesTransferredRole] = "bytesTransferred";
    roles[TotalBytesRole] = "totalBytes";
    roles[ErrorMessageRole] = "errorMessage";
    roles[FileNameRole] = "fileName";
    return roles;
}

void TransferQueue::scheduleProcessNext()
{
    // Deferred so signal handlers never re-enter the scheduler
    if (processingScheduled_) {
        return;
    }
    processingScheduled_ = true;
    QTimer::singleShot(0, this, [this]() {
        processingScheduled_ = false;
        processNext();
    });
}

void TransferQueue::processNext()
{
    if (pendingIds_.isEmpty()) {
        return;
    }

    QList<FtpControlChannel *> idle;
    for (const TransferSession &session : std::as_const(sessions_)) {
        if (session.ready && !session.closing && !session.engine && session.channel
            && session.channel->isReady()) {
            idle.append(session.channel);
        }
    }

    for (FtpControlChannel *channel : std::as_const(idle)) {
        if (pendingIds_.isEmpty()) {
            break;
        }
        startTask(channel, pendingIds_.dequeue());
    }

    int missing = pendingIds_.size() - openingSessionCount();
    while (missing > 0 && sessions_.size() < options_.maxConcurrentTransfers) {
        if (!openSession()) {
            break;
        }
        --missing;
    }
}

bool TransferQueue::openSession()
{
    if (!profile_.isValid()) {
        qWarning() << "TransferQueue: No server configured";
        failPendingTasks(FtpError::connectError(tr("No server configured")));
        return false;
    }

    auto *channel = new FtpControlChannel(this);
    TransferSession session;
    session.channel = channel;
    sessions_.append(session);

    LOG_VERBOSE() << "TransferQueue: Opening session" << sessions_.size() << "of"
                  << options_.maxConcurrentTransfers;

    connect(channel, &FtpControlChannel::stateChanged, this, [this, channel]() {
        onSessionStateChanged(channel);
    });

    QPointer<TransferQueue> guard(this);
    channel->open(profile_, options_, [guard, channel](const FtpError &error) {
        if (guard) {
            guard->onSessionOpened(channel, error);
        }
    });
    return true;
}

void TransferQueue::onSessionOpened(FtpControlChannel *channel, const FtpError &error)
{
    TransferSession *session = findSession(channel);
    if (!session) {
        // Closed on purpose while connecting
        return;
    }

    if (error.isError()) {
        qWarning() << "TransferQueue: Cannot open transfer session:" << error.toString();
        removeSession(channel);
        if (sessions_.isEmpty() && !pendingIds_.isEmpty()) {
            failPendingTasks(error);
        }
        return;
    }

    session->ready = true;
    scheduleProcessNext();
}

void TransferQueue::onSessionStateChanged(FtpControlChannel *channel)
{
    TransferSession *session = findSession(channel);
    if (!session || channel->state() != FtpControlChannel::State::Disconnected) {
        return;
    }
    // Sessions still opening are handled by their open() callback
    if (!session->ready) {
        return;
    }

    qDebug() << "TransferQueue: Transfer session lost";
    removeSession(channel);
    scheduleProcessNext();
}

void TransferQueue::removeSession(FtpControlChannel *channel)
{
    for (int i = 0; i < sessions_.size(); ++i) {
        if (sessions_[i].channel != channel) {
            continue;
        }
        const bool ready = sessions_[i].ready;
        sessions_.removeAt(i);
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
        if (ready) {
            channel->quit();
        } else {
            channel->abortConnection(FtpError::connectError(tr("Session closed")));
        }
        return;
    }
}

void TransferQueue::startTask(FtpControlChannel *channel, int id)
{
    TransferSession *session = findSession(channel);
    const int row = findRow(id);
    if (!session || row < 0) {
        return;
    }

    auto *engine = new TransferEngine(items_[row], channel, fileSystem_, this);
    session->engine = engine;
    engines_.insert(id, engine);

    connect(engine, &TransferEngine::stateChanged, this, &TransferQueue::onEngineStateChanged);
    connect(engine, &TransferEngine::progress, this, &TransferQueue::onEngineProgress);
    connect(engine, &TransferEngine::finished, this, &TransferQueue::onEngineFinished);

    engine->start();
}

void TransferQueue::onEngineStateChanged(int id, TransferTask::State state)
{
    const QPointer<TransferEngine> engine = engines_.value(id);
    if (engine) {
        updateRow(engine->task());
    }
    emit taskStateChanged(id, state);
}

void TransferQueue::onEngineProgress(int id, qint64 bytes, qint64 total)
{
    const int row = findRow(id);
    if (row >= 0) {
        items_[row].bytesTransferred = bytes;
        items_[row].totalBytes = total;
        emit dataChanged(index(row), index(row));
    }
    emit progress(id, bytes, total);
}

void TransferQueue::onEngineFinished(const TransferTask &task)
{
    const QPointer<TransferEngine> engine = engines_.take(task.id);
    updateRow(task);

    if (task.state == TransferTask::State::Failed) {
        qWarning() << "TransferQueue: Transfer" << task.id << "failed:" << task.error.toString();
    } else {
        qDebug() << "TransferQueue: Transfer" << task.id << TransferTask::stateToString(task.state);
    }

    if (engine) {
        FtpControlChannel *retired = nullptr;
        for (TransferSession &session : sessions_) {
            if (session.engine == engine) {
                session.engine = nullptr;
                if (session.closing) {
                    retired = session.channel;
                }
                break;
            }
        }
        if (retired) {
            removeSession(retired);
        }
        engine->deleteLater();
    }

    emit taskFinished(task);
    scheduleProcessNext();
    checkAllFinished();
}

void TransferQueue::failPendingTasks(const FtpError &error)
{
    const QList<int> pending = pendingIds_;
    pendingIds_.clear();
    for (int id : pending) {
        const int row = findRow(id);
        if (row < 0) {
            continue;
        }
        FtpError taskError = FtpError::transferError(FtpError::Phase::Opening, FtpError::Cause::Network,
                                                     items_[row].remotePath, error.toString());
        taskError.replyCode = error.replyCode;
        taskError.serverMessage = error.serverMessage;
        finishWithoutEngine(id, TransferTask::State::Failed, taskError);
    }
}

void TransferQueue::finishWithoutEngine(int id, TransferTask::State state, const FtpError &error)
{
    const int row = findRow(id);
    if (row < 0) {
        return;
    }

    TransferTask &item = items_[row];
    item.state = state;
    item.error = error;
    emit dataChanged(index(row), index(row));
    emit taskStateChanged(id, state);

    if (error.isError()) {
        qWarning() << "TransferQueue: Transfer" << id << "failed:" << error.toString();
    }

    emit taskFinished(item);
    checkAllFinished();
}

void TransferQueue::checkAllFinished()
{
    if (isIdle()) {
        qDebug() << "TransferQueue: All transfers finished";
        emit allTransfersFinished();
    }
}

void TransferQueue::updateRow(const TransferTask &task)
{
    const int row = findRow(task.id);
    if (row < 0) {
        return;
    }
    items_[row] = task;
    emit dataChanged(index(row), index(row));
}

int TransferQueue::findRow(int id) const
{
    for (int i = 0; i < items_.size(); ++i) {
        if (items_[i].id == id) {
            return i;
        }
    }
    return -1;
}

TransferQueue::TransferSession *TransferQueue::findSession(const FtpControlChannel *channel)
{
    for (TransferSession &session : sessions_) {
        if (session.channel == channel) {
            return &session;
        }
    }
    return nullptr;
}

int TransferQueue::openingSessionCount() const
{
    int count = 0;
    for (const TransferSession &session : sessions_) {
        if (!session.ready && !session.closing) {
            ++count;
        }
    }
    return count;
}
