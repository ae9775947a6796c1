#ifndef TRANSFERQUEUE_H
#define TRANSFERQUEUE_H

#include <QAbstractListModel>
#include <QHash>
#include <QList>
#include <QPointer>
#include <QQueue>
#include <QString>

#include <optional>

#include "services/connectionprofile.h"
#include "services/ftperror.h"
#include "services/sessionoptions.h"
#include "services/transferengine.h"
#include "services/transfertask.h"

class FtpControlChannel;
class ILocalFileSystem;

/**
 * @brief Bounded pool of transfer sessions and the tasks waiting for them.
 *
 * Every transfer runs on its own control connection, opened with the
 * profile passed to setConnection(). At most
 * SessionOptions::maxConcurrentTransfers sessions exist at a time; further
 * tasks stay Pending until a session becomes idle.
 *
 * A session that fails or drops is removed from the pool. If no session can
 * be opened at all, the waiting tasks fail with the connection error.
 *
 * The model exposes one row per task, in the order the tasks were queued.
 */
class TransferQueue : public QAbstractListModel
{
    Q_OBJECT

public:
    enum Roles {
        LocalPathRole = Qt::UserRole + 1,
        RemotePathRole,
        DirectionRole,
        StatusRole,
        StateRole,
        ProgressRole,
        BytesTransferredRole,
        TotalBytesRole,
        ErrorMessageRole,
        FileNameRole
    };

    explicit TransferQueue(ILocalFileSystem *fileSystem, QObject *parent = nullptr);
    ~TransferQueue() override;

    /**
     * @brief Sets the server that new sessions connect to.
     *
     * Idle sessions opened for a previous profile are closed.
     */
    void setConnection(const ConnectionProfile &profile, const SessionOptions &options);

    [[nodiscard]] const ConnectionProfile &profile() const { return profile_; }
    [[nodiscard]] const SessionOptions &options() const { return options_; }

    /**
     * @brief Queues an upload; the total size is taken from the local file.
     * @return Task id.
     */
    int enqueueUpload(const QString &localPath, const QString &remotePath);

    /**
     * @brief Queues a download.
     * @param totalBytes Size from the listing, -1 to ask the server with SIZE.
     * @return Task id.
     */
    int enqueueDownload(const QString &remotePath, const QString &localPath, qint64 totalBytes = -1);

    /**
     * @brief Cancels a pending or running task.
     * @return False if the id is unknown or the task already ended.
     */
    bool cancel(int id, TransferEngine::CancelMode mode = TransferEngine::CancelMode::Graceful);
    void cancelAll(TransferEngine::CancelMode mode = TransferEngine::CancelMode::Graceful);

    /**
     * @brief Cancels everything immediately and closes all sessions.
     */
    void shutdown();

    /**
     * @brief Removes finished tasks from the model.
     */
    void removeCompleted();

    [[nodiscard]] std::optional<TransferTask> task(int id) const;
    [[nodiscard]] QList<TransferTask> tasks() const { return items_; }

    [[nodiscard]] int pendingCount() const { return pendingIds_.size(); }
    [[nodiscard]] int activeCount() const { return engines_.size(); }
    [[nodiscard]] int sessionCount() const { return sessions_.size(); }
    [[nodiscard]] bool isIdle() const { return pendingIds_.isEmpty() && engines_.isEmpty(); }

    // QAbstractListModel interface
    [[nodiscard]] int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    [[nodiscard]] QVariant data(const QModelIndex &index, int role = Qt::DisplayRole) const override;
    [[nodiscard]] QHash<int, QByteArray> roleNames() const override;

signals:
    void taskQueued(const TransferTask &task);
    void taskStateChanged(int id, TransferTask::State state);
    void progress(int id, qint64 bytes, qint64 total);
    void taskFinished(const TransferTask &task);
    void allTransfersFinished();

private:
    struct TransferSession {
        QPointer<FtpControlChannel> channel;
        QPointer<TransferEngine> engine;
        bool ready = false;
        bool closing = false;
    };

    int addTask(const TransferTask &task);
    void scheduleProcessNext();
    void processNext();
    bool openSession();
    void onSessionOpened(FtpControlChannel *channel, const FtpError &error);
    void onSessionStateChanged(FtpControlChannel *channel);
    void removeSession(FtpControlChannel *channel);
    void startTask(FtpControlChannel *channel, int id);
    void onEngineStateChanged(int id, TransferTask::State state);
    void onEngineProgress(int id, qint64 bytes, qint64 total);
    void onEngineFinished(const TransferTask &task);
    void failPendingTasks(const FtpError &error);
    void finishWithoutEngine(int id, TransferTask::State state, const FtpError &error = FtpError());
    void checkAllFinished();
    void updateRow(const TransferTask &task);

    [[nodiscard]] int findRow(int id) const;
    [[nodiscard]] TransferSession *findSession(const FtpControlChannel *channel);
    [[nodiscard]] int openingSessionCount() const;

    ILocalFileSystem *fileSystem_ = nullptr;
    ConnectionProfile profile_;
    SessionOptions options_;

    QList<TransferTask> items_;
    QQueue<int> pendingIds_;
    QHash<int, QPointer<TransferEngine>> engines_;
    QList<TransferSession> sessions_;
    int nextId_ = 1;

    bool processingScheduled_ = false;
};

#endif // TRANSFERQUEUE_H
