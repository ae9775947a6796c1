/**
 * @file transferengine.h
 * @brief Runs one upload or download on a dedicated control channel.
 */

#ifndef TRANSFERENGINE_H
#define TRANSFERENGINE_H

#include <QIODevice>
#include <QObject>
#include <QPointer>

#include <memory>

#include "ftperror.h"
#include "ftpreply.h"
#include "transfertask.h"

class FtpControlChannel;
class FtpDataChannel;
class ILocalFileSystem;

/**
 * @brief Drives a TransferTask through Pending, Opening, Streaming and
 * Finalizing to exactly one terminal state.
 *
 * start() enqueues a single operation on the control channel; the engine
 * holds the channel until the transfer is over so no other command can
 * interleave with PASV/STOR/RETR.
 *
 * A transfer only succeeds once the data connection finished and the server
 * confirmed it with a 226/250 reply. Progress is reported only while
 * Streaming and is strictly increasing. finished() is emitted exactly once,
 * after the last progress() and after the control channel was released.
 *
 * Failed and cancelled downloads remove the partial local file.
 */
class TransferEngine : public QObject
{
    Q_OBJECT

public:
    /// @name FTP Response Codes
    /// @{
    static constexpr int FtpReplyFileStatusOk = 150;  ///< File status okay, opening connection
    static constexpr int FtpReplyDataConnectionOpen = 125;  ///< Data connection already open
    static constexpr int FtpReplyFileStatus = 213;  ///< SIZE reply
    /// @}

    enum class CancelMode {
        Graceful,   ///< ABOR and drain the replies, keep the control connection
        Immediate   ///< Drop data and control connections without handshake
    };
    Q_ENUM(CancelMode)

    TransferEngine(const TransferTask &task, FtpControlChannel *control,
                   ILocalFileSystem *fileSystem, QObject *parent = nullptr);
    ~TransferEngine() override;

    /**
     * @brief Queues the transfer on the control channel.
     */
    void start();

    /**
     * @brief Cancels the transfer; ignored once it reached a terminal state.
     */
    void cancel(CancelMode mode = CancelMode::Graceful);

    [[nodiscard]] const TransferTask &task() const { return task_; }
    [[nodiscard]] FtpControlChannel *controlChannel() const { return control_; }

    /**
     * @brief Extracts the size from a "150 ... (1234 bytes)" reply.
     * @return -1 if the reply carries no size.
     */
    [[nodiscard]] static qint64 parseSizeFromReply(const QString &text);

signals:
    void stateChanged(int id, TransferTask::State state);
    void progress(int id, qint64 bytes, qint64 total);
    void finished(const TransferTask &task);

private:
    void run();
    void onOperationAborted(const FtpError &error);
    void querySize();
    void openDataChannel();
    void sendTransferCommand();
    void onTransferReply(const FtpReply &reply);
    void onDataConnected();
    void onDataProgress(qint64 bytes);
    void onDataFinished(qint64 total);
    void onDataFailed(const FtpError &error);
    void maybeStartStreaming();
    void succeed();
    void fail(const FtpError &error);
    void endWith(TransferTask::State state);
    void releaseResources(bool removePartial);
    void releaseLease();
    void emitFinished();
    void setState(TransferTask::State state);

    [[nodiscard]] FtpError::Phase currentPhase() const;
    [[nodiscard]] FtpError makeError(FtpError::Cause cause, const QString &detail,
                                     const FtpError &underlying = FtpError()) const;

    TransferTask task_;
    QPointer<FtpControlChannel> control_;
    ILocalFileSystem *fileSystem_ = nullptr;
    QPointer<FtpDataChannel> data_;
    std::unique_ptr<QIODevice> file_;
    qint64 chunkSize_;

    bool leaseHeld_ = false;
    bool createdLocalFile_ = false;
    bool preliminaryReceived_ = false;
    bool dataConnected_ = false;
    bool dataFinished_ = false;
    bool finalReplyReceived_ = false;
    bool finishedEmitted_ = false;
};

#endif // TRANSFERENGINE_H
