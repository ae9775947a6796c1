/**
 * @file sessionmanager.h
 * @brief Top-level facade for browsing a server and transferring files.
 *
 * Owns the browsing control connection and the transfer pool, and reports
 * every outcome through Qt signals.
 */

#ifndef SESSIONMANAGER_H
#define SESSIONMANAGER_H

#include <QList>
#include <QObject>
#include <QPointer>
#include <QString>

#include <memory>

#include "connectionprofile.h"
#include "ftperror.h"
#include "remoteentry.h"
#include "sessionoptions.h"
#include "transferengine.h"
#include "transfertask.h"

class FtpControlChannel;
class ILocalFileSystem;
class TransferQueue;

/**
 * @brief Connection manager for one FTP/FTPS server.
 *
 * Browsing operations (listing, navigation, directory and file management)
 * are serialized on a single control connection. File transfers are handed
 * to a TransferQueue that runs them on dedicated sessions, so a long upload
 * never blocks a listing.
 *
 * Every connectToServer() builds a fresh control connection; a lost session
 * is never reused.
 *
 * @par Example usage:
 * @code
 * SessionManager *session = new SessionManager(&fileSystem, this);
 * connect(session, &SessionManager::connected, this, [session]() {
 *     session->listDirectory();
 * });
 * connect(session, &SessionManager::directoryListed, this, &MyClass::showEntries);
 * connect(session, &SessionManager::connectionFailed, this, &MyClass::onError);
 *
 * session->connectToServer(profile);
 * @endcode
 */
class SessionManager : public QObject
{
    Q_OBJECT
    Q_PROPERTY(ConnectionState state READ state NOTIFY stateChanged)
    Q_PROPERTY(bool connected READ isConnected NOTIFY stateChanged)

public:
    /**
     * @brief Connection state of the browsing session.
     */
    enum class ConnectionState {
        Disconnected,   ///< No session
        Connecting,     ///< Connect, TLS and login in progress
        Connected       ///< Logged in, ready for browsing and transfers
    };
    Q_ENUM(ConnectionState)

    /**
     * @brief Constructs a session manager.
     * @param fileSystem Local filesystem used for transfers and folder uploads.
     * @param parent Optional parent QObject for memory management.
     */
    explicit SessionManager(ILocalFileSystem *fileSystem, QObject *parent = nullptr);

    /**
     * @brief Destructor. Drops the session and running transfers.
     */
    ~SessionManager() override;

    /// @name Configuration
    /// @{
    void setOptions(const SessionOptions &options);
    [[nodiscard]] const SessionOptions &options() const { return options_; }
    /// @}

    /// @name Connection State
    /// @{
    [[nodiscard]] ConnectionState state() const { return state_; }
    [[nodiscard]] bool isConnected() const { return state_ == ConnectionState::Connected; }
    [[nodiscard]] const ConnectionProfile &profile() const { return profile_; }

    /**
     * @brief Returns the remote working directory reported by the last PWD.
     */
    [[nodiscard]] QString currentDirectory() const { return currentDir_; }

    /**
     * @brief Returns the welcome text the server sent for this session.
     */
    [[nodiscard]] QString serverGreeting() const { return greeting_; }

    [[nodiscard]] TransferQueue *transferQueue() const { return transferQueue_; }
    [[nodiscard]] FtpControlChannel *controlChannel() const { return channel_; }
    /// @}

    /**
     * @brief Resolves @p name against @p directory.
     *
     * Absolute names are returned unchanged.
     */
    [[nodiscard]] static QString joinRemotePath(const QString &directory, const QString &name);

    /**
     * @brief Name of the remote directory a folder upload of @p localDir creates.
     *
     * Trailing separators and "." or ".." components are resolved first, so
     * "photos/" and "photos/." both give "photos". Empty for a root directory.
     */
    [[nodiscard]] static QString remoteFolderName(const QString &localDir);

public slots:
    /**
     * @brief Opens a new session, replacing any existing one.
     *
     * Emits connected() or connectionFailed().
     */
    void connectToServer(const ConnectionProfile &profile);

    /**
     * @brief Sends QUIT, cancels transfers and closes all sessions.
     */
    void disconnectFromServer();

    /// @name Browsing
    /// @{

    /**
     * @brief Lists @p path, or the working directory if empty.
     *
     * Emits directoryListed() with the absolute path of the listed directory.
     */
    void listDirectory(const QString &path = QString());
    void changeDirectory(const QString &path);

    /**
     * @brief Re-queries the working directory from the server.
     */
    void refreshWorkingDirectory();

    void makeDirectory(const QString &path);
    void removeDirectory(const QString &path);
    void removeFile(const QString &path);
    void rename(const QString &oldPath, const QString &newPath);
    /// @}

    /// @name Transfers
    /// @{

    /**
     * @brief Queues an upload.
     * @param remotePath Target path, defaults to the file name in the working directory.
     * @return Task id.
     */
    int uploadFile(const QString &localPath, const QString &remotePath = QString());

    /**
     * @brief Queues a download.
     * @param totalBytes Size from the listing, -1 if unknown.
     * @return Task id.
     */
    int downloadFile(const QString &remotePath, const QString &localPath, qint64 totalBytes = -1);

    /**
     * @brief Uploads a local directory tree into the working directory.
     *
     * Remote directories are created and entered on the browsing connection
     * as one operation; every file becomes an upload task. The working
     * directory is restored afterwards, also on failure. Emits
     * folderUploadFinished() once all tasks were queued.
     */
    void uploadFolder(const QString &localDir);

    bool cancelTransfer(int id, TransferEngine::CancelMode mode = TransferEngine::CancelMode::Graceful);
    void cancelAllTransfers(TransferEngine::CancelMode mode = TransferEngine::CancelMode::Graceful);
    /// @}

signals:
    /// @name Connection Signals
    /// @{
    void stateChanged(SessionManager::ConnectionState state);
    void connected();
    void connectionFailed(const FtpError &error);
    void disconnected();
    /// @}

    /// @name Browsing Signals
    /// @{
    void directoryListed(const QString &path, const QList<RemoteEntry> &entries);
    void directoryChanged(const QString &path);
    void directoryCreated(const QString &path);
    void directoryRemoved(const QString &path);
    void fileRemoved(const QString &path);
    void fileRenamed(const QString &oldPath, const QString &newPath);
    void operationFailed(const FtpError &error);
    /// @}

    /// @name Transfer Signals
    /// @{
    void transferQueued(const TransferTask &task);
    void transferProgress(int id, qint64 bytes, qint64 total);
    void transferFinished(int id, TransferTask::Status status, const FtpError &error);
    void allTransfersFinished();
    void folderUploadFinished(const QString &localDir, const FtpError &error);
    /// @}

private slots:
    void onChannelFailed(const FtpError &error);
    void onTransferFinished(const TransferTask &task);

private:
    struct FolderUpload;

    void setState(ConnectionState state);
    void releaseChannel(bool sendQuit);
    void reportFailure(const FtpError &error);
    [[nodiscard]] bool ensureConnected(const QString &operation);

    void enterFolder(const std::shared_ptr<FolderUpload> &upload, const QString &localDir,
                     const QString &remoteParent);
    void queueFolderContents(const std::shared_ptr<FolderUpload> &upload, const QString &localDir,
                             const QString &remoteDir, const QString &remoteParent);
    void continueFolderUpload(const std::shared_ptr<FolderUpload> &upload);
    void restoreDirectory(const std::shared_ptr<FolderUpload> &upload);
    bool abandonFolderUpload(const std::shared_ptr<FolderUpload> &upload);
    void finishFolderUpload(const std::shared_ptr<FolderUpload> &upload);

    ILocalFileSystem *fileSystem_ = nullptr;
    TransferQueue *transferQueue_ = nullptr;
    QPointer<FtpControlChannel> channel_;

    SessionOptions options_;
    ConnectionProfile profile_;
    ConnectionState state_ = ConnectionState::Disconnected;
    QString currentDir_;
    QString greeting_;
};

#endif // SESSIONMANAGER_H
