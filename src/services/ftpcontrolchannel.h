/**
 * @file ftpcontrolchannel.h
 * @brief FTP control connection with a serialized operation queue.
 *
 * Provides asynchronous login, optional explicit TLS, directory navigation,
 * listing and remote file management over a single control connection.
 */

#ifndef FTPCONTROLCHANNEL_H
#define FTPCONTROLCHANNEL_H

#include <QHostAddress>
#include <QList>
#include <QObject>
#include <QQueue>
#include <QString>

#include <functional>
#include <memory>
#include <optional>

#include "connectionprofile.h"
#include "ftperror.h"
#include "ftpreply.h"
#include "remoteentry.h"
#include "sessionoptions.h"

class QSslSocket;
class QTimer;

/**
 * @brief A unit of work that holds the control channel exclusively.
 *
 * The channel calls start() once the operation reaches the head of the
 * queue. The operation may then issue any number of commands with
 * FtpControlChannel::sendCommand() and must finish with
 * FtpControlChannel::completeOperation(). If the channel is invalidated
 * first, abort() is called instead (for queued operations start() is never
 * called).
 */
struct FtpOperation {
    std::function<void()> start;
    std::function<void(const FtpError &)> abort;
};

/**
 * @brief Asynchronous FTP control connection.
 *
 * Commands are serialized: exactly one FtpOperation holds the channel at a
 * time, so multi-command exchanges such as PASV followed by STOR are never
 * interleaved with other requests.
 *
 * Any socket failure, malformed reply or reply timeout invalidates the
 * channel. It enters the terminal Disconnected state, every pending
 * operation is aborted with a reconnect-required error and failed() is
 * emitted if the session had been established. A channel is never
 * reconnected; build a new one instead.
 *
 * @par Example usage:
 * @code
 * auto *channel = new FtpControlChannel(this);
 * channel->open(profile, options, [channel](const FtpError &error) {
 *     if (error.isError()) {
 *         qWarning() << error.toString();
 *         return;
 *     }
 *     channel->listDirectory(QString(), [](const QList<RemoteEntry> &entries,
 *                                           const FtpError &error) {
 *         // ...
 *     });
 * });
 * @endcode
 */
class FtpControlChannel : public QObject
{
    Q_OBJECT

public:
    /// @name FTP Response Codes (RFC 959, RFC 4217)
    /// @{
    static constexpr int FtpReplyServiceReady = 220;  ///< Service ready for new user
    static constexpr int FtpReplyUserLoggedIn = 230;  ///< User logged in, proceed
    static constexpr int FtpReplyCommandSuperfluous = 202;  ///< Command not needed (PASS after USER)
    static constexpr int FtpReplyPasswordRequired = 331;  ///< User name okay, need password
    static constexpr int FtpReplyPathCreated = 257;  ///< Pathname created / current directory
    static constexpr int FtpReplyActionOk = 250;  ///< Requested file action okay
    static constexpr int FtpReplyFileStatus = 213;  ///< File status (SIZE)
    static constexpr int FtpReplyAuthOk = 234;  ///< Security data exchange complete
    static constexpr int FtpReplyPendingFurtherInfo = 350;  ///< Requested action pending further info
    static constexpr int FtpReplySyntaxError = 500;  ///< Command unrecognized
    static constexpr int FtpReplyNotImplemented = 502;  ///< Command not implemented
    /// @}

    /**
     * @brief Connection state of the channel.
     */
    enum class State {
        Unconnected,   ///< Not yet connected
        Connecting,    ///< TCP connect and greeting in progress
        LoggingIn,     ///< AUTH TLS / USER / PASS in progress
        Ready,         ///< Logged in and accepting operations
        Disconnected   ///< Closed or invalidated (terminal)
    };
    Q_ENUM(State)

    using ReplyHandler = std::function<void(const FtpReply &)>;
    using Completion = std::function<void(const FtpError &)>;
    using PathCallback = std::function<void(const QString &, const FtpError &)>;
    using ListingCallback = std::function<void(const QList<RemoteEntry> &, const FtpError &)>;
    using SizeCallback = std::function<void(qint64, const FtpError &)>;

    explicit FtpControlChannel(QObject *parent = nullptr);
    ~FtpControlChannel() override;

    void setOptions(const SessionOptions &options) { options_ = options; }
    [[nodiscard]] const SessionOptions &options() const { return options_; }

    [[nodiscard]] State state() const { return state_; }
    [[nodiscard]] bool isReady() const { return state_ == State::Ready; }

    /**
     * @brief Checks if PROT P succeeded and data connections must use TLS.
     */
    [[nodiscard]] bool isProtected() const { return protected_; }

    [[nodiscard]] QHostAddress peerAddress() const;
    [[nodiscard]] QHostAddress localAddress() const;
    [[nodiscard]] QString peerName() const { return host_; }

    /**
     * @brief Selects passive (default) or active data connections.
     */
    void setPassive(bool passive) { passive_ = passive; }
    [[nodiscard]] bool isPassive() const { return passive_; }

    /// @name Session Setup
    /// @{

    /**
     * @brief Connects and waits for the 220 greeting.
     *
     * Fails with a Connect error on socket failure, timeout or any other
     * greeting.
     */
    void connectToHost(const QString &host, quint16 port, int timeoutMs, Completion done);

    /**
     * @brief Sends AUTH TLS and performs the client-side TLS handshake.
     *
     * Must run before authenticate() so credentials never travel in clear.
     */
    void negotiateTls(Completion done);

    /**
     * @brief Logs in with USER/PASS; a rejection fails with an Auth error.
     */
    void authenticate(const FtpCredentials &credentials, Completion done);

    /**
     * @brief Sends PBSZ 0 and PROT P so that data connections are encrypted.
     */
    void upgradeToSecure(Completion done);

    /**
     * @brief Runs the full session setup for a profile.
     *
     * connectToHost, negotiateTls (TLS profiles), authenticate,
     * upgradeToSecure (TLS profiles) and a PWD. The channel is Ready once
     * done is called without error.
     */
    void open(const ConnectionProfile &profile, const SessionOptions &options, Completion done);

    /**
     * @brief Sends QUIT and closes the connection.
     *
     * Queued operations run first. Emits closed() once the socket is gone.
     */
    void quit();

    /**
     * @brief Drops the connection without any handshake.
     *
     * Every pending operation is aborted with @p error.
     */
    void abortConnection(const FtpError &error);
    /// @}

    /// @name Operation Queue
    /// @{

    /**
     * @brief Appends an operation; starts it immediately if the channel is idle.
     *
     * On a Disconnected channel the operation is aborted right away.
     */
    void enqueue(FtpOperation operation);

    /**
     * @brief Ends the running operation and starts the next one.
     */
    void completeOperation();

    /**
     * @brief Sends one command on behalf of the running operation.
     *
     * The handler receives preliminary (1xx) replies and the final reply.
     * It is released before the final reply is dispatched, so it may send
     * the next command from inside the callback.
     */
    void sendCommand(const QString &command, ReplyHandler handler);

    /**
     * @brief Enqueues a single-command operation.
     *
     * @p handler sees the final reply; @p aborted is called instead if the
     * channel is invalidated first.
     */
    void execute(const QString &command, ReplyHandler handler, Completion aborted);

    /**
     * @brief Checks if a sent command has not received its final reply yet.
     */
    [[nodiscard]] bool isCommandOutstanding() const { return commandOutstanding_; }

    /**
     * @brief Sends ABOR and drains the pending replies.
     *
     * Two final replies are expected when a command was outstanding (its
     * own 426/226 and the ABOR reply), otherwise one. The handler of the
     * outstanding command is dropped. If the drain does not finish within
     * the abort timeout the channel is invalidated; the running operation
     * then learns about it through its abort hook and @p done is not called.
     */
    void abortCommand(Completion done);

    /**
     * @brief Restarts the reply deadline while a transfer awaits its final reply.
     */
    void restartReplyTimer();

    /**
     * @brief Sends PWD on behalf of the running operation.
     *
     * Unlike printWorkingDirectory() the operation keeps the channel. A
     * positive reply updates lastKnownDirectory().
     */
    void queryWorkingDirectory(PathCallback done);
    /// @}

    /// @name Directory Operations
    /// @{

    /**
     * @brief Issues PWD; the reply updates lastKnownDirectory().
     */
    void printWorkingDirectory(PathCallback done);

    /**
     * @brief Returns the directory reported by the most recent PWD.
     */
    [[nodiscard]] QString lastKnownDirectory() const { return currentDir_; }

    /**
     * @brief Returns the text of the 220 welcome reply, one line per reply line.
     */
    [[nodiscard]] QString greeting() const { return greeting_; }

    /**
     * @brief CWD followed by PWD; reports the server-confirmed directory.
     */
    void changeDirectory(const QString &path, PathCallback done);

    /**
     * @brief Lists a directory with MLSD, falling back to LIST.
     * @param path Directory to list, empty for the working directory.
     */
    void listDirectory(const QString &path, ListingCallback done);

    /**
     * @brief Checks if MLSD has not been rejected as unsupported yet.
     */
    [[nodiscard]] bool isMachineListingSupported() const { return mlsdSupported_; }

    void makeDirectory(const QString &path, Completion done);
    void removeDirectory(const QString &path, Completion done);
    /// @}

    /// @name File Operations
    /// @{
    void deleteFile(const QString &path, Completion done);

    /**
     * @brief RNFR (expects 350) followed by RNTO.
     */
    void rename(const QString &oldPath, const QString &newPath, Completion done);

    /**
     * @brief Queries the size of a remote file with SIZE.
     */
    void sizeOf(const QString &path, SizeCallback done);
    /// @}

    /**
     * @brief Extracts the directory from a 257 reply, undoubling quotes.
     * @return Empty string if the reply carries no quoted path.
     */
    [[nodiscard]] static QString parsePwdReply(const QString &text);

signals:
    /**
     * @brief Emitted when the connection state changes.
     */
    void stateChanged(FtpControlChannel::State state);

    /**
     * @brief Emitted when an established session is lost.
     */
    void failed(const FtpError &error);

    /**
     * @brief Emitted after quit() once the connection is closed.
     */
    void closed();

private slots:
    void onSocketReadyRead();
    void onSocketDisconnected();
    void onSocketError();
    void onEncrypted();
    void onReplyTimeout();
    void onAbortTimeout();

private:
    enum class ListingFormat { Machine, Unix };
    struct ListingContext;

    void setState(State state);
    void invalidate(const FtpError &error);
    void dispatchReply(const FtpReply &reply);
    void writeCommand(const QString &command);
    void startNextOperation();
    void finishLogin(const Completion &done);
    void sendPwd(const PathCallback &done);
    void runSimpleCommand(const QString &verb, const QString &path, Completion done);
    void runListing(const std::shared_ptr<ListingContext> &context, ListingFormat format);
    void finishListing(const std::shared_ptr<ListingContext> &context, ListingFormat format,
                       const FtpError &error);

    QSslSocket *socket_ = nullptr;
    QTimer *replyTimer_ = nullptr;
    QTimer *abortTimer_ = nullptr;
    FtpReplyParser parser_;
    SessionOptions options_;

    // Connection state
    State state_ = State::Unconnected;
    QString host_;
    bool passive_ = true;
    bool protected_ = false;
    bool quitting_ = false;
    bool mlsdSupported_ = true;
    QString currentDir_;
    QString greeting_;

    // Operation queue
    QQueue<FtpOperation> operations_;
    std::optional<FtpOperation> activeOperation_;

    // Command in flight
    ReplyHandler replyHandler_;
    bool commandOutstanding_ = false;
    Completion tlsDone_;

    // ABOR drain
    int abortRepliesPending_ = 0;
    Completion abortDone_;
};

#endif // FTPCONTROLCHANNEL_H
