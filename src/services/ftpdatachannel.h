/**
 * @file ftpdatachannel.h
 * @brief Per-transfer FTP data connection (passive or active, optionally TLS).
 */

#ifndef FTPDATACHANNEL_H
#define FTPDATACHANNEL_H

#include <QHostAddress>
#include <QObject>
#include <QPointer>
#include <QString>

#include <functional>

#include "ftperror.h"

class FtpControlChannel;
class QIODevice;
class QSslSocket;
class QTcpServer;
class QTimer;

/**
 * @brief One data connection, used for exactly one listing or transfer.
 *
 * open() negotiates the connection on the control channel (PASV/EPSV or
 * PORT/EPRT) and must be called from inside the operation that holds the
 * control channel. The caller then sends the transfer command and hands a
 * source or sink to sendStream() / receiveStream(). Streaming starts once
 * the connection (and its TLS handshake) is established.
 *
 * Bytes move in bounded chunks: at most one chunk is buffered in the socket
 * at a time, and a received chunk is written to the sink before the next one
 * is read.
 *
 * @par Example usage:
 * @code
 * auto *data = new FtpDataChannel(control, FtpDataChannel::Mode::Passive, false, this);
 * data->open([=](const FtpError &error) {
 *     if (error.isError()) { ... }
 *     data->receiveStream(&file, 8192);
 *     control->sendCommand("RETR readme.txt", onReply);
 * });
 * @endcode
 */
class FtpDataChannel : public QObject
{
    Q_OBJECT

public:
    static constexpr int PassivePortMultiplier = 256;  ///< Multiplier for passive port calculation
    static constexpr int FtpReplyEnteringPassive = 227;  ///< Entering passive mode
    static constexpr int FtpReplyEnteringExtendedPassive = 229;  ///< Entering extended passive mode

    enum class Mode {
        Passive,  ///< Client connects to the port the server advertises
        Active    ///< Server connects to a port the client listens on
    };
    Q_ENUM(Mode)

    using Completion = std::function<void(const FtpError &)>;

    /**
     * @param control Control channel used for negotiation.
     * @param mode Passive or active connection setup.
     * @param secure Perform a client-side TLS handshake on the data socket.
     * @param parent Optional parent QObject.
     */
    FtpDataChannel(FtpControlChannel *control, Mode mode, bool secure, QObject *parent = nullptr);
    ~FtpDataChannel() override;

    /**
     * @brief Negotiates the data connection on the control channel.
     *
     * Passive: done() is called once the PASV/EPSV reply is parsed and the
     * connection attempt started. Active: done() is called once the server
     * accepted PORT/EPRT and the listener waits for the inbound connection.
     */
    void open(Completion done);

    /**
     * @brief Uploads @p source; emits finished() after closing the connection.
     */
    void sendStream(QIODevice *source, qint64 chunkSize);

    /**
     * @brief Downloads into @p sink; emits finished() when the peer closed.
     */
    void receiveStream(QIODevice *sink, qint64 chunkSize);

    /**
     * @brief Releases socket and listener. Safe to call more than once.
     */
    void close();

    [[nodiscard]] Mode mode() const { return mode_; }
    [[nodiscard]] bool isConnected() const { return connected_; }
    [[nodiscard]] bool isClosed() const { return closed_; }
    [[nodiscard]] qint64 bytesTransferred() const { return transferred_; }

    /**
     * @brief Returns the number of opened channels not closed yet.
     */
    [[nodiscard]] static int openChannelCount();

    /// @name Reply Parsing
    /// @{
    [[nodiscard]] static bool parsePassiveResponse(const QString &text, QString &host, quint16 &port);
    [[nodiscard]] static bool parseExtendedPassiveResponse(const QString &text, quint16 &port);
    [[nodiscard]] static QString formatPortArgument(const QHostAddress &address, quint16 port);
    [[nodiscard]] static QString formatExtendedPortArgument(const QHostAddress &address, quint16 port);
    /// @}

signals:
    /**
     * @brief Emitted when the data connection is usable (after TLS, if any).
     */
    void connected();

    /**
     * @brief Emitted after each chunk with the cumulative byte count.
     */
    void progress(qint64 bytes);

    /**
     * @brief Emitted once when all bytes have moved.
     */
    void finished(qint64 total);

    /**
     * @brief Emitted once on connection, socket or local I/O failure.
     */
    void failed(const FtpError &error);

private slots:
    void onSocketConnected();
    void onSocketEncrypted();
    void onSocketReadyRead();
    void onSocketBytesWritten();
    void onSocketDisconnected();
    void onSocketError();
    void onNewConnection();
    void onConnectTimeout();

private:
    void openPassive(const Completion &done);
    void openActive(const Completion &done);
    void attachSocket(QSslSocket *socket);
    void markConnected();
    void beginStreaming();
    void writeNextChunk();
    void drainSocket();
    void finish();
    void fail(const FtpError &error);

    QPointer<FtpControlChannel> control_;
    Mode mode_;
    bool secure_;

    QSslSocket *socket_ = nullptr;
    QTcpServer *server_ = nullptr;
    QTimer *connectTimer_ = nullptr;

    QIODevice *source_ = nullptr;
    QIODevice *sink_ = nullptr;
    qint64 chunkSize_;
    qint64 pendingChunk_ = 0;
    qint64 transferred_ = 0;

    bool opened_ = false;
    bool connected_ = false;
    bool streaming_ = false;
    bool sourceExhausted_ = false;
    bool peerClosed_ = false;
    bool done_ = false;
    bool closed_ = false;

    static int openChannels_;
};

#endif // FTPDATACHANNEL_H
