#include "ftpdatachannel.h"
#include "ftpcontrolchannel.h"

#include <QIODevice>
#include <QRegularExpression>
#include <QSslCipher>
#include <QSslSocket>
#include <QTcpServer>
#include <QTimer>

#include <algorithm>

#include "utils/logging.h"

namespace {

// Active-mode listener handing out QSslSocket instances so the accepted
// connection can be upgraded to TLS like a passive one
class ActiveModeServer : public QTcpServer
{
public:
    using QTcpServer::QTcpServer;

protected:
    void incomingConnection(qintptr socketDescriptor) override
    {
        auto *socket = new QSslSocket(this);
        if (socket->setSocketDescriptor(socketDescriptor)) {
            addPendingConnection(socket);
        } else {
            delete socket;
        }
    }
};

QHostAddress toIPv4(const QHostAddress &address)
{
    bool ok = false;
    const quint32 ipv4 = address.toIPv4Address(&ok);
    return ok ? QHostAddress(ipv4) : address;
}

} // namespace

int FtpDataChannel::openChannels_ = 0;

FtpDataChannel::FtpDataChannel(FtpControlChannel *control, Mode mode, bool secure, QObject *parent)
    : QObject(parent)
    , control_(control)
    , mode_(mode)
    , secure_(secure)
    , connectTimer_(new QTimer(this))
    , chunkSize_(SessionOptions::DefaultChunkSize)
{
    connectTimer_->setSingleShot(true);
    connect(connectTimer_, &QTimer::timeout, this, &FtpDataChannel::onConnectTimeout);
}

FtpDataChannel::~FtpDataChannel()
{
    close();
}

int FtpDataChannel::openChannelCount()
{
    return openChannels_;
}

void FtpDataChannel::open(Completion done)
{
    if (opened_) {
        done(FtpError::dataChannelError(tr("Data channel already opened")));
        return;
    }
    if (!control_ || control_->state() == FtpControlChannel::State::Disconnected) {
        done(FtpError::dataChannelError(tr("Control connection is closed")));
        return;
    }

    opened_ = true;
    ++openChannels_;
    connectTimer_->setInterval(control_->options().connectTimeoutMs);

    if (mode_ == Mode::Passive) {
        openPassive(done);
    } else {
        openActive(done);
    }
}

void FtpDataChannel::openPassive(const Completion &done)
{
    const QHostAddress peer = control_->peerAddress();
    bool mappedIPv4 = false;
    peer.toIPv4Address(&mappedIPv4);
    const bool extended = peer.protocol() == QAbstractSocket::IPv6Protocol && !mappedIPv4;
    const QString command = extended ? QStringLiteral("EPSV") : QStringLiteral("PASV");

    QPointer<FtpDataChannel> guard(this);
    control_->sendCommand(command, [this, guard, done, command, peer, extended](const FtpReply &reply) {
        if (!guard || reply.isPreliminary()) {
            return;
        }
        if (closed_) {
            done(FtpError::dataChannelError(tr("Data channel closed")));
            return;
        }
        if (reply.isNegative()) {
            done(FtpError::dataChannelError(tr("%1 rejected").arg(command),
                                            reply.code, reply.message()));
            return;
        }

        QString advertisedHost;
        quint16 port = 0;
        const bool parsed = extended ? parseExtendedPassiveResponse(reply.text(), port)
                                     : parsePassiveResponse(reply.text(), advertisedHost, port);
        if (!parsed || port == 0) {
            done(FtpError::dataChannelError(tr("Cannot parse %1 reply").arg(command),
                                            reply.code, reply.message()));
            return;
        }

        // Use the control socket's peer address instead of the advertised one;
        // servers behind NAT often advertise addresses that aren't reachable
        qDebug() << "FTP:" << command << "advertised" << advertisedHost << "port:" << port
                 << "connecting to" << peer.toString();

        auto *socket = new QSslSocket(this);
        attachSocket(socket);
        connect(socket, &QSslSocket::connected, this, &FtpDataChannel::onSocketConnected);
        connectTimer_->start();
        if (secure_) {
            socket->connectToHostEncrypted(peer.toString(), port, control_->peerName());
        } else {
            socket->connectToHost(peer, port);
        }
        done(FtpError::none());
    });
}

void FtpDataChannel::openActive(const Completion &done)
{
    const QHostAddress local = toIPv4(control_->localAddress());

    auto *server = new ActiveModeServer(this);
    server_ = server;
    connect(server_, &QTcpServer::newConnection, this, &FtpDataChannel::onNewConnection);
    if (!server_->listen(local, 0)) {
        done(FtpError::dataChannelError(tr("Cannot listen for data connection: %1")
                                            .arg(server_->errorString())));
        return;
    }

    const bool extended = local.protocol() != QAbstractSocket::IPv4Protocol;
    const QString command = extended
        ? QStringLiteral("EPRT ") + formatExtendedPortArgument(local, server_->serverPort())
        : QStringLiteral("PORT ") + formatPortArgument(local, server_->serverPort());

    QPointer<FtpDataChannel> guard(this);
    control_->sendCommand(command, [this, guard, done, command](const FtpReply &reply) {
        if (!guard || reply.isPreliminary()) {
            return;
        }
        if (closed_) {
            done(FtpError::dataChannelError(tr("Data channel closed")));
            return;
        }
        if (reply.isNegative()) {
            done(FtpError::dataChannelError(tr("%1 rejected").arg(command.section(' ', 0, 0)),
                                            reply.code, reply.message()));
            return;
        }
        connectTimer_->start();
        done(FtpError::none());
    });
}

void FtpDataChannel::onNewConnection()
{
    if (!server_) {
        return;
    }
    auto *socket = qobject_cast<QSslSocket *>(server_->nextPendingConnection());
    if (!socket) {
        return;
    }

    qDebug() << "FTP: Accepted data connection from" << socket->peerAddress().toString()
             << ":" << socket->peerPort();

    // One connection per channel
    server_->close();
    socket->setParent(this);
    attachSocket(socket);

    if (secure_) {
        // The client is always the TLS client, also on an accepted connection
        socket->startClientEncryption();
    } else {
        markConnected();
    }
}

void FtpDataChannel::attachSocket(QSslSocket *socket)
{
    socket_ = socket;
    if (secure_) {
        if (control_ && !control_->options().verifyPeerCertificates) {
            socket_->setPeerVerifyMode(QSslSocket::VerifyNone);
        }
        if (control_) {
            socket_->setPeerVerifyName(control_->peerName());
        }
    }

    connect(socket_, &QSslSocket::encrypted, this, &FtpDataChannel::onSocketEncrypted);
    connect(socket_, &QSslSocket::readyRead, this, &FtpDataChannel::onSocketReadyRead);
    connect(socket_, &QSslSocket::bytesWritten, this, &FtpDataChannel::onSocketBytesWritten);
    connect(socket_, &QSslSocket::disconnected, this, &FtpDataChannel::onSocketDisconnected);
    connect(socket_, &QSslSocket::errorOccurred, this, &FtpDataChannel::onSocketError);
}

void FtpDataChannel::onSocketConnected()
{
    qDebug() << "FTP: Data socket connected to" << socket_->peerAddress().toString()
             << ":" << socket_->peerPort();
    if (!secure_) {
        markConnected();
    }
}

void FtpDataChannel::onSocketEncrypted()
{
    LOG_VERBOSE() << "FTP: Data connection encrypted," << socket_->sessionCipher().name();
    markConnected();
}

void FtpDataChannel::markConnected()
{
    if (connected_ || done_) {
        return;
    }
    connectTimer_->stop();
    connected_ = true;

    QPointer<FtpDataChannel> guard(this);
    emit connected();
    if (guard) {
        beginStreaming();
    }
}

void FtpDataChannel::sendStream(QIODevice *source, qint64 chunkSize)
{
    source_ = source;
    chunkSize_ = std::max<qint64>(1, chunkSize);
    beginStreaming();
}

void FtpDataChannel::receiveStream(QIODevice *sink, qint64 chunkSize)
{
    sink_ = sink;
    chunkSize_ = std::max<qint64>(1, chunkSize);
    beginStreaming();
}

void FtpDataChannel::beginStreaming()
{
    if (!connected_ || streaming_ || done_ || (!source_ && !sink_)) {
        return;
    }
    streaming_ = true;

    if (source_) {
        writeNextChunk();
    } else {
        drainSocket();
    }
}

void FtpDataChannel::writeNextChunk()
{
    if (done_ || !socket_) {
        return;
    }

    const QByteArray chunk = source_->read(chunkSize_);
    if (chunk.isEmpty()) {
        if (!source_->atEnd()) {
            fail(FtpError::transferError(FtpError::Phase::Streaming,
                                         FtpError::Cause::LocalFilesystem,
                                         QString(), source_->errorString()));
            return;
        }
        // Source exhausted: closing our side tells the server the file ended
        LOG_VERBOSE() << "FTP: Upload source exhausted after" << transferred_ << "bytes";
        sourceExhausted_ = true;
        socket_->disconnectFromHost();
        return;
    }

    pendingChunk_ = chunk.size();
    if (socket_->write(chunk) != chunk.size()) {
        fail(FtpError::dataChannelError(socket_->errorString()));
    }
}

void FtpDataChannel::onSocketBytesWritten()
{
    if (!source_ || !streaming_ || sourceExhausted_ || done_ || !socket_) {
        return;
    }
    if (socket_->bytesToWrite() > 0) {
        return;
    }

    // The whole chunk has been handed to the network
    transferred_ += pendingChunk_;
    pendingChunk_ = 0;

    QPointer<FtpDataChannel> guard(this);
    emit progress(transferred_);
    if (guard) {
        writeNextChunk();
    }
}

void FtpDataChannel::onSocketReadyRead()
{
    if (sink_ && streaming_) {
        drainSocket();
    }
}

void FtpDataChannel::drainSocket()
{
    QPointer<FtpDataChannel> guard(this);

    while (guard && !done_ && socket_ && socket_->bytesAvailable() > 0) {
        const QByteArray chunk = socket_->read(chunkSize_);
        if (chunk.isEmpty()) {
            break;
        }
        if (sink_->write(chunk) != chunk.size()) {
            fail(FtpError::transferError(FtpError::Phase::Streaming,
                                         FtpError::Cause::LocalFilesystem,
                                         QString(), sink_->errorString()));
            return;
        }
        transferred_ += chunk.size();
        LOG_VERBOSE() << "FTP: Data received:" << chunk.size() << "bytes, total" << transferred_;
        emit progress(transferred_);
    }

    if (guard && peerClosed_ && !done_) {
        finish();
    }
}

void FtpDataChannel::onSocketDisconnected()
{
    qDebug() << "FTP: Data socket disconnected, transferred" << transferred_ << "bytes";
    if (done_) {
        return;
    }

    if (!connected_) {
        fail(FtpError::dataChannelError(tr("Data connection closed before it was established")));
        return;
    }

    if (source_) {
        if (sourceExhausted_) {
            finish();
        } else {
            fail(FtpError::dataChannelError(tr("Server closed the data connection during upload")));
        }
        return;
    }

    // Anything still buffered is read before finishing; the sink may not
    // have been attached yet
    peerClosed_ = true;
    if (sink_ && streaming_) {
        drainSocket();
    }
}

void FtpDataChannel::onSocketError()
{
    if (done_ || !socket_) {
        return;
    }

    // RemoteHostClosedError is normal - server closes after sending data.
    // disconnected() follows and finishes the transfer
    if (socket_->error() == QAbstractSocket::RemoteHostClosedError) {
        LOG_VERBOSE() << "FTP: Data socket closed by server";
        return;
    }

    qDebug() << "FTP: Data socket error:" << socket_->error() << socket_->errorString();
    if (socket_->error() == QAbstractSocket::SslHandshakeFailedError) {
        fail(FtpError::tlsError(socket_->errorString()));
    } else {
        fail(FtpError::dataChannelError(socket_->errorString()));
    }
}

void FtpDataChannel::onConnectTimeout()
{
    if (!connected_) {
        fail(FtpError::dataChannelError(tr("Data connection timed out")));
    }
}

void FtpDataChannel::finish()
{
    if (done_) {
        return;
    }
    done_ = true;
    qDebug() << "FTP: Data transfer finished," << transferred_ << "bytes";
    emit finished(transferred_);
}

void FtpDataChannel::fail(const FtpError &error)
{
    if (done_) {
        return;
    }
    done_ = true;
    connectTimer_->stop();
    qWarning() << "FTP: Data channel failed:" << error.toString();
    emit failed(error);
}

void FtpDataChannel::close()
{
    if (closed_) {
        return;
    }
    closed_ = true;
    done_ = true;
    connectTimer_->stop();

    if (socket_) {
        socket_->disconnect(this);
        socket_->abort();
        socket_->deleteLater();
        socket_ = nullptr;
    }
    if (server_) {
        server_->disconnect(this);
        server_->close();
        server_->deleteLater();
        server_ = nullptr;
    }
    if (opened_) {
        --openChannels_;
    }
}

bool FtpDataChannel::parsePassiveResponse(const QString &text, QString &host, quint16 &port)
{
    // Parse response like: 227 Entering Passive Mode (h1,h2,h3,h4,p1,p2)
    static const QRegularExpression rx("\\((\\d+),(\\d+),(\\d+),(\\d+),(\\d+),(\\d+)\\)");
    const auto match = rx.match(text);
    if (!match.hasMatch()) {
        return false;
    }

    for (int i = 1; i <= 6; ++i) {
        if (match.captured(i).toInt() > 255) {
            return false;
        }
    }

    host = QString("%1.%2.%3.%4")
               .arg(match.captured(1))
               .arg(match.captured(2))
               .arg(match.captured(3))
               .arg(match.captured(4));

    const int p1 = match.captured(5).toInt();
    const int p2 = match.captured(6).toInt();
    port = static_cast<quint16>((p1 * PassivePortMultiplier) + p2);
    return true;
}

bool FtpDataChannel::parseExtendedPassiveResponse(const QString &text, quint16 &port)
{
    // 229 Entering Extended Passive Mode (|||6446|)
    static const QRegularExpression rx("\\(([!-~])\\1\\1(\\d+)\\1\\)");
    const auto match = rx.match(text);
    if (!match.hasMatch()) {
        return false;
    }

    bool ok = false;
    const int value = match.captured(2).toInt(&ok);
    if (!ok || value <= 0 || value > 65535) {
        return false;
    }
    port = static_cast<quint16>(value);
    return true;
}

QString FtpDataChannel::formatPortArgument(const QHostAddress &address, quint16 port)
{
    const quint32 ipv4 = address.toIPv4Address();
    return QString("%1,%2,%3,%4,%5,%6")
        .arg((ipv4 >> 24) & 0xff)
        .arg((ipv4 >> 16) & 0xff)
        .arg((ipv4 >> 8) & 0xff)
        .arg(ipv4 & 0xff)
        .arg(port / PassivePortMultiplier)
        .arg(port % PassivePortMultiplier);
}

QString FtpDataChannel::formatExtendedPortArgument(const QHostAddress &address, quint16 port)
{
    const int family = address.protocol() == QAbstractSocket::IPv6Protocol ? 2 : 1;
    QHostAddress plain(address);
    plain.setScopeId(QString());
    return QString("|%1|%2|%3|").arg(family).arg(plain.toString()).arg(port);
}
