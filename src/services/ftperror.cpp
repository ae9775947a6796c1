#include "ftperror.h"

#include <QCoreApplication>

namespace {

QString tr(const char *text)
{
    return QCoreApplication::translate("FtpError", text);
}

} // namespace

bool FtpError::reconnectRequired() const
{
    switch (kind) {
    case Kind::Connect:
    case Kind::Auth:
    case Kind::Tls:
    case Kind::Protocol:
        return true;
    default:
        return false;
    }
}

QString FtpError::toString() const
{
    if (!isError()) {
        return tr("No error");
    }

    QString message;
    switch (kind) {
    case Kind::Connect:
        message = tr("Connection failed: %1").arg(detail);
        break;
    case Kind::Auth:
        message = tr("Login failed");
        break;
    case Kind::Tls:
        message = tr("TLS negotiation failed: %1").arg(detail);
        break;
    case Kind::RemoteOp:
        message = path.isEmpty() ? tr("%1 failed").arg(command)
                                 : tr("%1 failed for '%2'").arg(command, path);
        break;
    case Kind::DataChannel:
        message = tr("Cannot open data connection: %1").arg(detail);
        break;
    case Kind::Transfer:
        message = tr("Transfer of '%1' failed while %2 (%3 error): %4")
                      .arg(path, phaseToString(phase), causeToString(cause), detail);
        break;
    case Kind::Parse:
        message = tr("Cannot parse directory listing: %1").arg(detail);
        break;
    case Kind::Protocol:
        message = tr("Protocol error: %1").arg(detail);
        break;
    case Kind::NoError:
        break;
    }

    if (replyCode > 0) {
        message += QStringLiteral(" [%1 %2]").arg(replyCode).arg(serverMessage);
    } else if (!serverMessage.isEmpty()) {
        message += QStringLiteral(" [%1]").arg(serverMessage);
    }
    return message;
}

QString FtpError::kindToString(Kind kind)
{
    switch (kind) {
    case Kind::NoError: return QStringLiteral("NoError");
    case Kind::Connect: return QStringLiteral("ConnectError");
    case Kind::Auth: return QStringLiteral("AuthError");
    case Kind::Tls: return QStringLiteral("TlsError");
    case Kind::RemoteOp: return QStringLiteral("RemoteOpError");
    case Kind::DataChannel: return QStringLiteral("DataChannelError");
    case Kind::Transfer: return QStringLiteral("TransferError");
    case Kind::Parse: return QStringLiteral("ParseError");
    case Kind::Protocol: return QStringLiteral("ProtocolError");
    }
    return QStringLiteral("Unknown");
}

QString FtpError::phaseToString(Phase phase)
{
    switch (phase) {
    case Phase::None: return tr("idle");
    case Phase::Opening: return tr("opening");
    case Phase::Streaming: return tr("streaming");
    case Phase::Finalizing: return tr("finalizing");
    }
    return QString();
}

QString FtpError::causeToString(Cause cause)
{
    switch (cause) {
    case Cause::None: return tr("unknown");
    case Cause::Network: return tr("network");
    case Cause::LocalFilesystem: return tr("local filesystem");
    case Cause::Server: return tr("server");
    }
    return QString();
}

FtpError FtpError::connectError(const QString &detail)
{
    FtpError error;
    error.kind = Kind::Connect;
    error.cause = Cause::Network;
    error.detail = detail;
    return error;
}

FtpError FtpError::authError(int replyCode, const QString &serverMessage)
{
    FtpError error;
    error.kind = Kind::Auth;
    error.cause = Cause::Server;
    error.replyCode = replyCode;
    error.serverMessage = serverMessage;
    error.detail = serverMessage;
    return error;
}

FtpError FtpError::tlsError(const QString &detail, int replyCode, const QString &serverMessage)
{
    FtpError error;
    error.kind = Kind::Tls;
    error.detail = detail;
    error.replyCode = replyCode;
    error.serverMessage = serverMessage;
    return error;
}

FtpError FtpError::remoteOpError(const QString &command, int replyCode,
                                 const QString &serverMessage, const QString &path)
{
    FtpError error;
    error.kind = Kind::RemoteOp;
    error.cause = Cause::Server;
    error.command = command;
    error.replyCode = replyCode;
    error.serverMessage = serverMessage;
    error.path = path;
    error.detail = serverMessage;
    return error;
}

FtpError FtpError::dataChannelError(const QString &detail, int replyCode,
                                    const QString &serverMessage)
{
    FtpError error;
    error.kind = Kind::DataChannel;
    error.cause = Cause::Network;
    error.detail = detail;
    error.replyCode = replyCode;
    error.serverMessage = serverMessage;
    return error;
}

FtpError FtpError::transferError(Phase phase, Cause cause, const QString &path,
                                 const QString &detail)
{
    FtpError error;
    error.kind = Kind::Transfer;
    error.phase = phase;
    error.cause = cause;
    error.path = path;
    error.detail = detail;
    return error;
}

FtpError FtpError::parseError(const QString &detail)
{
    FtpError error;
    error.kind = Kind::Parse;
    error.detail = detail;
    return error;
}

FtpError FtpError::protocolError(const QString &detail)
{
    FtpError error;
    error.kind = Kind::Protocol;
    error.cause = Cause::Network;
    error.detail = detail;
    return error;
}
