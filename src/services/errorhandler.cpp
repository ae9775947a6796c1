#include "errorhandler.h"

#include <QDebug>

ErrorHandler::ErrorHandler(QObject *parent)
    : QObject(parent)
{
}

void ErrorHandler::handleError(ErrorCategory category,
                               ErrorSeverity severity,
                               const QString &title,
                               const QString &details)
{
    logError(category, severity, title, details);

    QString message = title;
    if (!details.isEmpty() && details != title) {
        message = QString("%1: %2").arg(title, details);
    }

    emit statusMessage(message, timeoutForSeverity(severity));

    if (severity == ErrorSeverity::Critical) {
        emit criticalError(title, details.isEmpty() ? title : details);
    }
}

void ErrorHandler::handleFtpError(const FtpError &error)
{
    if (!error.isError()) {
        return;
    }
    handleError(categoryFor(error), severityFor(error), titleFor(error), error.toString());
}

void ErrorHandler::handleConnectionError(const FtpError &error)
{
    if (!error.isError()) {
        return;
    }
    handleError(ErrorCategory::Connection,
                ErrorSeverity::Critical,
                tr("Connection Error"),
                error.toString());
}

ErrorCategory ErrorHandler::categoryFor(const FtpError &error)
{
    switch (error.kind) {
    case FtpError::Kind::Connect:
    case FtpError::Kind::Auth:
    case FtpError::Kind::Tls:
    case FtpError::Kind::Protocol:
        return ErrorCategory::Connection;
    case FtpError::Kind::RemoteOp:
    case FtpError::Kind::DataChannel:
    case FtpError::Kind::Transfer:
    case FtpError::Kind::Parse:
        return ErrorCategory::FileOperation;
    case FtpError::Kind::NoError:
        break;
    }
    return ErrorCategory::System;
}

ErrorSeverity ErrorHandler::severityFor(const FtpError &error)
{
    if (!error.isError()) {
        return ErrorSeverity::Info;
    }
    // The session is gone; the user has to reconnect
    if (error.reconnectRequired()) {
        return ErrorSeverity::Critical;
    }
    return ErrorSeverity::Warning;
}

QString ErrorHandler::titleFor(const FtpError &error)
{
    switch (error.kind) {
    case FtpError::Kind::Connect: return tr("Connection Error");
    case FtpError::Kind::Auth: return tr("Login Failed");
    case FtpError::Kind::Tls: return tr("Secure Connection Failed");
    case FtpError::Kind::Protocol: return tr("Protocol Error");
    case FtpError::Kind::RemoteOp:
        return error.command.isEmpty() ? tr("Operation failed") : tr("%1 failed").arg(error.command);
    case FtpError::Kind::DataChannel: return tr("Data Connection Failed");
    case FtpError::Kind::Transfer: return tr("Transfer Failed");
    case FtpError::Kind::Parse: return tr("Listing Failed");
    case FtpError::Kind::NoError: break;
    }
    return tr("Error");
}

void ErrorHandler::logError(ErrorCategory category,
                            ErrorSeverity severity,
                            const QString &title,
                            const QString &details)
{
    QString logMessage = QString("[%1/%2] %3")
        .arg(categoryToString(category),
             severityToString(severity),
             title);

    if (!details.isEmpty() && details != title) {
        logMessage += QString(": %1").arg(details);
    }

    switch (severity) {
    case ErrorSeverity::Info:
        qInfo().noquote() << logMessage;
        break;
    case ErrorSeverity::Warning:
        qWarning().noquote() << logMessage;
        break;
    case ErrorSeverity::Critical:
        qCritical().noquote() << logMessage;
        break;
    }

    emit errorLogged(category, severity, title, details);
}

int ErrorHandler::timeoutForSeverity(ErrorSeverity severity)
{
    switch (severity) {
    case ErrorSeverity::Info:
        return 3000;
    case ErrorSeverity::Warning:
        return 5000;
    case ErrorSeverity::Critical:
        return 0;     // Stays until replaced
    }
    return 5000;
}

QString ErrorHandler::categoryToString(ErrorCategory category)
{
    switch (category) {
    case ErrorCategory::Connection:
        return QStringLiteral("Connection");
    case ErrorCategory::FileOperation:
        return QStringLiteral("FileOp");
    case ErrorCategory::Validation:
        return QStringLiteral("Validation");
    case ErrorCategory::System:
        return QStringLiteral("System");
    }
    return QStringLiteral("Unknown");
}

QString ErrorHandler::severityToString(ErrorSeverity severity)
{
    switch (severity) {
    case ErrorSeverity::Info:
        return QStringLiteral("INFO");
    case ErrorSeverity::Warning:
        return QStringLiteral("WARN");
    case ErrorSeverity::Critical:
        return QStringLiteral("CRIT");
    }
    return QStringLiteral("UNKNOWN");
}
