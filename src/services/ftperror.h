/**
 * @file ftperror.h
 * @brief Error value reported by FTP session, channel and transfer operations.
 */

#ifndef FTPERROR_H
#define FTPERROR_H

#include <QMetaType>
#include <QString>

/**
 * @brief Describes the outcome of an FTP operation.
 *
 * Operations never throw. They complete with an FtpError whose kind is
 * Kind::NoError on success, in the same way QNetworkReply or QFileDevice
 * report their status.
 *
 * @par Example usage:
 * @code
 * channel->makeDirectory("incoming", [](const FtpError &error) {
 *     if (error.isError()) {
 *         qWarning() << error.toString();
 *     }
 * });
 * @endcode
 */
struct FtpError {
    /**
     * @brief Error taxonomy.
     */
    enum class Kind {
        NoError,      ///< Operation succeeded
        Connect,      ///< Unreachable host, timeout, lost control connection
        Auth,         ///< Credentials rejected
        Tls,          ///< TLS negotiation or handshake failure
        RemoteOp,     ///< Negative reply to a directory/file command
        DataChannel,  ///< Passive/active data connection negotiation failure
        Transfer,     ///< Upload/download failure (see phase and cause)
        Parse,        ///< Directory listing could not be parsed at all
        Protocol      ///< Malformed reply on the control connection
    };

    /**
     * @brief Transfer phase in which a Transfer error occurred.
     */
    enum class Phase {
        None,
        Opening,     ///< Negotiating the data connection / transfer command
        Streaming,   ///< Moving bytes
        Finalizing   ///< Waiting for the final control reply
    };

    /**
     * @brief Underlying cause of a Transfer error.
     */
    enum class Cause {
        None,
        Network,          ///< Socket failure on the control or data connection
        LocalFilesystem,  ///< Local file could not be opened, read or written
        Server            ///< Server answered with a negative reply
    };

    Kind kind = Kind::NoError;
    Phase phase = Phase::None;
    Cause cause = Cause::None;
    QString command;        ///< FTP command that failed (without password)
    QString serverMessage;  ///< Reply text from the server, if any
    int replyCode = 0;      ///< Reply code from the server, 0 if none
    QString path;           ///< Affected local or remote path/name
    QString detail;         ///< Human-readable description of the cause

    [[nodiscard]] bool isError() const { return kind != Kind::NoError; }

    /**
     * @brief Checks if the error invalidated the session.
     * @return True for connection-level errors; the caller must reconnect.
     */
    [[nodiscard]] bool reconnectRequired() const;

    /**
     * @brief Formats the error for verbatim display to the user.
     */
    [[nodiscard]] QString toString() const;

    [[nodiscard]] static QString kindToString(Kind kind);
    [[nodiscard]] static QString phaseToString(Phase phase);
    [[nodiscard]] static QString causeToString(Cause cause);

    /// @name Factories
    /// @{
    [[nodiscard]] static FtpError none() { return FtpError(); }
    [[nodiscard]] static FtpError connectError(const QString &detail);
    [[nodiscard]] static FtpError authError(int replyCode, const QString &serverMessage);
    [[nodiscard]] static FtpError tlsError(const QString &detail,
                                           int replyCode = 0,
                                           const QString &serverMessage = QString());
    [[nodiscard]] static FtpError remoteOpError(const QString &command, int replyCode,
                                                const QString &serverMessage,
                                                const QString &path = QString());
    [[nodiscard]] static FtpError dataChannelError(const QString &detail,
                                                   int replyCode = 0,
                                                   const QString &serverMessage = QString());
    [[nodiscard]] static FtpError transferError(Phase phase, Cause cause,
                                                const QString &path,
                                                const QString &detail);
    [[nodiscard]] static FtpError parseError(const QString &detail);
    [[nodiscard]] static FtpError protocolError(const QString &detail);
    /// @}
};

Q_DECLARE_METATYPE(FtpError)

#endif // FTPERROR_H
