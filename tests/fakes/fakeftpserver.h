/**
 * @file fakeftpserver.h
 * @brief Scripted in-process FTP server for channel, transfer and session tests.
 */

#ifndef FAKEFTPSERVER_H
#define FAKEFTPSERVER_H

#include <QByteArray>
#include <QDateTime>
#include <QHash>
#include <QList>
#include <QMap>
#include <QObject>
#include <QSslCertificate>
#include <QSslKey>
#include <QStringList>

#include <functional>
#include <memory>

#include "services/connectionprofile.h"

class QSslSocket;
class QTcpServer;
class QTcpSocket;

/**
 * @brief Minimal RFC 959 server with an in-memory file tree.
 *
 * Listens on 127.0.0.1 with a random port. Supports passive (PASV/EPSV)
 * and active (PORT/EPRT) data connections, MLSD and Unix LIST output,
 * uploads, downloads, ABOR and the usual directory commands.
 *
 * AUTH TLS is refused unless setTlsEnabled() loaded the test certificate
 * from tests/data. With TLS enabled the control connection is upgraded
 * after the 234 reply, and after PROT P every data connection is
 * encrypted too, with the server acting as TLS server in both modes.
 *
 * Failures are injected per command verb; every received command is logged
 * (passwords included) for assertions.
 *
 * @par Example usage:
 * @code
 * FakeFtpServer server;
 * QVERIFY(server.start());
 * server.addDirectory("/docs");
 * server.addFile("/readme.txt", QByteArray(1200, 'x'));
 *
 * FtpControlChannel channel;
 * channel.open(server.profile(), SessionOptions(), callback);
 * @endcode
 */
class FakeFtpServer : public QObject
{
    Q_OBJECT

public:
    static constexpr const char *DefaultUser = "tester";
    static constexpr const char *DefaultPassword = "secret";

    explicit FakeFtpServer(QObject *parent = nullptr);
    ~FakeFtpServer() override;

    /**
     * @brief Starts listening on a random loopback port.
     */
    bool start();

    [[nodiscard]] quint16 port() const;

    /**
     * @brief Returns a profile with the server's address and default credentials.
     */
    [[nodiscard]] ConnectionProfile profile() const;

    /// @name Behaviour
    /// @{
    void setCredentials(const QString &user, const QString &password);
    void setAllowAnonymous(bool allow) { allowAnonymous_ = allow; }

    /**
     * @brief Refuses plain-text logins with 530, like a server enforcing FTPS.
     */
    void setRequireTls(bool require) { requireTls_ = require; }

    /**
     * @brief Accepts AUTH TLS using the self-signed certificate in tests/data.
     * @return false if the certificate cannot be loaded or TLS is unavailable.
     */
    bool setTlsEnabled(bool enable);
    [[nodiscard]] bool tlsEnabled() const { return tlsEnabled_; }

    /**
     * @brief Answers MLSD with 500 when false.
     */
    void setMachineListingSupported(bool supported) { mlsdSupported_ = supported; }

    void setGreeting(const QStringList &lines) { greeting_ = lines; }

    /**
     * @brief Omits the "(N bytes)" hint from RETR's 150 reply.
     */
    void setAnnounceSize(bool announce) { announceSize_ = announce; }

    /**
     * @brief Answers SIZE with 502 when false.
     */
    void setSizeSupported(bool supported) { sizeSupported_ = supported; }

    /**
     * @brief Sends only the first @p bytes of a download, then waits for ABOR.
     *
     * Negative values disable the stall.
     */
    void setDownloadStallAfter(qint64 bytes) { stallAfter_ = bytes; }

    /**
     * @brief Ignores ABOR completely.
     */
    void setIgnoreAbort(bool ignore) { ignoreAbort_ = ignore; }

    /**
     * @brief Replies to @p verb with @p code and @p text instead of running it.
     * @param pathSuffix Only arguments ending with this suffix match, any if empty.
     */
    void failCommand(const QString &verb, int code, const QString &text,
                     const QString &pathSuffix = QString());
    void clearFailures() { failures_.clear(); }

    /**
     * @brief Drops the control connection when @p verb arrives.
     */
    void dropConnectionOn(const QString &verb) { dropOn_ = verb.toUpper(); }

    /**
     * @brief Never replies to @p verb.
     */
    void ignoreCommand(const QString &verb) { silentOn_ = verb.toUpper(); }
    /// @}

    /// @name File Tree
    /// @{
    void addDirectory(const QString &path);
    void addFile(const QString &path, const QByteArray &data,
                 const QDateTime &modified = QDateTime());

    [[nodiscard]] bool hasFile(const QString &path) const;
    [[nodiscard]] bool hasDirectory(const QString &path) const;
    [[nodiscard]] QByteArray fileData(const QString &path) const;
    /// @}

    /// @name Observation
    /// @{
    [[nodiscard]] QStringList commandLog() const { return commandLog_; }

    /**
     * @brief Returns the received commands whose verb is @p verb.
     */
    [[nodiscard]] QStringList commands(const QString &verb) const;
    [[nodiscard]] int commandCount(const QString &verb) const { return commands(verb).size(); }
    void clearCommandLog() { commandLog_.clear(); }

    [[nodiscard]] int connectionCount() const { return connectionCount_; }
    [[nodiscard]] int activeSessionCount() const { return sessions_.size(); }
    [[nodiscard]] int peakSessionCount() const { return peakSessions_; }

    /**
     * @brief Returns the number of data connections opened so far.
     */
    [[nodiscard]] int dataConnectionCount() const { return dataConnections_; }

    /**
     * @brief Returns the number of data connections that completed a TLS handshake.
     */
    [[nodiscard]] int encryptedDataConnectionCount() const { return encryptedDataConnections_; }
    /// @}

signals:
    void commandReceived(const QString &command);
    void sessionClosed();

private:
    struct Node {
        bool directory = false;
        QByteArray data;
        QDateTime modified;
    };

    struct Failure {
        QString verb;
        int code = 0;
        QString text;
        QString pathSuffix;
    };

    struct Session;
    using DataAction = std::function<void(Session *)>;

    void onNewConnection();
    void onControlReadyRead(Session *session);
    void handleCommand(Session *session, const QString &line);
    void reply(Session *session, int code, const QString &text);
    void closeSession(Session *session);

    void handleLogin(Session *session, const QString &verb, const QString &argument);
    void handlePassive(Session *session, bool extended);
    void handleActive(Session *session, const QString &argument, bool extended);
    void handleRetrieve(Session *session, const QString &argument);
    void handleStore(Session *session, const QString &argument);
    void handleListing(Session *session, const QString &argument, bool machine);
    void handleAbort(Session *session);
    void handleRename(Session *session, const QString &target);

    void withDataConnection(Session *session, DataAction action);
    void attachDataSocket(Session *session, QTcpSocket *socket);
    void markDataReady(Session *session);
    void startEncryption(QSslSocket *socket);
    void resetData(Session *session);
    void sendAndClose(Session *session, const QByteArray &payload, const QString &completion);

    [[nodiscard]] const Failure *findFailure(const QString &verb, const QString &argument) const;
    [[nodiscard]] static QString resolve(const Session *session, const QString &argument);
    [[nodiscard]] static QString parentOf(const QString &path);
    [[nodiscard]] QStringList childrenOf(const QString &path) const;
    [[nodiscard]] QByteArray formatListing(const QString &path, bool machine) const;

    QTcpServer *server_ = nullptr;
    QHash<QTcpSocket *, std::shared_ptr<Session>> sessions_;
    QMap<QString, Node> nodes_;

    QString user_;
    QString password_;
    QStringList greeting_;
    bool allowAnonymous_ = true;
    bool requireTls_ = false;
    bool tlsEnabled_ = false;
    QSslCertificate certificate_;
    QSslKey privateKey_;
    bool mlsdSupported_ = true;
    bool announceSize_ = true;
    bool sizeSupported_ = true;
    bool ignoreAbort_ = false;
    qint64 stallAfter_ = -1;
    QList<Failure> failures_;
    QString dropOn_;
    QString silentOn_;

    QStringList commandLog_;
    int connectionCount_ = 0;
    int peakSessions_ = 0;
    int dataConnections_ = 0;
    int encryptedDataConnections_ = 0;
};

#endif // FAKEFTPSERVER_H
