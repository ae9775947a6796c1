/**
 * @file commandrunner.h
 * @brief Executes one command-line request against a SessionManager.
 */

#ifndef COMMANDRUNNER_H
#define COMMANDRUNNER_H

#include <QObject>
#include <QSet>
#include <QString>
#include <QStringList>
#include <QTextStream>

#include "services/connectionprofile.h"
#include "services/ftperror.h"
#include "services/remoteentry.h"
#include "services/transfertask.h"

class ConnectionProfileStore;
class ErrorHandler;
class SessionManager;

/**
 * @brief Connects, runs a single command and reports the exit code.
 *
 * Supported commands: ls [path], get <remote> [localDir], put <file>,
 * put-dir <dir>, mkdir <name>, rmdir <name>, rm <name>, mv <old> <new>
 * and profiles [rm <name>]. The server's welcome text goes to the error
 * stream so listings stay clean. finished() is emitted once, after the
 * session was closed.
 */
class CommandRunner : public QObject
{
    Q_OBJECT

public:
    CommandRunner(SessionManager *session, ConnectionProfileStore *store,
                  QTextStream &out, QTextStream &err, QObject *parent = nullptr);

    /**
     * @brief Checks the command name and its argument count.
     * @param error Receives a usage message if the command is invalid.
     */
    [[nodiscard]] static bool validateCommand(const QStringList &arguments, QString *error = nullptr);

    /**
     * @brief Formats one listing line: type, size, timestamp and name.
     */
    [[nodiscard]] static QString formatEntry(const RemoteEntry &entry);

public slots:
    void run(const ConnectionProfile &profile, const QStringList &arguments);

signals:
    void finished(int exitCode);

private slots:
    void onConnected();
    void onConnectionFailed(const FtpError &error);
    void onOperationFailed(const FtpError &error);
    void onDirectoryListed(const QString &path, const QList<RemoteEntry> &entries);
    void onTransferQueued(const TransferTask &task);
    void onTransferFinished(int id, TransferTask::Status status, const FtpError &error);
    void onFolderUploadFinished(const QString &localDir, const FtpError &error);

private:
    void listProfiles();
    void removeProfile(const QString &name);
    void finish(int exitCode);
    void finishWhenTransfersDone();

    SessionManager *session_ = nullptr;
    ConnectionProfileStore *store_ = nullptr;
    ErrorHandler *errorHandler_ = nullptr;
    QTextStream &out_;
    QTextStream &err_;

    QString command_;
    QStringList args_;
    QSet<int> outstanding_;
    bool waitingForFolder_ = false;
    bool failed_ = false;
    bool finished_ = false;
};

#endif // COMMANDRUNNER_H
