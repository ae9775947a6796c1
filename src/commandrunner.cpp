#include "commandrunner.h"
#include "services/connectionprofilestore.h"
#include "services/errorhandler.h"
#include "services/sessionmanager.h"

#include <QDir>
#include <QFileInfo>
#include <QHash>

#include "utils/logging.h"

namespace {

struct CommandSpec {
    int minArgs;
    int maxArgs;
    const char *usage;
};

const QHash<QString, CommandSpec> &commandTable()
{
    static const QHash<QString, CommandSpec> table = {
        {"ls", {0, 1, "ls [path]"}},
        {"get", {1, 2, "get <remote> [localDir]"}},
        {"put", {1, 1, "put <file>"}},
        {"put-dir", {1, 1, "put-dir <dir>"}},
        {"mkdir", {1, 1, "mkdir <name>"}},
        {"rmdir", {1, 1, "rmdir <name>"}},
        {"rm", {1, 1, "rm <name>"}},
        {"mv", {2, 2, "mv <old> <new>"}},
        {"profiles", {0, 2, "profiles [rm <name>]"}},
    };
    return table;
}

} // namespace

CommandRunner::CommandRunner(SessionManager *session, ConnectionProfileStore *store,
                             QTextStream &out, QTextStream &err, QObject *parent)
    : QObject(parent)
    , session_(session)
    , store_(store)
    , errorHandler_(new ErrorHandler(this))
    , out_(out)
    , err_(err)
{
    connect(errorHandler_, &ErrorHandler::statusMessage, this, [this](const QString &message, int) {
        err_ << message << Qt::endl;
    });

    connect(session_, &SessionManager::connected, this, &CommandRunner::onConnected);
    connect(session_, &SessionManager::connectionFailed, this, &CommandRunner::onConnectionFailed);
    connect(session_, &SessionManager::operationFailed, this, &CommandRunner::onOperationFailed);
    connect(session_, &SessionManager::directoryListed, this, &CommandRunner::onDirectoryListed);
    connect(session_, &SessionManager::transferQueued, this, &CommandRunner::onTransferQueued);
    connect(session_, &SessionManager::transferFinished, this, &CommandRunner::onTransferFinished);
    connect(session_, &SessionManager::folderUploadFinished,
            this, &CommandRunner::onFolderUploadFinished);

    connect(session_, &SessionManager::transferProgress, this, [](int id, qint64 bytes, qint64 total) {
        LOG_VERBOSE() << "Transfer" << id << bytes << "/" << total;
    });
    connect(session_, &SessionManager::directoryCreated, this, [this](const QString &path) {
        if (command_ == "mkdir") {
            out_ << "Created " << path << Qt::endl;
            finish(0);
        }
    });
    connect(session_, &SessionManager::directoryRemoved, this, [this](const QString &path) {
        out_ << "Removed " << path << Qt::endl;
        finish(0);
    });
    connect(session_, &SessionManager::fileRemoved, this, [this](const QString &path) {
        out_ << "Removed " << path << Qt::endl;
        finish(0);
    });
    connect(session_, &SessionManager::fileRenamed, this,
            [this](const QString &oldPath, const QString &newPath) {
        out_ << "Renamed " << oldPath << " -> " << newPath << Qt::endl;
        finish(0);
    });
}

bool CommandRunner::validateCommand(const QStringList &arguments, QString *error)
{
    if (arguments.isEmpty()) {
        if (error) {
            *error = tr("No command given");
        }
        return false;
    }

    const auto &table = commandTable();
    const auto it = table.constFind(arguments.first());
    if (it == table.constEnd()) {
        if (error) {
            *error = tr("Unknown command '%1'").arg(arguments.first());
        }
        return false;
    }

    const int count = arguments.size() - 1;
    // profiles takes nothing or "rm <name>"
    const bool badProfilesForm = arguments.first() == QLatin1String("profiles") && count > 0
        && (count != 2 || arguments.at(1) != QLatin1String("rm"));
    if (count < it->minArgs || count > it->maxArgs || badProfilesForm) {
        if (error) {
            *error = tr("Usage: %1").arg(QString::fromLatin1(it->usage));
        }
        return false;
    }
    return true;
}

QString CommandRunner::formatEntry(const RemoteEntry &entry)
{
    QString type = QStringLiteral("-");
    if (entry.isDirectory()) {
        type = QStringLiteral("d");
    } else if (entry.kind == RemoteEntry::Kind::SymlinkUnknown) {
        type = QStringLiteral("l");
    }

    const QString when = entry.modified.isValid()
        ? entry.modified.toString("yyyy-MM-dd HH:mm")
        : entry.modifiedText;

    return QString("%1 %2 %3 %4")
        .arg(type)
        .arg(entry.isDirectory() ? 0 : entry.size, 12)
        .arg(when, -16)
        .arg(entry.name);
}

void CommandRunner::run(const ConnectionProfile &profile, const QStringList &arguments)
{
    QString error;
    if (!validateCommand(arguments, &error)) {
        errorHandler_->handleError(ErrorCategory::Validation, ErrorSeverity::Warning,
                                   tr("Invalid command"), error);
        finish(1);
        return;
    }

    command_ = arguments.first();
    args_ = arguments.mid(1);

    if (command_ == "profiles") {
        if (args_.isEmpty()) {
            listProfiles();
        } else {
            removeProfile(args_.at(1));
        }
        return;
    }

    session_->connectToServer(profile);
}

void CommandRunner::listProfiles()
{
    const QStringList names = store_ ? store_->names() : QStringList();
    for (const QString &name : names) {
        const auto profile = store_->profile(name);
        if (!profile) {
            continue;
        }
        out_ << name << "\t" << profile->host << ":" << profile->port
             << (profile->tls ? "\ttls" : "") << Qt::endl;
    }
    finish(0);
}

void CommandRunner::removeProfile(const QString &name)
{
    if (!store_ || !store_->profile(name)) {
        errorHandler_->handleError(ErrorCategory::Validation, ErrorSeverity::Warning,
                                   tr("Unknown profile"), name);
        finish(1);
        return;
    }
    if (!store_->removeProfile(name)) {
        errorHandler_->handleError(ErrorCategory::System, ErrorSeverity::Critical,
                                   tr("Cannot save profiles"), store_->filePath());
        finish(1);
        return;
    }
    out_ << "Removed profile " << name << Qt::endl;
    finish(0);
}

void CommandRunner::onConnected()
{
    const QString greeting = session_->serverGreeting();
    if (!greeting.isEmpty()) {
        err_ << greeting << Qt::endl;
    }

    LOG_VERBOSE() << "Running" << command_ << args_;

    if (command_ == "ls") {
        session_->listDirectory(args_.value(0));
    } else if (command_ == "get") {
        const QString remote = args_.at(0);
        const QString localDir = args_.value(1, QDir::currentPath());
        const QString name = remote.section('/', -1);
        session_->downloadFile(remote, QDir(localDir).filePath(name));
    } else if (command_ == "put") {
        session_->uploadFile(args_.at(0));
    } else if (command_ == "put-dir") {
        waitingForFolder_ = true;
        session_->uploadFolder(args_.at(0));
    } else if (command_ == "mkdir") {
        session_->makeDirectory(args_.at(0));
    } else if (command_ == "rmdir") {
        session_->removeDirectory(args_.at(0));
    } else if (command_ == "rm") {
        session_->removeFile(args_.at(0));
    } else if (command_ == "mv") {
        session_->rename(args_.at(0), args_.at(1));
    }
}

void CommandRunner::onConnectionFailed(const FtpError &error)
{
    errorHandler_->handleConnectionError(error);
    finish(1);
}

void CommandRunner::onOperationFailed(const FtpError &error)
{
    errorHandler_->handleFtpError(error);
    failed_ = true;
    if (!waitingForFolder_ && outstanding_.isEmpty()) {
        finish(1);
    }
}

void CommandRunner::onDirectoryListed(const QString &path, const QList<RemoteEntry> &entries)
{
    if (command_ != "ls") {
        return;
    }
    out_ << path << ":" << Qt::endl;
    for (const RemoteEntry &entry : entries) {
        out_ << formatEntry(entry) << Qt::endl;
    }
    finish(0);
}

void CommandRunner::onTransferQueued(const TransferTask &task)
{
    outstanding_.insert(task.id);
}

void CommandRunner::onTransferFinished(int id, TransferTask::Status status, const FtpError &error)
{
    outstanding_.remove(id);
    if (status == TransferTask::Status::Succeeded) {
        out_ << "Transfer " << id << " " << TransferTask::statusToString(status) << Qt::endl;
    } else {
        failed_ = true;
        err_ << "Transfer " << id << " " << TransferTask::statusToString(status) << Qt::endl;
        errorHandler_->handleFtpError(error);
    }
    finishWhenTransfersDone();
}

void CommandRunner::onFolderUploadFinished(const QString &localDir, const FtpError &error)
{
    waitingForFolder_ = false;
    if (error.isError()) {
        failed_ = true;
        errorHandler_->handleFtpError(error);
    } else {
        out_ << "Queued " << outstanding_.size() << " files from " << localDir << Qt::endl;
    }
    finishWhenTransfersDone();
}

void CommandRunner::finishWhenTransfersDone()
{
    if (waitingForFolder_ || !outstanding_.isEmpty()) {
        return;
    }
    finish(failed_ ? 1 : 0);
}

void CommandRunner::finish(int exitCode)
{
    if (finished_) {
        return;
    }
    finished_ = true;
    session_->disconnectFromServer();
    emit finished(exitCode);
}
