/**
 * @file test_ftpcontrolchannel.cpp
 * @brief Tests for FtpControlChannel against the in-process fake server.
 *
 * Tests verify:
 * - Login sequence, multi-line greetings and login failures
 * - AUTH TLS ordering and encrypted data connections
 * - Directory navigation and remote file management
 * - MLSD listings and the LIST fallback
 * - Invalidation on dropped connections and reply timeouts
 */

#include <QtTest>
#include <QSignalSpy>
#include <QSslSocket>
#include <QTcpServer>
#include <QTimeZone>

#include "fakes/fakeftpserver.h"
#include "services/ftpcontrolchannel.h"
#include "services/ftpdatachannel.h"

namespace {

struct ListingResult {
    bool done = false;
    QList<RemoteEntry> entries;
    FtpError error;
};

struct PathResult {
    bool done = false;
    QString path;
    FtpError error;
};

struct CompletionResult {
    bool done = false;
    FtpError error;
};

FtpError openChannel(FtpControlChannel &channel, const ConnectionProfile &profile,
                     const SessionOptions &options = SessionOptions())
{
    bool done = false;
    FtpError result;
    channel.open(profile, options, [&](const FtpError &error) {
        result = error;
        done = true;
    });
    if (!QTest::qWaitFor([&]() { return done; }, 5000)) {
        return FtpError::protocolError("open() did not complete");
    }
    return result;
}

FtpControlChannel::Completion recordInto(CompletionResult &result)
{
    return [&result](const FtpError &error) {
        result.error = error;
        result.done = true;
    };
}

} // namespace

class TestFtpControlChannel : public QObject
{
    Q_OBJECT

private:
    FakeFtpServer *server_ = nullptr;
    FtpControlChannel *channel_ = nullptr;

    ListingResult list(const QString &path)
    {
        ListingResult result;
        channel_->listDirectory(path, [&result](const QList<RemoteEntry> &entries, const FtpError &error) {
            result.entries = entries;
            result.error = error;
            result.done = true;
        });
        QTest::qWaitFor([&]() { return result.done; }, 5000);
        return result;
    }

private slots:
    void init()
    {
        server_ = new FakeFtpServer(this);
        QVERIFY(server_->start());
        channel_ = new FtpControlChannel(this);
    }

    void cleanup()
    {
        delete channel_;
        channel_ = nullptr;
        delete server_;
        server_ = nullptr;
    }

    // === Session Setup ===

    void open_LogsInAndQueriesDirectory()
    {
        QSignalSpy stateSpy(channel_, &FtpControlChannel::stateChanged);

        const FtpError error = openChannel(*channel_, server_->profile());

        QVERIFY2(!error.isError(), qPrintable(error.toString()));
        QCOMPARE(channel_->state(), FtpControlChannel::State::Ready);
        QVERIFY(channel_->isReady());
        QCOMPARE(channel_->lastKnownDirectory(), QString("/"));
        QCOMPARE(server_->commandLog(),
                 QStringList({"USER tester", "PASS secret", "PWD"}));
        QVERIFY(stateSpy.count() >= 3);
        QCOMPARE(stateSpy.last().at(0).value<FtpControlChannel::State>(),
                 FtpControlChannel::State::Ready);
    }

    void open_AcceptsMultiLineGreeting()
    {
        server_->setGreeting({"220-Welcome", "220-220 lines may repeat the code", "220 Ready"});

        const FtpError error = openChannel(*channel_, server_->profile());

        QVERIFY2(!error.isError(), qPrintable(error.toString()));
        QCOMPARE(server_->commands("USER").size(), 1);
        QCOMPARE(channel_->greeting(), QString("Welcome\n220 lines may repeat the code\nReady"));
    }

    void open_AnonymousLogin()
    {
        ConnectionProfile profile = server_->profile();
        profile.anonymous = true;

        const FtpError error = openChannel(*channel_, profile);

        QVERIFY2(!error.isError(), qPrintable(error.toString()));
        QCOMPARE(server_->commands("USER"), QStringList({"USER anonymous"}));
        QCOMPARE(server_->commands("PASS"), QStringList({"PASS anonymous@"}));
    }

    void open_UnexpectedGreeting_IsConnectError()
    {
        server_->setGreeting({"500 Go away"});

        const FtpError error = openChannel(*channel_, server_->profile());

        QCOMPARE(error.kind, FtpError::Kind::Connect);
        QCOMPARE(error.replyCode, 500);
        QCOMPARE(channel_->state(), FtpControlChannel::State::Disconnected);
        QVERIFY(server_->commandLog().isEmpty());
    }

    void open_PlainLoginRefused_IsAuthError()
    {
        server_->setRequireTls(true);
        QSignalSpy failedSpy(channel_, &FtpControlChannel::failed);

        const FtpError error = openChannel(*channel_, server_->profile());

        QCOMPARE(error.kind, FtpError::Kind::Auth);
        QCOMPARE(error.replyCode, 530);
        QVERIFY(error.serverMessage.contains("must use encryption"));
        QVERIFY(error.reconnectRequired());
        QCOMPARE(channel_->state(), FtpControlChannel::State::Disconnected);

        // Nothing beyond the refused USER
        QCOMPARE(server_->commandCount("PASS"), 0);
        QCOMPARE(server_->commandCount("PASV"), 0);
        QCOMPARE(server_->dataConnectionCount(), 0);
        // The session was never established
        QCOMPARE(failedSpy.count(), 0);
    }

    void open_WrongPassword_IsAuthError()
    {
        ConnectionProfile profile = server_->profile();
        profile.password = "wrong";

        const FtpError error = openChannel(*channel_, profile);

        QCOMPARE(error.kind, FtpError::Kind::Auth);
        QCOMPARE(error.replyCode, 530);
        QCOMPARE(error.toString(), QString("Login failed [530 Login incorrect.]"));
        QCOMPARE(server_->commandCount("PWD"), 0);
    }

    void open_TlsRefused_IsTlsError()
    {
        ConnectionProfile profile = server_->profile();
        profile.tls = true;

        const FtpError error = openChannel(*channel_, profile);

        QCOMPARE(error.kind, FtpError::Kind::Tls);
        QVERIFY(error.reconnectRequired());
        // Credentials never travel before TLS is up
        QCOMPARE(server_->commandCount("USER"), 0);
        QCOMPARE(server_->commandCount("PASS"), 0);
    }

    void open_Tls_SecuresBeforeCredentials()
    {
        if (!server_->setTlsEnabled(true)) {
            QSKIP("TLS backend not available");
        }
        ConnectionProfile profile = server_->profile();
        profile.tls = true;

        const FtpError error = openChannel(*channel_, profile);

        QVERIFY2(!error.isError(), qPrintable(error.toString()));
        QVERIFY(channel_->isReady());
        QVERIFY(channel_->isProtected());
        QCOMPARE(server_->commandLog(),
                 QStringList({"AUTH TLS", "USER tester", "PASS secret", "PBSZ 0", "PROT P", "PWD"}));
        QCOMPARE(server_->dataConnectionCount(), 0);
    }

    void open_TlsOnlyServer_AcceptsSecureLogin()
    {
        if (!server_->setTlsEnabled(true)) {
            QSKIP("TLS backend not available");
        }
        server_->setRequireTls(true);
        ConnectionProfile profile = server_->profile();
        profile.tls = true;

        const FtpError error = openChannel(*channel_, profile);

        QVERIFY2(!error.isError(), qPrintable(error.toString()));
        QCOMPARE(channel_->lastKnownDirectory(), QString("/"));
    }

    void open_PlainProfile_IsNotProtected()
    {
        QVERIFY(server_->setTlsEnabled(true) || !QSslSocket::supportsSsl());

        const FtpError error = openChannel(*channel_, server_->profile());

        QVERIFY2(!error.isError(), qPrintable(error.toString()));
        QVERIFY(!channel_->isProtected());
        QCOMPARE(server_->commandCount("AUTH"), 0);
        QCOMPARE(server_->commandCount("PROT"), 0);
    }

    void open_ConnectionRefused_IsConnectError()
    {
        QTcpServer unused;
        QVERIFY(unused.listen(QHostAddress::LocalHost, 0));
        const quint16 closedPort = unused.serverPort();
        unused.close();

        ConnectionProfile profile = server_->profile();
        profile.port = closedPort;

        const FtpError error = openChannel(*channel_, profile);

        QCOMPARE(error.kind, FtpError::Kind::Connect);
        QCOMPARE(channel_->state(), FtpControlChannel::State::Disconnected);
    }

    void open_PwdFailureIsNotFatal()
    {
        server_->failCommand("PWD", 550, "Permission denied.");

        const FtpError error = openChannel(*channel_, server_->profile());

        QVERIFY2(!error.isError(), qPrintable(error.toString()));
        QVERIFY(channel_->isReady());
        QVERIFY(channel_->lastKnownDirectory().isEmpty());
    }

    void operationOnClosedChannel_AbortsImmediately()
    {
        channel_->quit();
        QCOMPARE(channel_->state(), FtpControlChannel::State::Disconnected);

        CompletionResult result;
        channel_->makeDirectory("x", recordInto(result));

        QVERIFY(result.done);
        QCOMPARE(result.error.kind, FtpError::Kind::Connect);
    }

    // === Directory Operations ===

    void changeDirectory_ReportsServerPath()
    {
        server_->addDirectory("/docs/manuals");
        QVERIFY(!openChannel(*channel_, server_->profile()).isError());

        PathResult result;
        channel_->changeDirectory("docs", [&result](const QString &path, const FtpError &error) {
            result.path = path;
            result.error = error;
            result.done = true;
        });
        QTRY_VERIFY(result.done);

        QVERIFY(!result.error.isError());
        QCOMPARE(result.path, QString("/docs"));
        QCOMPARE(channel_->lastKnownDirectory(), QString("/docs"));
        QVERIFY(server_->commandLog().endsWith("PWD"));
    }

    void changeDirectory_Missing_IsRemoteOpError()
    {
        QVERIFY(!openChannel(*channel_, server_->profile()).isError());

        PathResult result;
        channel_->changeDirectory("missing", [&result](const QString &path, const FtpError &error) {
            result.path = path;
            result.error = error;
            result.done = true;
        });
        QTRY_VERIFY(result.done);

        QCOMPARE(result.error.kind, FtpError::Kind::RemoteOp);
        QCOMPARE(result.error.command, QString("CWD"));
        QCOMPARE(result.error.replyCode, 550);
        QCOMPARE(result.error.path, QString("missing"));
        QVERIFY(channel_->isReady());
        QCOMPARE(channel_->lastKnownDirectory(), QString("/"));
    }

    void makeAndRemoveDirectory()
    {
        QVERIFY(!openChannel(*channel_, server_->profile()).isError());

        CompletionResult made;
        channel_->makeDirectory("incoming", recordInto(made));
        QTRY_VERIFY(made.done);
        QVERIFY(!made.error.isError());
        QVERIFY(server_->hasDirectory("/incoming"));

        CompletionResult again;
        channel_->makeDirectory("incoming", recordInto(again));
        QTRY_VERIFY(again.done);
        QCOMPARE(again.error.kind, FtpError::Kind::RemoteOp);
        QCOMPARE(again.error.command, QString("MKD"));

        CompletionResult removed;
        channel_->removeDirectory("incoming", recordInto(removed));
        QTRY_VERIFY(removed.done);
        QVERIFY(!removed.error.isError());
        QVERIFY(!server_->hasDirectory("/incoming"));
    }

    void removeDirectory_NotEmpty_IsRemoteOpError()
    {
        server_->addFile("/docs/a.txt", "a");
        QVERIFY(!openChannel(*channel_, server_->profile()).isError());

        CompletionResult result;
        channel_->removeDirectory("docs", recordInto(result));
        QTRY_VERIFY(result.done);

        QCOMPARE(result.error.kind, FtpError::Kind::RemoteOp);
        QCOMPARE(result.error.command, QString("RMD"));
        QVERIFY(server_->hasDirectory("/docs"));
    }

    void deleteFile()
    {
        server_->addFile("/old.log", "log");
        QVERIFY(!openChannel(*channel_, server_->profile()).isError());

        CompletionResult deleted;
        channel_->deleteFile("old.log", recordInto(deleted));
        QTRY_VERIFY(deleted.done);
        QVERIFY(!deleted.error.isError());
        QVERIFY(!server_->hasFile("/old.log"));

        CompletionResult missing;
        channel_->deleteFile("old.log", recordInto(missing));
        QTRY_VERIFY(missing.done);
        QCOMPARE(missing.error.kind, FtpError::Kind::RemoteOp);
        QCOMPARE(missing.error.command, QString("DELE"));
        QVERIFY(!missing.error.reconnectRequired());
    }

    void rename_SendsRnfrThenRnto()
    {
        server_->addFile("/draft.txt", "text");
        QVERIFY(!openChannel(*channel_, server_->profile()).isError());

        CompletionResult result;
        channel_->rename("draft.txt", "final.txt", recordInto(result));
        QTRY_VERIFY(result.done);

        QVERIFY(!result.error.isError());
        QVERIFY(server_->hasFile("/final.txt"));
        QVERIFY(!server_->hasFile("/draft.txt"));
        QCOMPARE(server_->commands("RNFR"), QStringList({"RNFR draft.txt"}));
        QCOMPARE(server_->commands("RNTO"), QStringList({"RNTO final.txt"}));
    }

    void rename_MissingSource_StopsAfterRnfr()
    {
        QVERIFY(!openChannel(*channel_, server_->profile()).isError());

        CompletionResult result;
        channel_->rename("nothing.txt", "other.txt", recordInto(result));
        QTRY_VERIFY(result.done);

        QCOMPARE(result.error.kind, FtpError::Kind::RemoteOp);
        QCOMPARE(result.error.command, QString("RNFR"));
        QCOMPARE(server_->commandCount("RNTO"), 0);
    }

    void sizeOf()
    {
        server_->addFile("/data.bin", QByteArray(4321, 'd'));
        QVERIFY(!openChannel(*channel_, server_->profile()).isError());

        bool done = false;
        qint64 size = 0;
        FtpError error;
        channel_->sizeOf("data.bin", [&](qint64 value, const FtpError &e) {
            size = value;
            error = e;
            done = true;
        });
        QTRY_VERIFY(done);

        QVERIFY(!error.isError());
        QCOMPARE(size, qint64(4321));
    }

    void sizeOf_Missing_IsRemoteOpError()
    {
        QVERIFY(!openChannel(*channel_, server_->profile()).isError());

        bool done = false;
        qint64 size = 0;
        FtpError error;
        channel_->sizeOf("nope.bin", [&](qint64 value, const FtpError &e) {
            size = value;
            error = e;
            done = true;
        });
        QTRY_VERIFY(done);

        QCOMPARE(size, qint64(-1));
        QCOMPARE(error.kind, FtpError::Kind::RemoteOp);
        QCOMPARE(error.command, QString("SIZE"));
    }

    void operationsRunInOrder()
    {
        QVERIFY(!openChannel(*channel_, server_->profile()).isError());
        server_->clearCommandLog();

        QStringList completed;
        channel_->makeDirectory("a", [&completed](const FtpError &) { completed << "a"; });
        channel_->makeDirectory("b", [&completed](const FtpError &) { completed << "b"; });
        channel_->makeDirectory("c", [&completed](const FtpError &) { completed << "c"; });
        QTRY_COMPARE(completed.size(), 3);

        QCOMPARE(completed, QStringList({"a", "b", "c"}));
        QCOMPARE(server_->commandLog(), QStringList({"MKD a", "MKD b", "MKD c"}));
    }

    void parsePwdReply()
    {
        QCOMPARE(FtpControlChannel::parsePwdReply("\"/home/user\" is current directory"),
                 QString("/home/user"));
        QCOMPARE(FtpControlChannel::parsePwdReply("\"/say \"\"hi\"\"\" is current"),
                 QString("/say \"hi\""));
        QCOMPARE(FtpControlChannel::parsePwdReply("no quotes here"), QString());
        QCOMPARE(FtpControlChannel::parsePwdReply("\"/unterminated"), QString());
    }

    // === Listing ===

    void listDirectory_MachineListing()
    {
        server_->addDirectory("/docs");
        server_->addFile("/readme.txt", QByteArray(1200, 'r'));
        QVERIFY(!openChannel(*channel_, server_->profile()).isError());

        const ListingResult result = list(QString());

        QVERIFY2(!result.error.isError(), qPrintable(result.error.toString()));
        QCOMPARE(result.entries.size(), 2);
        QCOMPARE(result.entries.at(0).name, QString("docs"));
        QVERIFY(result.entries.at(0).isDirectory());
        QCOMPARE(result.entries.at(1).name, QString("readme.txt"));
        QVERIFY(result.entries.at(1).isFile());
        QCOMPARE(result.entries.at(1).size, qint64(1200));
        QCOMPARE(result.entries.at(1).modified,
                 QDateTime(QDate(2024, 1, 15), QTime(10, 30), QTimeZone::utc()));

        QCOMPARE(server_->commands("TYPE"), QStringList({"TYPE A"}));
        QCOMPARE(server_->commandCount("MLSD"), 1);
        QCOMPARE(server_->commandCount("LIST"), 0);
        QTRY_COMPARE(FtpDataChannel::openChannelCount(), 0);
    }

    void listDirectory_Subdirectory()
    {
        server_->addFile("/docs/guide.pdf", QByteArray(10, 'g'));
        QVERIFY(!openChannel(*channel_, server_->profile()).isError());

        const ListingResult result = list("/docs");

        QVERIFY(!result.error.isError());
        QCOMPARE(result.entries.size(), 1);
        QCOMPARE(result.entries.at(0).name, QString("guide.pdf"));
        QCOMPARE(server_->commands("MLSD"), QStringList({"MLSD /docs"}));
    }

    void listDirectory_FallsBackToList()
    {
        server_->setMachineListingSupported(false);
        server_->addDirectory("/docs");
        server_->addFile("/readme.txt", QByteArray(1200, 'r'));
        QVERIFY(!openChannel(*channel_, server_->profile()).isError());

        const ListingResult first = list(QString());

        QVERIFY2(!first.error.isError(), qPrintable(first.error.toString()));
        QCOMPARE(first.entries.size(), 2);
        QCOMPARE(first.entries.at(0).name, QString("docs"));
        QCOMPARE(first.entries.at(1).name, QString("readme.txt"));
        QCOMPARE(first.entries.at(1).size, qint64(1200));
        QVERIFY(!channel_->isMachineListingSupported());
        QCOMPARE(server_->commandCount("MLSD"), 1);
        QCOMPARE(server_->commandCount("LIST"), 1);

        // The unsupported command is not tried again
        const ListingResult second = list(QString());
        QVERIFY(!second.error.isError());
        QCOMPARE(server_->commandCount("MLSD"), 1);
        QCOMPARE(server_->commandCount("LIST"), 2);
    }

    void listDirectory_Missing_IsRemoteOpError()
    {
        QVERIFY(!openChannel(*channel_, server_->profile()).isError());

        const ListingResult result = list("/nowhere");

        QVERIFY(result.error.isError());
        QCOMPARE(result.error.kind, FtpError::Kind::RemoteOp);
        QCOMPARE(result.error.command, QString("LIST"));
        QVERIFY(result.entries.isEmpty());
        QVERIFY(channel_->isReady());
        // A failed MLSD on an existing server doesn't disable it
        QVERIFY(channel_->isMachineListingSupported());
        QTRY_COMPARE(FtpDataChannel::openChannelCount(), 0);
    }

    void listDirectory_ActiveMode()
    {
        server_->addFile("/readme.txt", QByteArray(1200, 'r'));
        ConnectionProfile profile = server_->profile();
        profile.passive = false;
        QVERIFY(!openChannel(*channel_, profile).isError());

        const ListingResult result = list(QString());

        QVERIFY2(!result.error.isError(), qPrintable(result.error.toString()));
        QCOMPARE(result.entries.size(), 1);
        QCOMPARE(server_->commandCount("PORT"), 1);
        QCOMPARE(server_->commandCount("PASV"), 0);
    }

    void listDirectory_Tls_EncryptsDataConnection()
    {
        if (!server_->setTlsEnabled(true)) {
            QSKIP("TLS backend not available");
        }
        server_->addDirectory("/docs");
        server_->addFile("/readme.txt", QByteArray(1200, 'r'));
        ConnectionProfile profile = server_->profile();
        profile.tls = true;
        QVERIFY(!openChannel(*channel_, profile).isError());

        const ListingResult result = list(QString());

        QVERIFY2(!result.error.isError(), qPrintable(result.error.toString()));
        QCOMPARE(result.entries.size(), 2);
        QCOMPARE(result.entries.at(1).name, QString("readme.txt"));
        QCOMPARE(result.entries.at(1).size, qint64(1200));
        QCOMPARE(server_->dataConnectionCount(), 1);
        QCOMPARE(server_->encryptedDataConnectionCount(), 1);

        // Protection is negotiated before the first data connection
        const QStringList log = server_->commandLog();
        const int firstPassive = std::max(log.indexOf("EPSV"), log.indexOf("PASV"));
        QVERIFY(firstPassive > log.indexOf("PROT P"));
        QTRY_COMPARE(FtpDataChannel::openChannelCount(), 0);
    }

    void listDirectory_TlsActiveMode_EncryptsDataConnection()
    {
        if (!server_->setTlsEnabled(true)) {
            QSKIP("TLS backend not available");
        }
        server_->addFile("/readme.txt", QByteArray(1200, 'r'));
        ConnectionProfile profile = server_->profile();
        profile.tls = true;
        profile.passive = false;
        QVERIFY(!openChannel(*channel_, profile).isError());

        const ListingResult result = list(QString());

        QVERIFY2(!result.error.isError(), qPrintable(result.error.toString()));
        QCOMPARE(result.entries.size(), 1);
        QCOMPARE(server_->commandCount("PORT"), 1);
        QCOMPARE(server_->encryptedDataConnectionCount(), 1);
    }

    // === Invalidation ===

    void droppedConnection_AbortsPendingOperations()
    {
        server_->addFile("/a.txt", "a");
        QVERIFY(!openChannel(*channel_, server_->profile()).isError());
        QSignalSpy failedSpy(channel_, &FtpControlChannel::failed);
        server_->dropConnectionOn("DELE");

        CompletionResult deleted;
        CompletionResult made;
        channel_->deleteFile("a.txt", recordInto(deleted));
        channel_->makeDirectory("later", recordInto(made));

        QTRY_VERIFY(deleted.done && made.done);
        QCOMPARE(deleted.error.kind, FtpError::Kind::Connect);
        QVERIFY(deleted.error.reconnectRequired());
        QCOMPARE(made.error.kind, FtpError::Kind::Connect);
        QCOMPARE(failedSpy.count(), 1);
        QCOMPARE(channel_->state(), FtpControlChannel::State::Disconnected);
        QCOMPARE(server_->commandCount("MKD"), 0);
    }

    void replyTimeout_InvalidatesChannel()
    {
        SessionOptions options;
        options.replyTimeoutMs = 200;
        QVERIFY(!openChannel(*channel_, server_->profile(), options).isError());
        QSignalSpy failedSpy(channel_, &FtpControlChannel::failed);
        server_->ignoreCommand("CWD");

        PathResult result;
        channel_->changeDirectory("docs", [&result](const QString &path, const FtpError &error) {
            result.path = path;
            result.error = error;
            result.done = true;
        });
        QTRY_VERIFY(result.done);

        QCOMPARE(result.error.kind, FtpError::Kind::Connect);
        QVERIFY(result.error.detail.contains("200"));
        QCOMPARE(failedSpy.count(), 1);
        QCOMPARE(channel_->state(), FtpControlChannel::State::Disconnected);
    }

    void serviceClosing_InvalidatesChannel()
    {
        QVERIFY(!openChannel(*channel_, server_->profile()).isError());
        server_->failCommand("MKD", 421, "Timeout, closing control connection.");

        CompletionResult result;
        channel_->makeDirectory("x", recordInto(result));
        QTRY_VERIFY(result.done);

        QCOMPARE(result.error.kind, FtpError::Kind::Connect);
        QCOMPARE(result.error.replyCode, 421);
        QCOMPARE(channel_->state(), FtpControlChannel::State::Disconnected);
    }

    void quit_EmitsClosed()
    {
        QVERIFY(!openChannel(*channel_, server_->profile()).isError());
        QSignalSpy closedSpy(channel_, &FtpControlChannel::closed);
        QSignalSpy failedSpy(channel_, &FtpControlChannel::failed);

        channel_->quit();

        QTRY_COMPARE(closedSpy.count(), 1);
        QCOMPARE(failedSpy.count(), 0);
        QCOMPARE(server_->commandCount("QUIT"), 1);
        QCOMPARE(channel_->state(), FtpControlChannel::State::Disconnected);
        QTRY_COMPARE(server_->activeSessionCount(), 0);
    }

    void quit_RunsQueuedOperationsFirst()
    {
        QVERIFY(!openChannel(*channel_, server_->profile()).isError());
        QSignalSpy closedSpy(channel_, &FtpControlChannel::closed);

        CompletionResult made;
        channel_->makeDirectory("first", recordInto(made));
        channel_->quit();

        QTRY_COMPARE(closedSpy.count(), 1);
        QVERIFY(made.done);
        QVERIFY(!made.error.isError());
        QVERIFY(server_->hasDirectory("/first"));
    }
};

QTEST_MAIN(TestFtpControlChannel)
#include "test_ftpcontrolchannel.moc"
