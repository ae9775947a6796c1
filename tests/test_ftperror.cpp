/**
 * @file test_ftperror.cpp
 * @brief Unit tests for FtpError formatting and classification.
 */

#include <QtTest>

#include "services/ftperror.h"

class TestFtpError : public QObject
{
    Q_OBJECT

private slots:
    // === Classification ===

    void defaultIsNoError()
    {
        FtpError error;
        QVERIFY(!error.isError());
        QVERIFY(!error.reconnectRequired());
        QCOMPARE(error.toString(), QString("No error"));
    }

    void reconnectRequired_data()
    {
        QTest::addColumn<FtpError>("error");
        QTest::addColumn<bool>("expected");

        QTest::newRow("connect") << FtpError::connectError("Connection refused") << true;
        QTest::newRow("auth") << FtpError::authError(530, "Login incorrect.") << true;
        QTest::newRow("tls") << FtpError::tlsError("Handshake failed") << true;
        QTest::newRow("protocol") << FtpError::protocolError("Malformed reply") << true;
        QTest::newRow("remote-op") << FtpError::remoteOpError("DELE", 550, "No such file") << false;
        QTest::newRow("data-channel") << FtpError::dataChannelError("Refused") << false;
        QTest::newRow("transfer")
            << FtpError::transferError(FtpError::Phase::Streaming, FtpError::Cause::Network,
                                       "a.bin", "Connection reset")
            << false;
        QTest::newRow("parse") << FtpError::parseError("No usable entries") << false;
    }

    void reconnectRequired()
    {
        QFETCH(FtpError, error);
        QFETCH(bool, expected);
        QVERIFY(error.isError());
        QCOMPARE(error.reconnectRequired(), expected);
    }

    // === Factories ===

    void authError_KeepsReply()
    {
        const FtpError error = FtpError::authError(530, "Login incorrect.");
        QCOMPARE(error.kind, FtpError::Kind::Auth);
        QCOMPARE(error.replyCode, 530);
        QCOMPARE(error.serverMessage, QString("Login incorrect."));
        QCOMPARE(error.cause, FtpError::Cause::Server);
    }

    void remoteOpError_KeepsCommandAndPath()
    {
        const FtpError error = FtpError::remoteOpError("RMD", 550, "Directory not empty", "docs");
        QCOMPARE(error.kind, FtpError::Kind::RemoteOp);
        QCOMPARE(error.command, QString("RMD"));
        QCOMPARE(error.path, QString("docs"));
        QCOMPARE(error.replyCode, 550);
    }

    void transferError_KeepsPhaseAndCause()
    {
        const FtpError error = FtpError::transferError(FtpError::Phase::Finalizing,
                                                       FtpError::Cause::Server,
                                                       "/remote/b.txt", "Could not create file.");
        QCOMPARE(error.kind, FtpError::Kind::Transfer);
        QCOMPARE(error.phase, FtpError::Phase::Finalizing);
        QCOMPARE(error.cause, FtpError::Cause::Server);
        QCOMPARE(error.path, QString("/remote/b.txt"));
    }

    // === Formatting ===

    void toString_Auth()
    {
        const FtpError error = FtpError::authError(530, "Non-anonymous sessions must use encryption.");
        QCOMPARE(error.toString(),
                 QString("Login failed [530 Non-anonymous sessions must use encryption.]"));
    }

    void toString_RemoteOpWithPath()
    {
        const FtpError error = FtpError::remoteOpError("MKD", 550, "File exists", "incoming");
        QCOMPARE(error.toString(), QString("MKD failed for 'incoming' [550 File exists]"));
    }

    void toString_RemoteOpWithoutPath()
    {
        const FtpError error = FtpError::remoteOpError("PWD", 502, "Not implemented");
        QCOMPARE(error.toString(), QString("PWD failed [502 Not implemented]"));
    }

    void toString_Transfer()
    {
        const FtpError error = FtpError::transferError(FtpError::Phase::Opening,
                                                       FtpError::Cause::LocalFilesystem,
                                                       "/tmp/a.bin", "Permission denied");
        QCOMPARE(error.toString(),
                 QString("Transfer of '/tmp/a.bin' failed while opening (local filesystem error): "
                         "Permission denied"));
    }

    void toString_Connect()
    {
        QCOMPARE(FtpError::connectError("Connection refused").toString(),
                 QString("Connection failed: Connection refused"));
    }

    void toString_TlsWithoutCode()
    {
        const FtpError error = FtpError::tlsError("Server refused AUTH TLS", 534, "Not available");
        QCOMPARE(error.toString(),
                 QString("TLS negotiation failed: Server refused AUTH TLS [534 Not available]"));
    }

    void kindToString()
    {
        QCOMPARE(FtpError::kindToString(FtpError::Kind::NoError), QString("NoError"));
        QCOMPARE(FtpError::kindToString(FtpError::Kind::Auth), QString("AuthError"));
        QCOMPARE(FtpError::kindToString(FtpError::Kind::Transfer), QString("TransferError"));
        QCOMPARE(FtpError::kindToString(FtpError::Kind::DataChannel), QString("DataChannelError"));
    }

    void metaTypeRoundTrip()
    {
        const FtpError error = FtpError::parseError("No usable entries");
        const QVariant variant = QVariant::fromValue(error);
        QCOMPARE(variant.value<FtpError>().kind, FtpError::Kind::Parse);
        QCOMPARE(variant.value<FtpError>().detail, QString("No usable entries"));
    }
};

QTEST_MAIN(TestFtpError)
#include "test_ftperror.moc"
