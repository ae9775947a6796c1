/**
 * @file test_connectionprofilestore.cpp
 * @brief Unit tests for ConnectionProfile and ConnectionProfileStore.
 */

#include <QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QFile>

#include "services/connectionprofilestore.h"

class TestConnectionProfileStore : public QObject
{
    Q_OBJECT

private:
    QTemporaryDir *tempDir_ = nullptr;

    QString storePath() const { return tempDir_->filePath("connections.json"); }

    static ConnectionProfile makeProfile(const QString &name, const QString &host)
    {
        ConnectionProfile profile;
        profile.name = name;
        profile.host = host;
        profile.port = 2121;
        profile.username = "alice";
        profile.password = "pw";
        profile.tls = true;
        profile.passive = false;
        return profile;
    }

private slots:
    void init()
    {
        tempDir_ = new QTemporaryDir();
        QVERIFY(tempDir_->isValid());
    }

    void cleanup()
    {
        delete tempDir_;
        tempDir_ = nullptr;
    }

    // === ConnectionProfile ===

    void credentials_AnonymousFlag()
    {
        ConnectionProfile profile = makeProfile("x", "host");
        profile.anonymous = true;
        const FtpCredentials credentials = profile.credentials();
        QCOMPARE(credentials.username, QString("anonymous"));
        QCOMPARE(credentials.password, QString("anonymous@"));
    }

    void credentials_EmptyUsernameIsAnonymous()
    {
        ConnectionProfile profile;
        profile.host = "host";
        QCOMPARE(profile.credentials().username, QString("anonymous"));
    }

    void credentials_Named()
    {
        const FtpCredentials credentials = makeProfile("x", "host").credentials();
        QCOMPARE(credentials.username, QString("alice"));
        QCOMPARE(credentials.password, QString("pw"));
    }

    void isValid()
    {
        ConnectionProfile profile;
        QVERIFY(!profile.isValid());
        profile.host = "ftp.example.com";
        QVERIFY(profile.isValid());
        profile.port = 0;
        QVERIFY(!profile.isValid());
    }

    void fromJson_DefaultsAndBadPort()
    {
        QJsonObject json;
        json["host"] = "ftp.example.com";
        json["port"] = 70000;

        const ConnectionProfile profile = ConnectionProfile::fromJson("p", json);
        QCOMPARE(profile.name, QString("p"));
        QCOMPARE(profile.port, ConnectionProfile::DefaultPort);
        QVERIFY(profile.passive);
        QVERIFY(!profile.tls);
        QVERIFY(!profile.anonymous);
    }

    // === Store ===

    void load_MissingFileIsEmpty()
    {
        ConnectionProfileStore store(storePath());
        QVERIFY(store.load());
        QVERIFY(store.names().isEmpty());
        QVERIFY(!store.profile("anything").has_value());
    }

    void load_MalformedFileFails()
    {
        QFile file(storePath());
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("{ not json");
        file.close();

        ConnectionProfileStore store(storePath());
        QVERIFY(!store.load());
        QVERIFY(store.names().isEmpty());
    }

    void saveProfile_PersistsAcrossInstances()
    {
        {
            ConnectionProfileStore store(storePath());
            QVERIFY(store.load());
            QVERIFY(store.saveProfile(makeProfile("work", "ftp.work.example")));
        }

        ConnectionProfileStore reloaded(storePath());
        QVERIFY(reloaded.load());
        const auto profile = reloaded.profile("work");
        QVERIFY(profile.has_value());
        QCOMPARE(profile->host, QString("ftp.work.example"));
        QCOMPARE(profile->port, quint16(2121));
        QCOMPARE(profile->username, QString("alice"));
        QCOMPARE(profile->password, QString("pw"));
        QVERIFY(profile->tls);
        QVERIFY(!profile->passive);
    }

    void names_AreSorted()
    {
        ConnectionProfileStore store(storePath());
        QVERIFY(store.saveProfile(makeProfile("zeta", "z")));
        QVERIFY(store.saveProfile(makeProfile("alpha", "a")));
        QVERIFY(store.saveProfile(makeProfile("mid", "m")));

        QCOMPARE(store.names(), QStringList({"alpha", "mid", "zeta"}));
    }

    void saveProfile_ReplacesExisting()
    {
        ConnectionProfileStore store(storePath());
        QVERIFY(store.saveProfile(makeProfile("home", "old.example")));
        QVERIFY(store.saveProfile(makeProfile("home", "new.example")));

        QCOMPARE(store.names().size(), 1);
        QCOMPARE(store.profile("home")->host, QString("new.example"));
    }

    void saveProfile_RefusesEmptyName()
    {
        ConnectionProfileStore store(storePath());
        QSignalSpy spy(&store, &ConnectionProfileStore::profilesChanged);

        QVERIFY(!store.saveProfile(makeProfile(QString(), "host")));
        QCOMPARE(spy.count(), 0);
        QVERIFY(!QFile::exists(storePath()));
    }

    void removeProfile()
    {
        ConnectionProfileStore store(storePath());
        QVERIFY(store.saveProfile(makeProfile("a", "a.example")));
        QVERIFY(store.saveProfile(makeProfile("b", "b.example")));

        QSignalSpy spy(&store, &ConnectionProfileStore::profilesChanged);
        QVERIFY(store.removeProfile("a"));
        QCOMPARE(spy.count(), 1);
        QVERIFY(!store.removeProfile("a"));
        QCOMPARE(spy.count(), 1);

        ConnectionProfileStore reloaded(storePath());
        QVERIFY(reloaded.load());
        QCOMPARE(reloaded.names(), QStringList({"b"}));
    }

    void load_SkipsNonObjectEntries()
    {
        QFile file(storePath());
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write(R"({"good": {"host": "ftp.example.com"}, "bad": 42})");
        file.close();

        ConnectionProfileStore store(storePath());
        QVERIFY(store.load());
        QCOMPARE(store.names(), QStringList({"good"}));
        QCOMPARE(store.profile("good")->host, QString("ftp.example.com"));
    }
};

QTEST_MAIN(TestConnectionProfileStore)
#include "test_connectionprofilestore.moc"
