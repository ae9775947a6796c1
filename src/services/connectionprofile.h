/**
 * @file connectionprofile.h
 * @brief Login credentials and saved server connection settings.
 */

#ifndef CONNECTIONPROFILE_H
#define CONNECTIONPROFILE_H

#include <QJsonObject>
#include <QString>

/**
 * @brief USER/PASS pair sent during authentication.
 */
struct FtpCredentials {
    QString username;
    QString password;

    /**
     * @brief Returns the conventional anonymous login.
     */
    [[nodiscard]] static FtpCredentials anonymous()
    {
        return FtpCredentials{QStringLiteral("anonymous"), QStringLiteral("anonymous@")};
    }
};

/**
 * @brief Everything needed to open a session with one server.
 *
 * Profiles are plain values; ConnectionProfileStore persists them as JSON.
 */
struct ConnectionProfile {
    static constexpr quint16 DefaultPort = 21;  ///< Default FTP control port

    QString name;                  ///< Key under which the profile is saved
    QString host;
    quint16 port = DefaultPort;
    QString username;
    QString password;
    bool anonymous = false;        ///< Ignore username/password, log in anonymously
    bool tls = false;              ///< Explicit FTPS (AUTH TLS)
    bool passive = true;           ///< Passive data connections, active (PORT) otherwise

    [[nodiscard]] bool isValid() const { return !host.isEmpty() && port != 0; }

    [[nodiscard]] FtpCredentials credentials() const
    {
        if (anonymous || username.isEmpty()) {
            return FtpCredentials::anonymous();
        }
        return FtpCredentials{username, password};
    }

    [[nodiscard]] QJsonObject toJson() const;

    /**
     * @brief Builds a profile from its JSON form.
     *
     * Unknown keys are ignored and missing keys keep their defaults.
     */
    [[nodiscard]] static ConnectionProfile fromJson(const QString &name, const QJsonObject &json);
};

#endif // CONNECTIONPROFILE_H
