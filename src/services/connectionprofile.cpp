#include "connectionprofile.h"

QJsonObject ConnectionProfile::toJson() const
{
    QJsonObject json;
    json["host"] = host;
    json["port"] = static_cast<int>(port);
    json["username"] = username;
    json["password"] = password;
    json["anonymous"] = anonymous;
    json["tls"] = tls;
    json["passive"] = passive;
    return json;
}

ConnectionProfile ConnectionProfile::fromJson(const QString &name, const QJsonObject &json)
{
    ConnectionProfile profile;
    profile.name = name;
    profile.host = json["host"].toString();

    const int port = json["port"].toInt(DefaultPort);
    profile.port = (port > 0 && port <= 65535) ? static_cast<quint16>(port) : DefaultPort;

    profile.username = json["username"].toString();
    profile.password = json["password"].toString();
    profile.anonymous = json["anonymous"].toBool(false);
    profile.tls = json["tls"].toBool(false);
    profile.passive = json["passive"].toBool(true);
    return profile;
}
