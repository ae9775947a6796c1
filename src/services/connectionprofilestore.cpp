#include "connectionprofilestore.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStandardPaths>

ConnectionProfileStore::ConnectionProfileStore(const QString &filePath, QObject *parent)
    : QObject(parent)
    , filePath_(filePath.isEmpty() ? defaultFilePath() : filePath)
{
}

QString ConnectionProfileStore::defaultFilePath()
{
    const QString configDir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    return QDir(configDir).filePath("connections.json");
}

bool ConnectionProfileStore::load()
{
    profiles_.clear();

    QFile file(filePath_);
    if (!file.exists()) {
        emit profilesChanged();
        return true;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "ConnectionProfileStore: Cannot open" << filePath_ << file.errorString();
        return false;
    }

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "ConnectionProfileStore: Malformed profile file" << filePath_
                   << error.errorString();
        return false;
    }

    const QJsonObject root = doc.object();
    for (auto it = root.constBegin(); it != root.constEnd(); ++it) {
        if (!it.value().isObject()) {
            qWarning() << "ConnectionProfileStore: Skipping profile" << it.key();
            continue;
        }
        profiles_.insert(it.key(), ConnectionProfile::fromJson(it.key(), it.value().toObject()));
    }

    qDebug() << "ConnectionProfileStore: Loaded" << profiles_.size() << "profiles";
    emit profilesChanged();
    return true;
}

bool ConnectionProfileStore::save() const
{
    QJsonObject root;
    for (auto it = profiles_.constBegin(); it != profiles_.constEnd(); ++it) {
        root[it.key()] = it.value().toJson();
    }

    QDir().mkpath(QFileInfo(filePath_).absolutePath());
    QFile file(filePath_);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qWarning() << "ConnectionProfileStore: Cannot write" << filePath_ << file.errorString();
        return false;
    }

    file.write(QJsonDocument(root).toJson());
    return true;
}

std::optional<ConnectionProfile> ConnectionProfileStore::profile(const QString &name) const
{
    const auto it = profiles_.constFind(name);
    if (it == profiles_.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

bool ConnectionProfileStore::saveProfile(const ConnectionProfile &profile)
{
    if (profile.name.isEmpty()) {
        qWarning() << "ConnectionProfileStore: Refusing to save unnamed profile";
        return false;
    }

    profiles_.insert(profile.name, profile);
    emit profilesChanged();
    return save();
}

bool ConnectionProfileStore::removeProfile(const QString &name)
{
    if (!profiles_.remove(name)) {
        return false;
    }
    emit profilesChanged();
    return save();
}
