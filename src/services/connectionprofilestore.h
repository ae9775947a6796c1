/**
 * @file connectionprofilestore.h
 * @brief Persists saved connection profiles as a JSON file.
 */

#ifndef CONNECTIONPROFILESTORE_H
#define CONNECTIONPROFILESTORE_H

#include <QMap>
#include <QObject>
#include <QString>
#include <QStringList>

#include <optional>

#include "connectionprofile.h"

/**
 * @brief Named connection profiles stored in one JSON object.
 *
 * The file maps each profile name to its ConnectionProfile::toJson() form.
 * Every change is written back immediately.
 *
 * @par Example usage:
 * @code
 * ConnectionProfileStore store;
 * store.load();
 * if (auto profile = store.profile("work")) {
 *     session->connectToServer(*profile);
 * }
 * @endcode
 */
class ConnectionProfileStore : public QObject
{
    Q_OBJECT

public:
    /**
     * @param filePath JSON file to use, defaultFilePath() if empty.
     * @param parent Optional parent QObject.
     */
    explicit ConnectionProfileStore(const QString &filePath = QString(), QObject *parent = nullptr);

    /**
     * @brief Returns connections.json in the application config directory.
     */
    [[nodiscard]] static QString defaultFilePath();

    [[nodiscard]] QString filePath() const { return filePath_; }

    /**
     * @brief Reads the file, replacing the profiles in memory.
     * @return False if the file exists but cannot be read or parsed.
     */
    bool load();

    /**
     * @brief Writes all profiles to the file.
     */
    bool save() const;

    /**
     * @brief Returns the profile names in alphabetical order.
     */
    [[nodiscard]] QStringList names() const { return profiles_.keys(); }
    [[nodiscard]] bool contains(const QString &name) const { return profiles_.contains(name); }
    [[nodiscard]] std::optional<ConnectionProfile> profile(const QString &name) const;

    /**
     * @brief Adds or replaces the profile stored under profile.name.
     */
    bool saveProfile(const ConnectionProfile &profile);
    bool removeProfile(const QString &name);

signals:
    void profilesChanged();

private:
    QString filePath_;
    QMap<QString, ConnectionProfile> profiles_;
};

#endif // CONNECTIONPROFILESTORE_H
