/**
 * @file ftplistingparser.h
 * @brief Parsers for MLSD and Unix-style LIST directory listings.
 */

#ifndef FTPLISTINGPARSER_H
#define FTPLISTINGPARSER_H

#include <QByteArray>
#include <QDateTime>
#include <QList>
#include <QString>

#include "remoteentry.h"

/**
 * @brief Turns raw directory-listing data into sorted RemoteEntry lists.
 *
 * Both parsers skip lines they cannot understand instead of failing the
 * whole listing. They only return false when the data contained lines but
 * not one of them was recognised.
 *
 * Results are sorted directories first, then by case-insensitive name.
 */
class FtpListingParser
{
public:
    static constexpr int UnixMinimumTokens = 9;  ///< perms links owner group size mon day time name
    static constexpr int UnixSizeToken = 4;
    static constexpr int UnixDateToken = 5;
    static constexpr int UnixNameToken = 8;

    /**
     * @brief Parses an RFC 3659 MLSD listing.
     * @param data Raw data-connection bytes.
     * @param entries Receives the sorted entries.
     * @return False if no line could be parsed.
     */
    [[nodiscard]] static bool parseMachineListing(const QByteArray &data, QList<RemoteEntry> &entries);

    /**
     * @brief Parses a Unix "ls -l" style LIST listing.
     * @param data Raw data-connection bytes.
     * @param entries Receives the sorted entries.
     * @param now Reference time for year-less dates (defaults to current UTC time).
     * @return False if no line could be parsed.
     */
    [[nodiscard]] static bool parseUnixListing(const QByteArray &data, QList<RemoteEntry> &entries,
                                               const QDateTime &now = QDateTime());

    /**
     * @brief Decodes an MLSD "modify" fact (YYYYMMDDHHMMSS[.fff], UTC).
     * @return Invalid QDateTime if the value is malformed.
     */
    [[nodiscard]] static QDateTime parseMachineTimestamp(const QString &value);

    /**
     * @brief Sorts directories first, then case-insensitively by name.
     */
    static void sortEntries(QList<RemoteEntry> &entries);

private:
    enum class LineResult { Entry, Skipped, Malformed };

    static LineResult parseMachineLine(const QString &line, RemoteEntry &entry);
    static LineResult parseUnixLine(const QString &line, const QDateTime &now, RemoteEntry &entry);
    static QDateTime parseUnixTimestamp(const QString &month, const QString &day,
                                        const QString &timeOrYear, const QDateTime &now);
    static QStringList splitLines(const QByteArray &data);
};

#endif // FTPLISTINGPARSER_H
