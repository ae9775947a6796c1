#include "ftplistingparser.h"

#include <QHash>
#include <QRegularExpression>
#include <QTimeZone>

#include <algorithm>

#include "utils/logging.h"

namespace {

const QStringList MonthNames = {
    "jan", "feb", "mar", "apr", "may", "jun",
    "jul", "aug", "sep", "oct", "nov", "dec"
};

bool isSelfOrParent(const QString &name)
{
    return name == QLatin1String(".") || name == QLatin1String("..");
}

} // namespace

QStringList FtpListingParser::splitLines(const QByteArray &data)
{
    QStringList lines;
    const QStringList rawLines = QString::fromUtf8(data).split('\n');
    for (QString line : rawLines) {
        if (line.endsWith('\r')) {
            line.chop(1);
        }
        if (!line.trimmed().isEmpty()) {
            lines.append(line);
        }
    }
    return lines;
}

bool FtpListingParser::parseMachineListing(const QByteArray &data, QList<RemoteEntry> &entries)
{
    entries.clear();
    const QStringList lines = splitLines(data);
    int recognised = 0;

    for (const QString &line : lines) {
        RemoteEntry entry;
        switch (parseMachineLine(line, entry)) {
        case LineResult::Entry:
            entries.append(entry);
            ++recognised;
            break;
        case LineResult::Skipped:
            ++recognised;
            break;
        case LineResult::Malformed:
            LOG_VERBOSE() << "FTP: Skipping malformed MLSD line:" << line;
            break;
        }
    }

    sortEntries(entries);
    return lines.isEmpty() || recognised > 0;
}

FtpListingParser::LineResult FtpListingParser::parseMachineLine(const QString &line, RemoteEntry &entry)
{
    // type=file;size=4;modify=20170113063314;UNIX.mode=0600; readme.txt
    const QString trimmed = line.startsWith(' ') ? line.mid(1) : line;
    const int blank = trimmed.indexOf(' ');
    if (blank <= 0) {
        return LineResult::Malformed;
    }

    entry.name = trimmed.mid(blank + 1);
    if (entry.name.isEmpty()) {
        return LineResult::Malformed;
    }

    QHash<QString, QString> facts;
    const QStringList parts = trimmed.left(blank).split(';', Qt::SkipEmptyParts);
    for (const QString &fact : parts) {
        const int eq = fact.indexOf('=');
        if (eq <= 0) {
            return LineResult::Malformed;
        }
        facts.insert(fact.left(eq).toLower(), fact.mid(eq + 1));
    }
    if (facts.isEmpty()) {
        return LineResult::Malformed;
    }

    const QString type = facts.value(QStringLiteral("type")).toLower();
    if (type == QLatin1String("cdir") || type == QLatin1String("pdir") || isSelfOrParent(entry.name)) {
        return LineResult::Skipped;
    }

    if (type == QLatin1String("dir")) {
        entry.kind = RemoteEntry::Kind::Directory;
    } else if (type.startsWith(QLatin1String("os.unix=slink")) ||
               type.startsWith(QLatin1String("os.unix=symlink"))) {
        entry.kind = RemoteEntry::Kind::SymlinkUnknown;
    } else {
        entry.kind = RemoteEntry::Kind::File;
    }

    if (entry.kind != RemoteEntry::Kind::Directory) {
        bool ok = false;
        const qint64 size = facts.value(QStringLiteral("size")).toLongLong(&ok);
        entry.size = (ok && size >= 0) ? size : 0;
    }

    const auto modify = facts.constFind(QStringLiteral("modify"));
    if (modify != facts.constEnd()) {
        entry.modifiedText = modify.value();
        entry.modified = parseMachineTimestamp(modify.value());
    }

    entry.permissions = facts.value(QStringLiteral("unix.mode"));
    return LineResult::Entry;
}

QDateTime FtpListingParser::parseMachineTimestamp(const QString &value)
{
    // Fractional seconds are allowed but ignored
    const QString digits = value.section('.', 0, 0);
    static const QRegularExpression rx("^(\\d{4})(\\d{2})(\\d{2})(\\d{2})(\\d{2})(\\d{2})$");
    const auto match = rx.match(digits);
    if (!match.hasMatch()) {
        return QDateTime();
    }

    const QDate date(match.captured(1).toInt(), match.captured(2).toInt(), match.captured(3).toInt());
    const QTime time(match.captured(4).toInt(), match.captured(5).toInt(), match.captured(6).toInt());
    if (!date.isValid() || !time.isValid()) {
        return QDateTime();
    }
    return QDateTime(date, time, QTimeZone::utc());
}

bool FtpListingParser::parseUnixListing(const QByteArray &data, QList<RemoteEntry> &entries,
                                        const QDateTime &now)
{
    entries.clear();
    const QDateTime reference = now.isValid() ? now.toUTC() : QDateTime::currentDateTimeUtc();
    const QStringList lines = splitLines(data);
    int recognised = 0;

    for (const QString &line : lines) {
        RemoteEntry entry;
        switch (parseUnixLine(line, reference, entry)) {
        case LineResult::Entry:
            entries.append(entry);
            ++recognised;
            break;
        case LineResult::Skipped:
            ++recognised;
            break;
        case LineResult::Malformed:
            LOG_VERBOSE() << "FTP: Skipping malformed LIST line:" << line;
            break;
        }
    }

    sortEntries(entries);
    return lines.isEmpty() || recognised > 0;
}

FtpListingParser::LineResult FtpListingParser::parseUnixLine(const QString &line, const QDateTime &now,
                                                             RemoteEntry &entry)
{
    // drwxr-xr-x 2 user group 4096 Jan 1 12:00 dirname
    static const QRegularExpression tokenRx("\\S+");

    QStringList tokens;
    QList<int> starts;
    auto it = tokenRx.globalMatch(line);
    while (it.hasNext()) {
        const auto match = it.next();
        tokens.append(match.captured(0));
        starts.append(match.capturedStart(0));
    }

    if (tokens.size() == 2 && tokens[0].compare(QLatin1String("total"), Qt::CaseInsensitive) == 0) {
        return LineResult::Skipped;
    }
    if (tokens.size() < UnixMinimumTokens) {
        return LineResult::Malformed;
    }

    const QString &perms = tokens[0];
    const QChar type = perms[0];
    if (!QStringLiteral("-dlbcps").contains(type)) {
        return LineResult::Malformed;
    }

    bool ok = false;
    const qint64 size = tokens[UnixSizeToken].toLongLong(&ok);
    if (!ok || size < 0) {
        return LineResult::Malformed;
    }

    entry.name = line.mid(starts[UnixNameToken]);
    if (type == 'l') {
        const int arrow = entry.name.indexOf(QLatin1String(" -> "));
        if (arrow > 0) {
            entry.name.truncate(arrow);
        }
        entry.kind = RemoteEntry::Kind::SymlinkUnknown;
    } else if (type == 'd') {
        entry.kind = RemoteEntry::Kind::Directory;
    } else {
        entry.kind = RemoteEntry::Kind::File;
    }

    if (isSelfOrParent(entry.name)) {
        return LineResult::Skipped;
    }

    entry.size = entry.kind == RemoteEntry::Kind::Directory ? 0 : size;
    entry.permissions = perms.mid(1);
    entry.modifiedText = QStringList(tokens.mid(UnixDateToken, 3)).join(' ');
    entry.modified = parseUnixTimestamp(tokens[UnixDateToken], tokens[UnixDateToken + 1],
                                        tokens[UnixDateToken + 2], now);
    return LineResult::Entry;
}

QDateTime FtpListingParser::parseUnixTimestamp(const QString &month, const QString &day,
                                               const QString &timeOrYear, const QDateTime &now)
{
    const int monthIndex = MonthNames.indexOf(month.toLower());
    bool ok = false;
    const int dayNumber = day.toInt(&ok);
    if (monthIndex < 0 || !ok || dayNumber < 1 || dayNumber > 31) {
        return QDateTime();
    }

    if (timeOrYear.contains(':')) {
        const QTime time = QTime::fromString(timeOrYear, QStringLiteral("H:mm"));
        if (!time.isValid()) {
            return QDateTime();
        }
        // Year-less dates are within the last six months; one day of
        // tolerance covers server time zones
        QDateTime result(QDate(now.date().year(), monthIndex + 1, dayNumber), time, QTimeZone::utc());
        if (result.isValid() && result > now.addDays(1)) {
            result = QDateTime(QDate(now.date().year() - 1, monthIndex + 1, dayNumber), time, QTimeZone::utc());
        }
        return result;
    }

    const int year = timeOrYear.toInt(&ok);
    if (!ok || timeOrYear.length() != 4) {
        return QDateTime();
    }
    const QDate date(year, monthIndex + 1, dayNumber);
    return date.isValid() ? QDateTime(date, QTime(0, 0), QTimeZone::utc()) : QDateTime();
}

void FtpListingParser::sortEntries(QList<RemoteEntry> &entries)
{
    std::stable_sort(entries.begin(), entries.end(),
                     [](const RemoteEntry &a, const RemoteEntry &b) {
        if (a.isDirectory() != b.isDirectory()) {
            return a.isDirectory();
        }
        const int cmp = QString::compare(a.name, b.name, Qt::CaseInsensitive);
        if (cmp != 0) {
            return cmp < 0;
        }
        return a.name < b.name;
    });
}
