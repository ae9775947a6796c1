#include "ftpreply.h"

namespace {

QString stripCode(const QString &line, int code)
{
    const QString prefix = QString::number(code);
    if (line.startsWith(prefix) && line.length() >= FtpReplyParser::ReplyCodeLength) {
        return line.mid(FtpReplyParser::ReplyCodeLength + 1);
    }
    return line;
}

} // namespace

QString FtpReply::text() const
{
    if (lines.isEmpty()) {
        return QString();
    }
    return lines.last().mid(FtpReplyParser::ReplyCodeLength + 1);
}

QString FtpReply::message() const
{
    QStringList parts;
    parts.reserve(lines.size());
    for (const QString &line : lines) {
        parts.append(stripCode(line, code).trimmed());
    }
    return parts.join('\n');
}

void FtpReplyParser::feed(const QByteArray &data)
{
    if (hasError()) {
        return;
    }

    buffer_.append(data);

    int newline = buffer_.indexOf('\n');
    while (newline >= 0) {
        QByteArray raw = buffer_.left(newline);
        buffer_.remove(0, newline + 1);
        if (raw.endsWith('\r')) {
            raw.chop(1);
        }

        processLine(QString::fromUtf8(raw));
        if (hasError()) {
            return;
        }
        newline = buffer_.indexOf('\n');
    }

    if (buffer_.size() > MaxLineLength) {
        error_ = QStringLiteral("Reply line exceeds %1 bytes").arg(MaxLineLength);
    }
}

FtpReply FtpReplyParser::takeReply()
{
    if (replies_.isEmpty()) {
        return FtpReply();
    }
    return replies_.dequeue();
}

void FtpReplyParser::reset()
{
    buffer_.clear();
    replies_.clear();
    multiLineCode_ = 0;
    pendingLines_.clear();
    error_.clear();
}

int FtpReplyParser::parseCode(const QString &line)
{
    if (line.length() < ReplyCodeLength) {
        return 0;
    }
    for (int i = 0; i < ReplyCodeLength; ++i) {
        if (!line[i].isDigit()) {
            return 0;
        }
    }
    const int code = line.left(ReplyCodeLength).toInt();
    return (code >= 100 && code < 600) ? code : 0;
}

void FtpReplyParser::processLine(const QString &line)
{
    if (multiLineCode_ != 0) {
        pendingLines_.append(line);

        // Only "ddd " with the opening code terminates; "ddd-" and other
        // codes inside the block are plain text
        const bool terminates = parseCode(line) == multiLineCode_ &&
                                (line.length() == ReplyCodeLength ||
                                 line[ReplyCodeLength] == ' ');
        if (terminates) {
            FtpReply reply;
            reply.code = multiLineCode_;
            reply.lines = pendingLines_;
            replies_.enqueue(reply);
            pendingLines_.clear();
            multiLineCode_ = 0;
        }
        return;
    }

    if (line.isEmpty()) {
        // Some servers send a bare CRLF between replies
        return;
    }

    const int code = parseCode(line);
    if (code == 0) {
        error_ = QStringLiteral("Malformed reply line: '%1'").arg(line.left(80));
        return;
    }

    if (line.length() == ReplyCodeLength || line[ReplyCodeLength] == ' ') {
        FtpReply reply;
        reply.code = code;
        reply.lines.append(line);
        replies_.enqueue(reply);
    } else if (line[ReplyCodeLength] == '-') {
        multiLineCode_ = code;
        pendingLines_.append(line);
    } else {
        error_ = QStringLiteral("Malformed reply line: '%1'").arg(line.left(80));
    }
}
