/**
 * @file ftpreply.h
 * @brief FTP control-connection reply and the reply reassembly state machine.
 */

#ifndef FTPREPLY_H
#define FTPREPLY_H

#include <QByteArray>
#include <QQueue>
#include <QString>
#include <QStringList>

/**
 * @brief One complete (possibly multi-line) reply from the server.
 */
struct FtpReply {
    int code = 0;        ///< Reply code taken from the terminating line
    QStringList lines;   ///< Raw reply lines without CRLF

    /**
     * @brief Returns the text of the terminating line after the code.
     */
    [[nodiscard]] QString text() const;

    /**
     * @brief Returns the text of all lines joined with newlines.
     *
     * Continuation lines that repeat the reply code have it stripped.
     */
    [[nodiscard]] QString message() const;

    // 1xx: Positive Preliminary
    // 2xx: Positive Completion
    // 3xx: Positive Intermediate
    // 4xx: Transient Negative
    // 5xx: Permanent Negative
    [[nodiscard]] bool isPreliminary() const { return code >= 100 && code < 200; }
    [[nodiscard]] bool isPositiveCompletion() const { return code >= 200 && code < 300; }
    [[nodiscard]] bool isIntermediate() const { return code >= 300 && code < 400; }
    [[nodiscard]] bool isNegative() const { return code >= 400; }
};

/**
 * @brief Reassembles control-connection bytes into complete replies.
 *
 * RFC 959 multi-line replies start with "ddd-" and end with the first line
 * that starts with the same code followed by a space. Lines in between may
 * look like anything, including other reply codes.
 *
 * @par Example usage:
 * @code
 * FtpReplyParser parser;
 * parser.feed(socket->readAll());
 * while (parser.hasReply()) {
 *     handleReply(parser.takeReply());
 * }
 * if (parser.hasError()) {
 *     // Stream is desynchronized, the connection must be dropped
 * }
 * @endcode
 */
class FtpReplyParser
{
public:
    static constexpr int ReplyCodeLength = 3;  ///< Length of FTP reply code
    static constexpr int MaxLineLength = 64 * 1024;  ///< Longest accepted line

    /**
     * @brief Appends received bytes and parses every complete line.
     * @param data Bytes read from the control socket.
     */
    void feed(const QByteArray &data);

    [[nodiscard]] bool hasReply() const { return !replies_.isEmpty(); }

    /**
     * @brief Removes and returns the oldest complete reply.
     */
    FtpReply takeReply();

    /**
     * @brief Checks if a malformed line was seen.
     *
     * Once set, the parser ignores further input until reset().
     */
    [[nodiscard]] bool hasError() const { return !error_.isEmpty(); }
    [[nodiscard]] QString errorString() const { return error_; }

    /**
     * @brief Checks if a multi-line reply is partially received.
     */
    [[nodiscard]] bool isInsideMultiLineReply() const { return multiLineCode_ != 0; }

    void reset();

private:
    void processLine(const QString &line);
    [[nodiscard]] static int parseCode(const QString &line);

    QByteArray buffer_;
    QQueue<FtpReply> replies_;
    int multiLineCode_ = 0;
    QStringList pendingLines_;
    QString error_;
};

#endif // FTPREPLY_H
