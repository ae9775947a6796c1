/**
 * @file errorhandler.h
 * @brief Centralized error reporting for the front end.
 *
 * Maps FtpError values to a category and severity, logs them and forwards
 * a user-facing message, so every front end reports failures the same way.
 */

#ifndef ERRORHANDLER_H
#define ERRORHANDLER_H

#include <QObject>
#include <QString>

#include "ftperror.h"

/**
 * @brief Categories of errors for appropriate handling.
 */
enum class ErrorCategory {
    Connection,     ///< Connect, login, TLS and lost-session errors
    FileOperation,  ///< Transfer, listing and remote file management errors
    Validation,     ///< Input validation, configuration errors
    System          ///< General system/application errors
};

/**
 * @brief Severity levels determining how errors are presented.
 */
enum class ErrorSeverity {
    Info,      ///< Informational - status line only, short timeout
    Warning,   ///< Warning - status line, longer timeout
    Critical   ///< Critical - status line and criticalError()
};

/**
 * @brief Centralized error reporting service.
 *
 * @par Example usage:
 * @code
 * ErrorHandler *handler = new ErrorHandler(this);
 *
 * connect(session, &SessionManager::connectionFailed,
 *         handler, &ErrorHandler::handleConnectionError);
 * connect(session, &SessionManager::operationFailed,
 *         handler, &ErrorHandler::handleFtpError);
 *
 * handler->handleError(ErrorCategory::Validation,
 *                      ErrorSeverity::Warning,
 *                      "Invalid port",
 *                      "Port must be between 1 and 65535");
 * @endcode
 */
class ErrorHandler : public QObject
{
    Q_OBJECT

public:
    explicit ErrorHandler(QObject *parent = nullptr);
    ~ErrorHandler() override = default;

    /**
     * @brief Handles an error with specified category and severity.
     * @param category The error category.
     * @param severity The error severity.
     * @param title Short error title/summary.
     * @param details Detailed error message.
     */
    void handleError(ErrorCategory category,
                     ErrorSeverity severity,
                     const QString &title,
                     const QString &details = QString());

    /**
     * @brief Handles an FtpError with the category and severity it maps to.
     *
     * NoError values are ignored.
     */
    void handleFtpError(const FtpError &error);

    /**
     * @brief Handles a session-level error (always critical).
     */
    void handleConnectionError(const FtpError &error);

    [[nodiscard]] static ErrorCategory categoryFor(const FtpError &error);
    [[nodiscard]] static ErrorSeverity severityFor(const FtpError &error);

    [[nodiscard]] static QString categoryToString(ErrorCategory category);
    [[nodiscard]] static QString severityToString(ErrorSeverity severity);

signals:
    /**
     * @brief Emitted to display a status message.
     * @param message The message text.
     * @param timeout Display timeout in milliseconds (0 for no timeout).
     */
    void statusMessage(const QString &message, int timeout);

    /**
     * @brief Emitted for critical errors that need the user's attention.
     */
    void criticalError(const QString &title, const QString &message);

    /**
     * @brief Emitted when an error is logged (for debugging/monitoring).
     */
    void errorLogged(ErrorCategory category,
                     ErrorSeverity severity,
                     const QString &title,
                     const QString &details);

private:
    void logError(ErrorCategory category,
                  ErrorSeverity severity,
                  const QString &title,
                  const QString &details);

    [[nodiscard]] static int timeoutForSeverity(ErrorSeverity severity);
    [[nodiscard]] static QString titleFor(const FtpError &error);
};

#endif // ERRORHANDLER_H
