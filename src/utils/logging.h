/**
 * @file logging.h
 * @brief Simple logging utility with runtime verbose flag.
 */

#ifndef LOGGING_H
#define LOGGING_H

#include <QDebug>

namespace hyperftp {

/// Global verbose logging flag, set via --verbose command line argument
inline bool verboseLogging = false;

} // namespace hyperftp

/// Log only when verbose mode is enabled
#define LOG_VERBOSE() if (hyperftp::verboseLogging) qDebug()

#endif // LOGGING_H
