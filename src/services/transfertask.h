/**
 * @file transfertask.h
 * @brief A single upload or download and its progress.
 */

#ifndef TRANSFERTASK_H
#define TRANSFERTASK_H

#include <QMetaType>
#include <QString>

#include "ftperror.h"

struct TransferTask {
    enum class Direction { Upload, Download };

    /**
     * @brief Coarse status exposed to observers.
     */
    enum class Status { Pending, Running, Succeeded, Failed, Cancelled };

    /**
     * @brief Engine state machine position.
     */
    enum class State { Pending, Opening, Streaming, Finalizing, Succeeded, Failed, Cancelled };

    int id = 0;
    Direction direction = Direction::Upload;
    QString localPath;
    QString remotePath;
    qint64 totalBytes = -1;        ///< -1 if unknown; fixed once known
    qint64 bytesTransferred = 0;   ///< Non-decreasing while running
    State state = State::Pending;
    FtpError error;                ///< Set when state is Failed

    [[nodiscard]] Status status() const
    {
        switch (state) {
        case State::Pending: return Status::Pending;
        case State::Opening:
        case State::Streaming:
        case State::Finalizing: return Status::Running;
        case State::Succeeded: return Status::Succeeded;
        case State::Failed: return Status::Failed;
        case State::Cancelled: return Status::Cancelled;
        }
        return Status::Pending;
    }

    [[nodiscard]] bool isTerminal() const
    {
        return state == State::Succeeded || state == State::Failed || state == State::Cancelled;
    }

    [[nodiscard]] bool isUpload() const { return direction == Direction::Upload; }

    [[nodiscard]] static const char *stateToString(State state)
    {
        switch (state) {
        case State::Pending: return "Pending";
        case State::Opening: return "Opening";
        case State::Streaming: return "Streaming";
        case State::Finalizing: return "Finalizing";
        case State::Succeeded: return "Succeeded";
        case State::Failed: return "Failed";
        case State::Cancelled: return "Cancelled";
        }
        return "Unknown";
    }

    [[nodiscard]] static QString statusToString(Status status)
    {
        switch (status) {
        case Status::Pending: return QStringLiteral("Pending");
        case Status::Running: return QStringLiteral("Running");
        case Status::Succeeded: return QStringLiteral("Succeeded");
        case Status::Failed: return QStringLiteral("Failed");
        case Status::Cancelled: return QStringLiteral("Cancelled");
        }
        return QString();
    }
};

Q_DECLARE_METATYPE(TransferTask)
Q_DECLARE_METATYPE(TransferTask::Status)
Q_DECLARE_METATYPE(TransferTask::State)

#endif // TRANSFERTASK_H
