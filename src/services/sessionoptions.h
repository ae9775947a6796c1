/**
 * @file sessionoptions.h
 * @brief Tunables shared by control channels, data channels and transfers.
 */

#ifndef SESSIONOPTIONS_H
#define SESSIONOPTIONS_H

#include <QtGlobal>

class QSettings;

struct SessionOptions {
    static constexpr int DefaultConnectTimeoutMs = 30000;
    static constexpr int DefaultReplyTimeoutMs = 30000;
    static constexpr int DefaultAbortTimeoutMs = 5000;
    static constexpr qint64 DefaultChunkSize = 8192;
    static constexpr int DefaultMaxConcurrentTransfers = 4;
    static constexpr int MaxConcurrentTransfersLimit = 8;

    int connectTimeoutMs = DefaultConnectTimeoutMs;
    int replyTimeoutMs = DefaultReplyTimeoutMs;       ///< Per-reply deadline on the control connection
    int abortTimeoutMs = DefaultAbortTimeoutMs;       ///< Deadline for draining ABOR replies
    qint64 chunkSize = DefaultChunkSize;              ///< Bytes per data-connection read/write
    int maxConcurrentTransfers = DefaultMaxConcurrentTransfers;
    bool verifyPeerCertificates = false;              ///< Reject self-signed FTPS certificates

    /**
     * @brief Clamps every value into its accepted range.
     */
    void normalize();

    /**
     * @brief Reads options from the "network/" and "transfer/" groups.
     *
     * Missing keys keep their current values.
     */
    void load(QSettings &settings);
    void save(QSettings &settings) const;
};

#endif // SESSIONOPTIONS_H
