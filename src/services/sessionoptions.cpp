#include "sessionoptions.h"

#include <QSettings>

#include <algorithm>

void SessionOptions::normalize()
{
    connectTimeoutMs = std::max(1, connectTimeoutMs);
    replyTimeoutMs = std::max(1, replyTimeoutMs);
    abortTimeoutMs = std::max(1, abortTimeoutMs);
    if (chunkSize <= 0) {
        chunkSize = DefaultChunkSize;
    }
    maxConcurrentTransfers = std::clamp(maxConcurrentTransfers, 1, MaxConcurrentTransfersLimit);
}

void SessionOptions::load(QSettings &settings)
{
    connectTimeoutMs = settings.value("network/connectTimeoutMs", connectTimeoutMs).toInt();
    replyTimeoutMs = settings.value("network/replyTimeoutMs", replyTimeoutMs).toInt();
    abortTimeoutMs = settings.value("network/abortTimeoutMs", abortTimeoutMs).toInt();
    verifyPeerCertificates = settings.value("network/verifyPeerCertificates",
                                            verifyPeerCertificates).toBool();
    chunkSize = settings.value("transfer/chunkSize", chunkSize).toLongLong();
    maxConcurrentTransfers = settings.value("transfer/maxConcurrentTransfers",
                                            maxConcurrentTransfers).toInt();
    normalize();
}

void SessionOptions::save(QSettings &settings) const
{
    settings.setValue("network/connectTimeoutMs", connectTimeoutMs);
    settings.setValue("network/replyTimeoutMs", replyTimeoutMs);
    settings.setValue("network/abortTimeoutMs", abortTimeoutMs);
    settings.setValue("network/verifyPeerCertificates", verifyPeerCertificates);
    settings.setValue("transfer/chunkSize", chunkSize);
    settings.setValue("transfer/maxConcurrentTransfers", maxConcurrentTransfers);
}
