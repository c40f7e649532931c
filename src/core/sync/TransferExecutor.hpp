#pragma once

#include <QtCore/QString>
#include "ProgressSink.hpp"
#include "SyncTypes.hpp"
#include "TransferPlan.hpp"
#include "../common/CancellationToken.hpp"
#include "../common/Expected.hpp"
#include "../network/RemoteStore.hpp"

namespace ReelSync {

/**
 * @brief Carries out a TransferPlan for one part
 *
 * Bytes are streamed from the remote to disk in chunks of at most
 * chunkSize; nothing is buffered whole. A failed or interrupted transfer
 * leaves the partial file in place so a later run can resume it.
 */
class TransferExecutor {
public:
    static constexpr qint64 kDefaultChunkSize = 64 * 1024;

    explicit TransferExecutor(RemoteStore& store, qint64 chunkSize = kDefaultChunkSize);

    // Returns the number of bytes written by this call
    Expected<qint64, SyncFailure> transfer(const RemotePart& part,
                                           const QString& destinationPath,
                                           const TransferPlan& plan,
                                           ProgressSink& sink,
                                           const CancellationToken& token);

private:
    Expected<qint64, SyncFailure> streamToFile(const RemotePart& part,
                                               const QString& destinationPath,
                                               qint64 offset,
                                               ProgressSink& sink,
                                               const CancellationToken& token);

    RemoteStore& store_;
    qint64 chunkSize_;
};

} // namespace ReelSync
