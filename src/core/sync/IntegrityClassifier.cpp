#include "IntegrityClassifier.hpp"
#include "../common/Logger.hpp"
#include "../common/RetryManager.hpp"

#include <QtCore/QFileInfo>

namespace ReelSync {

IntegrityClassifier::IntegrityClassifier(RemoteStore& store, const Config::TransferSettings& settings)
    : store_(store)
    , settings_(settings) {
}

Expected<TransferPlan, SyncFailure> IntegrityClassifier::classify(const QString& localPath,
                                                                  const RemotePart& part,
                                                                  const CancellationToken& token) {
    const QFileInfo info(localPath);
    if (!info.exists()) {
        return TransferPlan::redownload(part.declaredSize, false);
    }
    if (!info.isFile()) {
        return makeUnexpected(SyncFailure{SyncError::FilesystemError,
            QString("%1 exists but is not a regular file").arg(localPath)});
    }

    const qint64 localSize = info.size();
    if (localSize == part.declaredSize) {
        return TransferPlan::skip();
    }
    if (localSize == 0) {
        return TransferPlan::resume(0, part.declaredSize);
    }
    if (localSize > part.declaredSize) {
        REELSYNC_DEBUG("{} is larger than the remote ({} > {})", localPath.toStdString(),
                       localSize, part.declaredSize);
        return TransferPlan::redownload(part.declaredSize, true);
    }

    QFile local(localPath);
    if (!local.open(QIODevice::ReadOnly)) {
        return makeUnexpected(SyncFailure{SyncError::FilesystemError,
            QString("Cannot read %1: %2").arg(localPath, local.errorString())});
    }

    const qint64 window = qMin(settings_.probeBytes, localSize);

    RetryManager retryManager(RetryConfigs::probe(settings_.probeAttempts,
                                                  std::chrono::milliseconds(settings_.probeRetryDelayMs)),
                              token);
    SyncFailure lastFailure;
    auto result = retryManager.execute<bool, SyncFailure>(
        [&]() { return compareHead(local, part, window, token); },
        [&](const SyncFailure& failure) {
            lastFailure = failure;
            if (failure.error != SyncError::NetworkError || token.isCancelled()) {
                return false;
            }
            REELSYNC_WARN("Head-sample probe attempt {} for {} failed: {}",
                          retryManager.getCurrentAttempt(), part.sourcePath.toStdString(),
                          failure.message.toStdString());
            return true;
        });

    if (result.hasError()) {
        if (token.isCancelled()) {
            return makeUnexpected(SyncFailure{SyncError::Cancelled, "Interrupted during head-sample probe"});
        }
        if (result.error() == RetryError::MaxAttemptsExceeded) {
            REELSYNC_WARN("Could not verify {}, downloading it again: {}",
                          localPath.toStdString(), lastFailure.message.toStdString());
            return TransferPlan::redownload(part.declaredSize, true, true);
        }
        return makeUnexpected(lastFailure);
    }

    if (result.value()) {
        REELSYNC_DEBUG("{} matches the remote head, resuming at {}", localPath.toStdString(), localSize);
        return TransferPlan::resume(localSize, part.declaredSize);
    }

    REELSYNC_DEBUG("{} differs from the remote, marking stale", localPath.toStdString());
    return TransferPlan::redownload(part.declaredSize, true);
}

Expected<bool, SyncFailure> IntegrityClassifier::compareHead(QFile& local,
                                                            const RemotePart& part,
                                                            qint64 window,
                                                            const CancellationToken& token) {
    if (!local.seek(0)) {
        return makeUnexpected(SyncFailure{SyncError::FilesystemError,
            QString("Cannot seek in %1: %2").arg(local.fileName(), local.errorString())});
    }

    auto stream = store_.open(part, ByteRange::head(window), token);
    if (stream.hasError()) {
        return makeUnexpected(stream.error());
    }

    qint64 compared = 0;
    while (compared < window) {
        if (token.isCancelled()) {
            return makeUnexpected(SyncFailure{SyncError::Cancelled, "Interrupted during head-sample probe"});
        }

        auto remote = stream.value()->read(qMin(settings_.chunkSize, window - compared));
        if (remote.hasError()) {
            return makeUnexpected(remote.error());
        }
        const QByteArray& remoteChunk = remote.value();
        if (remoteChunk.isEmpty()) {
            REELSYNC_DEBUG("Remote body for {} ended after {} of {} sample bytes",
                           part.sourcePath.toStdString(), compared, window);
            return false;
        }

        const QByteArray localChunk = local.read(remoteChunk.size());
        if (localChunk.size() != remoteChunk.size()) {
            return makeUnexpected(SyncFailure{SyncError::FilesystemError,
                QString("Short read from %1: %2").arg(local.fileName(), local.errorString())});
        }
        if (localChunk != remoteChunk) {
            return false;
        }
        compared += remoteChunk.size();
    }

    return true;
}

} // namespace ReelSync
