#include "TransferExecutor.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>

namespace ReelSync {

TransferExecutor::TransferExecutor(RemoteStore& store, qint64 chunkSize)
    : store_(store)
    , chunkSize_(chunkSize > 0 ? chunkSize : kDefaultChunkSize) {
}

Expected<qint64, SyncFailure> TransferExecutor::transfer(const RemotePart& part,
                                                         const QString& destinationPath,
                                                         const TransferPlan& plan,
                                                         ProgressSink& sink,
                                                         const CancellationToken& token) {
    return std::visit(Overloaded{
        [](const Skip&) -> Expected<qint64, SyncFailure> {
            return qint64(0);
        },
        [&](const ResumeFrom& resume) -> Expected<qint64, SyncFailure> {
            return streamToFile(part, destinationPath, resume.offset, sink, token);
        },
        [&](const Redownload&) -> Expected<qint64, SyncFailure> {
            return streamToFile(part, destinationPath, 0, sink, token);
        }
    }, plan.action);
}

Expected<qint64, SyncFailure> TransferExecutor::streamToFile(const RemotePart& part,
                                                             const QString& destinationPath,
                                                             qint64 offset,
                                                             ProgressSink& sink,
                                                             const CancellationToken& token) {
    if (offset > part.declaredSize) {
        return makeUnexpected(SyncFailure{SyncError::NetworkError,
            QString("Resume offset %1 is past the declared size %2").arg(offset).arg(part.declaredSize)});
    }

    const QDir parent = QFileInfo(destinationPath).absoluteDir();
    if (!parent.exists() && !QDir().mkpath(parent.absolutePath())) {
        return makeUnexpected(SyncFailure{SyncError::FilesystemError,
            QString("Cannot create directory %1").arg(parent.absolutePath())});
    }

    QFile file(destinationPath);
    const QIODevice::OpenMode mode = offset > 0
        ? (QIODevice::WriteOnly | QIODevice::Append)
        : (QIODevice::WriteOnly | QIODevice::Truncate);
    if (!file.open(mode)) {
        return makeUnexpected(SyncFailure{SyncError::FilesystemError,
            QString("Cannot open %1 for writing: %2").arg(destinationPath, file.errorString())});
    }
    if (file.size() != offset) {
        return makeUnexpected(SyncFailure{SyncError::FilesystemError,
            QString("%1 changed size since it was checked (%2, expected %3)")
                .arg(destinationPath).arg(file.size()).arg(offset)});
    }

    REELSYNC_DEBUG("Transferring {} to {} from byte {}", part.remoteKey.toStdString(),
                   destinationPath.toStdString(), offset);

    sink.start(part.declaredSize, offset);

    auto stream = store_.open(part, offset > 0 ? ByteRange::from(offset) : ByteRange(), token);
    if (stream.hasError()) {
        sink.finish(false);
        return makeUnexpected(stream.error());
    }

    qint64 written = 0;
    while (true) {
        if (token.isCancelled()) {
            file.flush();
            sink.finish(false);
            return makeUnexpected(SyncFailure{SyncError::Cancelled,
                QString("Interrupted after %1 bytes of %2").arg(offset + written).arg(destinationPath)});
        }

        auto chunk = stream.value()->read(chunkSize_);
        if (chunk.hasError()) {
            file.flush();
            sink.finish(false);
            return makeUnexpected(chunk.error());
        }
        const QByteArray& data = chunk.value();
        if (data.isEmpty()) {
            break;
        }

        if (offset + written + data.size() > part.declaredSize) {
            file.flush();
            sink.finish(false);
            return makeUnexpected(SyncFailure{SyncError::NetworkError,
                QString("Remote sent more than the declared %1 bytes for %2")
                    .arg(part.declaredSize).arg(part.remoteKey)});
        }

        const qint64 count = file.write(data);
        if (count != data.size()) {
            sink.finish(false);
            return makeUnexpected(SyncFailure{SyncError::FilesystemError,
                QString("Short write to %1: %2").arg(destinationPath, file.errorString())});
        }

        written += count;
        sink.advance(count);
    }

    if (!file.flush()) {
        sink.finish(false);
        return makeUnexpected(SyncFailure{SyncError::FilesystemError,
            QString("Cannot flush %1: %2").arg(destinationPath, file.errorString())});
    }
    file.close();

    if (offset + written != part.declaredSize) {
        sink.finish(false);
        return makeUnexpected(SyncFailure{SyncError::NetworkError,
            QString("Received %1 of %2 bytes for %3")
                .arg(offset + written).arg(part.declaredSize).arg(part.remoteKey)});
    }

    sink.finish(true);
    return written;
}

} // namespace ReelSync
