#include "MockComponents.hpp"

namespace ReelSync {
namespace Test {

// FakeRemoteStore implementation
void FakeRemoteStore::setFailNextOpens(const QString& remoteKey, int count, SyncError error) {
    failOpens_[remoteKey] = count;
    failOpenErrors_[remoteKey] = error;
}

void FakeRemoteStore::resetCounters() {
    requests_.clear();
    bytesServed_ = 0;
}

void FakeRemoteStore::recordServed(qint64 bytes) {
    bytesServed_ += bytes;
    if (readObserver_) {
        readObserver_(bytesServed_);
    }
}

Expected<std::unique_ptr<RemoteStream>, SyncFailure> FakeRemoteStore::open(
    const RemotePart& part,
    const ByteRange& range,
    const CancellationToken& token) {
    requests_.append(Request{part.remoteKey, range});

    if (token.isCancelled()) {
        return makeUnexpected(SyncFailure{SyncError::Cancelled, "Transfer interrupted"});
    }

    if (failOpens_.value(part.remoteKey) > 0) {
        --failOpens_[part.remoteKey];
        return makeUnexpected(SyncFailure{failOpenErrors_.value(part.remoteKey),
                                          QString("Injected failure for %1").arg(part.remoteKey)});
    }

    if (!content_.contains(part.remoteKey)) {
        return makeUnexpected(SyncFailure{SyncError::NetworkError,
                                          QString("HTTP 404 Not Found for %1").arg(part.remoteKey)});
    }

    QByteArray body = content_.value(part.remoteKey);
    if (truncateAt_.contains(part.remoteKey)) {
        body.truncate(truncateAt_.value(part.remoteKey));
    }
    body = range.length < 0 ? body.mid(range.offset) : body.mid(range.offset, range.length);

    const qint64 failAfter = failAfter_.value(part.remoteKey, -1);
    return std::unique_ptr<RemoteStream>(std::make_unique<FakeRemoteStream>(this, body, failAfter, maxReadSize_));
}

// FakeRemoteStream implementation
FakeRemoteStream::FakeRemoteStream(FakeRemoteStore* store, QByteArray body, qint64 failAfter, qint64 maxReadSize)
    : store_(store)
    , body_(std::move(body))
    , failAfter_(failAfter)
    , maxReadSize_(maxReadSize) {
}

Expected<QByteArray, SyncFailure> FakeRemoteStream::read(qint64 maxBytes) {
    if (failAfter_ >= 0 && position_ >= failAfter_) {
        return makeUnexpected(SyncFailure{SyncError::NetworkError, "Connection reset by peer"});
    }

    qint64 count = qMin(maxBytes, body_.size() - position_);
    if (maxReadSize_ > 0) {
        count = qMin(count, maxReadSize_);
    }
    if (failAfter_ >= 0) {
        count = qMin(count, failAfter_ - position_);
    }

    const QByteArray chunk = body_.mid(position_, count);
    position_ += chunk.size();
    if (!chunk.isEmpty()) {
        store_->recordServed(chunk.size());
    }
    return chunk;
}

// RecordingProgressSink implementation
RecordingProgressSink::RecordingProgressSink(std::shared_ptr<SinkRecord> record)
    : record_(std::move(record)) {
}

void RecordingProgressSink::start(qint64 totalBytes, qint64 initialBytes) {
    record_->total = totalBytes;
    record_->initial = initialBytes;
    ++record_->startCount;
}

void RecordingProgressSink::advance(qint64 bytes) {
    record_->advanced += bytes;
    ++record_->advanceCount;
}

void RecordingProgressSink::finish(bool success) {
    record_->success = success;
    ++record_->finishCount;
}

// SinkRecorder implementation
ProgressSinkFactory SinkRecorder::factory() {
    return [this](const QString& label) -> std::unique_ptr<ProgressSink> {
        auto record = std::make_shared<SinkRecord>();
        record->label = label;
        records_.append(record);
        return std::make_unique<RecordingProgressSink>(record);
    };
}

} // namespace Test
} // namespace ReelSync
