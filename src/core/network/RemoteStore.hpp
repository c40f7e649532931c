#pragma once

#include <QtCore/QByteArray>
#include <memory>
#include "../common/CancellationToken.hpp"
#include "../common/Expected.hpp"
#include "../sync/SyncTypes.hpp"

namespace ReelSync {

// Byte range [offset, offset + length); length < 0 means "to the end"
struct ByteRange {
    qint64 offset = 0;
    qint64 length = -1;

    bool isFull() const { return offset == 0 && length < 0; }
    static ByteRange from(qint64 offset) { return ByteRange{offset, -1}; }
    static ByteRange head(qint64 length) { return ByteRange{0, length}; }
};

/**
 * @brief An open response body, consumed in bounded chunks
 *
 * read() returns at most maxBytes. An empty array means the body ended
 * cleanly; transport failures and timeouts are reported as errors.
 */
class RemoteStream {
public:
    virtual ~RemoteStream() = default;
    virtual Expected<QByteArray, SyncFailure> read(qint64 maxBytes) = 0;
};

/**
 * @brief Source of part bytes
 *
 * Implementations attach whatever authentication the caller configured;
 * the sync core only passes the part and the byte range.
 */
class RemoteStore {
public:
    virtual ~RemoteStore() = default;

    virtual Expected<std::unique_ptr<RemoteStream>, SyncFailure> open(
        const RemotePart& part,
        const ByteRange& range,
        const CancellationToken& token) = 0;
};

} // namespace ReelSync
