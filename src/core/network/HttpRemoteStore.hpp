#pragma once

#include <QtCore/QObject>
#include <QtCore/QUrl>
#include <QtNetwork/QNetworkRequest>
#include <memory>
#include "RemoteStore.hpp"
#include "../common/Config.hpp"

namespace ReelSync {

/**
 * @brief RemoteStore over HTTP(S) using QNetworkAccessManager
 *
 * Each part is fetched with GET <baseUrl><remoteKey>; partial reads use a
 * Range header. Calls block the calling thread on a local event loop, so
 * the store must live in a thread with a Qt event dispatcher (normally the
 * main thread of a QCoreApplication). Streams must not outlive the store.
 */
class HttpRemoteStore : public QObject, public RemoteStore {
    Q_OBJECT

public:
    explicit HttpRemoteStore(const Config::ConnectionSettings& settings, QObject* parent = nullptr);
    ~HttpRemoteStore() override;

    Expected<std::unique_ptr<RemoteStream>, SyncFailure> open(
        const RemotePart& part,
        const ByteRange& range,
        const CancellationToken& token) override;

    Expected<QUrl, SyncFailure> urlFor(const RemotePart& part) const;
    QNetworkRequest buildRequest(const QUrl& url, const ByteRange& range) const;

    static QByteArray rangeHeader(const ByteRange& range);

private:
    struct HttpRemoteStorePrivate;
    std::unique_ptr<HttpRemoteStorePrivate> d;
};

} // namespace ReelSync
