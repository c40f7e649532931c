#include "HttpRemoteStore.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QEventLoop>
#include <QtCore/QRegularExpression>
#include <QtCore/QTimer>
#include <QtNetwork/QNetworkAccessManager>
#include <QtNetwork/QNetworkReply>
#include <QtNetwork/QSslError>

namespace ReelSync {

namespace {

constexpr qint64 kReadBufferSize = 256 * 1024;
constexpr int kCancelPollMs = 100;

class HttpRemoteStream : public RemoteStream {
public:
    HttpRemoteStream(QNetworkReply* reply, int readTimeoutMs, const CancellationToken& token)
        : reply_(reply)
        , readTimeoutMs_(readTimeoutMs)
        , token_(token) {
        reply_->setReadBufferSize(kReadBufferSize);
    }

    ~HttpRemoteStream() override {
        if (reply_ && reply_->isRunning()) {
            reply_->abort();
        }
    }

    // Blocks until the status line and headers are in, then validates them
    // against the requested range.
    Expected<bool, SyncFailure> waitForHeaders(const ByteRange& range) {
        while (!reply_->attribute(QNetworkRequest::HttpStatusCodeAttribute).isValid()) {
            if (reply_->isFinished()) {
                return makeUnexpected(replyFailure());
            }
            auto waited = waitForActivity();
            if (waited.hasError()) {
                return makeUnexpected(waited.error());
            }
        }

        const int status = reply_->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        if (status < 200 || status >= 300) {
            const QString reason = reply_->attribute(QNetworkRequest::HttpReasonPhraseAttribute).toString();
            reply_->abort();
            return makeUnexpected(SyncFailure{SyncError::NetworkError,
                QString("HTTP %1 %2 for %3").arg(status).arg(reason, describe())});
        }

        if (range.offset > 0) {
            if (status != 206) {
                reply_->abort();
                return makeUnexpected(SyncFailure{SyncError::NetworkError,
                    QString("Server ignored range request from byte %1 for %2 (HTTP %3)")
                        .arg(range.offset).arg(describe()).arg(status)});
            }
            static const QRegularExpression contentRange(QStringLiteral("bytes (\\d+)-"));
            const auto match = contentRange.match(QString::fromLatin1(reply_->rawHeader("Content-Range")));
            if (match.hasMatch() && match.captured(1).toLongLong() != range.offset) {
                reply_->abort();
                return makeUnexpected(SyncFailure{SyncError::NetworkError,
                    QString("Server returned wrong content range %1, expected start %2")
                        .arg(QString::fromLatin1(reply_->rawHeader("Content-Range")))
                        .arg(range.offset)});
            }
        }

        return true;
    }

    Expected<QByteArray, SyncFailure> read(qint64 maxBytes) override {
        while (true) {
            if (token_.isCancelled()) {
                reply_->abort();
                return makeUnexpected(SyncFailure{SyncError::Cancelled, "Transfer interrupted"});
            }
            const qint64 available = reply_->bytesAvailable();
            if (available > 0) {
                return reply_->read(qMin(maxBytes, available));
            }
            if (reply_->isFinished()) {
                if (reply_->error() != QNetworkReply::NoError) {
                    return makeUnexpected(replyFailure());
                }
                return QByteArray();
            }
            auto waited = waitForActivity();
            if (waited.hasError()) {
                return makeUnexpected(waited.error());
            }
        }
    }

private:
    // Runs a local event loop until the reply makes progress, the read
    // timeout expires or the token is cancelled.
    Expected<bool, SyncFailure> waitForActivity() {
        QEventLoop loop;
        bool timedOut = false;

        QObject::connect(reply_.get(), &QIODevice::readyRead, &loop, &QEventLoop::quit);
        QObject::connect(reply_.get(), &QNetworkReply::metaDataChanged, &loop, &QEventLoop::quit);
        QObject::connect(reply_.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);

        QTimer timeoutTimer;
        timeoutTimer.setSingleShot(true);
        QObject::connect(&timeoutTimer, &QTimer::timeout, &loop, [&loop, &timedOut]() {
            timedOut = true;
            loop.quit();
        });

        QTimer cancelPoll;
        QObject::connect(&cancelPoll, &QTimer::timeout, &loop, [&loop, this]() {
            if (token_.isCancelled()) {
                loop.quit();
            }
        });

        timeoutTimer.start(readTimeoutMs_);
        cancelPoll.start(kCancelPollMs);
        loop.exec();

        if (token_.isCancelled()) {
            reply_->abort();
            return makeUnexpected(SyncFailure{SyncError::Cancelled, "Transfer interrupted"});
        }
        if (timedOut) {
            reply_->abort();
            REELSYNC_WARN("No data for {}ms from {}", readTimeoutMs_, describe().toStdString());
            return makeUnexpected(SyncFailure{SyncError::NetworkError,
                QString("Read timed out after %1 s for %2").arg(readTimeoutMs_ / 1000).arg(describe())});
        }
        return true;
    }

    SyncFailure replyFailure() const {
        return SyncFailure{SyncError::NetworkError,
            QString("%1 (%2)").arg(reply_->errorString(), describe())};
    }

    QString describe() const {
        return reply_->url().toString(QUrl::RemoveQuery | QUrl::RemoveUserInfo);
    }

    std::unique_ptr<QNetworkReply> reply_;
    int readTimeoutMs_;
    const CancellationToken& token_;
};

} // namespace

struct HttpRemoteStore::HttpRemoteStorePrivate {
    QNetworkAccessManager* networkManager = nullptr;
    Config::ConnectionSettings settings;
};

HttpRemoteStore::HttpRemoteStore(const Config::ConnectionSettings& settings, QObject* parent)
    : QObject(parent)
    , d(std::make_unique<HttpRemoteStorePrivate>()) {
    d->networkManager = new QNetworkAccessManager(this);
    d->networkManager->setRedirectPolicy(QNetworkRequest::NoLessSafeRedirectPolicy);
    d->settings = settings;

    REELSYNC_DEBUG("HttpRemoteStore ready for {}", settings.baseUrl.toStdString());
}

HttpRemoteStore::~HttpRemoteStore() = default;

Expected<QUrl, SyncFailure> HttpRemoteStore::urlFor(const RemotePart& part) const {
    QString base = d->settings.baseUrl.trimmed();
    while (base.endsWith(QLatin1Char('/'))) {
        base.chop(1);
    }
    QString key = part.remoteKey.trimmed();
    if (!key.startsWith(QLatin1Char('/'))) {
        key.prepend(QLatin1Char('/'));
    }

    QUrl url(base + key);
    if (!url.isValid() || (url.scheme() != "http" && url.scheme() != "https") || url.host().isEmpty()) {
        return makeUnexpected(SyncFailure{SyncError::NetworkError,
            QString("Invalid remote URL for part %1 (base URL '%2')").arg(part.remoteKey, base)});
    }
    return url;
}

QByteArray HttpRemoteStore::rangeHeader(const ByteRange& range) {
    if (range.length >= 0) {
        return "bytes=" + QByteArray::number(range.offset) + '-' +
               QByteArray::number(range.offset + range.length - 1);
    }
    return "bytes=" + QByteArray::number(range.offset) + '-';
}

QNetworkRequest HttpRemoteStore::buildRequest(const QUrl& url, const ByteRange& range) const {
    QNetworkRequest request(url);
    request.setRawHeader("User-Agent", d->settings.userAgent.toUtf8());
    request.setAttribute(QNetworkRequest::CacheLoadControlAttribute, QNetworkRequest::AlwaysNetwork);
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::NoLessSafeRedirectPolicy);

    if (!d->settings.token.isEmpty() && !d->settings.tokenHeader.isEmpty()) {
        request.setRawHeader(d->settings.tokenHeader.toUtf8(), d->settings.token.toUtf8());
    }
    if (!range.isFull()) {
        request.setRawHeader("Range", rangeHeader(range));
    }
    return request;
}

Expected<std::unique_ptr<RemoteStream>, SyncFailure> HttpRemoteStore::open(
    const RemotePart& part,
    const ByteRange& range,
    const CancellationToken& token) {

    if (range.length == 0) {
        return makeUnexpected(SyncFailure{SyncError::NetworkError, "Empty byte range requested"});
    }

    auto url = urlFor(part);
    if (url.hasError()) {
        return makeUnexpected(url.error());
    }

    REELSYNC_DEBUG("GET {} [{}]", url.value().toString(QUrl::RemoveQuery).toStdString(),
                   range.isFull() ? std::string("full") : rangeHeader(range).toStdString());

    QNetworkReply* reply = d->networkManager->get(buildRequest(url.value(), range));
    if (!reply) {
        return makeUnexpected(SyncFailure{SyncError::NetworkError, "Failed to create network reply"});
    }

    if (!d->settings.verifySsl) {
        connect(reply, &QNetworkReply::sslErrors, reply, [reply](const QList<QSslError>& errors) {
            REELSYNC_WARN("Ignoring {} SSL error(s) for {}", errors.size(),
                          reply->url().host().toStdString());
            reply->ignoreSslErrors();
        });
    }

    auto stream = std::make_unique<HttpRemoteStream>(reply, d->settings.readTimeoutSeconds * 1000, token);
    auto headers = stream->waitForHeaders(range);
    if (headers.hasError()) {
        REELSYNC_DEBUG("Open failed: {}", headers.error().message.toStdString());
        return makeUnexpected(headers.error());
    }

    return std::unique_ptr<RemoteStream>(std::move(stream));
}

} // namespace ReelSync
