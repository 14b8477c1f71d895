#include "StreamHttpServer.hpp"
#include "JsonViews.hpp"
#include "../core/common/CancelToken.hpp"
#include "../core/common/IoThreadPool.hpp"
#include "../core/common/Logger.hpp"
#include "../core/media/TranscodePool.hpp"
#include "../core/security/RateLimiter.hpp"
#include "../core/storage/CatalogStore.hpp"
#include "../core/streaming/ConnectionStatus.hpp"
#include "../core/streaming/StreamMultiplexer.hpp"
#include "../core/streaming/WatcherRegistry.hpp"
#include "../core/torrent/MagnetUri.hpp"
#include "../core/torrent/MetadataResolver.hpp"

#include <QtConcurrent/QtConcurrent>
#include <QtCore/QElapsedTimer>
#include <QtCore/QJsonDocument>
#include <QtNetwork/QHostAddress>

namespace Swarmcast {

namespace {

constexpr qint64 kWriteBudgetBytes = 4 * 1024 * 1024;
constexpr int kHeaderTimeoutMs = 30000;
constexpr qint64 kPumpChunkBytes = 256 * 1024;
constexpr int kStatusWaitSliceMs = 1000;

const QByteArray kExposedHeaders =
    "Content-Length, Content-Range, Accept-Ranges, X-Watcher-Id, X-Transcoded, X-Transcode-Mode";

QString identifierOf(const HttpRequest& request) {
    const QString magnet = request.queryValue("magnet");
    return magnet.isEmpty() ? request.queryValue("infohash") : magnet;
}

/// fileIndex query parameter; defaults to 0, nullopt when malformed
std::optional<int> fileIndexOf(const HttpRequest& request) {
    const QString text = request.queryValue("fileIndex");
    if (text.isEmpty()) {
        return 0;
    }
    bool ok = false;
    const int index = text.toInt(&ok);
    if (!ok || index < 0) {
        return std::nullopt;
    }
    return index;
}

QJsonObject routeError(const QString& code, const QString& message) {
    QJsonObject json;
    json["error"] = code;
    json["message"] = message;
    json["retryable"] = false;
    return json;
}

} // namespace

StreamHttpServer::StreamHttpServer(const ServerServices& services, const Config::ServerSettings& settings,
                                   QObject* parent)
    : QObject(parent)
    , services_(services)
    , settings_(settings)
    , server_(new QTcpServer(this)) {
    connect(server_, &QTcpServer::newConnection, this, &StreamHttpServer::onNewConnection);
}

StreamHttpServer::~StreamHttpServer() {
    close();
}

Expected<quint16, QString> StreamHttpServer::listen() {
    QHostAddress address;
    if (settings_.host.isEmpty() || !address.setAddress(settings_.host)) {
        address = QHostAddress::Any;
    }
    if (!server_->listen(address, static_cast<quint16>(settings_.port))) {
        SWARMCAST_ERROR("Cannot listen on {}:{}: {}", settings_.host.toStdString(), settings_.port,
                        server_->errorString().toStdString());
        return makeUnexpected(server_->errorString());
    }
    SWARMCAST_INFO("Streaming server listening on {}:{}", address.toString().toStdString(), server_->serverPort());
    return server_->serverPort();
}

void StreamHttpServer::close() {
    if (server_->isListening()) {
        server_->close();
        SWARMCAST_INFO("Streaming server stopped accepting connections");
    }
    const QSet<HttpConnection*> open = connections_;
    for (HttpConnection* connection : open) {
        connection->abort();
    }
}

quint16 StreamHttpServer::port() const {
    return server_->serverPort();
}

int StreamHttpServer::openConnections() const {
    return connections_.size();
}

void StreamHttpServer::onNewConnection() {
    while (server_->hasPendingConnections()) {
        QTcpSocket* socket = server_->nextPendingConnection();
        auto* connection = new HttpConnection(socket, kWriteBudgetBytes, kHeaderTimeoutMs, this);
        connections_.insert(connection);
        connect(connection, &QObject::destroyed, this, [this, connection]() { connections_.remove(connection); });
        connect(connection, &HttpConnection::requestReceived, this, &StreamHttpServer::onRequest);
        connect(connection, &HttpConnection::badRequest, this, &StreamHttpServer::onBadRequest);
    }
}

void StreamHttpServer::onRequest(HttpConnection* connection, const HttpRequest& request) {
    activeHandlers_.ref();
    const QFuture<void> handler = QtConcurrent::run(ioThreadPool(), [this, connection, request]() {
        dispatch(connection, request);
        connection->finish();
        activeHandlers_.deref();
    });
    Q_UNUSED(handler);
}

void StreamHttpServer::onBadRequest(HttpConnection* connection, int status) {
    SWARMCAST_DEBUG("Malformed request from {} ({})", connection->peerAddress().toStdString(), status);
    sendJson(connection, baseHead(status), routeError("bad_request", "Malformed HTTP request"));
    connection->finish();
}

void StreamHttpServer::dispatch(HttpConnection* connection, const HttpRequest& request) {
    const QString& path = request.path;
    const bool isGet = request.method == "GET";
    int status = 0;

    if (request.method == "OPTIONS") {
        status = handleOptions(connection);
    } else if (path == QLatin1String("/api/stream")) {
        status = (isGet || request.method == "HEAD") ? handleStream(connection, request) : 405;
    } else if (path == QLatin1String("/api/stream/status")) {
        status = isGet ? handleStatus(connection, request) : 405;
    } else if (path == QLatin1String("/api/metadata")) {
        status = isGet ? handleMetadata(connection, request) : 405;
    } else if (path == QLatin1String("/api/health/streaming")) {
        status = isGet ? handleHealth(connection, request) : 405;
    } else {
        status = sendJson(connection, baseHead(404), routeError("not_found", "No such endpoint"));
    }

    if (status == 405) {
        HttpResponseHead head = baseHead(405);
        head.setHeader("Allow", QByteArray(path == QLatin1String("/api/stream") ? "GET, HEAD, OPTIONS"
                                                                                : "GET, OPTIONS"));
        sendJson(connection, head, routeError("method_not_allowed", "Method not allowed"));
    }

    SWARMCAST_DEBUG("{} {} from {} -> {}", request.method.toStdString(), path.toStdString(),
                    request.peerAddress.toStdString(), status);
    emit requestCompleted(path, status);
}

int StreamHttpServer::handleStream(HttpConnection* connection, const HttpRequest& request) {
    const bool headersOnly = request.method == "HEAD";
    if (!admit(connection, request, services_.streamLimiter)) {
        return 429;
    }

    const QString identifier = identifierOf(request);
    const std::optional<int> fileIndex = fileIndexOf(request);
    if (identifier.isEmpty() || !fileIndex) {
        return sendError(connection, StreamError::InvalidIdentifier, headersOnly);
    }

    const QString rangeHeader = QString::fromLatin1(request.header("range"));
    auto cancel = std::make_shared<CancelToken>();
    connection->setDisconnectHandler([cancel]() { cancel->cancel(); });
    auto opened = services_.multiplexer->openStream(
        identifier, *fileIndex, rangeHeader,
        headersOnly ? StreamMultiplexer::OpenMode::HeadersOnly : StreamMultiplexer::OpenMode::Body,
        cancel.get());
    if (!opened || headersOnly || !opened.value().source) {
        connection->setDisconnectHandler(nullptr);
    }

    if (!opened) {
        const StreamError error = opened.error();
        if (error == StreamError::Cancelled) {
            return 499;
        }
        HttpResponseHead head = errorHead(error);
        if (error == StreamError::RangeNotSatisfiable) {
            auto magnet = MagnetUri::fromIdentifier(identifier);
            if (magnet) {
                if (auto size = services_.multiplexer->knownFileSize(magnet.value().infoHash, *fileIndex)) {
                    head.setHeader("Content-Range", "bytes */" + QByteArray::number(*size));
                }
            }
        }
        return sendJson(connection, head, JsonViews::error(error), headersOnly);
    }

    const StreamResponse& response = opened.value();
    const int status = response.range ? 206 : 200;
    HttpResponseHead head = baseHead(status);
    head.setHeader("Content-Type", response.mimeType);
    head.setHeader("Cache-Control", QByteArray("no-store"));
    head.setHeader("X-Watcher-Id", response.watcherId);
    if (response.transcoded) {
        head.setHeader("Accept-Ranges", QByteArray("none"));
        head.setHeader("Transfer-Encoding", QByteArray("chunked"));
        head.setHeader("X-Transcoded", QByteArray("true"));
        head.setHeader("X-Transcode-Mode", transcodeModeName(response.profile.mode));
    } else {
        head.setHeader("Accept-Ranges", QByteArray("bytes"));
        head.setContentLength(response.contentLength);
        if (response.range) {
            head.setHeader("Content-Range", response.range->contentRange(response.fileSize));
        }
    }

    if (!connection->write(head.serialize()) || headersOnly || !response.source) {
        services_.multiplexer->closeStream(response.watcherId);
        return connection->isOpen() ? status : 499;
    }

    pumpBody(connection, response.watcherId, response.source, response.transcoded);
    return status;
}

void StreamHttpServer::pumpBody(HttpConnection* connection, const QString& watcherId,
                                const std::shared_ptr<ByteSource>& source, bool chunked) {
    connection->setDisconnectHandler([source]() { source->cancel(); });

    QElapsedTimer timer;
    timer.start();
    qint64 sent = 0;
    bool complete = false;

    while (true) {
        auto chunk = source->read(kPumpChunkBytes);
        if (!chunk) {
            if (chunk.error() != StreamError::Cancelled) {
                SWARMCAST_WARN("Stream {} interrupted after {} bytes: {}", watcherId.toStdString(), sent,
                               errorCode(chunk.error()).toStdString());
            }
            break;
        }
        if (chunk.value().isEmpty()) {
            complete = true;
            break;
        }
        if (!connection->write(chunked ? encodeChunk(chunk.value()) : chunk.value())) {
            break;
        }
        sent += chunk.value().size();
        services_.registry->touch(watcherId);
    }

    if (complete && chunked) {
        connection->write(lastChunk());
    }
    if (!complete) {
        // A truncated body must not look like a finished one
        connection->abort();
    }
    connection->setDisconnectHandler(nullptr);
    source->cancel();

    SWARMCAST_INFO("Stream {} {} after {} bytes in {} ms", watcherId.toStdString(),
                   complete ? "completed" : "closed", sent, timer.elapsed());
    services_.multiplexer->closeStream(watcherId);
}

int StreamHttpServer::handleStatus(HttpConnection* connection, const HttpRequest& request) {
    QString watcherId = request.queryValue("watcher");
    bool ownsWatcher = false;

    if (watcherId.isEmpty()) {
        const QString identifier = identifierOf(request);
        const std::optional<int> fileIndex = fileIndexOf(request);
        if (identifier.isEmpty() || !fileIndex) {
            return sendError(connection, StreamError::InvalidIdentifier);
        }
        auto opened = services_.multiplexer->openStatusWatcher(identifier, *fileIndex);
        if (!opened) {
            return sendError(connection, opened.error());
        }
        watcherId = opened.value();
        ownsWatcher = true;
    }

    auto reader = services_.statusPublisher->subscribe(watcherId);
    if (!reader) {
        if (ownsWatcher) {
            services_.multiplexer->closeStream(watcherId);
        }
        return sendJson(connection, baseHead(404), routeError("unknown_watcher", "No such watcher"));
    }

    HttpResponseHead head = baseHead(200);
    head.setHeader("Content-Type", QByteArray("text/event-stream"));
    head.setHeader("Cache-Control", QByteArray("no-cache"));
    head.setHeader("X-Accel-Buffering", QByteArray("no"));
    head.setHeader("X-Watcher-Id", watcherId);

    QElapsedTimer sinceLastWrite;
    sinceLastWrite.start();
    bool open = connection->write(head.serialize());
    int events = 0;

    while (open) {
        const StatusReader::Read read = reader->next(kStatusWaitSliceMs);
        if (read.result == StatusReader::Result::Ended) {
            break;
        }
        if (read.result == StatusReader::Result::Event) {
            const QByteArray json = QJsonDocument(read.status.toJson()).toJson(QJsonDocument::Compact);
            open = connection->write("data: " + json + "\n\n");
            sinceLastWrite.restart();
            ++events;
            continue;
        }
        if (sinceLastWrite.elapsed() >= settings_.sseKeepAliveMs) {
            open = connection->write(QByteArrayLiteral(": keep-alive\n\n"));
            sinceLastWrite.restart();
        } else {
            open = connection->isOpen();
        }
    }

    SWARMCAST_DEBUG("Status stream for {} ended after {} events", watcherId.toStdString(), events);
    if (ownsWatcher) {
        services_.multiplexer->closeStream(watcherId);
    }
    return 200;
}

int StreamHttpServer::handleMetadata(HttpConnection* connection, const HttpRequest& request) {
    if (!admit(connection, request, services_.metadataLimiter)) {
        return 429;
    }

    const QString identifier = identifierOf(request);
    if (identifier.isEmpty()) {
        return sendError(connection, StreamError::InvalidIdentifier);
    }

    auto metadata = services_.metadataResolver->fetchMetadata(identifier);
    if (!metadata) {
        return sendError(connection, metadata.error());
    }

    std::optional<CatalogEntry> entry;
    if (services_.catalog) {
        entry = services_.catalog->lookup(metadata.value().infoHash);
    }
    return sendJson(connection, baseHead(200), JsonViews::metadata(metadata.value(), entry));
}

int StreamHttpServer::handleHealth(HttpConnection* connection, const HttpRequest& request) {
    Q_UNUSED(request);
    const TranscodePoolStats poolStats = services_.transcodePool ? services_.transcodePool->stats()
                                                                 : TranscodePoolStats();
    const QJsonObject body = JsonViews::health(services_.swarmClient->dhtStatus(),
                                               services_.swarmClient->allStats(),
                                               services_.registry->debugInfo(), poolStats);
    HttpResponseHead head = baseHead(200);
    head.setHeader("Cache-Control", QByteArray("no-store"));
    return sendJson(connection, head, body);
}

int StreamHttpServer::handleOptions(HttpConnection* connection) {
    HttpResponseHead head = baseHead(204);
    head.setHeader("Access-Control-Allow-Methods", QByteArray("GET, HEAD, OPTIONS"));
    head.setHeader("Access-Control-Allow-Headers", QByteArray("Range, Content-Type"));
    head.setHeader("Access-Control-Max-Age", QByteArray("86400"));
    head.setContentLength(0);
    connection->write(head.serialize());
    return 204;
}

bool StreamHttpServer::admit(HttpConnection* connection, const HttpRequest& request, RateLimiter* limiter) {
    if (!limiter) {
        return true;
    }
    const QString identity = clientIdentity(request, settings_.trustForwardedFor);
    const RateLimitResult result = limiter->check(identity);
    if (result.allowed) {
        return true;
    }

    SWARMCAST_WARN("Rate limit hit by {} on {}", identity.toStdString(), request.path.toStdString());
    HttpResponseHead head = errorHead(StreamError::RateLimited);
    head.setHeader("Retry-After", QByteArray::number(result.retryAfterSeconds));
    head.setHeader("X-RateLimit-Remaining", QByteArray("0"));
    sendJson(connection, head, JsonViews::error(StreamError::RateLimited), request.method == "HEAD");
    return false;
}

HttpResponseHead StreamHttpServer::baseHead(int status) const {
    HttpResponseHead head(status);
    head.setHeader("Access-Control-Allow-Origin", settings_.corsOrigin);
    head.setHeader("Access-Control-Expose-Headers", kExposedHeaders);
    head.setHeader("Connection", QByteArray("close"));
    return head;
}

HttpResponseHead StreamHttpServer::errorHead(StreamError error) const {
    HttpResponseHead head = baseHead(httpStatus(error));
    const int retryAfter = retryAfterFor(error);
    if (retryAfter > 0) {
        head.setHeader("Retry-After", QByteArray::number(retryAfter));
    }
    return head;
}

int StreamHttpServer::sendJson(HttpConnection* connection, HttpResponseHead head, const QJsonObject& body,
                               bool headersOnly) {
    const QByteArray payload = QJsonDocument(body).toJson(QJsonDocument::Compact);
    head.setHeader("Content-Type", QByteArray("application/json"));
    head.setContentLength(payload.size());
    connection->write(headersOnly ? head.serialize() : head.serialize() + payload);
    return head.status();
}

int StreamHttpServer::sendError(HttpConnection* connection, StreamError error, bool headersOnly) {
    return sendJson(connection, errorHead(error), JsonViews::error(error), headersOnly);
}

QString StreamHttpServer::clientIdentity(const HttpRequest& request, bool trustForwardedFor) {
    QString identity;
    if (trustForwardedFor) {
        const QByteArray forwarded = request.header("x-forwarded-for");
        if (!forwarded.isEmpty()) {
            identity = QString::fromLatin1(forwarded.split(',').first().trimmed());
        }
    }
    if (identity.isEmpty()) {
        identity = request.peerAddress;
    }
    if (identity.startsWith(QLatin1String("::ffff:"))) {
        identity.remove(0, 7);
    }
    return identity.isEmpty() ? QStringLiteral("unknown") : identity;
}

int StreamHttpServer::retryAfterFor(StreamError error) {
    switch (error) {
        case StreamError::PoolExhausted:
        case StreamError::CapacityReached:
            return 5;
        case StreamError::RateLimited:
            return 60;
        default:
            return 0;
    }
}

} // namespace Swarmcast
