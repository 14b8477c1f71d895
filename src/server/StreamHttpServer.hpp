#pragma once

#include <QtCore/QAtomicInt>
#include <QtCore/QJsonObject>
#include <QtCore/QObject>
#include <QtCore/QSet>
#include <QtNetwork/QTcpServer>

#include "../core/common/ByteSource.hpp"
#include "../core/common/Config.hpp"
#include "../core/common/Expected.hpp"
#include "../core/common/StreamError.hpp"
#include "HttpConnection.hpp"

namespace Swarmcast {

class CatalogStore;
class ConnectionStatusPublisher;
class MetadataResolver;
class RateLimiter;
class StreamMultiplexer;
class SwarmClient;
class TranscodePool;
class WatcherRegistry;

/// Components the HTTP layer serves from; catalog and limiters may be null
struct ServerServices {
    StreamMultiplexer* multiplexer = nullptr;
    MetadataResolver* metadataResolver = nullptr;
    ConnectionStatusPublisher* statusPublisher = nullptr;
    WatcherRegistry* registry = nullptr;
    SwarmClient* swarmClient = nullptr;
    TranscodePool* transcodePool = nullptr;
    CatalogStore* catalog = nullptr;
    RateLimiter* streamLimiter = nullptr;
    RateLimiter* metadataLimiter = nullptr;
};

/**
 * @brief HTTP/1.1 front end of the streaming engine
 *
 * Routes:
 *   GET|HEAD /api/stream          byte stream for one file of a torrent
 *   GET      /api/stream/status   server-sent connection status
 *   GET      /api/metadata        resolved torrent metadata
 *   GET      /api/health/streaming diagnostics
 *
 * Each request is handled on an ioThreadPool() worker; one request per connection.
 */
class StreamHttpServer : public QObject {
    Q_OBJECT

public:
    StreamHttpServer(const ServerServices& services, const Config::ServerSettings& settings,
                     QObject* parent = nullptr);
    ~StreamHttpServer() override;

    StreamHttpServer(const StreamHttpServer&) = delete;
    StreamHttpServer& operator=(const StreamHttpServer&) = delete;

    /// @return The bound port, or the socket error text
    Expected<quint16, QString> listen();

    /// Stops accepting and aborts open connections, cancelling their streams
    void close();

    quint16 port() const;
    int openConnections() const;
    int activeHandlers() const { return activeHandlers_.loadRelaxed(); }

    /// Caller identity for rate limiting: peer address or first X-Forwarded-For hop
    static QString clientIdentity(const HttpRequest& request, bool trustForwardedFor);

    /// Seconds to put in Retry-After for an error, 0 for none
    static int retryAfterFor(StreamError error);

signals:
    void requestCompleted(const QString& path, int status);

private slots:
    void onNewConnection();
    void onRequest(Swarmcast::HttpConnection* connection, const Swarmcast::HttpRequest& request);
    void onBadRequest(Swarmcast::HttpConnection* connection, int status);

private:
    void dispatch(HttpConnection* connection, const HttpRequest& request);

    int handleStream(HttpConnection* connection, const HttpRequest& request);
    int handleStatus(HttpConnection* connection, const HttpRequest& request);
    int handleMetadata(HttpConnection* connection, const HttpRequest& request);
    int handleHealth(HttpConnection* connection, const HttpRequest& request);
    int handleOptions(HttpConnection* connection);

    /// Streams @p source to the client until end, error or disconnect
    void pumpBody(HttpConnection* connection, const QString& watcherId,
                  const std::shared_ptr<ByteSource>& source, bool chunked);

    /// Applies @p limiter; sends 429 and returns false when over the limit
    bool admit(HttpConnection* connection, const HttpRequest& request, RateLimiter* limiter);

    /// Status line plus CORS headers
    HttpResponseHead baseHead(int status) const;
    HttpResponseHead errorHead(StreamError error) const;

    int sendJson(HttpConnection* connection, HttpResponseHead head, const QJsonObject& body,
                 bool headersOnly = false);
    int sendError(HttpConnection* connection, StreamError error, bool headersOnly = false);

    ServerServices services_;
    Config::ServerSettings settings_;
    QTcpServer* server_;
    QSet<HttpConnection*> connections_;
    QAtomicInt activeHandlers_;
};

} // namespace Swarmcast
