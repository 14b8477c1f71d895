#pragma once

#include <QtCore/QHash>
#include <QtCore/QMutex>
#include <QtCore/QObject>
#include <QtCore/QString>
#include <memory>
#include <optional>

#include "../common/ByteSource.hpp"
#include "../common/CancelToken.hpp"
#include "../common/Config.hpp"
#include "../media/CodecClassifier.hpp"
#include "../torrent/SwarmClient.hpp"
#include "ByteRange.hpp"

namespace Swarmcast {

class CatalogStore;
class CodecProbe;
class ConnectionStatusPublisher;
class TranscodePool;
class WatcherRegistry;

struct StreamResponse {
    QString watcherId;
    QString infoHash;
    int fileIndex = 0;
    QString fileName;
    QString mimeType;
    qint64 fileSize = 0;
    std::optional<ByteRange> range;   // set for a satisfiable partial request
    qint64 contentLength = -1;        // -1 when unknown (transcoded)
    bool seekable = true;
    bool transcoded = false;
    CodecProfile profile;
    std::shared_ptr<ByteSource> source;  // null when opened for headers only
};

/**
 * @brief Turns (identifier, fileIndex, range) requests into byte streams
 *
 * Browser-compatible files are served straight from the swarm with range
 * support. Everything else goes through the TranscodePool as a fragmented
 * MP4 that can only be read from the start. Every request is a watcher in
 * the WatcherRegistry until closeStream().
 *
 * openStream() blocks for metadata and first bytes; call it from an
 * ioThreadPool() worker. Cancelling the token passed to it ends any of those
 * waits and detaches the watcher.
 */
class StreamMultiplexer : public QObject {
    Q_OBJECT

public:
    enum class OpenMode {
        Body,        // returns a readable source
        HeadersOnly  // resolves everything a response head needs, no source
    };

    StreamMultiplexer(SwarmClient* swarmClient, WatcherRegistry* registry, TranscodePool* transcodePool,
                      ConnectionStatusPublisher* statusPublisher,
                      const Config::StreamingSettings& settings, QObject* parent = nullptr);
    ~StreamMultiplexer() override;

    StreamMultiplexer(const StreamMultiplexer&) = delete;
    StreamMultiplexer& operator=(const StreamMultiplexer&) = delete;

    /// Optional codec evidence sources, consulted catalog first
    void setCatalog(CatalogStore* catalog);
    void setProbe(CodecProbe* probe, qint64 probeBytes);

    /**
     * @brief Attaches a watcher and opens its byte stream
     * @param identifier Magnet URI or bare info hash
     * @param rangeHeader HTTP Range header value, may be empty
     * @param cancel Set when the requester goes away; the open then fails with Cancelled
     * @return The stream, or the typed failure; on failure no watcher remains
     */
    Expected<StreamResponse, StreamError> openStream(const QString& identifier, int fileIndex,
                                                     const QString& rangeHeader,
                                                     OpenMode mode = OpenMode::Body,
                                                     CancelToken* cancel = nullptr);

    /// Detaches a stream or status watcher; repeated calls are ignored
    void closeStream(const QString& watcherId);

    /**
     * @brief Attaches a status-only watcher, used by SSE subscribers
     * @return The watcher id to subscribe() to on the ConnectionStatusPublisher
     */
    Expected<QString, StreamError> openStatusWatcher(const QString& identifier, int fileIndex);

    /// Cached classification, computing it on first use
    CodecProfile profileFor(const SwarmHandle& swarm, const SwarmFile& file);

    CodecProfileCache& profileCache() { return profileCache_; }

    /// Size of a file seen by an earlier open, for "bytes */size" replies
    std::optional<qint64> knownFileSize(const QString& infoHash, int fileIndex) const;

signals:
    void streamOpened(const QString& watcherId, const QString& infoHash, int fileIndex, bool transcoded);
    void streamFailed(const QString& infoHash, int fileIndex, Swarmcast::StreamError error);
    void streamClosed(const QString& watcherId);

private:
    Expected<StreamResponse, StreamError> openAttached(const QString& watcherId, const SwarmHandle& swarm,
                                                       int fileIndex, const QString& rangeHeader,
                                                       OpenMode mode, CancelToken* cancel);
    Expected<void, StreamError> openDirect(StreamResponse& response, const SwarmHandle& swarm,
                                           const QString& rangeHeader, OpenMode mode, CancelToken* cancel);
    Expected<void, StreamError> openTranscoded(StreamResponse& response, const SwarmHandle& swarm,
                                               const QString& rangeHeader, OpenMode mode, CancelToken* cancel);

    /// waitForMetadata() in short slices so @p cancel is noticed
    Expected<TorrentMetadata, StreamError> awaitMetadata(const SwarmHandle& swarm, CancelToken* cancel);

    /// Reads the first chunk within firstByteTimeoutMs and puts it back in front of @p source
    Expected<std::shared_ptr<ByteSource>, StreamError> awaitFirstBytes(std::shared_ptr<ByteSource> source,
                                                                       CancelToken* cancel);

    void fail(const QString& watcherId, StreamError error);

    SwarmClient* swarmClient_;
    WatcherRegistry* registry_;
    TranscodePool* transcodePool_;
    ConnectionStatusPublisher* statusPublisher_;
    Config::StreamingSettings settings_;

    CatalogStore* catalog_ = nullptr;
    CodecProbe* probe_ = nullptr;
    qint64 probeBytes_ = 0;

    CodecProfileCache profileCache_;

    mutable QMutex fileSizesMutex_;
    QHash<QString, qint64> fileSizes_;
};

} // namespace Swarmcast
