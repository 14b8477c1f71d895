#pragma once

#include <QtCore/QFuture>
#include <QtCore/QHash>
#include <QtCore/QObject>
#include <QtCore/QReadWriteLock>
#include <chrono>

#include "SwarmClient.hpp"

namespace Swarmcast {

/**
 * @brief Resolves magnet links into complete torrent metadata
 *
 * Joins through the SwarmClient with its own lease, waits for the metadata
 * exchange and leaves again. If a stream already holds the swarm the lease
 * only adds a reference, so resolving never restarts a live download.
 */
class MetadataResolver : public QObject {
    Q_OBJECT

public:
    MetadataResolver(SwarmClient* swarmClient, std::chrono::milliseconds timeout,
                     QObject* parent = nullptr);
    ~MetadataResolver() override = default;

    /**
     * @brief Blocking resolution, for worker threads
     * @return Consistent metadata, InvalidIdentifier, SwarmTimeout or SwarmUnavailable
     */
    Expected<TorrentMetadata, StreamError> fetchMetadata(const QString& identifier);

    /// Runs fetchMetadata() on the I/O pool
    QFuture<Expected<TorrentMetadata, StreamError>> fetchMetadataAsync(const QString& identifier);

    /// Cached metadata, if resolved earlier
    std::optional<TorrentMetadata> cached(const QString& infoHash) const;
    void clearCache();

signals:
    void metadataResolved(const QString& infoHash, const TorrentMetadata& metadata);
    void metadataFailed(const QString& infoHash, StreamError error);

private:
    SwarmClient* swarmClient_;
    std::chrono::milliseconds timeout_;

    mutable QReadWriteLock cacheLock_;
    QHash<QString, TorrentMetadata> cache_;
};

} // namespace Swarmcast
