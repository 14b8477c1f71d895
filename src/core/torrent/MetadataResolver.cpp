#include "MetadataResolver.hpp"
#include "../common/IoThreadPool.hpp"
#include "../common/Logger.hpp"

#include <QtConcurrent/QtConcurrent>

namespace Swarmcast {

MetadataResolver::MetadataResolver(SwarmClient* swarmClient, std::chrono::milliseconds timeout,
                                   QObject* parent)
    : QObject(parent)
    , swarmClient_(swarmClient)
    , timeout_(timeout) {
}

Expected<TorrentMetadata, StreamError> MetadataResolver::fetchMetadata(const QString& identifier) {
    auto magnet = MagnetUri::fromIdentifier(identifier);
    if (magnet.hasError()) {
        return makeUnexpected(magnet.error());
    }
    const QString infoHash = magnet.value().infoHash;

    if (auto hit = cached(infoHash)) {
        SWARMCAST_DEBUG("Metadata cache hit for {}", infoHash.toStdString());
        return *hit;
    }

    auto handle = swarmClient_->join(magnet.value());
    if (handle.hasError()) {
        emit metadataFailed(infoHash, handle.error());
        return makeUnexpected(handle.error());
    }

    auto metadata = swarmClient_->waitForMetadata(handle.value(), timeout_);
    swarmClient_->leave(handle.value());

    if (metadata.hasError()) {
        // A swarm torn down under us looks the same as one that never answered
        const StreamError error = metadata.error() == StreamError::Cancelled
            ? StreamError::SwarmTimeout : metadata.error();
        SWARMCAST_WARN("Metadata resolution failed for {}: {}",
                       infoHash.toStdString(), errorCode(error).toStdString());
        emit metadataFailed(infoHash, error);
        return makeUnexpected(error);
    }

    TorrentMetadata result = metadata.value();
    if (!result.isConsistent()) {
        SWARMCAST_WARN("Discarding partial metadata for {}", infoHash.toStdString());
        emit metadataFailed(infoHash, StreamError::SwarmTimeout);
        return makeUnexpected(StreamError::SwarmTimeout);
    }
    result.name = magnet.value().displayNameOr(result.name);

    {
        QWriteLocker locker(&cacheLock_);
        cache_.insert(infoHash, result);
    }

    SWARMCAST_INFO("Resolved {} ({}, {} files, {} bytes)", infoHash.toStdString(),
                   result.name.toStdString(), result.files.size(), result.totalSize);
    emit metadataResolved(infoHash, result);
    return result;
}

QFuture<Expected<TorrentMetadata, StreamError>> MetadataResolver::fetchMetadataAsync(const QString& identifier) {
    return QtConcurrent::run(ioThreadPool(), [this, identifier]() {
        return fetchMetadata(identifier);
    });
}

std::optional<TorrentMetadata> MetadataResolver::cached(const QString& infoHash) const {
    QReadLocker locker(&cacheLock_);
    auto it = cache_.constFind(infoHash);
    if (it == cache_.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

void MetadataResolver::clearCache() {
    QWriteLocker locker(&cacheLock_);
    cache_.clear();
}

} // namespace Swarmcast
