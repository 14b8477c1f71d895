#include "StreamMultiplexer.hpp"
#include "ConnectionStatus.hpp"
#include "WatcherRegistry.hpp"
#include "../common/ByteChannel.hpp"
#include "../common/Logger.hpp"
#include "../common/ReadWatchdog.hpp"
#include "../media/FFmpegProbe.hpp"
#include "../media/TranscodePlan.hpp"
#include "../media/TranscodePool.hpp"
#include "../storage/CatalogStore.hpp"

#include <QtCore/QDeadlineTimer>
#include <QtCore/QElapsedTimer>

#include <algorithm>

namespace Swarmcast {

namespace {

constexpr qint64 kFirstReadBytes = 64 * 1024;
constexpr qint64 kMetadataSliceMs = 100;

} // namespace

StreamMultiplexer::StreamMultiplexer(SwarmClient* swarmClient, WatcherRegistry* registry,
                                     TranscodePool* transcodePool, ConnectionStatusPublisher* statusPublisher,
                                     const Config::StreamingSettings& settings, QObject* parent)
    : QObject(parent)
    , swarmClient_(swarmClient)
    , registry_(registry)
    , transcodePool_(transcodePool)
    , statusPublisher_(statusPublisher)
    , settings_(settings) {
}

StreamMultiplexer::~StreamMultiplexer() = default;

void StreamMultiplexer::setCatalog(CatalogStore* catalog) {
    catalog_ = catalog;
}

void StreamMultiplexer::setProbe(CodecProbe* probe, qint64 probeBytes) {
    probe_ = probe;
    probeBytes_ = probeBytes;
}

Expected<StreamResponse, StreamError> StreamMultiplexer::openStream(const QString& identifier, int fileIndex,
                                                                    const QString& rangeHeader, OpenMode mode,
                                                                    CancelToken* cancel) {
    auto magnet = MagnetUri::fromIdentifier(identifier);
    if (!magnet) {
        return makeUnexpected(magnet.error());
    }
    if (fileIndex < 0) {
        return makeUnexpected(StreamError::FileNotFound);
    }

    auto attached = registry_->attach(magnet.value(), fileIndex, WatcherKind::Stream);
    if (!attached) {
        SWARMCAST_WARN("Cannot attach to {}#{}: {}", magnet.value().infoHash.toStdString(), fileIndex,
                       errorCode(attached.error()).toStdString());
        emit streamFailed(magnet.value().infoHash, fileIndex, attached.error());
        return makeUnexpected(attached.error());
    }

    const QString watcherId = attached.value().watcherId;
    if (statusPublisher_) {
        statusPublisher_->track(watcherId, attached.value().swarm, fileIndex);
    }

    auto response = openAttached(watcherId, attached.value().swarm, fileIndex, rangeHeader, mode, cancel);
    if (response && cancel && cancel->isCancelled()) {
        if (response.value().source) {
            response.value().source->cancel();
        }
        response = makeUnexpected(StreamError::Cancelled);
    }
    if (!response) {
        if (response.error() == StreamError::Cancelled) {
            SWARMCAST_INFO("Watcher {} abandoned while opening {}#{}", watcherId.toStdString(),
                           magnet.value().infoHash.toStdString(), fileIndex);
            closeStream(watcherId);
            return makeUnexpected(StreamError::Cancelled);
        }
        fail(watcherId, response.error());
        emit streamFailed(magnet.value().infoHash, fileIndex, response.error());
        return makeUnexpected(response.error());
    }

    SWARMCAST_INFO("Watcher {} streaming {}#{} ({}{})", watcherId.toStdString(),
                   magnet.value().infoHash.toStdString(), fileIndex,
                   response.value().transcoded ? "transcoded " : "direct ",
                   transcodeModeName(response.value().profile.mode).toStdString());
    emit streamOpened(watcherId, magnet.value().infoHash, fileIndex, response.value().transcoded);
    return response;
}

Expected<StreamResponse, StreamError> StreamMultiplexer::openAttached(const QString& watcherId,
                                                                      const SwarmHandle& swarm, int fileIndex,
                                                                      const QString& rangeHeader, OpenMode mode,
                                                                      CancelToken* cancel) {
    auto metadata = awaitMetadata(swarm, cancel);
    if (!metadata) {
        return makeUnexpected(metadata.error());
    }
    if (cancel && cancel->isCancelled()) {
        return makeUnexpected(StreamError::Cancelled);
    }

    const QList<SwarmFile>& files = metadata.value().files;
    auto file = std::find_if(files.cbegin(), files.cend(),
                             [fileIndex](const SwarmFile& f) { return f.index == fileIndex; });
    if (file == files.cend()) {
        SWARMCAST_WARN("File index {} out of range for {} ({} files)", fileIndex,
                       swarm.infoHash.toStdString(), files.size());
        return makeUnexpected(StreamError::FileNotFound);
    }

    StreamResponse response;
    response.watcherId = watcherId;
    response.infoHash = swarm.infoHash;
    response.fileIndex = fileIndex;
    response.fileName = file->name;
    response.fileSize = file->length;
    {
        QMutexLocker locker(&fileSizesMutex_);
        fileSizes_.insert(CodecProfileCache::key(swarm.infoHash, fileIndex), file->length);
    }
    response.profile = profileFor(swarm, *file);

    if (statusPublisher_) {
        statusPublisher_->setFileInfo(watcherId, file->length, response.profile.mediaKind);
    }

    Expected<void, StreamError> opened = response.profile.needsTranscoding
        ? openTranscoded(response, swarm, rangeHeader, mode, cancel)
        : openDirect(response, swarm, rangeHeader, mode, cancel);
    if (!opened) {
        return makeUnexpected(opened.error());
    }
    return response;
}

Expected<void, StreamError> StreamMultiplexer::openDirect(StreamResponse& response, const SwarmHandle& swarm,
                                                          const QString& rangeHeader, OpenMode mode,
                                                          CancelToken* cancel) {
    auto range = ByteRange::parse(rangeHeader, response.fileSize);
    if (!range) {
        return makeUnexpected(range.error());
    }

    response.seekable = true;
    response.transcoded = false;
    response.mimeType = CodecClassifier::mimeTypeFor(response.fileName);
    response.range = range.value();

    const qint64 start = response.range ? response.range->start : 0;
    const qint64 end = response.range ? response.range->end : response.fileSize - 1;
    response.contentLength = response.fileSize == 0 ? 0 : end - start + 1;
    registry_->setRange(response.watcherId, start, end);

    if (response.fileSize == 0) {
        if (mode == OpenMode::Body) {
            auto empty = std::make_shared<ByteChannel>(1);
            empty->finish();
            response.source = empty;
        }
        return {};
    }

    swarmClient_->setPriority(swarm, response.fileIndex, start, end);
    if (mode == OpenMode::HeadersOnly) {
        return {};
    }

    auto reader = swarmClient_->readRange(swarm, response.fileIndex, start, end);
    if (!reader) {
        return makeUnexpected(reader.error());
    }
    auto source = awaitFirstBytes(reader.value(), cancel);
    if (!source) {
        return makeUnexpected(source.error());
    }
    response.source = source.value();
    return {};
}

Expected<void, StreamError> StreamMultiplexer::openTranscoded(StreamResponse& response, const SwarmHandle& swarm,
                                                              const QString& rangeHeader, OpenMode mode,
                                                              CancelToken* cancel) {
    if (!rangeHeader.trimmed().isEmpty() && !ByteRange::isFromStart(rangeHeader)) {
        SWARMCAST_DEBUG("Range '{}' refused for transcoded {}#{}", rangeHeader.toStdString(),
                        response.infoHash.toStdString(), response.fileIndex);
        return makeUnexpected(StreamError::RangeUnsupported);
    }
    if (!transcodePool_) {
        return makeUnexpected(StreamError::TranscodeFailed);
    }

    const TranscodePlan plan = TranscodePlan::fromProfile(response.profile);
    response.seekable = false;
    response.transcoded = true;
    response.mimeType = plan.outputMimeType();
    response.range.reset();
    response.contentLength = -1;
    registry_->setTranscoded(response.watcherId, true);
    registry_->setRange(response.watcherId, 0, response.fileSize - 1);

    if (mode == OpenMode::HeadersOnly) {
        return {};
    }

    SwarmClient* client = swarmClient_;
    const int fileIndex = response.fileIndex;
    const qint64 lastByte = response.fileSize - 1;
    auto sourceFactory = [client, swarm, fileIndex, lastByte]() {
        client->setPriority(swarm, fileIndex, 0, lastByte);
        return client->readRange(swarm, fileIndex, 0, lastByte);
    };

    auto lease = transcodePool_->acquire(response.infoHash, response.fileIndex, response.watcherId,
                                         sourceFactory, plan, cancel);
    if (!lease) {
        return makeUnexpected(lease.error());
    }
    response.mimeType = lease.value().mimeType;

    auto source = awaitFirstBytes(lease.value().output, cancel);
    if (!source) {
        return makeUnexpected(source.error());
    }
    response.source = source.value();
    return {};
}

Expected<TorrentMetadata, StreamError> StreamMultiplexer::awaitMetadata(const SwarmHandle& swarm,
                                                                       CancelToken* cancel) {
    QDeadlineTimer deadline(settings_.metadataTimeoutMs);
    while (true) {
        if (cancel && cancel->isCancelled()) {
            return makeUnexpected(StreamError::Cancelled);
        }
        const qint64 slice = cancel ? std::min(kMetadataSliceMs, std::max<qint64>(0, deadline.remainingTime()))
                                    : static_cast<qint64>(settings_.metadataTimeoutMs);
        auto metadata = swarmClient_->waitForMetadata(swarm, std::chrono::milliseconds(slice));
        if (metadata) {
            return metadata;
        }
        if (metadata.error() == StreamError::Cancelled) {
            // The swarm went away underneath the wait
            return makeUnexpected(StreamError::SwarmTimeout);
        }
        if (metadata.error() != StreamError::SwarmTimeout || deadline.hasExpired() || !cancel) {
            if (metadata.error() == StreamError::SwarmTimeout) {
                SWARMCAST_WARN("No metadata for {} within {} ms", swarm.infoHash.toStdString(),
                               settings_.metadataTimeoutMs);
            }
            return makeUnexpected(metadata.error());
        }
    }
}

Expected<std::shared_ptr<ByteSource>, StreamError> StreamMultiplexer::awaitFirstBytes(
    std::shared_ptr<ByteSource> source, CancelToken* cancel) {
    QElapsedTimer timer;
    timer.start();

    Expected<QByteArray, StreamError> head = QByteArray();
    bool timedOut = false;
    {
        CancelCallback cancelRead(cancel, [source]() { source->cancel(); });
        ReadWatchdog watchdog(source, settings_.firstByteTimeoutMs);
        head = source->read(kFirstReadBytes);
        timedOut = watchdog.fired();
    }

    if (cancel && cancel->isCancelled()) {
        return makeUnexpected(StreamError::Cancelled);
    }
    if (timedOut) {
        SWARMCAST_WARN("No data within {} ms", settings_.firstByteTimeoutMs);
        source->cancel();
        return makeUnexpected(StreamError::SwarmTimeout);
    }
    if (!head) {
        return makeUnexpected(head.error() == StreamError::Cancelled ? StreamError::SwarmTimeout : head.error());
    }

    SWARMCAST_DEBUG("First {} bytes after {} ms", head.value().size(), timer.elapsed());
    if (head.value().isEmpty()) {
        return source;
    }
    return std::shared_ptr<ByteSource>(std::make_shared<PrefetchedSource>(head.value(), source));
}

CodecProfile StreamMultiplexer::profileFor(const SwarmHandle& swarm, const SwarmFile& file) {
    if (auto cached = profileCache_.find(swarm.infoHash, file.index)) {
        return *cached;
    }

    std::optional<ProbedCodecs> evidence;
    if (catalog_) {
        if (auto entry = catalog_->lookup(swarm.infoHash)) {
            evidence = entry->codecsFor(file.index);
        }
    }

    if (!evidence && probe_ && probeBytes_ > 0 && file.length > 0
        && CodecClassifier::mediaKindFor(file.name) != MediaKind::Other) {
        const qint64 end = std::min(file.length, probeBytes_) - 1;
        auto head = swarmClient_->readRange(swarm, file.index, 0, end);
        if (head) {
            evidence = probe_->probe(head.value(), file.name);
            head.value()->cancel();
        } else {
            SWARMCAST_DEBUG("Probe skipped for {}#{}: {}", swarm.infoHash.toStdString(), file.index,
                            errorCode(head.error()).toStdString());
        }
    }

    const CodecProfile profile = CodecClassifier::classify(file.name, evidence);
    SWARMCAST_INFO("{}#{} '{}' -> {} (evidence: {}, video: {}, audio: {})", swarm.infoHash.toStdString(),
                   file.index, file.name.toStdString(), transcodeModeName(profile.mode).toStdString(),
                   profile.evidenceSource().toStdString(), profile.videoCodec.toStdString(),
                   profile.audioCodec.toStdString());
    return profileCache_.insert(swarm.infoHash, file.index, profile);
}

std::optional<qint64> StreamMultiplexer::knownFileSize(const QString& infoHash, int fileIndex) const {
    QMutexLocker locker(&fileSizesMutex_);
    auto it = fileSizes_.constFind(CodecProfileCache::key(infoHash, fileIndex));
    if (it == fileSizes_.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

void StreamMultiplexer::closeStream(const QString& watcherId) {
    if (watcherId.isEmpty()) {
        return;
    }
    const bool known = registry_->watcher(watcherId).has_value();
    registry_->detach(watcherId);
    if (statusPublisher_) {
        statusPublisher_->untrack(watcherId);
    }
    if (known) {
        SWARMCAST_DEBUG("Watcher {} closed", watcherId.toStdString());
        emit streamClosed(watcherId);
    }
}

Expected<QString, StreamError> StreamMultiplexer::openStatusWatcher(const QString& identifier, int fileIndex) {
    auto magnet = MagnetUri::fromIdentifier(identifier);
    if (!magnet) {
        return makeUnexpected(magnet.error());
    }
    if (fileIndex < 0) {
        return makeUnexpected(StreamError::FileNotFound);
    }

    auto attached = registry_->attach(magnet.value(), fileIndex, WatcherKind::Status);
    if (!attached) {
        return makeUnexpected(attached.error());
    }
    if (statusPublisher_) {
        statusPublisher_->track(attached.value().watcherId, attached.value().swarm, fileIndex);
    }
    return attached.value().watcherId;
}

void StreamMultiplexer::fail(const QString& watcherId, StreamError error) {
    SWARMCAST_WARN("Watcher {} failed: {}", watcherId.toStdString(), errorMessage(error).toStdString());
    if (statusPublisher_) {
        statusPublisher_->publishError(watcherId, error);
    }
    closeStream(watcherId);
}

} // namespace Swarmcast
