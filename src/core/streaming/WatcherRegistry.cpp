#include "WatcherRegistry.hpp"
#include "../common/Logger.hpp"
#include "../media/TranscodePool.hpp"

#include <QtCore/QTimer>
#include <QtCore/QUuid>

namespace Swarmcast {

WatcherRegistry::WatcherRegistry(SwarmClient* swarmClient, TranscodePool* transcodePool,
                                 const Config::StreamingSettings& settings, QObject* parent)
    : QObject(parent)
    , swarmClient_(swarmClient)
    , transcodePool_(transcodePool)
    , settings_(settings) {
}

WatcherRegistry::~WatcherRegistry() {
    shutdown();
}

std::shared_ptr<WatcherRegistry::SwarmSlot> WatcherRegistry::findSlot(const QString& infoHash) const {
    QReadLocker locker(&mapLock_);
    return slots_.value(infoHash);
}

std::shared_ptr<WatcherRegistry::SwarmSlot> WatcherRegistry::findOrCreateSlot(const QString& infoHash) {
    if (auto slot = findSlot(infoHash)) {
        return slot;
    }
    QWriteLocker locker(&mapLock_);
    auto slot = slots_.value(infoHash);
    if (!slot) {
        slot = std::make_shared<SwarmSlot>();
        slot->infoHash = infoHash;
        slots_.insert(infoHash, slot);
    }
    return slot;
}

void WatcherRegistry::removeSlot(const std::shared_ptr<SwarmSlot>& slot) {
    QWriteLocker locker(&mapLock_);
    if (slots_.value(slot->infoHash) == slot) {
        slots_.remove(slot->infoHash);
    }
}

Expected<AttachResult, StreamError> WatcherRegistry::attach(const MagnetUri& magnet, int fileIndex,
                                                           WatcherKind kind) {
    if (kind == WatcherKind::Stream
        && streamWatchers_.fetch_add(1) >= settings_.maxConcurrentStreams) {
        streamWatchers_.fetch_sub(1);
        SWARMCAST_WARN("Stream capacity of {} reached, rejecting {}#{}",
                       settings_.maxConcurrentStreams, magnet.infoHash.toStdString(), fileIndex);
        return makeUnexpected(StreamError::CapacityReached);
    }

    const QString& infoHash = magnet.infoHash;
    bool joined = false;
    bool cancelledCleanup = false;
    AttachResult result;

    while (true) {
        auto slot = findOrCreateSlot(infoHash);
        QMutexLocker locker(&slot->mutex);

        if (slot->retired) {
            // Lost the race with a teardown; replace the dead entry
            locker.unlock();
            removeSlot(slot);
            continue;
        }

        if (!slot->lease.isValid()) {
            auto lease = swarmClient_->join(magnet);
            if (!lease) {
                slot->retired = true;
                locker.unlock();
                removeSlot(slot);
                if (kind == WatcherKind::Stream) {
                    streamWatchers_.fetch_sub(1);
                }
                return makeUnexpected(lease.error());
            }
            slot->lease = lease.value();
            joined = true;
        }

        FileSlot& file = slot->files[fileIndex];
        if (file.cleanupPending) {
            file.cleanupPending = false;
            ++file.cleanupGeneration;
            cancelledCleanup = true;
        }

        result.watcherId = QUuid::createUuid().toString(QUuid::WithoutBraces);
        result.swarm = slot->lease;
        file.watchers.insert(result.watcherId);

        WatcherInfo info;
        info.id = result.watcherId;
        info.infoHash = infoHash;
        info.fileIndex = fileIndex;
        info.kind = kind;
        info.createdAt = QDateTime::currentDateTimeUtc();
        info.lastActivity = info.createdAt;
        {
            QMutexLocker watchersLocker(&watchersMutex_);
            watchers_.insert(result.watcherId, info);
        }

        SWARMCAST_DEBUG("Watcher {} attached to {}#{} ({} on file)", result.watcherId.toStdString(),
                        infoHash.toStdString(), fileIndex, file.watchers.size());
        break;
    }

    if (joined) {
        SWARMCAST_INFO("Swarm {} acquired by registry", infoHash.toStdString());
        emit swarmAttached(infoHash);
    }
    if (cancelledCleanup) {
        SWARMCAST_DEBUG("Cleanup of {}#{} cancelled by reattach", infoHash.toStdString(), fileIndex);
        emit cleanupCancelled(infoHash, fileIndex);
    }
    return result;
}

void WatcherRegistry::detach(const QString& watcherId) {
    WatcherInfo info;
    {
        QMutexLocker locker(&watchersMutex_);
        auto it = watchers_.find(watcherId);
        if (it == watchers_.end()) {
            return;
        }
        info = it.value();
        watchers_.erase(it);
    }

    if (info.kind == WatcherKind::Stream) {
        streamWatchers_.fetch_sub(1);
    }
    if (transcodePool_) {
        transcodePool_->release(watcherId);
    }

    auto slot = findSlot(info.infoHash);
    if (!slot) {
        return;
    }

    quint64 generation = 0;
    {
        QMutexLocker locker(&slot->mutex);
        auto it = slot->files.find(info.fileIndex);
        if (it == slot->files.end()) {
            return;
        }
        it->watchers.remove(watcherId);
        if (!it->watchers.isEmpty() || it->cleanupPending) {
            return;
        }
        it->cleanupPending = true;
        generation = ++it->cleanupGeneration;
    }

    SWARMCAST_DEBUG("Last watcher left {}#{}, cleanup in {} ms",
                    info.infoHash.toStdString(), info.fileIndex, settings_.cleanupGraceMs);
    armCleanup(info.infoHash, info.fileIndex, generation);
    emit cleanupScheduled(info.infoHash, info.fileIndex);
}

void WatcherRegistry::armCleanup(const QString& infoHash, int fileIndex, quint64 generation) {
    // Timers must be started on the registry's thread
    QMetaObject::invokeMethod(this, [this, infoHash, fileIndex, generation]() {
        QTimer::singleShot(settings_.cleanupGraceMs, this, [this, infoHash, fileIndex, generation]() {
            onCleanupTimer(infoHash, fileIndex, generation);
        });
    }, Qt::QueuedConnection);
}

void WatcherRegistry::onCleanupTimer(const QString& infoHash, int fileIndex, quint64 generation) {
    auto slot = findSlot(infoHash);
    if (!slot) {
        return;
    }

    bool swarmIdle = false;
    SwarmHandle lease;
    {
        QMutexLocker locker(&slot->mutex);
        auto it = slot->files.find(fileIndex);
        if (it == slot->files.end() || !it->cleanupPending
            || it->cleanupGeneration != generation || !it->watchers.isEmpty()) {
            return;
        }
        slot->files.erase(it);
        if (slot->files.isEmpty()) {
            slot->retired = true;
            swarmIdle = true;
            lease = slot->lease;
        }
    }

    SWARMCAST_INFO("Releasing idle file {}#{}", infoHash.toStdString(), fileIndex);
    if (transcodePool_) {
        transcodePool_->terminate(infoHash, fileIndex);
    }
    emit fileReleased(infoHash, fileIndex);

    if (swarmIdle) {
        removeSlot(slot);
        swarmClient_->leave(lease);
        SWARMCAST_INFO("Swarm {} released, no watchers left", infoHash.toStdString());
        emit swarmReleased(infoHash);
    }
}

std::optional<WatcherInfo> WatcherRegistry::watcher(const QString& watcherId) const {
    QMutexLocker locker(&watchersMutex_);
    auto it = watchers_.constFind(watcherId);
    if (it == watchers_.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

void WatcherRegistry::touch(const QString& watcherId) {
    QMutexLocker locker(&watchersMutex_);
    auto it = watchers_.find(watcherId);
    if (it != watchers_.end()) {
        it->lastActivity = QDateTime::currentDateTimeUtc();
    }
}

void WatcherRegistry::setRange(const QString& watcherId, qint64 start, qint64 end) {
    QMutexLocker locker(&watchersMutex_);
    auto it = watchers_.find(watcherId);
    if (it != watchers_.end()) {
        it->rangeStart = start;
        it->rangeEnd = end;
    }
}

void WatcherRegistry::setTranscoded(const QString& watcherId, bool transcoded) {
    QMutexLocker locker(&watchersMutex_);
    auto it = watchers_.find(watcherId);
    if (it != watchers_.end()) {
        it->transcoded = transcoded;
    }
}

int WatcherRegistry::watcherCount(const QString& infoHash, int fileIndex) const {
    auto slot = findSlot(infoHash);
    if (!slot) {
        return 0;
    }
    QMutexLocker locker(&slot->mutex);
    auto it = slot->files.constFind(fileIndex);
    return it == slot->files.constEnd() ? 0 : it->watchers.size();
}

bool WatcherRegistry::hasCleanupTimer(const QString& infoHash, int fileIndex) const {
    auto slot = findSlot(infoHash);
    if (!slot) {
        return false;
    }
    QMutexLocker locker(&slot->mutex);
    auto it = slot->files.constFind(fileIndex);
    return it != slot->files.constEnd() && it->cleanupPending;
}

bool WatcherRegistry::hasSwarm(const QString& infoHash) const {
    auto slot = findSlot(infoHash);
    if (!slot) {
        return false;
    }
    QMutexLocker locker(&slot->mutex);
    return !slot->retired && slot->lease.isValid();
}

RegistryDebugInfo WatcherRegistry::debugInfo() const {
    QList<std::shared_ptr<SwarmSlot>> slots;
    {
        QReadLocker locker(&mapLock_);
        slots = slots_.values();
    }

    RegistryDebugInfo info;
    info.activeStreams = streamWatchers_.load();
    for (const auto& slot : slots) {
        QMutexLocker locker(&slot->mutex);
        if (slot->retired || !slot->lease.isValid()) {
            continue;
        }
        ++info.activeTorrents;
        for (auto it = slot->files.constBegin(); it != slot->files.constEnd(); ++it) {
            FileWatchInfo file;
            file.infoHash = slot->infoHash;
            file.fileIndex = it.key();
            file.watchers = it->watchers.size();
            file.hasCleanupTimer = it->cleanupPending;
            info.totalWatchers += file.watchers;
            info.files.append(file);
        }
    }
    return info;
}

void WatcherRegistry::shutdown() {
    QList<std::shared_ptr<SwarmSlot>> slots;
    {
        QWriteLocker locker(&mapLock_);
        slots = slots_.values();
        slots_.clear();
    }
    {
        QMutexLocker locker(&watchersMutex_);
        watchers_.clear();
    }
    streamWatchers_.store(0);

    for (const auto& slot : slots) {
        SwarmHandle lease;
        {
            QMutexLocker locker(&slot->mutex);
            slot->retired = true;
            slot->files.clear();
            lease = slot->lease;
        }
        if (lease.isValid()) {
            swarmClient_->leave(lease);
        }
    }
}

} // namespace Swarmcast
