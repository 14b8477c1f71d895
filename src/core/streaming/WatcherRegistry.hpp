#pragma once

#include <QtCore/QDateTime>
#include <QtCore/QHash>
#include <QtCore/QMutex>
#include <QtCore/QObject>
#include <QtCore/QReadWriteLock>
#include <QtCore/QSet>
#include <atomic>
#include <memory>
#include <optional>

#include "../common/Config.hpp"
#include "../torrent/SwarmClient.hpp"

namespace Swarmcast {

class TranscodePool;

enum class WatcherKind {
    Stream,  // consumes bytes
    Status   // SSE subscriber without a byte stream
};

struct WatcherInfo {
    QString id;
    QString infoHash;
    int fileIndex = 0;
    WatcherKind kind = WatcherKind::Stream;
    QDateTime createdAt;
    QDateTime lastActivity;
    qint64 rangeStart = -1;
    qint64 rangeEnd = -1;
    bool transcoded = false;
};

struct AttachResult {
    QString watcherId;
    SwarmHandle swarm;
};

struct FileWatchInfo {
    QString infoHash;
    int fileIndex = 0;
    int watchers = 0;
    bool hasCleanupTimer = false;
};

struct RegistryDebugInfo {
    int activeStreams = 0;
    int activeTorrents = 0;
    int totalWatchers = 0;
    QList<FileWatchInfo> files;
};

/**
 * @brief Reference counts watchers per (infohash, fileIndex) and owns swarm leases
 *
 * The first watcher of an info hash joins the swarm; the registry holds that
 * lease until the idle timer of every file of the swarm has fired with no
 * watchers attached. Each detach that brings a file to zero watchers arms
 * exactly one cleanup timer, identified by a generation number; an attach
 * before it fires bumps the generation, so the timer finds itself stale and
 * does nothing.
 *
 * The map lock is only held for lookups and inserts. Per-swarm state has its
 * own mutex and the two are never held together.
 */
class WatcherRegistry : public QObject {
    Q_OBJECT

public:
    WatcherRegistry(SwarmClient* swarmClient, TranscodePool* transcodePool,
                    const Config::StreamingSettings& settings, QObject* parent = nullptr);
    ~WatcherRegistry() override;

    WatcherRegistry(const WatcherRegistry&) = delete;
    WatcherRegistry& operator=(const WatcherRegistry&) = delete;

    /**
     * @brief Adds a watcher, joining the swarm if this is its first
     * @return Watcher id and the swarm lease, CapacityReached, or the join failure
     */
    Expected<AttachResult, StreamError> attach(const MagnetUri& magnet, int fileIndex, WatcherKind kind);

    /// Removes a watcher; unknown or repeated ids are ignored
    void detach(const QString& watcherId);

    std::optional<WatcherInfo> watcher(const QString& watcherId) const;
    void touch(const QString& watcherId);
    void setRange(const QString& watcherId, qint64 start, qint64 end);
    void setTranscoded(const QString& watcherId, bool transcoded);

    int watcherCount(const QString& infoHash, int fileIndex) const;
    bool hasCleanupTimer(const QString& infoHash, int fileIndex) const;
    bool hasSwarm(const QString& infoHash) const;
    int streamWatcherCount() const { return streamWatchers_.load(); }

    RegistryDebugInfo debugInfo() const;

    /// Drops every watcher and lease without waiting for grace periods
    void shutdown();

signals:
    void swarmAttached(const QString& infoHash);
    void cleanupScheduled(const QString& infoHash, int fileIndex);
    void cleanupCancelled(const QString& infoHash, int fileIndex);
    void fileReleased(const QString& infoHash, int fileIndex);
    void swarmReleased(const QString& infoHash);

private:
    struct FileSlot {
        QSet<QString> watchers;
        quint64 cleanupGeneration = 0;
        bool cleanupPending = false;
    };

    struct SwarmSlot {
        QMutex mutex;
        QString infoHash;
        SwarmHandle lease;
        bool retired = false;
        QHash<int, FileSlot> files;
    };

    std::shared_ptr<SwarmSlot> findSlot(const QString& infoHash) const;
    std::shared_ptr<SwarmSlot> findOrCreateSlot(const QString& infoHash);
    void removeSlot(const std::shared_ptr<SwarmSlot>& slot);
    void armCleanup(const QString& infoHash, int fileIndex, quint64 generation);
    void onCleanupTimer(const QString& infoHash, int fileIndex, quint64 generation);

    SwarmClient* swarmClient_;
    TranscodePool* transcodePool_;
    Config::StreamingSettings settings_;

    mutable QReadWriteLock mapLock_;
    QHash<QString, std::shared_ptr<SwarmSlot>> slots_;

    mutable QMutex watchersMutex_;
    QHash<QString, WatcherInfo> watchers_;

    std::atomic<int> streamWatchers_{0};
};

} // namespace Swarmcast
