#pragma once

#include <QtCore/QHash>
#include <QtCore/QMutex>
#include <QtCore/QObject>
#include <QtCore/QSet>
#include <QtCore/QWaitCondition>
#include <functional>
#include <memory>

#include "../common/CancelToken.hpp"
#include "TranscodeSession.hpp"

namespace Swarmcast {

/// What a watcher holds while attached to a transcode
struct TranscodeLease {
    QString sessionId;
    std::shared_ptr<ByteChannel> output;
    QString mimeType;
};

struct TranscodePoolStats {
    int activeProcesses = 0;
    int maxProcesses = 0;
    int queuedAcquirers = 0;
    QList<TranscodeSessionInfo> sessions;
};

/**
 * @brief Bounded set of transcode sessions, one per (infohash, fileIndex)
 *
 * acquire() attaches to the running session for the file or starts one when
 * below the process ceiling. At the ceiling it waits up to queueWaitMs for a
 * slot, then fails with PoolExhausted. A session whose last subscriber leaves
 * is kept for graceMs so a reconnecting watcher can rejoin it.
 *
 * The pool and its sessions live on one thread; acquire() may be called from
 * any thread.
 */
class TranscodePool : public QObject {
    Q_OBJECT

public:
    using SourceFactory = std::function<Expected<std::shared_ptr<ByteSource>, StreamError>()>;

    explicit TranscodePool(const Config::TranscodeSettings& settings, QObject* parent = nullptr);
    ~TranscodePool() override;

    TranscodePool(const TranscodePool&) = delete;
    TranscodePool& operator=(const TranscodePool&) = delete;

    /// Replaces the ffmpeg command builder
    void setCommandFactory(TranscodeCommandFactory factory);

    /**
     * @brief Subscribes @p watcherId to the session for a file, starting it if needed
     * @param sourceFactory Opens the input stream; only called when a new process starts
     * @param cancel Ends a wait for a free slot early with Cancelled
     * @return The lease, PoolExhausted, or TranscodeFailed if the process would not start
     */
    Expected<TranscodeLease, StreamError> acquire(const QString& infoHash, int fileIndex,
                                                  const QString& watcherId,
                                                  const SourceFactory& sourceFactory,
                                                  const TranscodePlan& plan,
                                                  CancelToken* cancel = nullptr);

    /// Detaches a watcher; starts the grace timer when the session has no subscribers left
    void release(const QString& watcherId);

    /// Stops the session for a file, if any
    void terminate(const QString& infoHash, int fileIndex);

    void terminateAll();

    bool hasSession(const QString& infoHash, int fileIndex) const;
    int activeCount() const;
    TranscodePoolStats stats() const;

    static TranscodeCommandFactory ffmpegCommandFactory(const Config::TranscodeSettings& settings);

signals:
    void sessionStarted(const QString& infoHash, int fileIndex, const QString& sessionId);
    void sessionEnded(const QString& infoHash, int fileIndex, const QString& sessionId, bool success);

private slots:
    void onSessionFinished(const QString& sessionId, bool success);
    void onSubscriberDropped(const QString& sessionId, const QString& watcherId);

private:
    static QString keyFor(const QString& infoHash, int fileIndex);

    TranscodeSession* createSession(const QString& infoHash, int fileIndex,
                                    const TranscodePlan& plan,
                                    std::shared_ptr<ByteSource> source);
    void scheduleGrace(const QString& key);
    void onGraceExpired(const QString& key, quint64 generation);
    void retireLocked(const QString& key);
    int occupiedLocked() const;

    Config::TranscodeSettings settings_;
    TranscodeCommandFactory commandFactory_;

    mutable QMutex mutex_;
    QWaitCondition slotFreed_;
    QHash<QString, TranscodeSession*> sessions_;   // accepting subscribers
    QSet<TranscodeSession*> retiring_;              // stopping, still counted against the ceiling
    QSet<QString> starting_;                        // keys with a spawn in progress
    QHash<QString, QString> watchers_;              // watcherId -> key
    QHash<QString, quint64> graceGeneration_;
    int queued_ = 0;
};

} // namespace Swarmcast
