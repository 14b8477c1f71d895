#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QHash>
#include <QtCore/QList>
#include <QtCore/QMutex>
#include <QtCore/QPair>
#include <QtCore/QString>
#include <QtCore/QWaitCondition>
#include <atomic>
#include <memory>
#include <optional>

#include "../../src/core/common/ByteSource.hpp"
#include "../../src/core/media/FFmpegProbe.hpp"
#include "../../src/core/torrent/SwarmClient.hpp"

namespace Swarmcast {
namespace Test {

/**
 * @brief ByteSource over an in-memory buffer
 *
 * With stall set, read() blocks until cancel() and then returns Cancelled,
 * like a piece that never arrives.
 */
class MemoryByteSource : public ByteSource {
public:
    MemoryByteSource(QByteArray data, qint64 chunkLimit, bool stall);

    Expected<QByteArray, StreamError> read(qint64 maxBytes) override;
    void cancel() override;

    bool isCancelled() const;

private:
    mutable QMutex mutex_;
    QWaitCondition cancelled_;
    QByteArray data_;
    qint64 position_ = 0;
    qint64 chunkLimit_;
    bool stall_;
    bool isCancelled_ = false;
};

/**
 * @brief In-process swarm with scripted torrents
 *
 * Torrents registered with addTorrent() are known to the fake "DHT"; their
 * metadata becomes available after a join unless withheld. Counts joins,
 * swarm creations and leaves so tests can check sharing and cleanup.
 */
class FakeSwarmClient : public SwarmClient {
public:
    struct FakeFile {
        QString path;
        QByteArray content;
        qint64 declaredLength = -1;   // overrides content.size() when >= 0
    };

    FakeSwarmClient() = default;

    void addTorrent(const QString& infoHash, const QString& name, const QList<FakeFile>& files,
                    int pieceLength = 16384);

    /// Keeps metadata of @p infoHash unknown until released
    void setMetadataWithheld(const QString& infoHash, bool withheld);

    void setJoinFailure(std::optional<StreamError> error);
    void setStallReads(bool stall);
    void setReadChunkLimit(qint64 bytes);
    void setStats(const QString& infoHash, const SwarmStats& stats);
    void setDhtStatus(const DhtStatus& status);

    int swarmCreations(const QString& infoHash) const;
    int joinCount() const;
    int leaveCount() const;
    int leaseCount(const QString& infoHash) const;
    int readRangeCount() const;
    bool isJoined(const QString& infoHash) const;
    QList<QPair<qint64, qint64>> priorities(const QString& infoHash) const;

    // SwarmClient
    Expected<SwarmHandle, StreamError> join(const MagnetUri& magnet) override;
    void leave(const SwarmHandle& handle) override;
    Expected<TorrentMetadata, StreamError> waitForMetadata(const SwarmHandle& handle,
                                                           std::chrono::milliseconds timeout) override;
    Expected<std::shared_ptr<ByteSource>, StreamError> readRange(const SwarmHandle& handle, int fileIndex,
                                                                 qint64 byteStart, qint64 byteEnd) override;
    void setPriority(const SwarmHandle& handle, int fileIndex, qint64 byteStart, qint64 byteEnd) override;
    std::optional<SwarmStats> stats(const QString& infoHash) const override;
    QList<SwarmStats> allStats() const override;
    DhtStatus dhtStatus() const override;
    int activeSwarmCount() const override;

private:
    struct Torrent {
        TorrentMetadata metadata;
        QList<QByteArray> contents;
        bool withheld = false;
    };

    struct Swarm {
        QHash<quint64, bool> leases;
        QList<QPair<qint64, qint64>> priorities;
    };

    bool metadataReadyLocked(const QString& infoHash) const;

    mutable QMutex mutex_;
    QWaitCondition changed_;
    QHash<QString, Torrent> torrents_;
    QHash<QString, Swarm> swarms_;
    QHash<QString, int> creations_;
    QHash<QString, SwarmStats> stats_;
    DhtStatus dht_{true, 120};
    std::optional<StreamError> joinFailure_;
    bool stallReads_ = false;
    qint64 readChunkLimit_ = 0;
    quint64 nextLease_ = 1;
    int joins_ = 0;
    int leaves_ = 0;
    int readRanges_ = 0;
};

/**
 * @brief CodecProbe answering from a fixed table keyed by file name
 */
class FakeCodecProbe : public CodecProbe {
public:
    void setResult(const QString& fileName, const ProbedCodecs& codecs);

    std::optional<ProbedCodecs> probe(std::shared_ptr<ByteSource> source,
                                      const QString& fileName) override;

    int probeCount() const { return probes_.load(); }

private:
    QMutex mutex_;
    QHash<QString, ProbedCodecs> results_;
    std::atomic<int> probes_{0};
};

/// Smallest fragmented MP4 box sequence: ftyp, moov, then @p fragments moof+mdat pairs
QByteArray buildFragmentedMp4(int fragments, int payloadBytes = 64);

/// One ISO BMFF box with a 32-bit size header
QByteArray buildMp4Box(const QByteArray& type, const QByteArray& payload);

} // namespace Test
} // namespace Swarmcast
