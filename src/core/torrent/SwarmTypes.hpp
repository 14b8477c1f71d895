#pragma once

#include <QtCore/QList>
#include <QtCore/QMetaType>
#include <QtCore/QString>
#include <QtCore/QVector>

namespace Swarmcast {

struct SwarmFile {
    int index = 0;
    QString path;        // path inside the torrent
    QString name;        // last path component
    qint64 offset = 0;   // byte offset within the torrent
    qint64 length = 0;
    int firstPiece = 0;
    int lastPiece = 0;
};

/**
 * @brief Normalized torrent metadata
 *
 * Either fully populated (totalSize equals the sum of file lengths) or not
 * returned at all.
 */
struct TorrentMetadata {
    QString infoHash;
    QString name;
    qint64 totalSize = 0;
    int pieceLength = 0;
    int pieceCount = 0;
    QList<SwarmFile> files;

    bool isConsistent() const {
        if (infoHash.isEmpty() || files.isEmpty()) {
            return false;
        }
        qint64 sum = 0;
        for (const SwarmFile& file : files) {
            sum += file.length;
        }
        return sum == totalSize;
    }
};

/**
 * @brief One lease on a joined swarm
 *
 * The swarm stays joined while any lease is outstanding; releasing the same
 * lease twice is a no-op.
 */
struct SwarmHandle {
    QString infoHash;
    quint64 leaseId = 0;

    bool isValid() const { return !infoHash.isEmpty() && leaseId != 0; }
};

struct SwarmStats {
    QString infoHash;
    QString name;
    bool hasMetadata = false;
    int numPeers = 0;
    int numSeeds = 0;       // peers with the full torrent, from the tracker/DHT scrape
    int numLeechers = 0;
    qint64 downloadRate = 0;  // bytes/s
    qint64 uploadRate = 0;
    double progress = 0.0;    // 0..1 of wanted bytes
    qint64 downloaded = 0;
    qint64 uploaded = 0;
    QVector<qint64> fileBytesDone;
};

struct DhtStatus {
    bool ready = false;
    int nodeCount = 0;
};

} // namespace Swarmcast

Q_DECLARE_METATYPE(Swarmcast::TorrentMetadata)
