#include "MockComponents.hpp"

#include <QtCore/QDeadlineTimer>
#include <QtCore/QFileInfo>
#include <QtCore/QtEndian>

#include <algorithm>

namespace Swarmcast {
namespace Test {

MemoryByteSource::MemoryByteSource(QByteArray data, qint64 chunkLimit, bool stall)
    : data_(std::move(data))
    , chunkLimit_(chunkLimit)
    , stall_(stall) {
}

Expected<QByteArray, StreamError> MemoryByteSource::read(qint64 maxBytes) {
    QMutexLocker locker(&mutex_);
    while (stall_ && !isCancelled_) {
        cancelled_.wait(&mutex_);
    }
    if (isCancelled_) {
        return makeUnexpected(StreamError::Cancelled);
    }

    qint64 count = std::min<qint64>(maxBytes, data_.size() - position_);
    if (chunkLimit_ > 0) {
        count = std::min(count, chunkLimit_);
    }
    const QByteArray chunk = data_.mid(position_, count);
    position_ += chunk.size();
    return chunk;
}

void MemoryByteSource::cancel() {
    QMutexLocker locker(&mutex_);
    isCancelled_ = true;
    cancelled_.wakeAll();
}

bool MemoryByteSource::isCancelled() const {
    QMutexLocker locker(&mutex_);
    return isCancelled_;
}

void FakeSwarmClient::addTorrent(const QString& infoHash, const QString& name,
                                 const QList<FakeFile>& files, int pieceLength) {
    Torrent torrent;
    torrent.metadata.infoHash = infoHash;
    torrent.metadata.name = name;
    torrent.metadata.pieceLength = pieceLength;

    qint64 offset = 0;
    for (int i = 0; i < files.size(); ++i) {
        const FakeFile& fake = files.at(i);
        SwarmFile file;
        file.index = i;
        file.path = fake.path;
        file.name = QFileInfo(fake.path).fileName();
        file.offset = offset;
        file.length = fake.declaredLength >= 0 ? fake.declaredLength : fake.content.size();
        file.firstPiece = static_cast<int>(offset / pieceLength);
        file.lastPiece = static_cast<int>(std::max<qint64>(offset, offset + file.length - 1) / pieceLength);
        offset += file.length;
        torrent.metadata.files.append(file);
        torrent.contents.append(fake.content);
    }
    torrent.metadata.totalSize = offset;
    torrent.metadata.pieceCount = static_cast<int>((offset + pieceLength - 1) / pieceLength);

    QMutexLocker locker(&mutex_);
    torrents_.insert(infoHash, torrent);
    changed_.wakeAll();
}

void FakeSwarmClient::setMetadataWithheld(const QString& infoHash, bool withheld) {
    QMutexLocker locker(&mutex_);
    auto it = torrents_.find(infoHash);
    if (it != torrents_.end()) {
        it->withheld = withheld;
    }
    changed_.wakeAll();
}

void FakeSwarmClient::setJoinFailure(std::optional<StreamError> error) {
    QMutexLocker locker(&mutex_);
    joinFailure_ = error;
}

void FakeSwarmClient::setStallReads(bool stall) {
    QMutexLocker locker(&mutex_);
    stallReads_ = stall;
}

void FakeSwarmClient::setReadChunkLimit(qint64 bytes) {
    QMutexLocker locker(&mutex_);
    readChunkLimit_ = bytes;
}

void FakeSwarmClient::setStats(const QString& infoHash, const SwarmStats& stats) {
    QMutexLocker locker(&mutex_);
    stats_.insert(infoHash, stats);
}

void FakeSwarmClient::setDhtStatus(const DhtStatus& status) {
    QMutexLocker locker(&mutex_);
    dht_ = status;
}

int FakeSwarmClient::swarmCreations(const QString& infoHash) const {
    QMutexLocker locker(&mutex_);
    return creations_.value(infoHash);
}

int FakeSwarmClient::joinCount() const {
    QMutexLocker locker(&mutex_);
    return joins_;
}

int FakeSwarmClient::leaveCount() const {
    QMutexLocker locker(&mutex_);
    return leaves_;
}

int FakeSwarmClient::leaseCount(const QString& infoHash) const {
    QMutexLocker locker(&mutex_);
    auto it = swarms_.constFind(infoHash);
    return it == swarms_.constEnd() ? 0 : it->leases.size();
}

int FakeSwarmClient::readRangeCount() const {
    QMutexLocker locker(&mutex_);
    return readRanges_;
}

bool FakeSwarmClient::isJoined(const QString& infoHash) const {
    QMutexLocker locker(&mutex_);
    return swarms_.contains(infoHash);
}

QList<QPair<qint64, qint64>> FakeSwarmClient::priorities(const QString& infoHash) const {
    QMutexLocker locker(&mutex_);
    return swarms_.value(infoHash).priorities;
}

Expected<SwarmHandle, StreamError> FakeSwarmClient::join(const MagnetUri& magnet) {
    QMutexLocker locker(&mutex_);
    if (joinFailure_) {
        return makeUnexpected(*joinFailure_);
    }

    ++joins_;
    if (!swarms_.contains(magnet.infoHash)) {
        swarms_.insert(magnet.infoHash, Swarm());
        ++creations_[magnet.infoHash];
    }

    SwarmHandle handle;
    handle.infoHash = magnet.infoHash;
    handle.leaseId = nextLease_++;
    swarms_[magnet.infoHash].leases.insert(handle.leaseId, true);
    return handle;
}

void FakeSwarmClient::leave(const SwarmHandle& handle) {
    QMutexLocker locker(&mutex_);
    auto it = swarms_.find(handle.infoHash);
    if (it == swarms_.end() || !it->leases.remove(handle.leaseId)) {
        return;
    }
    ++leaves_;
    if (it->leases.isEmpty()) {
        swarms_.erase(it);
        changed_.wakeAll();
    }
}

bool FakeSwarmClient::metadataReadyLocked(const QString& infoHash) const {
    auto it = torrents_.constFind(infoHash);
    return it != torrents_.constEnd() && !it->withheld;
}

Expected<TorrentMetadata, StreamError> FakeSwarmClient::waitForMetadata(const SwarmHandle& handle,
                                                                        std::chrono::milliseconds timeout) {
    QMutexLocker locker(&mutex_);
    QDeadlineTimer deadline(timeout.count());

    while (true) {
        auto swarm = swarms_.constFind(handle.infoHash);
        if (swarm == swarms_.constEnd() || !swarm->leases.contains(handle.leaseId)) {
            return makeUnexpected(StreamError::Cancelled);
        }
        if (metadataReadyLocked(handle.infoHash)) {
            return torrents_.value(handle.infoHash).metadata;
        }
        if (deadline.hasExpired() || !changed_.wait(&mutex_, deadline)) {
            if (metadataReadyLocked(handle.infoHash)) {
                continue;
            }
            return makeUnexpected(StreamError::SwarmTimeout);
        }
    }
}

Expected<std::shared_ptr<ByteSource>, StreamError> FakeSwarmClient::readRange(const SwarmHandle& handle,
                                                                              int fileIndex,
                                                                              qint64 byteStart,
                                                                              qint64 byteEnd) {
    QMutexLocker locker(&mutex_);
    if (!swarms_.contains(handle.infoHash)) {
        return makeUnexpected(StreamError::SwarmUnavailable);
    }
    if (!metadataReadyLocked(handle.infoHash)) {
        return makeUnexpected(StreamError::SwarmTimeout);
    }
    const Torrent& torrent = torrents_[handle.infoHash];
    if (fileIndex < 0 || fileIndex >= torrent.contents.size()) {
        return makeUnexpected(StreamError::FileNotFound);
    }
    const qint64 length = torrent.metadata.files.at(fileIndex).length;
    if (byteStart < 0 || byteEnd >= length || byteStart > byteEnd) {
        return makeUnexpected(StreamError::RangeNotSatisfiable);
    }

    ++readRanges_;
    const QByteArray slice = torrent.contents.at(fileIndex).mid(byteStart, byteEnd - byteStart + 1);
    return std::shared_ptr<ByteSource>(std::make_shared<MemoryByteSource>(slice, readChunkLimit_, stallReads_));
}

void FakeSwarmClient::setPriority(const SwarmHandle& handle, int fileIndex, qint64 byteStart, qint64 byteEnd) {
    Q_UNUSED(fileIndex);
    QMutexLocker locker(&mutex_);
    auto it = swarms_.find(handle.infoHash);
    if (it != swarms_.end()) {
        it->priorities.append(qMakePair(byteStart, byteEnd));
    }
}

std::optional<SwarmStats> FakeSwarmClient::stats(const QString& infoHash) const {
    QMutexLocker locker(&mutex_);
    if (!swarms_.contains(infoHash)) {
        return std::nullopt;
    }
    auto it = stats_.constFind(infoHash);
    if (it != stats_.constEnd()) {
        return it.value();
    }
    SwarmStats stats;
    stats.infoHash = infoHash;
    stats.hasMetadata = metadataReadyLocked(infoHash);
    return stats;
}

QList<SwarmStats> FakeSwarmClient::allStats() const {
    QStringList hashes;
    {
        QMutexLocker locker(&mutex_);
        hashes = swarms_.keys();
    }
    QList<SwarmStats> result;
    for (const QString& hash : hashes) {
        if (auto s = stats(hash)) {
            result.append(*s);
        }
    }
    return result;
}

DhtStatus FakeSwarmClient::dhtStatus() const {
    QMutexLocker locker(&mutex_);
    return dht_;
}

int FakeSwarmClient::activeSwarmCount() const {
    QMutexLocker locker(&mutex_);
    return swarms_.size();
}

void FakeCodecProbe::setResult(const QString& fileName, const ProbedCodecs& codecs) {
    QMutexLocker locker(&mutex_);
    results_.insert(fileName, codecs);
}

std::optional<ProbedCodecs> FakeCodecProbe::probe(std::shared_ptr<ByteSource> source, const QString& fileName) {
    ++probes_;
    source->cancel();
    QMutexLocker locker(&mutex_);
    auto it = results_.constFind(fileName);
    if (it == results_.constEnd()) {
        return std::nullopt;
    }
    return it.value();
}

QByteArray buildMp4Box(const QByteArray& type, const QByteArray& payload) {
    QByteArray box(4, '\0');
    qToBigEndian<quint32>(static_cast<quint32>(payload.size() + 8), reinterpret_cast<uchar*>(box.data()));
    box.append(type.left(4));
    box.append(payload);
    return box;
}

QByteArray buildFragmentedMp4(int fragments, int payloadBytes) {
    QByteArray stream;
    stream.append(buildMp4Box("ftyp", QByteArray("isomiso6mp41")));
    stream.append(buildMp4Box("moov", QByteArray(payloadBytes, 'v')));
    for (int i = 0; i < fragments; ++i) {
        stream.append(buildMp4Box("moof", QByteArray(16, static_cast<char>('a' + (i % 26)))));
        stream.append(buildMp4Box("mdat", QByteArray(payloadBytes, static_cast<char>('A' + (i % 26)))));
    }
    return stream;
}

} // namespace Test
} // namespace Swarmcast
