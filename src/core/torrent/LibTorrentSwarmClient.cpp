#include "LibTorrentSwarmClient.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QDeadlineTimer>
#include <QtCore/QDir>
#include <QtCore/QHash>
#include <QtCore/QMutex>
#include <QtCore/QQueue>
#include <QtCore/QSet>
#include <QtCore/QTimer>
#include <QtCore/QWaitCondition>

#include <libtorrent/add_torrent_params.hpp>
#include <libtorrent/alert_types.hpp>
#include <libtorrent/error_code.hpp>
#include <libtorrent/file_storage.hpp>
#include <libtorrent/magnet_uri.hpp>
#include <libtorrent/session.hpp>
#include <libtorrent/session_params.hpp>
#include <libtorrent/session_stats.hpp>
#include <libtorrent/settings_pack.hpp>
#include <libtorrent/sha1_hash.hpp>
#include <libtorrent/torrent_handle.hpp>
#include <libtorrent/torrent_info.hpp>
#include <libtorrent/torrent_status.hpp>
#include <libtorrent/version.hpp>

#include <algorithm>
#include <atomic>
#include <iomanip>
#include <sstream>

namespace lt = libtorrent;

namespace Swarmcast {

namespace {

constexpr int kRerequestIntervalMs = 5000;
constexpr int kCancelPollMs = 250;
constexpr int kReadaheadDeadlineStepMs = 400;
constexpr int kTailDeadlineMs = 1500;
constexpr qint64 kMinTailBytes = 128 * 1024;

std::string to_hex(const lt::sha1_hash& hash) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned char i : hash) {
        oss << std::setw(2) << static_cast<int>(i);
    }
    return oss.str();
}

QString infoHashOf(const lt::torrent_handle& handle) {
    return QString::fromStdString(to_hex(handle.info_hashes().v1));
}

} // namespace

// Per-swarm state; its mutex never nests inside another entry's mutex
struct SwarmEntry {
    QString infoHash;
    QString displayName;
    lt::torrent_handle handle;
    QSet<quint64> leases;

    QMutex mutex;
    QWaitCondition changed;
    bool joined = false;
    bool removed = false;
    bool metadataReady = false;
    std::shared_ptr<const lt::torrent_info> info;

    QHash<int, QByteArray> pieceCache;
    QQueue<int> cacheOrder;
    qint64 cacheBytes = 0;
    QSet<int> activeFiles;

    // Caller holds mutex
    void applyFilePriorities() {
        if (!info) {
            return;
        }
        const int fileCount = info->num_files();
        std::vector<lt::download_priority_t> priorities(
            static_cast<std::size_t>(fileCount), lt::dont_download);
        for (int file : activeFiles) {
            if (file >= 0 && file < fileCount) {
                priorities[static_cast<std::size_t>(file)] = lt::default_priority;
            }
        }
        handle.prioritize_files(priorities);
    }

    // Caller holds mutex
    void storePiece(int piece, const QByteArray& data, qint64 capacity) {
        if (pieceCache.contains(piece)) {
            return;
        }
        pieceCache.insert(piece, data);
        cacheOrder.enqueue(piece);
        cacheBytes += data.size();
        while (cacheBytes > capacity && cacheOrder.size() > 1) {
            const int evicted = cacheOrder.dequeue();
            cacheBytes -= pieceCache.take(evicted).size();
        }
    }

    Expected<QByteArray, StreamError> fetchPiece(int piece, int timeoutMs,
                                                 const std::atomic<bool>& cancelled) {
        QMutexLocker locker(&mutex);
        QDeadlineTimer deadline(timeoutMs);
        QDeadlineTimer rerequest(0);

        while (true) {
            if (removed || cancelled.load()) {
                return makeUnexpected(StreamError::Cancelled);
            }
            auto it = pieceCache.constFind(piece);
            if (it != pieceCache.constEnd()) {
                return it.value();
            }
            if (deadline.hasExpired()) {
                SWARMCAST_WARN("Piece {} of {} not available within {} ms",
                               piece, infoHash.toStdString(), timeoutMs);
                return makeUnexpected(StreamError::SwarmTimeout);
            }
            if (rerequest.hasExpired()) {
                // Downloads the piece first if needed, then posts read_piece_alert
                handle.set_piece_deadline(lt::piece_index_t(piece), 0,
                                          lt::torrent_handle::alert_when_available);
                rerequest.setRemainingTime(kRerequestIntervalMs);
            }
            const qint64 wait = std::min<qint64>(kCancelPollMs, deadline.remainingTime());
            changed.wait(&mutex, static_cast<unsigned long>(std::max<qint64>(wait, 1)));
        }
    }
};

namespace {

/**
 * Sequential reader over one file range, slicing cached pieces.
 */
class PieceReader : public ByteSource {
public:
    PieceReader(std::weak_ptr<SwarmEntry> entry,
                std::shared_ptr<const lt::torrent_info> info,
                int fileIndex, qint64 start, qint64 end,
                int pieceTimeoutMs, int readaheadBytes)
        : entry_(std::move(entry))
        , info_(std::move(info))
        , fileIndex_(fileIndex)
        , position_(start)
        , end_(end)
        , pieceTimeoutMs_(pieceTimeoutMs) {
        const int pieceLength = std::max(1, info_->piece_length());
        readaheadPieces_ = std::max(1, readaheadBytes / pieceLength);
        lastFilePiece_ = static_cast<int>(info_->files().map_file(
            lt::file_index_t(fileIndex_), std::max<qint64>(0, fileSize() - 1), 1).piece);
    }

    Expected<QByteArray, StreamError> read(qint64 maxBytes) override {
        if (cancelled_.load()) {
            return makeUnexpected(StreamError::Cancelled);
        }
        if (position_ > end_) {
            return QByteArray();
        }

        auto entry = entry_.lock();
        if (!entry) {
            return makeUnexpected(StreamError::Cancelled);
        }

        const lt::peer_request request = info_->files().map_file(
            lt::file_index_t(fileIndex_), position_, 1);
        const int piece = static_cast<int>(request.piece);

        scheduleReadahead(*entry, piece);

        auto data = entry->fetchPiece(piece, pieceTimeoutMs_, cancelled_);
        if (data.hasError()) {
            return makeUnexpected(data.error());
        }

        const QByteArray& pieceData = data.value();
        const qint64 available = pieceData.size() - request.start;
        if (available <= 0) {
            SWARMCAST_ERROR("Short piece {} ({} bytes) for offset {}", piece, pieceData.size(), request.start);
            return makeUnexpected(StreamError::SwarmUnavailable);
        }

        const qint64 length = std::min({maxBytes, available, end_ - position_ + 1});
        position_ += length;
        return pieceData.mid(request.start, static_cast<int>(length));
    }

    void cancel() override {
        cancelled_.store(true);
        if (auto entry = entry_.lock()) {
            entry->changed.wakeAll();
        }
    }

private:
    qint64 fileSize() const {
        return info_->files().file_size(lt::file_index_t(fileIndex_));
    }

    void scheduleReadahead(SwarmEntry& entry, int piece) {
        if (piece <= scheduledThrough_ - readaheadPieces_ / 2) {
            return;
        }
        const int last = std::min(lastFilePiece_, piece + readaheadPieces_);
        for (int p = std::max(piece + 1, scheduledThrough_ + 1); p <= last; ++p) {
            entry.handle.set_piece_deadline(lt::piece_index_t(p),
                                            (p - piece) * kReadaheadDeadlineStepMs);
        }
        scheduledThrough_ = std::max(scheduledThrough_, last);
    }

    std::weak_ptr<SwarmEntry> entry_;
    std::shared_ptr<const lt::torrent_info> info_;
    int fileIndex_;
    qint64 position_;
    qint64 end_;
    int pieceTimeoutMs_;
    int readaheadPieces_ = 1;
    int lastFilePiece_ = 0;
    int scheduledThrough_ = -1;
    std::atomic<bool> cancelled_{false};
};

} // namespace

struct LibTorrentSwarmClient::LibTorrentSwarmClientPrivate {
    std::unique_ptr<lt::session> session;
    QHash<QString, std::shared_ptr<SwarmEntry>> swarms;
    mutable QMutex swarmsMutex;

    QTimer* alertTimer = nullptr;
    QTimer* statsTimer = nullptr;

    Config::SwarmSettings settings;
    bool initialized = false;

    std::atomic<quint64> nextLease{1};
    std::atomic<int> dhtNodes{0};
    int statsIdxDhtNodes = -1;

    std::shared_ptr<SwarmEntry> find(const QString& infoHash) const {
        QMutexLocker locker(&swarmsMutex);
        return swarms.value(infoHash);
    }
};

LibTorrentSwarmClient::LibTorrentSwarmClient(QObject* parent)
    : QObject(parent)
    , d(std::make_unique<LibTorrentSwarmClientPrivate>()) {

    d->alertTimer = new QTimer(this);
    d->alertTimer->setInterval(100);
    connect(d->alertTimer, &QTimer::timeout, this, &LibTorrentSwarmClient::processAlerts);

    d->statsTimer = new QTimer(this);
    d->statsTimer->setInterval(1000);
    connect(d->statsTimer, &QTimer::timeout, this, &LibTorrentSwarmClient::postStatistics);
}

LibTorrentSwarmClient::~LibTorrentSwarmClient() {
    shutdown();
}

Expected<bool, StreamError> LibTorrentSwarmClient::initialize(const Config::SwarmSettings& settings) {
    if (d->initialized) {
        SWARMCAST_WARN("Swarm session already initialized");
        return true;
    }

    if (!QDir().mkpath(settings.downloadPath)) {
        SWARMCAST_ERROR("Cannot create download directory {}", settings.downloadPath.toStdString());
        return makeUnexpected(StreamError::SwarmUnavailable);
    }

    try {
        d->statsIdxDhtNodes = lt::find_metric_idx("dht.dht_nodes");

        lt::settings_pack pack;
        pack.set_str(lt::settings_pack::user_agent, std::string("Swarmcast/1.0 libtorrent/") + lt::version());
        pack.set_str(lt::settings_pack::listen_interfaces, settings.listenInterfaces.toStdString());
        pack.set_str(lt::settings_pack::dht_bootstrap_nodes,
                     settings.dhtBootstrapNodes.join(QLatin1Char(',')).toStdString());
        pack.set_bool(lt::settings_pack::enable_dht, settings.enableDHT);
        pack.set_bool(lt::settings_pack::enable_lsd, settings.enableLSD);
        pack.set_bool(lt::settings_pack::enable_upnp, settings.enableUPnP);
        pack.set_bool(lt::settings_pack::enable_natpmp, settings.enableNATPMP);

        pack.set_int(lt::settings_pack::download_rate_limit,
                     settings.downloadRateLimit > 0 ? settings.downloadRateLimit * 1024 : 0);
        pack.set_int(lt::settings_pack::upload_rate_limit,
                     settings.uploadRateLimit > 0 ? settings.uploadRateLimit * 1024 : 0);
        pack.set_int(lt::settings_pack::connections_limit, settings.maxConnections);

        pack.set_int(lt::settings_pack::alert_mask,
            lt::alert_category::error |
            lt::alert_category::status |
            lt::alert_category::storage |
            lt::alert_category::stats);

        lt::session_params params;
        params.settings = pack;
        d->session = std::make_unique<lt::session>(std::move(params));

    } catch (const std::exception& e) {
        SWARMCAST_ERROR("Failed to create libtorrent session: {}", e.what());
        d->session.reset();
        return makeUnexpected(StreamError::SwarmUnavailable);
    }

    d->settings = settings;
    d->initialized = true;
    d->alertTimer->start();
    d->statsTimer->start();

    SWARMCAST_INFO("libtorrent {} session listening on {}",
                   lt::version(), settings.listenInterfaces.toStdString());
    return true;
}

void LibTorrentSwarmClient::shutdown() {
    if (!d->initialized) {
        return;
    }

    d->alertTimer->stop();
    d->statsTimer->stop();

    QList<std::shared_ptr<SwarmEntry>> entries;
    {
        QMutexLocker locker(&d->swarmsMutex);
        entries = d->swarms.values();
        d->swarms.clear();
    }

    for (const auto& entry : entries) {
        QMutexLocker locker(&entry->mutex);
        entry->removed = true;
        entry->changed.wakeAll();
        try {
            if (entry->handle.is_valid()) {
                d->session->remove_torrent(entry->handle, lt::session_handle::delete_files);
            }
        } catch (const std::exception& e) {
            SWARMCAST_WARN("Failed to remove {} during shutdown: {}", entry->infoHash.toStdString(), e.what());
        }
    }

    d->session.reset();
    d->initialized = false;
    SWARMCAST_INFO("Swarm session shut down");
}

bool LibTorrentSwarmClient::isInitialized() const {
    return d->initialized;
}

Expected<SwarmHandle, StreamError> LibTorrentSwarmClient::join(const MagnetUri& magnet) {
    if (!d->initialized) {
        return makeUnexpected(StreamError::SwarmUnavailable);
    }

    std::shared_ptr<SwarmEntry> entry;
    bool created = false;
    {
        QMutexLocker locker(&d->swarmsMutex);
        entry = d->swarms.value(magnet.infoHash);
        if (!entry) {
            entry = std::make_shared<SwarmEntry>();
            entry->infoHash = magnet.infoHash;
            entry->displayName = magnet.displayName;
            d->swarms.insert(magnet.infoHash, entry);
            created = true;
        }
    }

    // Creator adds the torrent under the entry lock; concurrent joiners wait on that lock
    QMutexLocker entryLocker(&entry->mutex);

    if (created) {
        try {
            lt::add_torrent_params params;
            lt::error_code ec;
            lt::parse_magnet_uri(magnet.withTrackers(d->settings.trackers).toString().toStdString(), params, ec);
            if (ec) {
                SWARMCAST_ERROR("Failed to parse magnet link: {}", ec.message());
                entry->removed = true;
            } else {
                params.save_path = d->settings.downloadPath.toStdString();
                params.max_connections = d->settings.maxConnectionsPerTorrent;
                params.flags &= ~lt::torrent_flags::paused;
                params.flags &= ~lt::torrent_flags::auto_managed;

                entry->handle = d->session->add_torrent(std::move(params), ec);
                if (ec || !entry->handle.is_valid()) {
                    SWARMCAST_ERROR("Failed to add torrent {}: {}", magnet.infoHash.toStdString(), ec.message());
                    entry->removed = true;
                } else {
                    entry->joined = true;
                    if (auto info = entry->handle.torrent_file()) {
                        entry->info = info;
                        entry->metadataReady = true;
                        entry->applyFilePriorities();
                    }
                }
            }
        } catch (const std::exception& e) {
            SWARMCAST_ERROR("Exception joining swarm {}: {}", magnet.infoHash.toStdString(), e.what());
            entry->removed = true;
        }

        if (entry->removed) {
            entry->changed.wakeAll();
            entryLocker.unlock();
            QMutexLocker locker(&d->swarmsMutex);
            if (d->swarms.value(magnet.infoHash) == entry) {
                d->swarms.remove(magnet.infoHash);
            }
            return makeUnexpected(StreamError::SwarmUnavailable);
        }

        QMetaObject::invokeMethod(this, [this, infoHash = magnet.infoHash]() {
            emit swarmJoined(infoHash);
        }, Qt::QueuedConnection);
        SWARMCAST_INFO("Joined swarm {}", magnet.infoHash.toStdString());
    }

    if (entry->removed || !entry->joined) {
        // Lost a race with the creator's failure or a final leave; retry against a fresh entry
        entryLocker.unlock();
        return join(magnet);
    }

    const quint64 lease = d->nextLease.fetch_add(1);
    entry->leases.insert(lease);
    SWARMCAST_DEBUG("Swarm {} lease {} ({} outstanding)",
                    magnet.infoHash.toStdString(), lease, entry->leases.size());
    return SwarmHandle{magnet.infoHash, lease};
}

void LibTorrentSwarmClient::leave(const SwarmHandle& handle) {
    if (!handle.isValid()) {
        return;
    }

    auto entry = d->find(handle.infoHash);
    if (!entry) {
        return;
    }

    lt::torrent_handle torrent;
    {
        QMutexLocker entryLocker(&entry->mutex);
        if (!entry->leases.remove(handle.leaseId) || !entry->leases.isEmpty()) {
            return;
        }
        entry->removed = true;
        entry->changed.wakeAll();
        torrent = entry->handle;
    }

    {
        QMutexLocker locker(&d->swarmsMutex);
        if (d->swarms.value(handle.infoHash) == entry) {
            d->swarms.remove(handle.infoHash);
        }
    }

    try {
        if (d->session && torrent.is_valid()) {
            d->session->remove_torrent(torrent, lt::session_handle::delete_files);
        }
    } catch (const std::exception& e) {
        SWARMCAST_WARN("Failed to remove torrent {}: {}", handle.infoHash.toStdString(), e.what());
    }

    SWARMCAST_INFO("Left swarm {}", handle.infoHash.toStdString());
}

Expected<TorrentMetadata, StreamError> LibTorrentSwarmClient::waitForMetadata(
    const SwarmHandle& handle, std::chrono::milliseconds timeout) {

    auto entry = d->find(handle.infoHash);
    if (!entry) {
        return makeUnexpected(StreamError::Cancelled);
    }

    std::shared_ptr<const lt::torrent_info> info;
    {
        QMutexLocker locker(&entry->mutex);
        QDeadlineTimer deadline(timeout);
        while (!entry->metadataReady && !entry->removed) {
            if (!entry->changed.wait(&entry->mutex, deadline)) {
                SWARMCAST_DEBUG("No metadata for {} within {} ms",
                               handle.infoHash.toStdString(), static_cast<long long>(timeout.count()));
                return makeUnexpected(StreamError::SwarmTimeout);
            }
        }
        if (entry->removed) {
            return makeUnexpected(StreamError::Cancelled);
        }
        info = entry->info;
    }

    TorrentMetadata metadata;
    metadata.infoHash = handle.infoHash;
    metadata.name = QString::fromStdString(info->name());
    metadata.pieceLength = info->piece_length();
    metadata.pieceCount = info->num_pieces();

    const lt::file_storage& files = info->files();
    for (const lt::file_index_t index : files.file_range()) {
        if (files.pad_file_at(index)) {
            continue;
        }
        SwarmFile file;
        file.index = static_cast<int>(index);
        file.path = QString::fromStdString(files.file_path(index));
        file.name = QString::fromStdString(std::string(files.file_name(index)));
        file.offset = files.file_offset(index);
        file.length = files.file_size(index);
        file.firstPiece = static_cast<int>(files.map_file(index, 0, 1).piece);
        file.lastPiece = static_cast<int>(files.map_file(index, std::max<qint64>(0, file.length - 1), 1).piece);
        metadata.totalSize += file.length;
        metadata.files.append(file);
    }

    if (!metadata.isConsistent()) {
        SWARMCAST_ERROR("Inconsistent metadata for {}", handle.infoHash.toStdString());
        return makeUnexpected(StreamError::SwarmUnavailable);
    }
    return metadata;
}

Expected<std::shared_ptr<ByteSource>, StreamError> LibTorrentSwarmClient::readRange(
    const SwarmHandle& handle, int fileIndex, qint64 byteStart, qint64 byteEnd) {

    auto entry = d->find(handle.infoHash);
    if (!entry) {
        return makeUnexpected(StreamError::Cancelled);
    }

    std::shared_ptr<const lt::torrent_info> info;
    {
        QMutexLocker locker(&entry->mutex);
        if (!entry->metadataReady) {
            return makeUnexpected(StreamError::SwarmTimeout);
        }
        info = entry->info;
    }

    if (fileIndex < 0 || fileIndex >= info->num_files()) {
        return makeUnexpected(StreamError::FileNotFound);
    }
    const qint64 size = info->files().file_size(lt::file_index_t(fileIndex));
    if (byteStart < 0 || byteEnd >= size || byteStart > byteEnd) {
        return makeUnexpected(StreamError::RangeNotSatisfiable);
    }

    return std::shared_ptr<ByteSource>(std::make_shared<PieceReader>(
        entry, info, fileIndex, byteStart, byteEnd,
        d->settings.pieceTimeoutMs, d->settings.readaheadBytes));
}

void LibTorrentSwarmClient::setPriority(const SwarmHandle& handle, int fileIndex,
                                        qint64 byteStart, qint64 byteEnd) {
    auto entry = d->find(handle.infoHash);
    if (!entry) {
        return;
    }

    QMutexLocker locker(&entry->mutex);
    if (!entry->metadataReady || fileIndex < 0 || fileIndex >= entry->info->num_files()) {
        return;
    }

    try {
        const lt::file_storage& files = entry->info->files();
        const lt::file_index_t file(fileIndex);
        const qint64 size = files.file_size(file);
        if (size <= 0) {
            return;
        }

        if (!entry->activeFiles.contains(fileIndex)) {
            entry->activeFiles.insert(fileIndex);
            entry->applyFilePriorities();
        }

        const qint64 start = std::clamp<qint64>(byteStart, 0, size - 1);
        const qint64 end = std::clamp<qint64>(byteEnd, start, size - 1);
        const qint64 windowEnd = std::min(end, start + d->settings.readaheadBytes);

        const int first = static_cast<int>(files.map_file(file, start, 1).piece);
        const int last = static_cast<int>(files.map_file(file, windowEnd, 1).piece);
        for (int p = first; p <= last; ++p) {
            entry->handle.set_piece_deadline(lt::piece_index_t(p), (p - first) * kReadaheadDeadlineStepMs);
        }

        // Head and tail hold the container index for most formats
        const qint64 tailBytes = std::max(size / 1000, kMinTailBytes);
        const int tailFirst = static_cast<int>(files.map_file(file, std::max<qint64>(0, size - tailBytes), 1).piece);
        const int tailLast = static_cast<int>(files.map_file(file, size - 1, 1).piece);
        for (int p = tailFirst; p <= tailLast; ++p) {
            entry->handle.set_piece_deadline(lt::piece_index_t(p), kTailDeadlineMs);
        }
        if (start > 0) {
            const int headPiece = static_cast<int>(files.map_file(file, 0, 1).piece);
            entry->handle.set_piece_deadline(lt::piece_index_t(headPiece), kTailDeadlineMs);
        }
    } catch (const std::exception& e) {
        SWARMCAST_WARN("Failed to set priority on {}: {}", handle.infoHash.toStdString(), e.what());
    }
}

std::optional<SwarmStats> LibTorrentSwarmClient::stats(const QString& infoHash) const {
    auto entry = d->find(infoHash);
    if (!entry) {
        return std::nullopt;
    }

    lt::torrent_handle torrent;
    QString fallbackName;
    {
        QMutexLocker locker(&entry->mutex);
        if (!entry->joined || entry->removed) {
            return std::nullopt;
        }
        torrent = entry->handle;
        fallbackName = entry->displayName;
    }

    try {
        const lt::torrent_status status = torrent.status();

        SwarmStats stats;
        stats.infoHash = infoHash;
        stats.name = status.name.empty() ? fallbackName : QString::fromStdString(status.name);
        stats.hasMetadata = status.has_metadata;
        stats.numPeers = status.num_peers;
        stats.numSeeds = std::max(status.num_complete, status.num_seeds);
        stats.numLeechers = std::max(status.num_incomplete, status.num_peers - status.num_seeds);
        stats.downloadRate = status.download_payload_rate;
        stats.uploadRate = status.upload_payload_rate;
        stats.progress = status.progress;
        stats.downloaded = status.total_payload_download;
        stats.uploaded = status.total_payload_upload;

        if (status.has_metadata) {
            std::vector<std::int64_t> progress;
            torrent.file_progress(progress, lt::torrent_handle::piece_granularity);
            stats.fileBytesDone.reserve(static_cast<int>(progress.size()));
            for (std::int64_t bytes : progress) {
                stats.fileBytesDone.append(bytes);
            }
        }
        return stats;

    } catch (const std::exception& e) {
        SWARMCAST_WARN("Failed to get torrent status for {}: {}", infoHash.toStdString(), e.what());
        return std::nullopt;
    }
}

QList<SwarmStats> LibTorrentSwarmClient::allStats() const {
    QList<QString> hashes;
    {
        QMutexLocker locker(&d->swarmsMutex);
        hashes = d->swarms.keys();
    }

    QList<SwarmStats> result;
    for (const QString& infoHash : hashes) {
        if (auto s = stats(infoHash)) {
            result.append(*s);
        }
    }
    return result;
}

DhtStatus LibTorrentSwarmClient::dhtStatus() const {
    const int nodes = d->dhtNodes.load();
    return DhtStatus{nodes > 0, nodes};
}

int LibTorrentSwarmClient::activeSwarmCount() const {
    QMutexLocker locker(&d->swarmsMutex);
    return d->swarms.size();
}

QString LibTorrentSwarmClient::libtorrentVersion() {
    return QString::fromLatin1(lt::version());
}

void LibTorrentSwarmClient::processAlerts() {
    if (!d->session) {
        return;
    }

    std::vector<lt::alert*> alerts;
    d->session->pop_alerts(&alerts);

    for (lt::alert* alert : alerts) {
        try {
            if (auto* piece = lt::alert_cast<lt::read_piece_alert>(alert)) {
                auto entry = d->find(infoHashOf(piece->handle));
                if (!entry) {
                    continue;
                }
                if (piece->error) {
                    SWARMCAST_DEBUG("read_piece {} failed: {}", static_cast<int>(piece->piece), piece->error.message());
                    continue;
                }
                QByteArray data(piece->buffer.get(), piece->size);
                QMutexLocker locker(&entry->mutex);
                entry->storePiece(static_cast<int>(piece->piece), data, d->settings.pieceCacheBytes);
                entry->changed.wakeAll();

            } else if (auto* received = lt::alert_cast<lt::metadata_received_alert>(alert)) {
                const QString infoHash = infoHashOf(received->handle);
                auto entry = d->find(infoHash);
                if (!entry) {
                    continue;
                }
                {
                    QMutexLocker locker(&entry->mutex);
                    entry->info = received->handle.torrent_file();
                    entry->metadataReady = entry->info != nullptr;
                    entry->applyFilePriorities();
                    entry->changed.wakeAll();
                }
                SWARMCAST_INFO("Metadata received for {}", infoHash.toStdString());
                emit metadataReceived(infoHash);

            } else if (auto* failed = lt::alert_cast<lt::metadata_failed_alert>(alert)) {
                // Another peer may still deliver it; the waiter's timeout decides
                SWARMCAST_WARN("Metadata exchange failed for {}: {}",
                               infoHashOf(failed->handle).toStdString(), failed->error.message());

            } else if (auto* removed = lt::alert_cast<lt::torrent_removed_alert>(alert)) {
                const QString infoHash = QString::fromStdString(to_hex(removed->info_hashes.v1));
                emit swarmRemoved(infoHash);

            } else if (auto* torrentError = lt::alert_cast<lt::torrent_error_alert>(alert)) {
                SWARMCAST_ERROR("Torrent error on {}: {}",
                                infoHashOf(torrentError->handle).toStdString(), torrentError->error.message());

            } else if (auto* stats = lt::alert_cast<lt::session_stats_alert>(alert)) {
                if (d->statsIdxDhtNodes >= 0) {
                    const auto counters = stats->counters();
                    const int nodes = static_cast<int>(counters[d->statsIdxDhtNodes]);
                    const int previous = d->dhtNodes.exchange(nodes);
                    if ((previous > 0) != (nodes > 0)) {
                        SWARMCAST_INFO("DHT {} ({} nodes)", nodes > 0 ? "ready" : "not ready", nodes);
                        emit dhtStateChanged(nodes > 0, nodes);
                    }
                }
            }
        } catch (const std::exception& e) {
            SWARMCAST_WARN("Exception processing alert: {}", e.what());
        }
    }
}

void LibTorrentSwarmClient::postStatistics() {
    if (d->session) {
        d->session->post_session_stats();
    }
}

} // namespace Swarmcast
